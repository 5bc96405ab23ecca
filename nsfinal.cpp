#include "modules/codec.hpp"
#include "modules/keygen.hpp"
#include "modules/rsa.hpp"
#include <iostream>

namespace {

void print_blocks(const char* label, const std::vector<mpz_class>& blocks) {
  std::cout << label << "[";
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    if (i != 0) std::cout << ", ";
    std::cout << blocks[i];
  }
  std::cout << "]\n";
}

mpz_class key_prime(std::size_t bits) {
  return find_random_prime(mpz_class(1) << (bits - 1), mpz_class(1) << bits);
}

}  // namespace

int main() {
  try {
    std::cout << "=== Block Encoding ===\n";
    print_blocks("\"a\"      -> ", text_to_blocks("a"));
    print_blocks("\"aaa\"    -> ", text_to_blocks("aaa"));
    // 最短會產生兩個區塊的訊息：[X, 97]
    print_blocks("\"a\"x129  -> ", text_to_blocks(std::string(kDefaultBlockSize + 1, 'a')));

    const std::string msg = "abcdefghijklmnopqrstuvwxyz";
    std::cout << "\nMessage: " << msg << "\n";
    std::vector<mpz_class> encoded = text_to_blocks(msg);
    print_blocks("Encoded: ", encoded);
    if (blocks_to_text(encoded) != msg) {
      std::cout << "[FAIL] encode/decode mismatch!\n";
      return 1;
    }

    // 範例金鑰（n 約 42 bits，所以 block_size 只能用 5）
    std::cout << "\n=== Sample Key ===\n";
    RSAKey sample_public{mpz_class("5551201688147"), mpz_class(65537), std::nullopt};
    RSAKey sample_private{mpz_class("5551201688147"), mpz_class("109182490673"), std::nullopt};
    std::vector<mpz_class> cipher = rsa_encrypt(msg, sample_public, 5);
    print_blocks("Encrypted: ", cipher);
    std::cout << "Plaintext: " << rsa_decrypt(cipher, sample_private, 5) << "\n";

    std::cout << "\n=== Random Primes ===\n";
    std::cout << "Little Prime: " << key_prime(32) << "\n";
    std::cout << "Medium Prime: " << key_prime(256) << "\n";

    std::cout << "\n=== Generated Key (256-bit primes) ===\n";
    RSAKeyPair pair = rsa_keygen(256);
    std::cout << "public  = " << format_key(pair.public_key) << "\n";
    std::cout << "n (bits) = " << mpz_sizeinbase(pair.public_key.n.get_mpz_t(), 2) << "\n";

    cipher = rsa_encrypt(msg, pair.public_key, 16);
    print_blocks("Encrypted: ", cipher);
    std::string plain = rsa_decrypt(cipher, pair.private_key, 16);
    std::cout << "Plaintext: " << plain << "\n\n";

    if (plain == msg) {
      std::cout << "[OK] decrypt(encrypt(msg)) == msg\n";
      return 0;
    } else {
      std::cout << "[FAIL] mismatch!\n";
      return 1;
    }

  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
