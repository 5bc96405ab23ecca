#include "rsa.hpp"
#include "codec.hpp"
#include <stdexcept>

namespace {

void check_modulus(const RSAKey& key) {
  if (key.n <= 1) throw std::invalid_argument("key modulus must be > 1.");
}

// 區塊值必須 < n，RSA 才是 [0, n) 上的一對一映射
void check_key_size(const RSAKey& key, std::size_t block_size) {
  if (key.key_size && *key.key_size <= block_size * 8) {
    throw std::domain_error("key bits must be larger than block bits (key " +
                            std::to_string(*key.key_size) + " bits, block " +
                            std::to_string(block_size * 8) + " bits).");
  }
}

}  // namespace

RSAKey make_key(const mpz_class& n, const mpz_class& exponent, KeyShape shape,
                std::size_t key_size) {
  RSAKey key;
  key.n = n;
  key.exponent = exponent;
  if (shape == KeyShape::Sized) key.key_size = key_size;
  return key;
}

std::string format_key(const RSAKey& key) {
  std::string out = "(" + key.n.get_str() + ", " + key.exponent.get_str();
  if (key.key_size) out += ", " + std::to_string(*key.key_size);
  return out + ")";
}

mpz_class rsa_encrypt_block(const mpz_class& m, const RSAKey& key) {
  check_modulus(key);
  if (m < 0) throw std::invalid_argument("message must be non-negative.");
  if (m >= key.n) throw std::invalid_argument("message must be < n.");
  mpz_class c;
  //mpz_powm為GMP的mod指數運算
  mpz_powm(c.get_mpz_t(), m.get_mpz_t(), key.exponent.get_mpz_t(),
           key.n.get_mpz_t());
  return c;
}

mpz_class rsa_decrypt_block(const mpz_class& c, const RSAKey& key) {
  check_modulus(key);
  if (c < 0) throw std::invalid_argument("cipher must be non-negative.");
  if (c >= key.n) throw std::invalid_argument("cipher must be < n.");
  mpz_class m;
  mpz_powm(m.get_mpz_t(), c.get_mpz_t(), key.exponent.get_mpz_t(),
           key.n.get_mpz_t());
  return m;
}

std::vector<mpz_class> rsa_encrypt(const std::string& message,
                                   const RSAKey& public_key,
                                   std::size_t block_size) {
  check_key_size(public_key, block_size);

  std::vector<mpz_class> blocks = text_to_blocks(message, block_size);
  for (mpz_class& block : blocks) {
    block = rsa_encrypt_block(block, public_key);
  }
  return blocks;
}

std::string rsa_decrypt(const std::vector<mpz_class>& blocks,
                        const RSAKey& private_key, std::size_t block_size) {
  check_key_size(private_key, block_size);

  std::vector<mpz_class> plain;
  plain.reserve(blocks.size());
  for (const mpz_class& block : blocks) {
    plain.push_back(rsa_decrypt_block(block, private_key));
  }
  return blocks_to_text(plain, block_size);
}
