#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <gmpxx.h>

#include "modules/codec.hpp"
#include "modules/keygen.hpp"
#include "modules/rsa.hpp"

namespace {

int failures = 0;

void check(bool ok, const std::string& name) {
  std::cout << (ok ? "[OK]   " : "[FAIL] ") << name << std::endl;
  if (!ok) ++failures;
}

template <typename Exception, typename Fn>
bool throws(Fn fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  } catch (const std::exception& ex) {
    std::cout << "       unexpected exception: " << ex.what() << std::endl;
  }
  return false;
}

// 範例金鑰 n = 2219947 * 2500601
const RSAKey kSamplePublic{mpz_class("5551201688147"), mpz_class(65537), std::nullopt};
const RSAKey kSamplePrivate{mpz_class("5551201688147"), mpz_class("109182490673"), std::nullopt};
const std::string kAlphabet = "abcdefghijklmnopqrstuvwxyz";

void test_text_to_blocks() {
  std::vector<mpz_class> a = text_to_blocks("a", 128);
  check(a.size() == 1 && a[0] == 97, "text_to_blocks(\"a\") == [97]");

  std::vector<mpz_class> aaa = text_to_blocks("aaa", 128);
  check(aaa.size() == 1 && aaa[0] == 6381921, "text_to_blocks(\"aaa\") == [6381921]");

  std::vector<mpz_class> hello = text_to_blocks("hello world", 4);
  check(hello.size() == 3 && hello[0] == 1819043176 && hello[1] == 1870078063 &&
            hello[2] == 6581362,
        "\"hello world\" in 4-byte blocks, last block not padded");

  check(text_to_blocks("", 8).empty(), "empty message has no blocks");
  check(text_to_blocks(std::string("ab\0\0", 4), 8).size() == 1 &&
            text_to_blocks(std::string("ab\0\0", 4), 8)[0] == 97 + 98 * 256,
        "trailing NULs are stripped before encoding");
  check(text_to_blocks(std::string("\0\0", 2), 8).empty(), "all-NUL message has no blocks");

  check(throws<std::invalid_argument>([] { text_to_blocks("caf\xc3\xa9", 8); }),
        "non-ASCII input throws");
  check(throws<std::invalid_argument>([] { text_to_blocks("abc", 0); }),
        "zero block size throws");
}

void test_block_boundary() {
  const std::size_t block = 16;
  std::vector<mpz_class> exact = text_to_blocks(std::string(block, 'a'), block);
  check(exact.size() == 1, "blockSize bytes -> one block");

  std::vector<mpz_class> over = text_to_blocks(std::string(block + 1, 'a'), block);
  check(over.size() == 2 && over[1] == 97, "blockSize+1 bytes -> two blocks, second is [97]");

  std::vector<mpz_class> def = text_to_blocks(std::string(kDefaultBlockSize + 1, 'a'));
  check(def.size() == 2 && def[1] == 97, "default block size is 128");
}

void test_blocks_to_text() {
  check(blocks_to_text({97}, 128) == "a", "blocks_to_text([97]) == \"a\"");
  check(blocks_to_text({6381921}, 128) == "aaa", "blocks_to_text([6381921]) == \"aaa\"");

  // 中間的區塊會補滿 block_size 個 byte，所以中間的 '\0' 保留
  std::vector<mpz_class> blocks = {97, 98};
  check(blocks_to_text(blocks, 2) == std::string("a\0b", 3),
        "interior NULs survive, trailing ones are stripped");

  check(throws<std::invalid_argument>([] { blocks_to_text({mpz_class(1) << 16}, 2); }),
        "block wider than block_size throws");
  check(throws<std::invalid_argument>([] { blocks_to_text({-1}, 2); }),
        "negative block throws");
  check(blocks_to_text({65535}, 2) == "\xff\xff", "largest 2-byte block decodes");
}

void test_round_trip() {
  const std::vector<std::string> messages = {
      "", "a", kAlphabet, "The quick brown fox jumps over the lazy dog.\n",
      std::string("\0lead", 5), std::string(300, '~')};
  bool ok = true;
  for (const std::string& m : messages) {
    for (std::size_t b : {1, 3, 5, 16, 128}) {
      if (blocks_to_text(text_to_blocks(m, b), b) != m) {
        std::cout << "       round trip failed: size " << m.size() << ", block " << b << std::endl;
        ok = false;
      }
    }
  }
  check(ok, "blocks_to_text(text_to_blocks(m, b), b) == m");

  std::string with_nul = std::string("abc\0", 4);
  check(blocks_to_text(text_to_blocks(with_nul, 4), 4) == "abc",
        "message ending in NUL loses it");
}

void test_sample_key() {
  std::vector<mpz_class> cipher = rsa_encrypt(kAlphabet, kSamplePublic, 5);
  const std::vector<mpz_class> expected = {
      mpz_class("4482626298700"), mpz_class("5357620110857"), mpz_class("2690146677706"),
      mpz_class("919368960504"),  mpz_class("4294187765105"), mpz_class("5477535081657")};
  check(cipher == expected, "alphabet encrypted with sample public key");
  check(rsa_decrypt(cipher, kSamplePrivate, 5) == kAlphabet,
        "alphabet decrypted with sample private key");

  // 6 bytes 的區塊 > n，單一區塊的檢查會擋下來
  check(throws<std::invalid_argument>([] { rsa_encrypt("zzzzzz", kSamplePublic, 6); }),
        "block value >= n throws");
  check(throws<std::invalid_argument>([] {
          rsa_decrypt({mpz_class("5551201688147")}, kSamplePrivate, 5);
        }),
        "cipher block >= n throws");
}

void test_block_primitives() {
  RSAKey pub{3233, 17, std::nullopt};
  RSAKey priv{3233, 413, std::nullopt};
  check(rsa_encrypt_block(65, pub) == 2790, "65^17 mod 3233 == 2790");
  check(rsa_decrypt_block(2790, priv) == 65, "2790^413 mod 3233 == 65");
  check(throws<std::invalid_argument>([&] { rsa_encrypt_block(-1, pub); }),
        "negative block throws");
  RSAKey broken{1, 3, std::nullopt};
  check(throws<std::invalid_argument>([&] { rsa_encrypt_block(0, broken); }),
        "modulus <= 1 throws");
}

void test_key_size_check() {
  RSAKeyPair pair = rsa_keygen(128);
  check(throws<std::domain_error>([&] { rsa_encrypt(kAlphabet, pair.public_key, 16); }),
        "key_size == block bits throws domain_error");
  check(throws<std::domain_error>([&] { rsa_encrypt(kAlphabet, pair.public_key, 32); }),
        "key_size < block bits throws domain_error");
  check(throws<std::domain_error>([&] { rsa_decrypt({}, pair.private_key, 16); }),
        "decrypt checks the declared size too");

  std::vector<mpz_class> cipher = rsa_encrypt(kAlphabet, pair.public_key, 15);
  check(cipher.size() == 2, "26 bytes in 15-byte blocks -> 2 blocks");
  check(rsa_decrypt(cipher, pair.private_key, 15) == kAlphabet,
        "round trip with 128-bit primes and 15-byte blocks");
}

void test_generated_keys() {
  const std::string msg = "Attack at dawn! 0123456789 ~!@#$%^&*()";
  RSAKeyPair sized = rsa_keygen(256);
  check(rsa_decrypt(rsa_encrypt(msg, sized.public_key, 16), sized.private_key, 16) == msg,
        "decrypt(encrypt(m)) with sized 256-bit key");

  RSAKeyPair plain = rsa_keygen(256, false, KeyShape::Plain);
  check(rsa_decrypt(rsa_encrypt(msg, plain.public_key, 31), plain.private_key, 31) == msg,
        "decrypt(encrypt(m)) with plain key and random exponent");

  RSAKeyPair big = rsa_keygen(1024);
  std::string long_msg(1000, 'x');
  check(rsa_decrypt(rsa_encrypt(long_msg, big.public_key, 127), big.private_key, 127) == long_msg,
        "decrypt(encrypt(m)) with 1024-bit primes and 127-byte blocks");
  check(throws<std::domain_error>([&] { rsa_encrypt(long_msg, big.public_key); }),
        "1024-bit key is too small for the default 128-byte block");
}

}  // namespace

int main() {
  std::cout << "=== BlockCodec / CipherEngine ===" << std::endl;
  test_text_to_blocks();
  test_block_boundary();
  test_blocks_to_text();
  test_round_trip();
  test_sample_key();
  test_block_primitives();
  test_key_size_check();
  test_generated_keys();

  if (failures != 0) {
    std::cout << "\n" << failures << " check(s) failed." << std::endl;
    return 1;
  }
  std::cout << "\nall checks passed." << std::endl;
  return 0;
}
