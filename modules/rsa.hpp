#ifndef RSA_HPP
#define RSA_HPP

#include <gmpxx.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"

// 金鑰的兩種形狀：(n, exponent) 或 (n, exponent, key_size)
enum class KeyShape { Plain, Sized };

struct RSAKey {
  mpz_class n;                          // modulus
  mpz_class exponent;                   // 公鑰放 e，私鑰放 d
  std::optional<std::size_t> key_size;  // 宣告的位元數（Plain 形狀沒有）
};

struct RSAKeyPair {
  RSAKey public_key;   // (n, e[, bits])
  RSAKey private_key;  // (n, d[, bits])
  mpz_class p;         // 保留質因數，方便驗證 n = p*q
  mpz_class q;
};

RSAKey make_key(const mpz_class& n, const mpz_class& exponent, KeyShape shape,
                std::size_t key_size);

// "(n, e)" 或 "(n, e, bits)"
std::string format_key(const RSAKey& key);

// RSA: c = m^e mod n，要求 0 <= m < n
mpz_class rsa_encrypt_block(const mpz_class& m, const RSAKey& key);

// RSA: m = c^d mod n，要求 0 <= c < n
mpz_class rsa_decrypt_block(const mpz_class& c, const RSAKey& key);

// 文字 -> 區塊 -> 逐塊 m^e mod n
// key 有宣告位元數且 key_size <= block_size * 8 時丟 std::domain_error；
// 沒有宣告時由呼叫端保證 256^block_size < n
std::vector<mpz_class> rsa_encrypt(const std::string& message,
                                   const RSAKey& public_key,
                                   std::size_t block_size = kDefaultBlockSize);

// 逐塊 c^d mod n -> 區塊 -> 文字
std::string rsa_decrypt(const std::vector<mpz_class>& blocks,
                        const RSAKey& private_key,
                        std::size_t block_size = kDefaultBlockSize);

#endif
