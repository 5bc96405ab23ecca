#ifndef KEYGEN_HPP
#define KEYGEN_HPP

#include <gmpxx.h>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "rsa.hpp"

// 隨機搜尋的上限；兩個欄位都是 0 代表不設限（跟原本一樣可能永遠跑下去）
struct SearchLimit {
  std::size_t max_attempts = 0;
  std::chrono::milliseconds timeout{0};
};

// 有設 SearchLimit 而且用完了才會丟
class SearchExhausted : public std::runtime_error {
public:
  SearchExhausted(const std::string& what, std::size_t attempts)
      : std::runtime_error(what), attempts_(attempts) {}

  std::size_t attempts() const { return attempts_; }

private:
  std::size_t attempts_;
};

// 在 [low, high) 隨機抽，回傳第一個 is_prime 的數
mpz_class find_random_prime(const mpz_class& low, const mpz_class& high,
                            const SearchLimit& limit = {});

// 在 [low, high) 隨機抽，回傳第一個跟 n 互質的數
mpz_class find_random_coprime(const mpz_class& n, const mpz_class& low,
                              const mpz_class& high,
                              const SearchLimit& limit = {});

// 擴展歐幾里得：回傳 x 使得 value * x ≡ 1 (mod modulus)，x 在 [0, modulus)
// modulus <= 0 或 gcd(modulus, value) != 1 時丟 std::invalid_argument
mpz_class modular_inverse(const mpz_class& modulus, const mpz_class& value);

// 產生 RSA 金鑰對，bits 是 p、q 各自的位元數（n 約 2*bits）
// use_default_exponent = false 時 e 改取 [2^bits, 2^(bits+1)) 中與 phi 互質的亂數
RSAKeyPair rsa_keygen(std::size_t bits, bool use_default_exponent = true,
                      KeyShape shape = KeyShape::Sized,
                      const SearchLimit& limit = {});

#endif
