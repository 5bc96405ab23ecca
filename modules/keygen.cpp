#include "keygen.hpp"
#include "config.hpp"
#include "primality.hpp"
#include "random.hpp"

#include <string>

namespace {

// 記錄嘗試次數與起始時間，超過 SearchLimit 就丟 SearchExhausted
class SearchBudget {
public:
  SearchBudget(const SearchLimit& limit, const char* what)
      : limit_(limit), what_(what), start_(std::chrono::steady_clock::now()) {}

  void spend() {
    ++attempts_;
    if (limit_.max_attempts != 0 && attempts_ > limit_.max_attempts) {
      throw SearchExhausted(std::string(what_) + ": gave up after " +
                                std::to_string(limit_.max_attempts) +
                                " attempts.",
                            limit_.max_attempts);
    }
    if (limit_.timeout.count() != 0 &&
        std::chrono::steady_clock::now() - start_ > limit_.timeout) {
      throw SearchExhausted(std::string(what_) + ": deadline of " +
                                std::to_string(limit_.timeout.count()) +
                                " ms exceeded.",
                            attempts_ - 1);
    }
  }

private:
  const SearchLimit& limit_;
  const char* what_;
  std::chrono::steady_clock::time_point start_;
  std::size_t attempts_ = 0;
};

mpz_class gcd_of(const mpz_class& a, const mpz_class& b) {
  mpz_class g;
  mpz_gcd(g.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
  return g;
}

// 2^bits
mpz_class power_of_two(std::size_t bits) {
  return mpz_class(1) << bits;
}

}  // namespace

mpz_class find_random_prime(const mpz_class& low, const mpz_class& high,
                            const SearchLimit& limit) {
  if (high <= low) {
    throw std::invalid_argument("find_random_prime: empty range.");
  }
  SearchBudget budget(limit, "find_random_prime");
  while (true) {
    budget.spend();
    mpz_class n = random_range(low, high);
    if (is_prime(n)) return n;
  }
}

mpz_class find_random_coprime(const mpz_class& n, const mpz_class& low,
                              const mpz_class& high,
                              const SearchLimit& limit) {
  if (high <= low) {
    throw std::invalid_argument("find_random_coprime: empty range.");
  }
  SearchBudget budget(limit, "find_random_coprime");
  while (true) {
    budget.spend();
    mpz_class e = random_range(low, high);
    if (gcd_of(e, n) == 1) return e;
  }
}

mpz_class modular_inverse(const mpz_class& modulus, const mpz_class& value) {
  if (modulus <= 0) {
    throw std::invalid_argument("modular_inverse: modulus must be positive.");
  }

  // 先把 value 拉回 [0, modulus)，之後全部都是非負數
  mpz_class r;
  mpz_mod(r.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());

  // 只追蹤 value 的係數：old_s * value ≡ old_r (mod modulus)
  mpz_class old_r = modulus;
  mpz_class old_s = 0, s = 1;
  mpz_class q, tmp;
  while (r != 0) {
    q = old_r / r;
    tmp = old_r - q * r;
    old_r = r;
    r = tmp;
    tmp = old_s - q * s;
    old_s = s;
    s = tmp;
  }

  // 迴圈結束時 old_r 就是 gcd
  if (old_r != 1) {
    throw std::invalid_argument(
        "modular_inverse: modulus and value are not coprime.");
  }

  mpz_class x;
  mpz_mod(x.get_mpz_t(), old_s.get_mpz_t(), modulus.get_mpz_t());
  return x;
}

RSAKeyPair rsa_keygen(std::size_t bits, bool use_default_exponent,
                      KeyShape shape, const SearchLimit& limit) {
  if (bits < 2) {
    throw std::invalid_argument("bits too small (need at least 2).");
  }

  const mpz_class low = power_of_two(bits - 1);
  const mpz_class high = power_of_two(bits);
  const mpz_class fixed_e = kDefaultExponent;

  //生成p、q兩個質數，避免 p == q
  mpz_class p = find_random_prime(low, high, limit);
  mpz_class q, phi;
  do {
    q = find_random_prime(low, high, limit);
    phi = (p - 1) * (q - 1);
    // 固定 e 時 phi 不能被 65537 整除，不然 d 不存在
  } while (q == p || (use_default_exponent && gcd_of(fixed_e, phi) != 1));

  mpz_class n = p * q;

  mpz_class e;
  if (use_default_exponent) {
    e = fixed_e;
  } else {
    e = find_random_coprime(phi, high, power_of_two(bits + 1), limit);
  }

  // d = e^{-1} mod phi
  mpz_class d = modular_inverse(phi, e);

  RSAKeyPair pair;
  pair.p = p;
  pair.q = q;
  pair.public_key = make_key(n, e, shape, bits);
  pair.private_key = make_key(n, d, shape, bits);
  return pair;
}
