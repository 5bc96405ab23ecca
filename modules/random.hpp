#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <gmpxx.h>

// 全域亂數來源（GMP Mersenne Twister，時間 seed）
// 注意：不是密碼學安全的亂數，也不是 thread-safe
gmp_randclass& global_rng();

// 均勻取 [low, high) 之間的整數；high <= low 丟 std::invalid_argument
mpz_class random_range(const mpz_class& low, const mpz_class& high);

#endif
