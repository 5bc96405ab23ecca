#ifndef PRIMALITY_HPP
#define PRIMALITY_HPP

#include <gmpxx.h>
#include <unordered_set>
#include <vector>

#include "config.hpp"

// 小質數表（< kSmallPrimeLimit），全程式只算一次，之後唯讀
struct SmallPrimeTable {
  std::vector<unsigned long> primes;          // 由小到大，給試除法用
  std::unordered_set<unsigned long> lookup;   // O(1) 查詢
};

// Eratosthenes 篩法：回傳所有小於 limit 的質數
std::vector<unsigned long> prime_sieve(unsigned long limit);

// 第一次呼叫時建表（function-local static，初始化是 thread-safe 的）
const SmallPrimeTable& small_primes();

// 最簡單的試除法（到 sqrt(n)），只適合小數字，拿來當對照組
bool simple_is_prime(const mpz_class& n);

// Miller-Rabin 見證迴圈本體；前提：n 為大於 3 的奇數
bool miller_rabin(const mpz_class& n, int rounds = kMillerRabinRounds);

// 判斷質數：先查小質數表、試除，再跑 Miller-Rabin
// 機率性結果：合數被誤判為質數的機率 <= 4^-rounds，不會丟例外
bool is_prime(const mpz_class& n, int rounds = kMillerRabinRounds);

#endif
