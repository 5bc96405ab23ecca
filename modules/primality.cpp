#include "primality.hpp"
#include "random.hpp"

std::vector<unsigned long> prime_sieve(unsigned long limit) {
  std::vector<unsigned long> primes;
  if (limit < 3) return primes;

  std::vector<bool> sieve(limit, true);
  sieve[0] = sieve[1] = false;
  for (unsigned long i = 2; i * i < limit; ++i) {
    if (!sieve[i]) continue;
    for (unsigned long j = i * i; j < limit; j += i) {
      sieve[j] = false;
    }
  }

  for (unsigned long i = 2; i < limit; ++i) {
    if (sieve[i]) primes.push_back(i);
  }
  return primes;
}

const SmallPrimeTable& small_primes() {
  static const SmallPrimeTable table = [] {
    SmallPrimeTable t;
    t.primes = prime_sieve(kSmallPrimeLimit);
    t.lookup.insert(t.primes.begin(), t.primes.end());
    return t;
  }();
  return table;
}

bool simple_is_prime(const mpz_class& n) {
  if (n < 2) return false;
  for (mpz_class i = 2; i * i <= n; ++i) {
    if (mpz_divisible_p(n.get_mpz_t(), i.get_mpz_t())) return false;
  }
  return true;
}

bool miller_rabin(const mpz_class& n, int rounds) {
  if (rounds < 1) rounds = 1;

  // n - 1 = 2^r * d，d 為奇數
  const mpz_class n_minus_1 = n - 1;
  mpz_class d = n_minus_1;
  unsigned long r = 0;
  while (mpz_even_p(d.get_mpz_t())) {
    d >>= 1;
    ++r;
  }

  mpz_class x;
  for (int round = 0; round < rounds; ++round) {
    // a 取 [2, n-2]
    mpz_class a = random_range(2, n - 1);
    mpz_powm(x.get_mpz_t(), a.get_mpz_t(), d.get_mpz_t(), n.get_mpz_t());
    if (x == 1) continue;

    unsigned long i = 0;
    while (x != n_minus_1) {
      if (i == r - 1) return false;  // 找到合數的見證
      x = (x * x) % n;
      ++i;
    }
  }
  return true;
}

bool is_prime(const mpz_class& n, int rounds) {
  if (n < 2) return false;

  const SmallPrimeTable& table = small_primes();
  if (n < kSmallPrimeLimit) {
    return table.lookup.count(n.get_ui()) != 0;
  }

  for (unsigned long p : table.primes) {
    if (mpz_divisible_ui_p(n.get_mpz_t(), p)) return false;
  }

  return miller_rabin(n, rounds);
}
