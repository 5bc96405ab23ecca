#include "random.hpp"
#include <ctime>
#include <stdexcept>

gmp_randclass& global_rng() {
  static gmp_randclass rng(gmp_randinit_default);
  static bool seeded = false;
  if (!seeded) {
    // 教科書版本：用時間當 seed（可改 /dev/urandom 但會改變行為）
    rng.seed(static_cast<unsigned long>(std::time(nullptr)));
    seeded = true;
  }
  return rng;
}

mpz_class random_range(const mpz_class& low, const mpz_class& high) {
  if (high <= low) {
    throw std::invalid_argument("random range is empty (high <= low).");
  }
  mpz_class span = high - low;
  // get_z_range(span) 回傳 [0, span)
  return low + global_rng().get_z_range(span);
}
