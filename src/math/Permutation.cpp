#include "Permutation.hpp"

#include <cassert>
#include <numeric>
#include <random>
#include <utility>

// Uniform draw in [0, max] from raw 32 bit generator output. Smallest all-ones mask covering max,
// redraw until the masked value is in range.
static uint32_t boundedDraw(std::mt19937 &rng, uint32_t max);

std::vector<unsigned> math::SeededPermutation(unsigned n, uint32_t seed) {
  std::vector<unsigned> result(n);
  std::iota(result.begin(), result.end(), 0u);

  std::mt19937 rng(seed);
  for (unsigned i = n; i > 1; i--) {
    unsigned j = boundedDraw(rng, i - 1);
    assert(j < i);
    std::swap(result[i - 1], result[j]);
  }

  return result;
}

uint32_t boundedDraw(std::mt19937 &rng, uint32_t max) {
  if (max == 0) {
    return 0;
  }

  uint32_t mask = max;
  mask |= mask >> 1;
  mask |= mask >> 2;
  mask |= mask >> 4;
  mask |= mask >> 8;
  mask |= mask >> 16;

  uint32_t value;
  do {
    value = static_cast<uint32_t>(rng()) & mask;
  } while (value > max);

  return value;
}
