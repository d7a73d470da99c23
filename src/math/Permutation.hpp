#pragma once

#include <cstdint>
#include <vector>

namespace math {

// Returns a permutation of [0, n) determined entirely by the seed. Uses an MT19937 generator
// seeded with the given value and a descending Fisher-Yates pass drawing each swap index with
// masked rejection sampling, which reproduces numpy.random.RandomState(seed).shuffle exactly.
std::vector<unsigned> SeededPermutation(unsigned n, uint32_t seed);
}
