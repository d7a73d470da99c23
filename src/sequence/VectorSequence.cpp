#include "VectorSequence.hpp"
#include "../math/Permutation.hpp"
#include "IndexOutOfRange.hpp"

#include <algorithm>
#include <cassert>

using namespace sequence;

VectorSequence::VectorSequence(const EMatrix &data, unsigned batchSize, uint32_t seed,
                               unsigned elapsedEpochs)
    : counter(static_cast<unsigned>(data.rows()), batchSize, elapsedEpochs), seed(seed),
      data(data), shuffled(data) {}

VectorSequence::VectorSequence(const EVector &data, unsigned batchSize, uint32_t seed,
                               unsigned elapsedEpochs)
    : VectorSequence(math::AsColumn(data), batchSize, seed, elapsedEpochs) {}

VectorSequence::VectorSequence(const EMatrix &data, const SequenceSpec &spec)
    : VectorSequence(data, spec.batchSize, spec.seed, spec.elapsedEpochs) {}

void VectorSequence::OnEpochEnd(void) {
  counter.OnEpochEnd();

  // Unsigned wrap-around keeps the derivation defined for any seed.
  uint32_t epochSeed = seed + static_cast<uint32_t>(counter.ElapsedEpochs());
  vector<unsigned> indices = math::SeededPermutation(counter.NumSamples(), epochSeed);

  shuffled = math::GatherRows(data, indices);
  assert(shuffled.rows() == data.rows());
}

EMatrix VectorSequence::GetBatch(int idx) const {
  if (!counter.IsValidStep(idx)) {
    throw IndexOutOfRange(idx, counter.StepsPerEpoch());
  }

  unsigned start = static_cast<unsigned>(idx) * counter.BatchSize();
  unsigned count = min(counter.BatchSize(), counter.NumSamples() - start);
  assert(count > 0);

  return shuffled.middleRows(start, count);
}
