#pragma once

#include "../common/Common.hpp"
#include "../math/Math.hpp"
#include "Sequence.hpp"
#include "SequenceCounter.hpp"
#include "SequenceSpec.hpp"
#include <cstdint>

namespace sequence {

// Batches the rows of an in-memory dataset. The rows are served in their original order until the
// first epoch ends, after which every epoch serves them in a fresh order derived from
// seed + ElapsedEpochs(). The same seed and epoch always give the same order, so a run resumed
// with the elapsed epoch count of an interrupted one sees the same batches from then on.
class VectorSequence : public Sequence {
public:
  VectorSequence(const EMatrix &data, unsigned batchSize, uint32_t seed = 42,
                 unsigned elapsedEpochs = 0);
  VectorSequence(const EVector &data, unsigned batchSize, uint32_t seed = 42,
                 unsigned elapsedEpochs = 0);
  VectorSequence(const EMatrix &data, const SequenceSpec &spec);

  unsigned NumSamples(void) const override { return counter.NumSamples(); }
  unsigned BatchSize(void) const override { return counter.BatchSize(); }
  unsigned StepsPerEpoch(void) const override { return counter.StepsPerEpoch(); }
  unsigned ElapsedEpochs(void) const override { return counter.ElapsedEpochs(); }

  void OnEpochEnd(void) override;
  EMatrix GetBatch(int idx) const override;

  uint32_t Seed(void) const { return seed; }
  const EMatrix &Data(void) const { return data; }
  const EMatrix &Shuffled(void) const { return shuffled; }

private:
  SequenceCounter counter;
  uint32_t seed;

  const EMatrix data;
  EMatrix shuffled;
};
}
