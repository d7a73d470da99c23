#pragma once

#include "../math/Math.hpp"

namespace sequence {

// What a training loop needs from a batch source: sizes, epoch bookkeeping and indexed batches.
// A loop calls GetBatch for every index in [0, StepsPerEpoch()) and then OnEpochEnd once.
class Sequence {
public:
  virtual ~Sequence() = default;

  virtual unsigned NumSamples(void) const = 0;
  virtual unsigned BatchSize(void) const = 0;
  virtual unsigned StepsPerEpoch(void) const = 0;
  virtual unsigned ElapsedEpochs(void) const = 0;

  virtual void OnEpochEnd(void) = 0;

  // Throws IndexOutOfRange unless 0 <= idx < StepsPerEpoch().
  virtual EMatrix GetBatch(int idx) const = 0;
};
}
