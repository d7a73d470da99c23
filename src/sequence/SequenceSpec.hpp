#pragma once

#include <cstdint>

namespace sequence {

struct SequenceSpec {
  unsigned batchSize;
  uint32_t seed = 42;

  // Epochs already completed, non-zero when resuming an interrupted run.
  unsigned elapsedEpochs = 0;
};
}
