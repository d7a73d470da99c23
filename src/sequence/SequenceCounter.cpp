#include "SequenceCounter.hpp"

#include <stdexcept>
#include <string>

using namespace sequence;

SequenceCounter::SequenceCounter(unsigned numSamples, unsigned batchSize, unsigned elapsedEpochs)
    : numSamples(numSamples), batchSize(batchSize), elapsedEpochs(elapsedEpochs) {
  if (batchSize == 0) {
    throw std::invalid_argument("Batch size must be a positive integer, got 0 for " +
                                std::to_string(numSamples) + " samples.");
  }
}

unsigned SequenceCounter::StepsPerEpoch(void) const {
  return numSamples / batchSize + (numSamples % batchSize == 0 ? 0 : 1);
}

bool SequenceCounter::IsValidStep(int idx) const {
  return idx >= 0 && static_cast<unsigned>(idx) < StepsPerEpoch();
}

void SequenceCounter::OnEpochEnd(void) { elapsedEpochs++; }
