#pragma once

namespace sequence {

// Size and epoch bookkeeping shared by every sequence. Sequences embed one of these and forward
// their accessors to it.
class SequenceCounter {
public:
  SequenceCounter(unsigned numSamples, unsigned batchSize, unsigned elapsedEpochs = 0);

  unsigned NumSamples(void) const { return numSamples; }
  unsigned BatchSize(void) const { return batchSize; }
  unsigned ElapsedEpochs(void) const { return elapsedEpochs; }

  // ceil(NumSamples / BatchSize), the last batch may be short.
  unsigned StepsPerEpoch(void) const;

  bool IsValidStep(int idx) const;

  void OnEpochEnd(void);

private:
  unsigned numSamples;
  unsigned batchSize;
  unsigned elapsedEpochs;
};
}
