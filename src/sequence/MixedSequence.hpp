#pragma once

#include "../common/Common.hpp"
#include "../math/Math.hpp"
#include "Sequence.hpp"
#include "SequenceCounter.hpp"

namespace sequence {

typedef map<string, sptr<Sequence>> SequenceMap;
typedef map<string, EMatrix> BatchMap;

struct MixedBatch {
  BatchMap inputs;
  BatchMap outputs;
};

// Drives named input and output sequences in lock-step. All of them must agree on the number of
// samples and the batch size, so batch idx of every member covers the same step.
class MixedSequence {
public:
  MixedSequence(const SequenceMap &inputs, const SequenceMap &outputs);

  unsigned NumSamples(void) const { return counter.NumSamples(); }
  unsigned BatchSize(void) const { return counter.BatchSize(); }
  unsigned StepsPerEpoch(void) const { return counter.StepsPerEpoch(); }
  unsigned ElapsedEpochs(void) const { return counter.ElapsedEpochs(); }

  void OnEpochEnd(void);
  MixedBatch GetBatch(int idx) const;

  const SequenceMap &Inputs(void) const { return inputs; }
  const SequenceMap &Outputs(void) const { return outputs; }

private:
  SequenceMap inputs;
  SequenceMap outputs;
  SequenceCounter counter;
};
}
