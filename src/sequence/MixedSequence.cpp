#include "MixedSequence.hpp"
#include "IndexOutOfRange.hpp"

#include <stdexcept>

using namespace sequence;

static const Sequence &firstInput(const SequenceMap &inputs);
static void checkCompatible(const SequenceMap &sequences, const string &role,
                            const Sequence &reference);
static BatchMap batchesOf(const SequenceMap &sequences, int idx);

MixedSequence::MixedSequence(const SequenceMap &inputs, const SequenceMap &outputs)
    : inputs(inputs), outputs(outputs),
      counter(firstInput(inputs).NumSamples(), firstInput(inputs).BatchSize(),
              firstInput(inputs).ElapsedEpochs()) {
  if (outputs.empty()) {
    throw std::invalid_argument("A mixed sequence needs at least one output sequence.");
  }

  const Sequence &reference = firstInput(inputs);
  checkCompatible(inputs, "input", reference);
  checkCompatible(outputs, "output", reference);
}

void MixedSequence::OnEpochEnd(void) {
  counter.OnEpochEnd();

  for (auto &entry : inputs) {
    entry.second->OnEpochEnd();
  }
  for (auto &entry : outputs) {
    entry.second->OnEpochEnd();
  }
}

MixedBatch MixedSequence::GetBatch(int idx) const {
  if (!counter.IsValidStep(idx)) {
    throw IndexOutOfRange(idx, counter.StepsPerEpoch());
  }

  MixedBatch result;
  result.inputs = batchesOf(inputs, idx);
  result.outputs = batchesOf(outputs, idx);
  return result;
}

const Sequence &firstInput(const SequenceMap &inputs) {
  if (inputs.empty()) {
    throw std::invalid_argument("A mixed sequence needs at least one input sequence.");
  }
  if (!inputs.begin()->second) {
    throw std::invalid_argument("The input sequence '" + inputs.begin()->first + "' is null.");
  }
  return *inputs.begin()->second;
}

void checkCompatible(const SequenceMap &sequences, const string &role,
                     const Sequence &reference) {
  for (const auto &entry : sequences) {
    if (!entry.second) {
      throw std::invalid_argument("The " + role + " sequence '" + entry.first + "' is null.");
    }

    const Sequence &seq = *entry.second;
    if (seq.BatchSize() != reference.BatchSize()) {
      throw std::invalid_argument("The " + role + " sequence '" + entry.first +
                                  "' has batch size " + to_string(seq.BatchSize()) +
                                  ", expected " + to_string(reference.BatchSize()) + ".");
    }
    if (seq.NumSamples() != reference.NumSamples()) {
      throw std::invalid_argument("The " + role + " sequence '" + entry.first + "' has " +
                                  to_string(seq.NumSamples()) + " samples, expected " +
                                  to_string(reference.NumSamples()) + ".");
    }
  }
}

BatchMap batchesOf(const SequenceMap &sequences, int idx) {
  BatchMap result;
  for (const auto &entry : sequences) {
    result.emplace(entry.first, entry.second->GetBatch(idx));
  }
  return result;
}
