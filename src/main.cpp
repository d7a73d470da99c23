#include "common/Common.hpp"
#include "math/Math.hpp"
#include "sequence/IndexOutOfRange.hpp"
#include "sequence/MixedSequence.hpp"
#include "sequence/SequenceSpec.hpp"
#include "sequence/VectorSequence.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

using namespace sequence;

struct DemoSpec {
  unsigned numSamples = 10;
  unsigned epochs = 2;
  SequenceSpec batching;
};

static bool parseUnsigned(const char *arg, unsigned long &out);
static bool parseArgs(int argc, char **argv, DemoSpec &spec);
static void printBatch(const string &name, const EMatrix &batch);

int main(int argc, char **argv) {
  DemoSpec spec;
  spec.batching.batchSize = 3;

  if (!parseArgs(argc, argv, spec)) {
    cerr << "usage: " << argv[0] << " [numSamples] [batchSize] [epochs] [seed]" << endl;
    return 1;
  }

  EMatrix features(spec.numSamples, 2);
  EMatrix targets(spec.numSamples, 1);
  for (unsigned i = 0; i < spec.numSamples; i++) {
    features(i, 0) = i;
    features(i, 1) = 2.0f * i;
    targets(i, 0) = i;
  }

  uptr<MixedSequence> mixed;
  try {
    SequenceMap inputs;
    inputs["features"] = make_shared<VectorSequence>(features, spec.batching);
    SequenceMap outputs;
    outputs["targets"] = make_shared<VectorSequence>(targets, spec.batching);
    mixed = make_unique<MixedSequence>(inputs, outputs);
  } catch (const std::invalid_argument &e) {
    cerr << "Error, " << e.what() << endl;
    return 1;
  }

  cout << "samples: " << mixed->NumSamples() << " batch size: " << mixed->BatchSize()
       << " steps per epoch: " << mixed->StepsPerEpoch() << " seed: " << spec.batching.seed
       << endl;

  for (unsigned epoch = 0; epoch < spec.epochs; epoch++) {
    cout << "epoch " << mixed->ElapsedEpochs() << endl;

    for (unsigned step = 0; step < mixed->StepsPerEpoch(); step++) {
      MixedBatch batch = mixed->GetBatch(step);
      cout << " step " << step << endl;
      for (const auto &entry : batch.inputs) {
        printBatch(entry.first, entry.second);
      }
      for (const auto &entry : batch.outputs) {
        printBatch(entry.first, entry.second);
      }
    }

    mixed->OnEpochEnd();
  }

  // Asking past the last step is a loop bounds bug in the caller.
  try {
    mixed->GetBatch(mixed->StepsPerEpoch());
  } catch (const IndexOutOfRange &e) {
    cout << "out of range: " << e.what() << endl;
  }

  cout << "finished after " << mixed->ElapsedEpochs() << " epochs" << endl;
  return 0;
}

bool parseUnsigned(const char *arg, unsigned long &out) {
  char *end = nullptr;
  out = strtoul(arg, &end, 10);
  return end != arg && *end == '\0' && arg[0] != '-';
}

bool parseArgs(int argc, char **argv, DemoSpec &spec) {
  if (argc > 5) {
    return false;
  }

  unsigned long values[4] = {spec.numSamples, spec.batching.batchSize, spec.epochs,
                             spec.batching.seed};
  for (int i = 1; i < argc; i++) {
    if (!parseUnsigned(argv[i], values[i - 1])) {
      cerr << "Error, not a non-negative integer: " << argv[i] << endl;
      return false;
    }
  }

  spec.numSamples = static_cast<unsigned>(values[0]);
  spec.batching.batchSize = static_cast<unsigned>(values[1]);
  spec.epochs = static_cast<unsigned>(values[2]);
  spec.batching.seed = static_cast<uint32_t>(values[3]);
  return true;
}

void printBatch(const string &name, const EMatrix &batch) {
  cout << "  " << name << " (" << batch.rows() << " rows)" << endl;
  cout << batch << endl;
}
