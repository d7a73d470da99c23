#pragma once

#include <stdexcept>
#include <string>

namespace sequence {

// Raised when a batch index falls outside [0, StepsPerEpoch).
class IndexOutOfRange : public std::out_of_range {
public:
  IndexOutOfRange(int index, unsigned stepsPerEpoch)
      : std::out_of_range(describe(index, stepsPerEpoch)), index(index),
        stepsPerEpoch(stepsPerEpoch) {}

  int Index(void) const { return index; }
  unsigned StepsPerEpoch(void) const { return stepsPerEpoch; }

private:
  int index;
  unsigned stepsPerEpoch;

  static std::string describe(int index, unsigned stepsPerEpoch) {
    if (index < 0) {
      return "Given index " + std::to_string(index) +
             " is negative, the number of steps per epoch of this sequence is " +
             std::to_string(stepsPerEpoch) + ".";
    }
    return "Given index " + std::to_string(index) +
           " is greater than the number of steps per epoch of this sequence " +
           std::to_string(stepsPerEpoch) + ".";
  }
};
}
