// Weights profile lookup.

#include "fingering/fingering_config.h"

namespace akkordio {

bool weightsPresetFromString(const std::string& name, FingeringWeights& weights) {
  if (name == "standard") {
    weights = FingeringWeights::standard();
  } else if (name == "relaxed") {
    weights = FingeringWeights::relaxed();
  } else if (name == "strict") {
    weights = FingeringWeights::strict();
  } else {
    return false;
  }
  return true;
}

}  // namespace akkordio
