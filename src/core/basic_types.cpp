// Implementation of enum-to-string and string-to-enum conversions.

#include "core/basic_types.h"

#include <cctype>

namespace akkordio {

namespace {

constexpr const char* kNoteNames[12] = {"C",  "C#", "D",  "D#", "E",  "F",
                                        "F#", "G",  "G#", "A",  "A#", "B"};

std::string toLower(const std::string& str) {
  std::string result = str;
  for (auto& chr : result) {
    chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  }
  return result;
}

}  // namespace

const char* bellowsDirectionToString(BellowsDirection direction) {
  switch (direction) {
    case BellowsDirection::Unspecified: return "unspecified";
    case BellowsDirection::Push:        return "push";
    case BellowsDirection::Pull:        return "pull";
    case BellowsDirection::Neutral:     return "neutral";
  }
  return "unspecified";
}

BellowsDirection bellowsDirectionFromString(const std::string& str) {
  std::string lower = toLower(str);
  if (lower == "push") return BellowsDirection::Push;
  if (lower == "pull") return BellowsDirection::Pull;
  if (lower == "neutral") return BellowsDirection::Neutral;
  return BellowsDirection::Unspecified;
}

const char* fingerStatusToString(FingerStatus status) {
  switch (status) {
    case FingerStatus::Free:          return "Free";
    case FingerStatus::Pressing:      return "Pressing";
    case FingerStatus::LockedHolding: return "LockedHolding";
  }
  return "Unknown";
}

const char* fingeringErrorToString(FingeringError error) {
  switch (error) {
    case FingeringError::None:            return "None";
    case FingeringError::UnmappablePitch: return "UnmappablePitch";
    case FingeringError::NoFeasiblePath:  return "NoFeasiblePath";
    case FingeringError::TimeoutExceeded: return "TimeoutExceeded";
    case FingeringError::InvalidInput:    return "InvalidInput";
  }
  return "Unknown";
}

std::string midiToNoteName(uint8_t pitch) {
  int octave = static_cast<int>(pitch) / 12 - 1;
  return std::string(kNoteNames[pitch % 12]) + std::to_string(octave);
}

}  // namespace akkordio
