// Basic types for accordion fingering assignment.

#ifndef AKKORDIO_CORE_BASIC_TYPES_H
#define AKKORDIO_CORE_BASIC_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace akkordio {

/// Number of fingers on one hand (1 = thumb ... 5 = pinky).
constexpr uint8_t kNumFingers = 5;

/// Highest valid MIDI pitch.
constexpr uint8_t kMaxMidiPitch = 127;

/// Number of distinct MIDI pitches (0-127).
constexpr size_t kMidiPitchCount = 128;

// ---------------------------------------------------------------------------
// Bellows
// ---------------------------------------------------------------------------

/// @brief Bellows air direction.
///
/// Unspecified is only meaningful as an input hint ("no information");
/// a hand configuration always carries Push, Pull or Neutral.
enum class BellowsDirection : uint8_t {
  Unspecified,
  Push,
  Pull,
  Neutral
};

/// @brief Convert BellowsDirection to its lowercase name ("push", "pull", ...).
const char* bellowsDirectionToString(BellowsDirection direction);

/// @brief Parse a BellowsDirection from a string.
/// @param str "push", "pull", "neutral" (case-insensitive). Anything else maps
///        to Unspecified.
BellowsDirection bellowsDirectionFromString(const std::string& str);

// ---------------------------------------------------------------------------
// Fingers
// ---------------------------------------------------------------------------

/// @brief What a finger is doing at one event.
enum class FingerStatus : uint8_t {
  Free,          // Not touching any button
  Pressing,      // Struck a new note at this event
  LockedHolding  // Sustaining a note tied from the previous event
};

/// @brief Convert FingerStatus to string.
const char* fingerStatusToString(FingerStatus status);

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/// @brief Failure classification surfaced by the fingering engine.
enum class FingeringError : uint8_t {
  None,
  UnmappablePitch,   // A pitch has no button on the layout (fatal)
  NoFeasiblePath,    // Every search branch died (fatal)
  TimeoutExceeded,   // Search budget exhausted (recovered, non-optimal)
  InvalidInput       // Malformed request or unusable layout
};

/// @brief Convert FingeringError to string.
const char* fingeringErrorToString(FingeringError error);

// ---------------------------------------------------------------------------
// Pitch naming
// ---------------------------------------------------------------------------

/// @brief Convert a MIDI pitch to a note name with octave (60 -> "C4").
/// Uses sharps for black keys.
std::string midiToNoteName(uint8_t pitch);

}  // namespace akkordio

#endif  // AKKORDIO_CORE_BASIC_TYPES_H
