// Score input for one hand: time-ordered note events.

#ifndef AKKORDIO_CORE_MUSICAL_EVENT_H
#define AKKORDIO_CORE_MUSICAL_EVENT_H

#include <cstdint>
#include <vector>

#include "core/basic_types.h"

namespace akkordio {

/// @brief One note sounding in an event.
struct EventNote {
  uint8_t pitch = 60;       // MIDI pitch
  bool tied_from_prev = false;  // Held by the same finger since the previous event
  BellowsDirection bellows = BellowsDirection::Unspecified;  // Per-note hint
};

/// @brief One time-slice of the score for one hand.
///
/// Produced by the external score parser and read-only afterwards. An event
/// with no notes is a rest.
struct MusicalEvent {
  std::vector<EventNote> notes;
  BellowsDirection bellows = BellowsDirection::Unspecified;
  bool is_downbeat = false;  // Metrically strong
  uint16_t measure = 0;      // 1-based; 0 = unknown
  float beat = 0.0f;         // 1-based beat position in the measure
  float duration = 0.0f;     // In quarter notes

  /// @brief Effective bellows hint: the event-level hint if specified,
  /// otherwise the first specified per-note hint.
  BellowsDirection bellowsHint() const {
    if (bellows != BellowsDirection::Unspecified) return bellows;
    for (const auto& note : notes) {
      if (note.bellows != BellowsDirection::Unspecified) return note.bellows;
    }
    return BellowsDirection::Unspecified;
  }

  bool isRest() const { return notes.empty(); }
};

/// @brief Build an event from plain pitches (none tied).
inline MusicalEvent makeEvent(const std::vector<uint8_t>& pitches, bool is_downbeat = false) {
  MusicalEvent event;
  event.is_downbeat = is_downbeat;
  for (uint8_t pitch : pitches) {
    EventNote note;
    note.pitch = pitch;
    event.notes.push_back(note);
  }
  return event;
}

}  // namespace akkordio

#endif  // AKKORDIO_CORE_MUSICAL_EVENT_H
