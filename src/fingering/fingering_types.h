// Hand-configuration and solution types for fingering search.

#ifndef AKKORDIO_FINGERING_FINGERING_TYPES_H
#define AKKORDIO_FINGERING_FINGERING_TYPES_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "instrument/accordion/button_layout.h"

namespace akkordio {

/// @brief State of one finger at one event.
///
/// button and pitch are only meaningful when status != Free.
struct FingerState {
  uint8_t finger = 1;  // 1 = thumb ... 5 = pinky
  FingerStatus status = FingerStatus::Free;
  ButtonPosition button;
  uint8_t pitch = 0;
  uint16_t hold_count = 0;  // Consecutive events the note has been held

  bool isFree() const { return status == FingerStatus::Free; }

  /// @brief Lift the finger off its button.
  void release() {
    status = FingerStatus::Free;
    button = ButtonPosition{};
    pitch = 0;
    hold_count = 0;
  }
};

/// Five fingers, index 0 = finger 1 (thumb).
using HandFingers = std::array<FingerState, kNumFingers>;

/// @brief Derived shape of the hand at one configuration.
struct HandGeometry {
  GridPoint centroid;          // Mean row/column of non-free fingers
  uint8_t active_count = 0;    // Non-free fingers
  float span_mm = 0.0f;        // Maximum pairwise physical distance
  float wrist_angle_deg = 0.0f;  // Diagnostic only, never used in cost
};

/// @brief A vertex of the fingering search.
///
/// Nodes live in the search arena; parent is an arena index (-1 for the root).
struct NodeState {
  HandFingers fingers;
  HandGeometry geometry;
  BellowsDirection bellows = BellowsDirection::Neutral;
  int event_index = -1;  // Last event accounted for; -1 = start
  int parent = -1;
  float g = 0.0f;
  float h = 0.0f;
  float f = 0.0f;

  NodeState() {
    for (uint8_t idx = 0; idx < kNumFingers; ++idx) {
      fingers[idx].finger = static_cast<uint8_t>(idx + 1);
    }
  }

  /// @brief Access by finger number (1-5).
  const FingerState& finger(uint8_t number) const { return fingers[number - 1]; }
  FingerState& finger(uint8_t number) { return fingers[number - 1]; }
};

/// @brief One note's fingering in the final solution.
struct FingeringAssignment {
  uint8_t pitch = 0;
  uint8_t finger = 0;
  ButtonPosition button;
  bool is_crossing = false;  // Finger takes part in an inversion
  bool is_held = false;      // Sustained from the previous event
};

/// @brief Fingering of one input event.
struct EventFingering {
  uint32_t event_index = 0;
  uint16_t measure = 0;
  float beat = 0.0f;
  BellowsDirection bellows = BellowsDirection::Neutral;
  float step_cost = 0.0f;  // Transition cost into this event
  std::vector<FingeringAssignment> assignments;  // Sorted by finger
};

/// @brief The externally visible fingering result.
struct FingeringSolution {
  std::vector<EventFingering> events;
  float total_cost = 0.0f;
  std::string algorithm = "astar";
  bool is_optimal = false;
  bool is_complete = false;  // One entry per input event
  uint32_t expansions = 0;
  std::string layout_system;
};

}  // namespace akkordio

#endif  // AKKORDIO_FINGERING_FINGERING_TYPES_H
