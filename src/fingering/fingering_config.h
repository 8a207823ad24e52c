// Tunable weights, search budgets and solve options for the fingering engine.

#ifndef AKKORDIO_FINGERING_FINGERING_CONFIG_H
#define AKKORDIO_FINGERING_FINGERING_CONFIG_H

#include <array>
#include <cstdint>
#include <string>

#include "core/basic_types.h"
#include "instrument/accordion/button_layout.h"

namespace akkordio {

/// @brief Biomechanical cost weights for hand transitions.
///
/// Use the static factory methods for predefined profiles.
struct FingeringWeights {
  float distance_weight = 1.0f;      // Cost per mm of centroid travel
  float row_jump_weight = 2.0f;      // Cost per row of centroid travel
  float crossing_penalty = 25.0f;    // Cost per column of finger inversion
  /// Per-finger weakness (index 0 = thumb), charged for struck notes on downbeats.
  std::array<float, kNumFingers> finger_weakness = {2.0f, 0.0f, 0.0f, 4.0f, 8.0f};
  bool weakness_on_downbeats = true;
  float pivot_factor = 0.8f;         // Additive multiplier when a finger stays on its button
  float bellows_shift_bonus = 0.25f; // Distance discount fraction on a bellows change
  uint8_t max_inversion_columns = 2; // Hard limit on an inverted pair's column gap
  uint8_t max_inversion_rows = 3;    // Hard limit on an inverted pair's row gap

  /// @brief Default profile.
  static FingeringWeights standard() { return FingeringWeights{}; }

  /// @brief Lenient profile: cheaper crossings, wider inversions allowed.
  static FingeringWeights relaxed() {
    FingeringWeights weights;
    weights.crossing_penalty = 12.0f;
    weights.finger_weakness = {1.0f, 0.0f, 0.0f, 2.0f, 4.0f};
    weights.max_inversion_columns = 3;
    weights.max_inversion_rows = 4;
    return weights;
  }

  /// @brief Conservative profile: crossings expensive, at most one column deep.
  static FingeringWeights strict() {
    FingeringWeights weights;
    weights.row_jump_weight = 3.0f;
    weights.crossing_penalty = 50.0f;
    weights.finger_weakness = {4.0f, 0.0f, 0.0f, 6.0f, 12.0f};
    weights.pivot_factor = 0.7f;
    weights.max_inversion_columns = 1;
    weights.max_inversion_rows = 2;
    return weights;
  }
};

/// @brief Parse a weights profile name ("standard", "relaxed", "strict").
/// @param name Profile name.
/// @param weights Output weights (untouched when unrecognized).
/// @return True if the name was recognized.
bool weightsPresetFromString(const std::string& name, FingeringWeights& weights);

/// @brief Cooperative cancellation budgets. 0 disables a limit.
struct SearchLimits {
  uint32_t max_expansions = 200000;  // Node expansion budget
  uint32_t time_limit_ms = 0;        // Wall-clock budget
  uint32_t beam_width = 0;           // Maximum open-set size
};

/// @brief Full configuration of one solve.
struct FingeringConfig {
  FingeringWeights weights;
  SearchLimits limits;
  BellowsDirection start_bellows = BellowsDirection::Neutral;
  bool has_start_position = false;  ///< Use start_position instead of the layout center.
  GridPoint start_position;
  bool verbose = false;             ///< Log search progress to stderr.
};

}  // namespace akkordio

#endif  // AKKORDIO_FINGERING_FINGERING_CONFIG_H
