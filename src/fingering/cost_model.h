// Biomechanical cost model for hand transitions on a button keyboard.

#ifndef AKKORDIO_FINGERING_COST_MODEL_H
#define AKKORDIO_FINGERING_COST_MODEL_H

#include <vector>

#include "core/musical_event.h"
#include "fingering/fingering_config.h"
#include "fingering/fingering_types.h"
#include "instrument/accordion/button_layout.h"

namespace akkordio {

/// @brief Component breakdown of one transition's cost.
struct TransitionCost {
  float distance_cost = 0.0f;     // Centroid travel after discounts
  float row_cost = 0.0f;          // Row travel after discounts
  float crossing_penalty = 0.0f;
  float weakness_penalty = 0.0f;
  bool pivot = false;             // Some finger stayed on its button
  bool bellows_shift = false;     // Bellows direction changed at this event
  float total = 0.0f;             // Clamped sum, always >= 0
};

/// @brief Pure cost functions over hand configurations.
///
/// Holds the weights and the layout's physical spacing; every method is
/// const and free of side effects, so one model can be shared by concurrent
/// expansions.
class CostModel {
 public:
  CostModel(const FingeringWeights& weights, const LayoutGeometry& geometry);

  /// @brief Euclidean distance in mm between two hand centroids.
  ///
  /// Row and column deltas are scaled by their spacing independently and
  /// combined by Pythagoras.
  float distance(const HandGeometry& from, const HandGeometry& to) const;

  /// @brief Physical distance in mm between two buttons.
  float buttonDistance(const ButtonPosition& from, const ButtonPosition& to) const;

  /// @brief Maximum pairwise physical distance among non-free fingers.
  float span(const HandFingers& fingers) const;
  float span(const NodeState& node) const { return span(node.fingers); }

  /// @brief True if a lower-index finger sits at a strictly higher column
  /// than a higher-index finger.
  static bool isGeometricInversion(const NodeState& node);

  /// @brief Sum of column gaps over all inverted finger pairs.
  static float crossingSeverity(const NodeState& node);

  /// @brief True if the given finger belongs to an inverted pair.
  static bool isFingerCrossing(const NodeState& node, uint8_t finger);

  /// @brief True if an inverted pair exceeds the anatomical row/column limit.
  bool isInversionImpossible(const NodeState& node) const;

  /// @brief Check one ordered pair (lower.finger < higher.finger) against
  /// the inversion hard limit.
  bool isPairInversionImpossible(const FingerState& lower, const FingerState& higher) const;

  /// @brief Recompute the derived hand geometry.
  /// @param fingers Finger states.
  /// @param fallback Centroid used when every finger is free.
  HandGeometry computeGeometry(const HandFingers& fingers, const GridPoint& fallback) const;

  /// @brief Cost of moving from prev to next while playing event.
  ///
  /// Order: additive travel terms, penalties, pivot multiplier on the
  /// additive part, bellows-shift discount on the distance part, clamp.
  TransitionCost transitionCost(const NodeState& prev, const NodeState& next,
                                const MusicalEvent& event) const;

  /// @brief Scalar edge cost (transitionCost().total).
  float edgeCost(const NodeState& prev, const NodeState& next,
                 const MusicalEvent& event) const {
    return transitionCost(prev, next, event).total;
  }

  /// @brief Admissible lower bounds on the cost still to pay.
  ///
  /// Element i is a lower bound on the total cost of events i..n-1 given
  /// any configuration that accounts for event i-1 (element 0 starts from
  /// the start centroid). The returned vector has events.size() + 1 entries;
  /// the last is 0.
  std::vector<float> remainingCostBounds(const GridPoint& start,
                                         const std::vector<MusicalEvent>& events,
                                         const ButtonLayout& layout) const;

  const FingeringWeights& weights() const { return weights_; }
  const LayoutGeometry& geometry() const { return geometry_; }

 private:
  /// True if some finger occupies the same button in both configurations.
  static bool hasPivotFinger(const NodeState& prev, const NodeState& next);

  FingeringWeights weights_;
  LayoutGeometry geometry_;
};

}  // namespace akkordio

#endif  // AKKORDIO_FINGERING_COST_MODEL_H
