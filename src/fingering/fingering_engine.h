// Fingering engine: validates input, drives the search, builds the solution.

#ifndef AKKORDIO_FINGERING_FINGERING_ENGINE_H
#define AKKORDIO_FINGERING_FINGERING_ENGINE_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/musical_event.h"
#include "fingering/cost_model.h"
#include "fingering/fingering_config.h"
#include "fingering/fingering_types.h"
#include "fingering/search_engine.h"
#include "instrument/accordion/button_layout.h"

namespace akkordio {

/// @brief Result of one solve.
///
/// On NoFeasiblePath the solution holds the furthest partial path found. On
/// TimeoutExceeded success is true only if the best-effort path covers every
/// event.
struct FingeringResult {
  bool success = false;
  FingeringError error = FingeringError::None;
  std::string error_message;
  FingeringSolution solution;
  SearchStats stats;
};

/// @brief Right-hand fingering solver for one layout.
///
/// solve() is const and owns all per-call search state, so one engine may be
/// shared between threads.
class FingeringEngine {
 public:
  explicit FingeringEngine(ButtonLayout layout, const FingeringConfig& config = FingeringConfig{});

  /// @brief Find the cheapest fingering of events.
  /// @param events Time-ordered events for the right hand.
  /// @return Result with solution, error kind and search statistics.
  FingeringResult solve(const std::vector<MusicalEvent>& events) const;

  /// @brief Start configuration: all fingers free, centroid at the layout
  /// center (or the configured start position), configured bellows.
  NodeState makeStartNode() const;

  const ButtonLayout& layout() const { return layout_; }
  const FingeringConfig& config() const { return config_; }

 private:
  /// Reject weights that would break the non-negative edge cost.
  bool validateWeights(std::string& message) const;

  /// Convert the node chain into per-event assignments.
  FingeringSolution buildSolution(const NodeState& start, const std::vector<NodeState>& path,
                                  const std::vector<MusicalEvent>& events) const;

  ButtonLayout layout_;
  FingeringConfig config_;
};

/// @brief Convenience wrapper: construct an engine and solve once.
FingeringResult solveFingering(const ButtonLayout& layout, const std::vector<MusicalEvent>& events,
                               const FingeringConfig& config = FingeringConfig{});

}  // namespace akkordio

#endif  // AKKORDIO_FINGERING_FINGERING_ENGINE_H
