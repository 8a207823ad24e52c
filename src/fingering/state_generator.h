// Successor generation: legal hand configurations for the next event.

#ifndef AKKORDIO_FINGERING_STATE_GENERATOR_H
#define AKKORDIO_FINGERING_STATE_GENERATOR_H

#include <vector>

#include "core/musical_event.h"
#include "fingering/cost_model.h"
#include "fingering/fingering_types.h"
#include "instrument/accordion/button_layout.h"

namespace akkordio {

/// @brief Enumerates legal successor configurations.
///
/// Tied notes lock the finger that held them; the remaining fingers are
/// assigned to the event's new notes in every combination of finger and
/// candidate button. Configurations wider than the layout's max span or with
/// an anatomically impossible inversion are discarded.
///
/// A branch that cannot continue (tie without a holding finger, no viable
/// assignment) yields an empty list; that is normal pruning, not an error.
class StateGenerator {
 public:
  /// @param layout Pitch-to-button oracle (must outlive the generator).
  /// @param cost_model Geometry and hard-limit predicates (must outlive the generator).
  StateGenerator(const ButtonLayout& layout, const CostModel& cost_model);

  /// @brief Generate all legal configurations for event.
  /// @param current Configuration accounting for event_index - 1.
  /// @param event The event to play.
  /// @param event_index Index of event in the sequence.
  /// @return Successor nodes in deterministic order; g/h/f/parent are left for the caller.
  std::vector<NodeState> successors(const NodeState& current, const MusicalEvent& event,
                                    int event_index) const;

  /// @brief Resolve which finger holds each tied note of event.
  /// @param current Previous configuration.
  /// @param event Event whose tied notes are resolved.
  /// @param holders Output: finger number per note (0 for untied notes).
  /// @return False if some tied note has no holding finger in current.
  static bool resolveHeldNotes(const NodeState& current, const MusicalEvent& event,
                               std::vector<uint8_t>& holders);

  const ButtonLayout& layout() const { return layout_; }

 private:
  /// Depth-first enumeration of new-note assignments.
  void assignNewNotes(const std::vector<const EventNote*>& new_notes, size_t note_idx,
                      NodeState& draft, std::vector<ButtonPosition>& used_buttons,
                      std::vector<NodeState>& out) const;

  /// True if placing finger `placed` keeps the draft within hard limits.
  bool placementFeasible(const NodeState& draft, uint8_t placed) const;

  const ButtonLayout& layout_;
  const CostModel& cost_model_;
};

}  // namespace akkordio

#endif  // AKKORDIO_FINGERING_STATE_GENERATOR_H
