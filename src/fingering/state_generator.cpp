// Successor generation implementation.

#include "fingering/state_generator.h"

#include <algorithm>
#include <array>

namespace akkordio {

StateGenerator::StateGenerator(const ButtonLayout& layout, const CostModel& cost_model)
    : layout_(layout), cost_model_(cost_model) {}

bool StateGenerator::resolveHeldNotes(const NodeState& current, const MusicalEvent& event,
                                      std::vector<uint8_t>& holders) {
  holders.assign(event.notes.size(), 0);
  std::array<bool, kNumFingers + 1> claimed = {};

  for (size_t idx = 0; idx < event.notes.size(); ++idx) {
    const EventNote& note = event.notes[idx];
    if (!note.tied_from_prev) continue;

    uint8_t holder = 0;
    for (uint8_t finger = 1; finger <= kNumFingers; ++finger) {
      const FingerState& state = current.finger(finger);
      if (!state.isFree() && state.pitch == note.pitch && !claimed[finger]) {
        holder = finger;
        break;
      }
    }
    if (holder == 0) return false;  // Tie without history: branch is dead.

    claimed[holder] = true;
    holders[idx] = holder;
  }
  return true;
}

std::vector<NodeState> StateGenerator::successors(const NodeState& current,
                                                  const MusicalEvent& event,
                                                  int event_index) const {
  std::vector<NodeState> out;

  std::vector<uint8_t> holders;
  if (!resolveHeldNotes(current, event, holders)) return out;

  NodeState draft;
  draft.event_index = event_index;
  draft.parent = -1;
  BellowsDirection hint = event.bellowsHint();
  draft.bellows = hint != BellowsDirection::Unspecified ? hint : current.bellows;
  // A rest keeps the hand where it was.
  draft.geometry.centroid = current.geometry.centroid;

  std::vector<ButtonPosition> used_buttons;
  std::vector<const EventNote*> new_notes;
  size_t locked = 0;

  for (size_t idx = 0; idx < event.notes.size(); ++idx) {
    const EventNote& note = event.notes[idx];
    if (!note.tied_from_prev) {
      new_notes.push_back(&note);
      continue;
    }
    const FingerState& before = current.finger(holders[idx]);
    FingerState& held = draft.finger(holders[idx]);
    held = before;
    held.status = FingerStatus::LockedHolding;
    held.hold_count = static_cast<uint16_t>(before.hold_count + 1);
    used_buttons.push_back(before.button);
    ++locked;
  }

  if (new_notes.size() > kNumFingers - locked) return out;

  assignNewNotes(new_notes, 0, draft, used_buttons, out);
  return out;
}

void StateGenerator::assignNewNotes(const std::vector<const EventNote*>& new_notes,
                                    size_t note_idx, NodeState& draft,
                                    std::vector<ButtonPosition>& used_buttons,
                                    std::vector<NodeState>& out) const {
  if (note_idx == new_notes.size()) {
    NodeState node = draft;
    node.geometry = cost_model_.computeGeometry(node.fingers, draft.geometry.centroid);

    // Hard filters.
    if (node.geometry.span_mm > cost_model_.geometry().max_span_mm) return;
    if (cost_model_.isInversionImpossible(node)) return;

    out.push_back(node);
    return;
  }

  const EventNote& note = *new_notes[note_idx];
  const auto& positions = layout_.candidates(note.pitch);

  for (uint8_t finger = 1; finger <= kNumFingers; ++finger) {
    FingerState& slot = draft.finger(finger);
    if (!slot.isFree()) continue;

    for (const auto& pos : positions) {
      if (std::find(used_buttons.begin(), used_buttons.end(), pos) != used_buttons.end()) {
        continue;
      }

      slot.status = FingerStatus::Pressing;
      slot.button = pos;
      slot.pitch = note.pitch;
      slot.hold_count = 0;

      if (placementFeasible(draft, finger)) {
        used_buttons.push_back(pos);
        assignNewNotes(new_notes, note_idx + 1, draft, used_buttons, out);
        used_buttons.pop_back();
      }
      slot.release();
    }
  }
}

bool StateGenerator::placementFeasible(const NodeState& draft, uint8_t placed) const {
  const FingerState& moved = draft.finger(placed);
  float max_span = cost_model_.geometry().max_span_mm;

  for (const auto& other : draft.fingers) {
    if (other.finger == placed || other.isFree()) continue;
    if (cost_model_.buttonDistance(other.button, moved.button) > max_span) return false;

    bool impossible = other.finger < placed
                          ? cost_model_.isPairInversionImpossible(other, moved)
                          : cost_model_.isPairInversionImpossible(moved, other);
    if (impossible) return false;
  }
  return true;
}

}  // namespace akkordio
