// Fingering engine implementation.

#include "fingering/fingering_engine.h"

#include <cstdio>
#include <utility>

#include "fingering/state_generator.h"

namespace akkordio {

namespace {

bool isNonNegative(float val) { return val >= 0.0f; }  // False for NaN too.

}  // namespace

FingeringEngine::FingeringEngine(ButtonLayout layout, const FingeringConfig& config)
    : layout_(std::move(layout)), config_(config) {}

NodeState FingeringEngine::makeStartNode() const {
  NodeState start;
  start.geometry.centroid =
      config_.has_start_position ? config_.start_position : layout_.physicalCenter();
  start.bellows = config_.start_bellows;
  start.event_index = -1;
  start.parent = -1;
  return start;
}

bool FingeringEngine::validateWeights(std::string& message) const {
  const FingeringWeights& weights = config_.weights;
  if (!isNonNegative(weights.distance_weight) || !isNonNegative(weights.row_jump_weight) ||
      !isNonNegative(weights.crossing_penalty)) {
    message = "distance, row jump and crossing weights must be non-negative";
    return false;
  }
  for (size_t idx = 0; idx < kNumFingers; ++idx) {
    if (!isNonNegative(weights.finger_weakness[idx])) {
      message = "finger weakness for finger " + std::to_string(idx + 1) + " is negative";
      return false;
    }
  }
  if (!isNonNegative(weights.pivot_factor)) {
    message = "pivot factor must be non-negative";
    return false;
  }
  if (!isNonNegative(weights.bellows_shift_bonus) || weights.bellows_shift_bonus > 1.0f) {
    message = "bellows shift bonus must be within [0, 1]";
    return false;
  }
  return true;
}

FingeringResult FingeringEngine::solve(const std::vector<MusicalEvent>& events) const {
  FingeringResult result;
  result.solution.layout_system = layoutSystemToString(layout_.system());

  if (!validateWeights(result.error_message)) {
    result.error = FingeringError::InvalidInput;
    return result;
  }

  if (events.empty()) {
    result.success = true;
    result.solution.is_optimal = true;
    result.solution.is_complete = true;
    return result;
  }

  if (layout_.empty()) {
    result.error = FingeringError::InvalidInput;
    result.error_message = "layout has no buttons";
    return result;
  }

  MappingValidation mapping = validateEvents(events, layout_);
  if (!mapping.valid) {
    result.error = FingeringError::UnmappablePitch;
    result.error_message = "pitch " + std::to_string(mapping.first_unmapped_pitch) +
                           " at event " + std::to_string(mapping.first_unmapped_event) +
                           " is not on the layout";
    if (config_.verbose) {
      std::fprintf(stderr, "[FingeringEngine] %s (%zu of %zu notes unmapped)\n",
                   result.error_message.c_str(), mapping.unmapped_notes, mapping.total_notes);
    }
    return result;
  }

  CostModel cost_model(config_.weights, layout_.geometry());
  StateGenerator generator(layout_, cost_model);
  SearchEngine search(generator, cost_model, config_.limits, config_.verbose);

  if (config_.verbose) {
    std::fprintf(stderr, "[FingeringEngine] solving %zu events on %s layout (%zu buttons)\n",
                 events.size(), result.solution.layout_system.c_str(), layout_.buttons().size());
  }

  const NodeState start = makeStartNode();
  SearchResult found = search.search(start, events);

  result.stats = found.stats;
  result.solution = buildSolution(start, found.path, events);
  result.solution.layout_system = layoutSystemToString(layout_.system());
  result.solution.expansions = found.stats.expansions;
  result.solution.is_complete = found.path.size() == events.size();

  switch (found.outcome) {
    case SearchOutcome::Complete:
      result.success = true;
      result.solution.is_optimal = found.optimal;
      break;
    case SearchOutcome::Exhausted:
      result.error = FingeringError::NoFeasiblePath;
      result.error_message = "no feasible fingering for event " +
                             std::to_string(found.stats.furthest_event + 1) + " of " +
                             std::to_string(events.size());
      break;
    case SearchOutcome::BudgetExceeded:
      result.error = FingeringError::TimeoutExceeded;
      result.success = result.solution.is_complete;
      result.error_message = "search budget exceeded after " +
                             std::to_string(found.stats.expansions) + " expansions";
      if (!result.solution.is_complete) {
        result.error_message += "; partial fingering covers " +
                                std::to_string(found.path.size()) + " of " +
                                std::to_string(events.size()) + " events";
      }
      break;
  }

  if (config_.verbose) {
    std::fprintf(stderr, "[FingeringEngine] %s: cost=%.3f events=%zu/%zu optimal=%d\n",
                 fingeringErrorToString(result.error), result.solution.total_cost,
                 result.solution.events.size(), events.size(),
                 result.solution.is_optimal ? 1 : 0);
  }
  return result;
}

FingeringSolution FingeringEngine::buildSolution(const NodeState& start,
                                                 const std::vector<NodeState>& path,
                                                 const std::vector<MusicalEvent>& events) const {
  FingeringSolution solution;
  const NodeState* prev = &start;

  for (const auto& node : path) {
    const MusicalEvent& event = events[static_cast<size_t>(node.event_index)];
    EventFingering fingering;
    fingering.event_index = static_cast<uint32_t>(node.event_index);
    fingering.measure = event.measure;
    fingering.beat = event.beat;
    fingering.bellows = node.bellows;
    fingering.step_cost = node.g - prev->g;

    for (const auto& state : node.fingers) {
      if (state.isFree()) continue;
      FingeringAssignment assignment;
      assignment.pitch = state.pitch;
      assignment.finger = state.finger;
      assignment.button = state.button;
      assignment.is_crossing = CostModel::isFingerCrossing(node, state.finger);
      assignment.is_held = state.status == FingerStatus::LockedHolding;
      fingering.assignments.push_back(assignment);
    }

    solution.events.push_back(std::move(fingering));
    prev = &node;
  }

  solution.total_cost = path.empty() ? 0.0f : path.back().g;
  return solution;
}

FingeringResult solveFingering(const ButtonLayout& layout, const std::vector<MusicalEvent>& events,
                               const FingeringConfig& config) {
  FingeringEngine engine(layout, config);
  return engine.solve(events);
}

}  // namespace akkordio
