// Cost model implementation.

#include "fingering/cost_model.h"

#include <algorithm>
#include <cmath>

namespace akkordio {

namespace {

constexpr float kRadToDeg = 57.29577951308232f;

/// @brief Axis-aligned box around every candidate button of an event.
struct CandidateBox {
  bool valid = false;
  float min_row = 0.0f;
  float max_row = 0.0f;
  float min_col = 0.0f;
  float max_col = 0.0f;

  void include(float row, float col) {
    if (!valid) {
      min_row = max_row = row;
      min_col = max_col = col;
      valid = true;
      return;
    }
    min_row = std::min(min_row, row);
    max_row = std::max(max_row, row);
    min_col = std::min(min_col, col);
    max_col = std::max(max_col, col);
  }
};

/// @brief Gap between two closed intervals (0 when they overlap).
float intervalGap(float a_min, float a_max, float b_min, float b_max) {
  return std::max(0.0f, std::max(b_min - a_max, a_min - b_max));
}

CandidateBox eventBox(const MusicalEvent& event, const ButtonLayout& layout) {
  CandidateBox box;
  for (const auto& note : event.notes) {
    for (const auto& pos : layout.candidates(note.pitch)) {
      box.include(static_cast<float>(pos.row), static_cast<float>(pos.column));
    }
  }
  return box;
}

}  // namespace

CostModel::CostModel(const FingeringWeights& weights, const LayoutGeometry& geometry)
    : weights_(weights), geometry_(geometry) {}

float CostModel::distance(const HandGeometry& from, const HandGeometry& to) const {
  float row_mm = (to.centroid.row - from.centroid.row) * geometry_.row_spacing_mm;
  float col_mm = (to.centroid.column - from.centroid.column) * geometry_.column_spacing_mm;
  return std::sqrt(row_mm * row_mm + col_mm * col_mm);
}

float CostModel::buttonDistance(const ButtonPosition& from, const ButtonPosition& to) const {
  float row_mm = static_cast<float>(static_cast<int>(to.row) - static_cast<int>(from.row)) *
                 geometry_.row_spacing_mm;
  float col_mm = static_cast<float>(static_cast<int>(to.column) - static_cast<int>(from.column)) *
                 geometry_.column_spacing_mm;
  return std::sqrt(row_mm * row_mm + col_mm * col_mm);
}

float CostModel::span(const HandFingers& fingers) const {
  float widest = 0.0f;
  for (size_t lo = 0; lo < fingers.size(); ++lo) {
    if (fingers[lo].isFree()) continue;
    for (size_t hi = lo + 1; hi < fingers.size(); ++hi) {
      if (fingers[hi].isFree()) continue;
      widest = std::max(widest, buttonDistance(fingers[lo].button, fingers[hi].button));
    }
  }
  return widest;
}

bool CostModel::isGeometricInversion(const NodeState& node) {
  for (size_t lo = 0; lo < node.fingers.size(); ++lo) {
    if (node.fingers[lo].isFree()) continue;
    for (size_t hi = lo + 1; hi < node.fingers.size(); ++hi) {
      if (node.fingers[hi].isFree()) continue;
      if (node.fingers[lo].button.column > node.fingers[hi].button.column) return true;
    }
  }
  return false;
}

float CostModel::crossingSeverity(const NodeState& node) {
  float severity = 0.0f;
  for (size_t lo = 0; lo < node.fingers.size(); ++lo) {
    if (node.fingers[lo].isFree()) continue;
    for (size_t hi = lo + 1; hi < node.fingers.size(); ++hi) {
      if (node.fingers[hi].isFree()) continue;
      int gap = static_cast<int>(node.fingers[lo].button.column) -
                static_cast<int>(node.fingers[hi].button.column);
      if (gap > 0) severity += static_cast<float>(gap);
    }
  }
  return severity;
}

bool CostModel::isFingerCrossing(const NodeState& node, uint8_t finger) {
  if (finger < 1 || finger > kNumFingers) return false;
  const FingerState& self = node.finger(finger);
  if (self.isFree()) return false;

  for (const auto& other : node.fingers) {
    if (other.finger == finger || other.isFree()) continue;
    bool inverted = other.finger < finger ? other.button.column > self.button.column
                                          : self.button.column > other.button.column;
    if (inverted) return true;
  }
  return false;
}

bool CostModel::isPairInversionImpossible(const FingerState& lower,
                                          const FingerState& higher) const {
  if (lower.isFree() || higher.isFree()) return false;
  int col_gap = static_cast<int>(lower.button.column) - static_cast<int>(higher.button.column);
  if (col_gap <= 0) return false;  // Not inverted
  int row_gap = std::abs(static_cast<int>(lower.button.row) - static_cast<int>(higher.button.row));
  return col_gap > weights_.max_inversion_columns || row_gap > weights_.max_inversion_rows;
}

bool CostModel::isInversionImpossible(const NodeState& node) const {
  for (size_t lo = 0; lo < node.fingers.size(); ++lo) {
    for (size_t hi = lo + 1; hi < node.fingers.size(); ++hi) {
      if (isPairInversionImpossible(node.fingers[lo], node.fingers[hi])) return true;
    }
  }
  return false;
}

HandGeometry CostModel::computeGeometry(const HandFingers& fingers,
                                        const GridPoint& fallback) const {
  HandGeometry geom;
  float row_sum = 0.0f;
  float col_sum = 0.0f;
  const FingerState* lowest = nullptr;
  const FingerState* highest = nullptr;

  for (const auto& state : fingers) {
    if (state.isFree()) continue;
    ++geom.active_count;
    row_sum += static_cast<float>(state.button.row);
    col_sum += static_cast<float>(state.button.column);
    if (lowest == nullptr) lowest = &state;
    highest = &state;
  }

  if (geom.active_count == 0) {
    geom.centroid = fallback;
    return geom;
  }

  geom.centroid.row = row_sum / static_cast<float>(geom.active_count);
  geom.centroid.column = col_sum / static_cast<float>(geom.active_count);
  geom.span_mm = span(fingers);

  if (lowest != highest) {
    float dy = static_cast<float>(static_cast<int>(highest->button.row) -
                                  static_cast<int>(lowest->button.row)) *
               geometry_.row_spacing_mm;
    float dx = static_cast<float>(static_cast<int>(highest->button.column) -
                                  static_cast<int>(lowest->button.column)) *
               geometry_.column_spacing_mm;
    geom.wrist_angle_deg = std::atan2(dy, dx) * kRadToDeg;
  }
  return geom;
}

bool CostModel::hasPivotFinger(const NodeState& prev, const NodeState& next) {
  for (size_t idx = 0; idx < kNumFingers; ++idx) {
    const FingerState& before = prev.fingers[idx];
    const FingerState& after = next.fingers[idx];
    if (!before.isFree() && !after.isFree() && before.button == after.button) return true;
  }
  return false;
}

TransitionCost CostModel::transitionCost(const NodeState& prev, const NodeState& next,
                                         const MusicalEvent& event) const {
  TransitionCost cost;

  // 1. Additive travel.
  cost.distance_cost = distance(prev.geometry, next.geometry) * weights_.distance_weight;
  cost.row_cost = std::fabs(next.geometry.centroid.row - prev.geometry.centroid.row) *
                  weights_.row_jump_weight;

  // 2. Penalties.
  if (isGeometricInversion(next)) {
    cost.crossing_penalty = crossingSeverity(next) * weights_.crossing_penalty;
  }
  if (event.is_downbeat && weights_.weakness_on_downbeats) {
    for (size_t idx = 0; idx < kNumFingers; ++idx) {
      if (next.fingers[idx].status == FingerStatus::Pressing) {
        cost.weakness_penalty += weights_.finger_weakness[idx];
      }
    }
  }

  // 3. Pivot finger anchors the hand.
  cost.pivot = hasPivotFinger(prev, next);
  if (cost.pivot) {
    cost.distance_cost *= weights_.pivot_factor;
    cost.row_cost *= weights_.pivot_factor;
  }

  // 4. A bellows reversal realigns the hand.
  BellowsDirection hint = event.bellowsHint();
  if (hint != BellowsDirection::Unspecified && hint != prev.bellows) {
    cost.bellows_shift = true;
    cost.distance_cost *= 1.0f - weights_.bellows_shift_bonus;
  }

  cost.total = std::max(0.0f, cost.distance_cost + cost.row_cost + cost.crossing_penalty +
                                  cost.weakness_penalty);
  return cost;
}

std::vector<float> CostModel::remainingCostBounds(const GridPoint& start,
                                                  const std::vector<MusicalEvent>& events,
                                                  const ButtonLayout& layout) const {
  std::vector<float> bounds(events.size() + 1, 0.0f);
  if (events.empty()) return bounds;

  // Cheapest possible multipliers a transition can receive.
  float pivot = std::min(1.0f, std::max(0.0f, weights_.pivot_factor));
  float bellows = std::min(1.0f, std::max(0.0f, weights_.bellows_shift_bonus));
  float dist_scale = std::max(0.0f, weights_.distance_weight) * pivot * (1.0f - bellows);
  float row_scale = std::max(0.0f, weights_.row_jump_weight) * pivot;

  CandidateBox prev_box;
  prev_box.include(start.row, start.column);

  std::vector<float> step(events.size(), 0.0f);
  for (size_t idx = 0; idx < events.size(); ++idx) {
    CandidateBox box = eventBox(events[idx], layout);
    if (prev_box.valid && box.valid) {
      float row_gap = intervalGap(prev_box.min_row, prev_box.max_row, box.min_row, box.max_row);
      float col_gap = intervalGap(prev_box.min_col, prev_box.max_col, box.min_col, box.max_col);
      float row_mm = row_gap * geometry_.row_spacing_mm;
      float col_mm = col_gap * geometry_.column_spacing_mm;
      step[idx] = std::sqrt(row_mm * row_mm + col_mm * col_mm) * dist_scale + row_gap * row_scale;
    }
    prev_box = box;
  }

  for (size_t idx = events.size(); idx > 0; --idx) {
    bounds[idx - 1] = bounds[idx] + step[idx - 1];
  }
  return bounds;
}

}  // namespace akkordio
