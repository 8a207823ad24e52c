// Tests for fingering/cost_model.h -- distances, inversions, edge cost, heuristic bounds.

#include "fingering/cost_model.h"

#include <gtest/gtest.h>

#include <vector>

#include "core/musical_event.h"

namespace akkordio {
namespace {

constexpr float kTolerance = 1e-3f;

CostModel makeModel(const FingeringWeights& weights = FingeringWeights::standard()) {
  return CostModel(weights, LayoutGeometry::standard());
}

void place(NodeState& node, uint8_t finger, uint8_t row, uint8_t column, uint8_t pitch,
           FingerStatus status = FingerStatus::Pressing) {
  FingerState& state = node.finger(finger);
  state.status = status;
  state.button = {row, column};
  state.pitch = pitch;
}

/// Start node with every finger free at the given centroid.
NodeState startAt(float row, float column) {
  NodeState node;
  node.geometry.centroid = {row, column};
  return node;
}

void refresh(const CostModel& model, NodeState& node, const GridPoint& fallback = {}) {
  node.geometry = model.computeGeometry(node.fingers, fallback);
}

// ---------------------------------------------------------------------------
// Distances
// ---------------------------------------------------------------------------

TEST(CostModelTest, DistanceIsPythagoreanInMillimetres) {
  CostModel model = makeModel();
  HandGeometry from;
  HandGeometry to;
  to.centroid = {1.0f, 1.0f};
  EXPECT_NEAR(model.distance(from, to), 23.4307f, kTolerance);
  EXPECT_NEAR(model.distance(to, from), 23.4307f, kTolerance);
}

TEST(CostModelTest, ButtonDistance) {
  CostModel model = makeModel();
  EXPECT_FLOAT_EQ(model.buttonDistance({0, 0}, {0, 4}), 72.0f);
  EXPECT_FLOAT_EQ(model.buttonDistance({3, 2}, {1, 2}), 30.0f);
  EXPECT_FLOAT_EQ(model.buttonDistance({2, 2}, {2, 2}), 0.0f);
}

TEST(CostModelTest, SpanNeedsTwoFingers) {
  CostModel model = makeModel();
  NodeState node;
  EXPECT_FLOAT_EQ(model.span(node), 0.0f);
  place(node, 2, 1, 1, 60);
  EXPECT_FLOAT_EQ(model.span(node), 0.0f);
  place(node, 4, 1, 5, 68);
  EXPECT_FLOAT_EQ(model.span(node), 72.0f);
}

// ---------------------------------------------------------------------------
// Inversions
// ---------------------------------------------------------------------------

TEST(CostModelTest, NoInversionWhenColumnsAscend) {
  NodeState node;
  place(node, 1, 0, 1, 50);
  place(node, 2, 2, 1, 52);
  place(node, 3, 0, 3, 54);
  EXPECT_FALSE(CostModel::isGeometricInversion(node));
  EXPECT_FLOAT_EQ(CostModel::crossingSeverity(node), 0.0f);
}

TEST(CostModelTest, InversionSeveritySumsColumnGaps) {
  NodeState node;
  place(node, 1, 0, 3, 54);
  place(node, 2, 0, 1, 50);
  place(node, 3, 0, 2, 52);
  // (1,2): gap 2, (1,3): gap 1, (2,3): not inverted.
  EXPECT_TRUE(CostModel::isGeometricInversion(node));
  EXPECT_FLOAT_EQ(CostModel::crossingSeverity(node), 3.0f);
}

TEST(CostModelTest, FingerCrossingFlagsOnlyInvertedFingers) {
  NodeState node;
  place(node, 1, 0, 3, 54);
  place(node, 2, 0, 1, 50);
  place(node, 4, 0, 5, 58);
  EXPECT_TRUE(CostModel::isFingerCrossing(node, 1));
  EXPECT_TRUE(CostModel::isFingerCrossing(node, 2));
  EXPECT_FALSE(CostModel::isFingerCrossing(node, 3));  // Free
  EXPECT_FALSE(CostModel::isFingerCrossing(node, 4));
  EXPECT_FALSE(CostModel::isFingerCrossing(node, 0));
  EXPECT_FALSE(CostModel::isFingerCrossing(node, 6));
}

TEST(CostModelTest, InversionColumnLimit) {
  CostModel model = makeModel();
  NodeState node;
  place(node, 1, 0, 3, 54);
  place(node, 2, 0, 1, 50);
  EXPECT_FALSE(model.isInversionImpossible(node));  // Gap 2 == limit

  place(node, 1, 0, 4, 56);
  EXPECT_TRUE(model.isInversionImpossible(node));  // Gap 3 > limit
}

TEST(CostModelTest, InversionRowLimit) {
  CostModel model = makeModel();
  NodeState node;
  place(node, 1, 4, 2, 60);
  place(node, 3, 0, 1, 50);
  EXPECT_TRUE(model.isInversionImpossible(node));  // Row gap 4 > 3
}

TEST(CostModelTest, RowLimitIgnoredWithoutInversion) {
  CostModel model = makeModel();
  NodeState node;
  place(node, 1, 4, 1, 58);
  place(node, 3, 0, 2, 52);
  EXPECT_FALSE(model.isInversionImpossible(node));
}

TEST(CostModelTest, StrictProfileForbidsTwoColumnInversion) {
  CostModel model = makeModel(FingeringWeights::strict());
  NodeState node;
  place(node, 1, 0, 3, 54);
  place(node, 2, 0, 1, 50);
  EXPECT_TRUE(model.isInversionImpossible(node));
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

TEST(CostModelTest, GeometryFallbackWhenAllFree) {
  CostModel model = makeModel();
  NodeState node;
  HandGeometry geom = model.computeGeometry(node.fingers, {2.5f, 6.0f});
  EXPECT_EQ(geom.active_count, 0);
  EXPECT_FLOAT_EQ(geom.centroid.row, 2.5f);
  EXPECT_FLOAT_EQ(geom.centroid.column, 6.0f);
  EXPECT_FLOAT_EQ(geom.span_mm, 0.0f);
}

TEST(CostModelTest, GeometryCentroidSpanAndWristAngle) {
  CostModel model = makeModel();
  NodeState node;
  place(node, 1, 0, 0, 48);
  place(node, 4, 2, 4, 58);
  HandGeometry geom = model.computeGeometry(node.fingers, {});
  EXPECT_EQ(geom.active_count, 2);
  EXPECT_FLOAT_EQ(geom.centroid.row, 1.0f);
  EXPECT_FLOAT_EQ(geom.centroid.column, 2.0f);
  EXPECT_NEAR(geom.span_mm, 78.0f, kTolerance);
  EXPECT_NEAR(geom.wrist_angle_deg, 22.62f, 0.01f);
}

// ---------------------------------------------------------------------------
// Edge cost
// ---------------------------------------------------------------------------

TEST(CostModelTest, SingleNoteFromOffsetCentroid) {
  CostModel model = makeModel();
  NodeState prev = startAt(3.0f, 0.0f);
  NodeState next;
  place(next, 1, 2, 5, 60);
  refresh(model, next);

  TransitionCost cost = model.transitionCost(prev, next, makeEvent({60}));
  EXPECT_NEAR(cost.distance_cost, 91.2414f, kTolerance);
  EXPECT_FLOAT_EQ(cost.row_cost, 2.0f);
  EXPECT_FALSE(cost.pivot);
  EXPECT_FALSE(cost.bellows_shift);
  EXPECT_NEAR(cost.total, 93.2414f, kTolerance);
  EXPECT_NEAR(model.edgeCost(prev, next, makeEvent({60})), 93.2414f, kTolerance);
}

TEST(CostModelTest, PivotFingerDiscountsTravel) {
  CostModel model = makeModel();
  NodeState prev;
  place(prev, 1, 2, 5, 60);
  place(prev, 2, 2, 6, 62);
  refresh(model, prev);

  NodeState next;
  place(next, 1, 2, 5, 60, FingerStatus::LockedHolding);
  place(next, 2, 2, 8, 66);
  refresh(model, next);

  TransitionCost cost = model.transitionCost(prev, next, makeEvent({66}));
  EXPECT_TRUE(cost.pivot);
  EXPECT_NEAR(cost.total, 18.0f * 0.8f, kTolerance);
}

TEST(CostModelTest, BellowsChangeDiscountsDistanceOnly) {
  CostModel model = makeModel();
  NodeState prev = startAt(3.0f, 0.0f);
  prev.bellows = BellowsDirection::Neutral;
  NodeState next;
  place(next, 1, 2, 5, 60);
  refresh(model, next);

  MusicalEvent event = makeEvent({60});
  event.bellows = BellowsDirection::Pull;
  TransitionCost cost = model.transitionCost(prev, next, event);
  EXPECT_TRUE(cost.bellows_shift);
  EXPECT_NEAR(cost.total, 70.4311f, kTolerance);

  prev.bellows = BellowsDirection::Pull;
  cost = model.transitionCost(prev, next, event);
  EXPECT_FALSE(cost.bellows_shift);
  EXPECT_NEAR(cost.total, 93.2414f, kTolerance);
}

TEST(CostModelTest, NoteLevelBellowsHintCounts) {
  CostModel model = makeModel();
  NodeState prev = startAt(3.0f, 0.0f);
  NodeState next;
  place(next, 1, 2, 5, 60);
  refresh(model, next);

  MusicalEvent event = makeEvent({60});
  event.notes[0].bellows = BellowsDirection::Push;
  EXPECT_TRUE(model.transitionCost(prev, next, event).bellows_shift);
}

TEST(CostModelTest, WeaknessChargedForStruckNotesOnDownbeats) {
  CostModel model = makeModel();
  NodeState prev;
  place(prev, 4, 1, 4, 57);
  refresh(model, prev);

  NodeState next;
  place(next, 4, 1, 4, 57, FingerStatus::LockedHolding);
  place(next, 5, 1, 5, 59);
  refresh(model, next);

  MusicalEvent downbeat = makeEvent({59}, true);
  EXPECT_FLOAT_EQ(model.transitionCost(prev, next, downbeat).weakness_penalty, 8.0f);

  MusicalEvent offbeat = makeEvent({59}, false);
  EXPECT_FLOAT_EQ(model.transitionCost(prev, next, offbeat).weakness_penalty, 0.0f);

  FingeringWeights weights;
  weights.weakness_on_downbeats = false;
  CostModel lenient = makeModel(weights);
  EXPECT_FLOAT_EQ(lenient.transitionCost(prev, next, downbeat).weakness_penalty, 0.0f);
}

TEST(CostModelTest, CrossingPenaltyScalesWithSeverity) {
  CostModel model = makeModel();
  NodeState prev = startAt(0.0f, 2.0f);
  NodeState next;
  place(next, 1, 0, 3, 54);
  place(next, 2, 0, 2, 52);
  refresh(model, next);

  TransitionCost cost = model.transitionCost(prev, next, makeEvent({52, 54}));
  EXPECT_FLOAT_EQ(cost.crossing_penalty, 25.0f);
}

TEST(CostModelTest, EdgeCostNeverNegative) {
  CostModel model = makeModel();
  ButtonLayout layout = ButtonLayout::chromatic(LayoutSystem::CSystem, 3, 4, 48);

  for (const auto& from : layout.buttons()) {
    for (const auto& to : layout.buttons()) {
      for (uint8_t finger = 1; finger <= kNumFingers; ++finger) {
        NodeState prev;
        place(prev, 1, from.position.row, from.position.column, from.pitch);
        refresh(model, prev);
        NodeState next;
        place(next, finger, to.position.row, to.position.column, to.pitch);
        refresh(model, next);
        EXPECT_GE(model.edgeCost(prev, next, makeEvent({to.pitch}, true)), 0.0f);
      }
    }
  }
}

TEST(CostModelTest, TotalClampedAtZero) {
  FingeringWeights weights;
  weights.distance_weight = -5.0f;
  CostModel model = makeModel(weights);
  NodeState prev = startAt(3.0f, 0.0f);
  NodeState next;
  place(next, 1, 2, 5, 60);
  refresh(model, next);
  EXPECT_FLOAT_EQ(model.edgeCost(prev, next, makeEvent({60})), 0.0f);
}

// ---------------------------------------------------------------------------
// Heuristic bounds
// ---------------------------------------------------------------------------

TEST(CostModelTest, BoundsShapeAndMonotonicity) {
  CostModel model = makeModel();
  ButtonLayout layout;
  ASSERT_TRUE(ButtonLayout::fromPreset("c_system_5row", layout));
  std::vector<MusicalEvent> events = {makeEvent({48}), makeEvent({74}), makeEvent({}),
                                      makeEvent({50})};

  std::vector<float> bounds = model.remainingCostBounds(layout.physicalCenter(), events, layout);
  ASSERT_EQ(bounds.size(), events.size() + 1);
  EXPECT_FLOAT_EQ(bounds.back(), 0.0f);
  for (size_t idx = 0; idx + 1 < bounds.size(); ++idx) {
    EXPECT_GE(bounds[idx], bounds[idx + 1]);
  }
  // Transitions into and out of the rest are bounded by 0.
  EXPECT_FLOAT_EQ(bounds[2], 0.0f);
}

TEST(CostModelTest, BoundForSingleCandidate) {
  CostModel model = makeModel();
  ButtonLayout layout;
  layout.addButton(2, 5, 60);
  std::vector<MusicalEvent> events = {makeEvent({60})};

  std::vector<float> bounds = model.remainingCostBounds({3.0f, 0.0f}, events, layout);
  // 91.24 mm * 0.8 * 0.75 + 1 row * 2 * 0.8
  EXPECT_NEAR(bounds[0], 56.3449f, kTolerance);

  NodeState prev = startAt(3.0f, 0.0f);
  NodeState next;
  place(next, 1, 2, 5, 60);
  refresh(model, next);
  EXPECT_LE(bounds[0], model.edgeCost(prev, next, events[0]));
}

TEST(CostModelTest, BoundIsZeroForOverlappingCandidates) {
  CostModel model = makeModel();
  ButtonLayout layout;
  ASSERT_TRUE(ButtonLayout::fromPreset("c_system_5row", layout));
  // 60 and 61 share rows/columns in their candidate boxes.
  std::vector<MusicalEvent> events = {makeEvent({60}), makeEvent({61})};
  std::vector<float> bounds = model.remainingCostBounds({2.0f, 5.0f}, events, layout);
  EXPECT_FLOAT_EQ(bounds[0], 0.0f);
}

TEST(CostModelTest, EmptySequenceBounds) {
  CostModel model = makeModel();
  ButtonLayout layout;
  std::vector<float> bounds = model.remainingCostBounds({}, {}, layout);
  ASSERT_EQ(bounds.size(), 1u);
  EXPECT_FLOAT_EQ(bounds[0], 0.0f);
}

}  // namespace
}  // namespace akkordio
