// Tests for fingering/search_engine.h -- A* loop, budgets and failure handling.

#include "fingering/search_engine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <vector>

#include "core/musical_event.h"

namespace akkordio {
namespace {

class SearchEngineTest : public ::testing::Test {
 protected:
  SearchEngineTest()
      : layout_(ButtonLayout::chromatic(LayoutSystem::CSystem, 5, 12, 48)),
        model_(FingeringWeights::standard(), layout_.geometry()),
        generator_(layout_, model_) {}

  NodeState startNode() const {
    NodeState node;
    node.geometry.centroid = layout_.physicalCenter();
    node.bellows = BellowsDirection::Neutral;
    return node;
  }

  SearchResult run(const std::vector<MusicalEvent>& events,
                   const SearchLimits& limits = SearchLimits{}) const {
    SearchEngine engine(generator_, model_, limits);
    return engine.search(startNode(), events);
  }

  /// Exhaustive minimum over every successor chain.
  float bruteForce(const NodeState& node, const std::vector<MusicalEvent>& events,
                   size_t next) const {
    if (next == events.size()) return 0.0f;
    float best = std::numeric_limits<float>::infinity();
    for (const auto& succ :
         generator_.successors(node, events[next], static_cast<int>(next))) {
      float cost = model_.edgeCost(node, succ, events[next]) + bruteForce(succ, events, next + 1);
      best = std::min(best, cost);
    }
    return best;
  }

  ButtonLayout layout_;
  CostModel model_;
  StateGenerator generator_;
};

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------

TEST_F(SearchEngineTest, SearchKeyIgnoresCostsAndParent) {
  NodeState first = startNode();
  first.event_index = 3;
  first.finger(2).status = FingerStatus::Pressing;
  first.finger(2).button = {2, 5};
  first.finger(2).pitch = 60;

  NodeState second = first;
  second.g = 42.0f;
  second.parent = 17;

  EXPECT_TRUE(searchKeyOf(first) == searchKeyOf(second));
  EXPECT_EQ(SearchKeyHash{}(searchKeyOf(first)), SearchKeyHash{}(searchKeyOf(second)));
  EXPECT_EQ(searchKeyOf(first).fingers[0], 0u);  // Free finger
}

TEST_F(SearchEngineTest, SearchKeyDistinguishesStatusAndEvent) {
  NodeState pressed = startNode();
  pressed.event_index = 1;
  pressed.finger(1).status = FingerStatus::Pressing;
  pressed.finger(1).button = {2, 5};
  pressed.finger(1).pitch = 60;

  NodeState held = pressed;
  held.finger(1).status = FingerStatus::LockedHolding;
  EXPECT_FALSE(searchKeyOf(pressed) == searchKeyOf(held));

  NodeState later = pressed;
  later.event_index = 2;
  EXPECT_FALSE(searchKeyOf(pressed) == searchKeyOf(later));
}

TEST_F(SearchEngineTest, RestKeyIncludesInheritedPosition) {
  NodeState rest = startNode();
  rest.event_index = 1;
  rest.geometry.centroid = {0.0f, 5.0f};

  NodeState same = rest;
  same.g = 7.0f;
  EXPECT_TRUE(searchKeyOf(rest) == searchKeyOf(same));

  NodeState moved = rest;
  moved.geometry.centroid = {4.0f, 0.0f};
  EXPECT_FALSE(searchKeyOf(rest) == searchKeyOf(moved));
  EXPECT_NE(SearchKeyHash{}(searchKeyOf(rest)), SearchKeyHash{}(searchKeyOf(moved)));
}

TEST_F(SearchEngineTest, HeldKeyIgnoresCentroid) {
  NodeState held = startNode();
  held.event_index = 1;
  held.finger(1).status = FingerStatus::Pressing;
  held.finger(1).button = {2, 5};
  held.finger(1).pitch = 60;

  NodeState shifted = held;
  shifted.geometry.centroid = {4.0f, 0.0f};
  EXPECT_TRUE(searchKeyOf(held) == searchKeyOf(shifted));
  EXPECT_EQ(searchKeyOf(held).rest_row, 0);
}

TEST_F(SearchEngineTest, OutcomeStrings) {
  EXPECT_STREQ(searchOutcomeToString(SearchOutcome::Complete), "Complete");
  EXPECT_STREQ(searchOutcomeToString(SearchOutcome::Exhausted), "Exhausted");
  EXPECT_STREQ(searchOutcomeToString(SearchOutcome::BudgetExceeded), "BudgetExceeded");
}

// ---------------------------------------------------------------------------
// Successful searches
// ---------------------------------------------------------------------------

TEST_F(SearchEngineTest, EmptySequenceCompletesImmediately) {
  SearchResult result = run({});
  EXPECT_EQ(result.outcome, SearchOutcome::Complete);
  EXPECT_TRUE(result.optimal);
  EXPECT_TRUE(result.path.empty());
  EXPECT_EQ(result.stats.expansions, 0u);
}

TEST_F(SearchEngineTest, PathCoversEveryEventInOrder) {
  std::vector<MusicalEvent> events = {makeEvent({60}, true), makeEvent({62}), makeEvent({}),
                                      makeEvent({64, 67}, true)};
  SearchResult result = run(events);
  ASSERT_EQ(result.outcome, SearchOutcome::Complete);
  EXPECT_TRUE(result.optimal);
  ASSERT_EQ(result.path.size(), events.size());
  for (size_t idx = 0; idx < result.path.size(); ++idx) {
    EXPECT_EQ(result.path[idx].event_index, static_cast<int>(idx));
    EXPECT_EQ(static_cast<size_t>(result.path[idx].geometry.active_count), events[idx].notes.size());
  }
  for (size_t idx = 1; idx < result.path.size(); ++idx) {
    EXPECT_GE(result.path[idx].g, result.path[idx - 1].g);
  }
  EXPECT_EQ(result.stats.furthest_event, 3);
}

TEST_F(SearchEngineTest, FindsMinimumCostPath) {
  std::vector<MusicalEvent> events = {makeEvent({60}), makeEvent({65}, true), makeEvent({62, 67})};
  SearchResult result = run(events);
  ASSERT_EQ(result.outcome, SearchOutcome::Complete);
  ASSERT_EQ(result.path.size(), events.size());

  float expected = bruteForce(startNode(), events, 0);
  EXPECT_NEAR(result.path.back().g, expected, 1e-3f);
}

TEST_F(SearchEngineTest, MatchesExhaustiveMinimumAcrossRestsTiesAndBellows) {
  std::vector<std::vector<MusicalEvent>> sequences;
  sequences.push_back({makeEvent({60}), makeEvent({}), makeEvent({64}, true)});
  sequences.push_back({makeEvent({}), makeEvent({67}), makeEvent({60, 72})});

  MusicalEvent tied = makeEvent({60, 67});
  tied.notes[0].tied_from_prev = true;
  sequences.push_back({makeEvent({60, 64}), tied, makeEvent({62})});

  MusicalEvent pull = makeEvent({62});
  pull.bellows = BellowsDirection::Pull;
  MusicalEvent push = makeEvent({64}, true);
  push.bellows = BellowsDirection::Push;
  MusicalEvent note_hint = makeEvent({65});
  note_hint.notes[0].bellows = BellowsDirection::Pull;
  sequences.push_back({makeEvent({60}), pull, makeEvent({}), push, note_hint});

  sequences.push_back({makeEvent({60}, true), makeEvent({65}), makeEvent({}), makeEvent({}),
                       makeEvent({62}, true)});

  for (size_t idx = 0; idx < sequences.size(); ++idx) {
    SCOPED_TRACE(idx);
    const auto& events = sequences[idx];
    SearchResult result = run(events);
    ASSERT_EQ(result.outcome, SearchOutcome::Complete);
    EXPECT_TRUE(result.optimal);
    ASSERT_EQ(result.path.size(), events.size());
    EXPECT_NEAR(result.path.back().g, bruteForce(startNode(), events, 0), 1e-2f);
  }
}

TEST_F(SearchEngineTest, PathCostsMatchEdgeCosts) {
  std::vector<MusicalEvent> events = {makeEvent({55, 59}), makeEvent({57}), makeEvent({60, 64})};
  SearchResult result = run(events);
  ASSERT_EQ(result.path.size(), events.size());

  NodeState prev = startNode();
  float total = 0.0f;
  for (size_t idx = 0; idx < result.path.size(); ++idx) {
    total += model_.edgeCost(prev, result.path[idx], events[idx]);
    EXPECT_NEAR(result.path[idx].g, total, 1e-3f);
    prev = result.path[idx];
  }
}

TEST_F(SearchEngineTest, RepeatedSearchesAreIdentical) {
  std::vector<MusicalEvent> events = {makeEvent({60, 64, 67}), makeEvent({62, 65}),
                                      makeEvent({60}), makeEvent({59, 62, 67}, true)};
  SearchResult first = run(events);
  SearchResult second = run(events);
  ASSERT_EQ(first.path.size(), second.path.size());
  EXPECT_EQ(first.stats.expansions, second.stats.expansions);
  for (size_t idx = 0; idx < first.path.size(); ++idx) {
    EXPECT_TRUE(searchKeyOf(first.path[idx]) == searchKeyOf(second.path[idx]));
    EXPECT_FLOAT_EQ(first.path[idx].g, second.path[idx].g);
  }
}

TEST_F(SearchEngineTest, ExpandedNodesRespectMaxSpan) {
  std::vector<MusicalEvent> events = {makeEvent({48, 60}), makeEvent({50, 67}),
                                      makeEvent({55, 72}), makeEvent({52, 64})};
  std::vector<NodeState> expanded;
  SearchEngine engine(generator_, model_, SearchLimits{});
  engine.setExpansionObserver([&expanded](const NodeState& node) { expanded.push_back(node); });

  SearchResult result = engine.search(startNode(), events);
  ASSERT_FALSE(expanded.empty());
  EXPECT_EQ(expanded.size(), result.stats.expansions);
  for (const auto& node : expanded) {
    EXPECT_LE(model_.span(node), layout_.geometry().max_span_mm);
  }
  for (const auto& node : result.path) {
    EXPECT_LE(model_.span(node), layout_.geometry().max_span_mm);
  }
}

// ---------------------------------------------------------------------------
// Failure handling
// ---------------------------------------------------------------------------

TEST_F(SearchEngineTest, InfeasibleEventExhaustsWithPartialPath) {
  // 48 and 74 each have a single button, too far apart for one hand.
  std::vector<MusicalEvent> events = {makeEvent({60}), makeEvent({62}), makeEvent({48, 74}),
                                      makeEvent({64})};
  SearchResult result = run(events);
  EXPECT_EQ(result.outcome, SearchOutcome::Exhausted);
  EXPECT_FALSE(result.optimal);
  EXPECT_EQ(result.stats.furthest_event, 1);
  ASSERT_EQ(result.path.size(), 2u);
  EXPECT_EQ(result.path.back().event_index, 1);
}

TEST_F(SearchEngineTest, InconsistentTieOnFirstEventExhausts) {
  MusicalEvent event = makeEvent({60});
  event.notes[0].tied_from_prev = true;
  SearchResult result = run({event, makeEvent({62})});
  EXPECT_EQ(result.outcome, SearchOutcome::Exhausted);
  EXPECT_TRUE(result.path.empty());
  EXPECT_EQ(result.stats.furthest_event, -1);
}

// ---------------------------------------------------------------------------
// Budgets
// ---------------------------------------------------------------------------

TEST_F(SearchEngineTest, ExpansionBudgetFallsBackToGreedyCompletion) {
  std::vector<MusicalEvent> events = {makeEvent({60}), makeEvent({64}), makeEvent({67})};
  SearchLimits limits;
  limits.max_expansions = 1;
  SearchResult result = run(events, limits);

  EXPECT_EQ(result.outcome, SearchOutcome::BudgetExceeded);
  EXPECT_FALSE(result.optimal);
  EXPECT_TRUE(result.completed_greedily);
  EXPECT_EQ(result.stats.expansions, 1u);
  ASSERT_EQ(result.path.size(), events.size());
  for (size_t idx = 0; idx < result.path.size(); ++idx) {
    EXPECT_EQ(result.path[idx].event_index, static_cast<int>(idx));
  }
}

TEST_F(SearchEngineTest, GoalPoppedAtExactBudgetIsComplete) {
  std::vector<MusicalEvent> events = {makeEvent({60})};
  SearchLimits limits;
  limits.max_expansions = 1;
  SearchResult result = run(events, limits);

  EXPECT_EQ(result.outcome, SearchOutcome::Complete);
  EXPECT_TRUE(result.optimal);
  EXPECT_FALSE(result.completed_greedily);
  EXPECT_EQ(result.stats.expansions, 1u);
  ASSERT_EQ(result.path.size(), 1u);
  EXPECT_NEAR(result.path.back().g, bruteForce(startNode(), events, 0), 1e-3f);
}

TEST_F(SearchEngineTest, ExpansionBudgetPrefersGeneratedCompletePath) {
  std::vector<MusicalEvent> events = {makeEvent({60}), makeEvent({64})};
  SearchLimits limits;
  limits.max_expansions = 2;
  SearchResult result = run(events, limits);

  EXPECT_EQ(result.outcome, SearchOutcome::BudgetExceeded);
  EXPECT_FALSE(result.completed_greedily);
  ASSERT_EQ(result.path.size(), events.size());
}

TEST_F(SearchEngineTest, GreedyCompletionStopsAtDeadEnd) {
  std::vector<MusicalEvent> events = {makeEvent({60}), makeEvent({62}), makeEvent({48, 74})};
  SearchLimits limits;
  limits.max_expansions = 1;
  SearchResult result = run(events, limits);

  EXPECT_EQ(result.outcome, SearchOutcome::BudgetExceeded);
  EXPECT_FALSE(result.completed_greedily);
  EXPECT_EQ(result.path.size(), 2u);
}

TEST_F(SearchEngineTest, BeamWidthCapsOpenSet) {
  std::vector<MusicalEvent> events = {makeEvent({60, 64}), makeEvent({62, 65}),
                                      makeEvent({64, 67}), makeEvent({65, 69})};
  SearchLimits limits;
  limits.beam_width = 4;
  SearchResult result = run(events, limits);

  ASSERT_EQ(result.outcome, SearchOutcome::Complete);
  ASSERT_EQ(result.path.size(), events.size());
  EXPECT_GT(result.stats.beam_dropped, 0u);
  EXPECT_FALSE(result.optimal);

  SearchResult unbounded = run(events);
  EXPECT_GE(result.path.back().g + 1e-3f, unbounded.path.back().g);
}

}  // namespace
}  // namespace akkordio
