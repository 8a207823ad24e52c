// A* search implementation.

#include "fingering/search_engine.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <set>
#include <unordered_map>

#include "core/stable_hash.h"

namespace akkordio {

namespace {

/// @brief Open-set entry: ascending f, then ascending arena index.
struct OpenEntry {
  float f = 0.0f;
  uint32_t index = 0;

  bool operator<(const OpenEntry& other) const {
    if (f != other.f) return f < other.f;
    return index < other.index;
  }
};

/// Start nodes tried by the best-effort fallback.
constexpr size_t kMaxGreedyStarts = 32;

/// Centroid resolution of rest keys.
constexpr float kRestKeyScale = 1000.0f;

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point since) {
  return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

}  // namespace

const char* searchOutcomeToString(SearchOutcome outcome) {
  switch (outcome) {
    case SearchOutcome::Complete:       return "Complete";
    case SearchOutcome::Exhausted:      return "Exhausted";
    case SearchOutcome::BudgetExceeded: return "BudgetExceeded";
  }
  return "Unknown";
}

size_t SearchKeyHash::operator()(const SearchKey& key) const {
  StableHash hasher;
  hasher.addI32(key.event_index);
  for (uint32_t packed : key.fingers) hasher.addU32(packed);
  hasher.addI32(key.rest_row);
  hasher.addI32(key.rest_column);
  return static_cast<size_t>(hasher.value());
}

SearchKey searchKeyOf(const NodeState& node) {
  SearchKey key;
  key.event_index = node.event_index;
  bool all_free = true;
  for (size_t idx = 0; idx < kNumFingers; ++idx) {
    const FingerState& state = node.fingers[idx];
    if (state.isFree()) continue;  // Free fingers pack to 0.
    all_free = false;
    key.fingers[idx] = (static_cast<uint32_t>(state.status) << 24) |
                       (static_cast<uint32_t>(state.button.row) << 16) |
                       (static_cast<uint32_t>(state.button.column) << 8) |
                       static_cast<uint32_t>(state.pitch);
  }
  if (all_free) {
    key.rest_row = static_cast<int32_t>(std::lround(node.geometry.centroid.row * kRestKeyScale));
    key.rest_column =
        static_cast<int32_t>(std::lround(node.geometry.centroid.column * kRestKeyScale));
  }
  return key;
}

SearchEngine::SearchEngine(const StateGenerator& generator, const CostModel& cost_model,
                           const SearchLimits& limits, bool verbose)
    : generator_(generator), cost_model_(cost_model), limits_(limits), verbose_(verbose) {}

SearchResult SearchEngine::search(const NodeState& start,
                                  const std::vector<MusicalEvent>& events) const {
  SearchResult result;
  const auto started = Clock::now();

  if (events.empty()) {
    result.outcome = SearchOutcome::Complete;
    result.optimal = true;
    return result;
  }

  const int last_event = static_cast<int>(events.size()) - 1;
  const std::vector<float> bounds =
      cost_model_.remainingCostBounds(start.geometry.centroid, events, generator_.layout());

  std::vector<NodeState> arena;
  std::set<OpenEntry> open;
  std::unordered_map<SearchKey, float, SearchKeyHash> best_g;
  std::unordered_map<SearchKey, float, SearchKeyHash> closed;

  NodeState root = start;
  root.event_index = -1;
  root.parent = -1;
  root.g = 0.0f;
  root.h = bounds[0];
  root.f = root.h;
  arena.push_back(root);
  best_g[searchKeyOf(root)] = 0.0f;
  open.insert({root.f, 0});

  int furthest = 0;        // Deepest node generated (ties: lowest g)
  int best_complete = -1;  // Cheapest node generated for the last event
  int goal = -1;
  bool budget_hit = false;

  while (!open.empty()) {
    OpenEntry entry = *open.begin();
    open.erase(open.begin());
    // Copy: the arena may reallocate while successors are appended.
    const NodeState node = arena[entry.index];
    const SearchKey key = searchKeyOf(node);

    auto closed_it = closed.find(key);
    if (closed_it != closed.end() && closed_it->second <= node.g) {
      ++result.stats.duplicates_skipped;
      continue;
    }
    closed[key] = node.g;

    if (node.event_index == last_event) {
      goal = static_cast<int>(entry.index);
      break;
    }

    // Popping the goal is free; budgets only stop expansions.
    if (limits_.max_expansions > 0 && result.stats.expansions >= limits_.max_expansions) {
      budget_hit = true;
      break;
    }
    if (limits_.time_limit_ms > 0 &&
        elapsedMs(started) >= static_cast<double>(limits_.time_limit_ms)) {
      budget_hit = true;
      break;
    }

    ++result.stats.expansions;
    if (observer_) observer_(node);

    const int next_event = node.event_index + 1;
    const MusicalEvent& event = events[static_cast<size_t>(next_event)];
    std::vector<NodeState> successors = generator_.successors(node, event, next_event);

    for (auto& succ : successors) {
      succ.g = node.g + cost_model_.edgeCost(node, succ, event);
      succ.h = bounds[static_cast<size_t>(next_event + 1)];
      succ.f = succ.g + succ.h;
      succ.parent = static_cast<int>(entry.index);

      const SearchKey succ_key = searchKeyOf(succ);
      auto known = best_g.find(succ_key);
      if (known != best_g.end() && known->second <= succ.g) {
        ++result.stats.duplicates_skipped;
        continue;
      }
      best_g[succ_key] = succ.g;

      const int index = static_cast<int>(arena.size());
      arena.push_back(succ);
      open.insert({succ.f, static_cast<uint32_t>(index)});
      ++result.stats.generated;

      const NodeState& deepest = arena[static_cast<size_t>(furthest)];
      if (succ.event_index > deepest.event_index ||
          (succ.event_index == deepest.event_index && succ.g < deepest.g)) {
        furthest = index;
      }
      if (succ.event_index == last_event &&
          (best_complete < 0 || succ.g < arena[static_cast<size_t>(best_complete)].g)) {
        best_complete = index;
      }
    }

    if (limits_.beam_width > 0) {
      while (open.size() > limits_.beam_width) {
        open.erase(std::prev(open.end()));
        ++result.stats.beam_dropped;
      }
    }
  }

  if (goal >= 0) {
    result.outcome = SearchOutcome::Complete;
    // Beam pruning can discard the optimum.
    result.optimal = result.stats.beam_dropped == 0;
    result.path = reconstructPath(arena, goal);
  } else if (budget_hit || result.stats.beam_dropped > 0) {
    // An open set emptied by beam pruning proves nothing about feasibility.
    result.outcome = SearchOutcome::BudgetExceeded;
    std::fprintf(stderr,
                 "[SearchEngine] WARNING: %s after %u expansions "
                 "(%.1f ms, %u beam drops); returning best-effort path\n",
                 budget_hit ? "budget exhausted" : "beam emptied the open set",
                 result.stats.expansions, elapsedMs(started), result.stats.beam_dropped);
    int tail = best_complete;
    if (tail < 0) {
      tail = bestEffortTail(arena, events);
      result.completed_greedily = arena[static_cast<size_t>(tail)].event_index == last_event;
    }
    result.path = reconstructPath(arena, tail);
    const int reached = arena[static_cast<size_t>(tail)].event_index;
    if (reached > arena[static_cast<size_t>(furthest)].event_index) furthest = tail;
  } else {
    result.outcome = SearchOutcome::Exhausted;
    result.path = reconstructPath(arena, furthest);
  }

  result.stats.furthest_event = arena[static_cast<size_t>(furthest)].event_index;
  result.stats.arena_size = static_cast<uint32_t>(arena.size());
  result.stats.elapsed_ms = elapsedMs(started);

  if (verbose_) {
    std::fprintf(stderr,
                 "[SearchEngine] %s: expansions=%u generated=%u duplicates=%u "
                 "beam_dropped=%u arena=%u furthest=%d elapsed=%.1fms\n",
                 searchOutcomeToString(result.outcome), result.stats.expansions,
                 result.stats.generated, result.stats.duplicates_skipped,
                 result.stats.beam_dropped, result.stats.arena_size,
                 result.stats.furthest_event, result.stats.elapsed_ms);
  }
  return result;
}

int SearchEngine::completeGreedily(std::vector<NodeState>& arena, int from,
                                   const std::vector<MusicalEvent>& events) const {
  const int last_event = static_cast<int>(events.size()) - 1;
  int cursor = from;

  while (arena[static_cast<size_t>(cursor)].event_index < last_event) {
    const NodeState node = arena[static_cast<size_t>(cursor)];
    const int next_event = node.event_index + 1;
    const MusicalEvent& event = events[static_cast<size_t>(next_event)];
    std::vector<NodeState> successors = generator_.successors(node, event, next_event);
    if (successors.empty()) break;

    size_t best = 0;
    float best_cost = 0.0f;
    for (size_t idx = 0; idx < successors.size(); ++idx) {
      float cost = cost_model_.edgeCost(node, successors[idx], event);
      if (idx == 0 || cost < best_cost) {
        best = idx;
        best_cost = cost;
      }
    }

    NodeState chosen = successors[best];
    chosen.g = node.g + best_cost;
    chosen.h = 0.0f;
    chosen.f = chosen.g;
    chosen.parent = cursor;
    cursor = static_cast<int>(arena.size());
    arena.push_back(chosen);
  }
  return cursor;
}

int SearchEngine::bestEffortTail(std::vector<NodeState>& arena,
                                 const std::vector<MusicalEvent>& events) const {
  const int last_event = static_cast<int>(events.size()) - 1;

  // Deepest first, then cheapest, then oldest.
  std::vector<int> starts(arena.size());
  for (size_t idx = 0; idx < arena.size(); ++idx) starts[idx] = static_cast<int>(idx);
  const size_t count = std::min(kMaxGreedyStarts, starts.size());
  std::partial_sort(starts.begin(), starts.begin() + static_cast<std::ptrdiff_t>(count),
                    starts.end(), [&arena](int lhs, int rhs) {
                      const NodeState& left = arena[static_cast<size_t>(lhs)];
                      const NodeState& right = arena[static_cast<size_t>(rhs)];
                      if (left.event_index != right.event_index) {
                        return left.event_index > right.event_index;
                      }
                      if (left.g != right.g) return left.g < right.g;
                      return lhs < rhs;
                    });
  starts.resize(count);

  int deepest = starts.front();
  for (int from : starts) {
    int tail = completeGreedily(arena, from, events);
    const int reached = arena[static_cast<size_t>(tail)].event_index;
    if (reached == last_event) return tail;
    if (reached > arena[static_cast<size_t>(deepest)].event_index) deepest = tail;
  }
  return deepest;
}

std::vector<NodeState> SearchEngine::reconstructPath(const std::vector<NodeState>& arena,
                                                     int tail) {
  std::vector<NodeState> path;
  for (int idx = tail; idx >= 0; idx = arena[static_cast<size_t>(idx)].parent) {
    if (arena[static_cast<size_t>(idx)].event_index < 0) break;  // Start node
    path.push_back(arena[static_cast<size_t>(idx)]);
  }
  return std::vector<NodeState>(path.rbegin(), path.rend());
}

}  // namespace akkordio
