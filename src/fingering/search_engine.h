// A* search over hand configurations.

#ifndef AKKORDIO_FINGERING_SEARCH_ENGINE_H
#define AKKORDIO_FINGERING_SEARCH_ENGINE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "core/musical_event.h"
#include "fingering/cost_model.h"
#include "fingering/fingering_config.h"
#include "fingering/fingering_types.h"
#include "fingering/state_generator.h"

namespace akkordio {

/// @brief How a search ended.
enum class SearchOutcome : uint8_t {
  Complete,       // Optimal path to the last event found
  Exhausted,      // Open set emptied first: no feasible path
  BudgetExceeded  // Expansion/time/beam budget hit: best-effort path returned
};

/// @brief Convert SearchOutcome to string.
const char* searchOutcomeToString(SearchOutcome outcome);

/// @brief Closed-set key: event index plus every finger's button/pitch/status.
///
/// A node with every finger free (a rest) keeps the hand position it
/// inherited, and the next transition is charged from there, so that
/// position is part of its key. Bellows direction is not: it depends only
/// on the event index.
struct SearchKey {
  int32_t event_index = -1;
  std::array<uint32_t, kNumFingers> fingers = {};
  int32_t rest_row = 0;     // Centroid in 1/1000 rows; 0 unless all fingers are free
  int32_t rest_column = 0;  // Centroid in 1/1000 columns; 0 unless all fingers are free

  bool operator==(const SearchKey& other) const {
    return event_index == other.event_index && fingers == other.fingers &&
           rest_row == other.rest_row && rest_column == other.rest_column;
  }
};

/// @brief FNV-1a hash of a SearchKey (stable across platforms).
struct SearchKeyHash {
  size_t operator()(const SearchKey& key) const;
};

/// @brief Build the closed-set key of a node.
SearchKey searchKeyOf(const NodeState& node);

/// @brief Counters reported after a search.
struct SearchStats {
  uint32_t expansions = 0;
  uint32_t generated = 0;
  uint32_t duplicates_skipped = 0;
  uint32_t beam_dropped = 0;
  uint32_t arena_size = 0;
  int furthest_event = -1;
  double elapsed_ms = 0.0;
};

/// @brief Result of one search.
struct SearchResult {
  SearchOutcome outcome = SearchOutcome::Exhausted;
  /// One node per event accounted for, in order (start node excluded).
  /// Shorter than the event list for a partial path.
  std::vector<NodeState> path;
  bool optimal = false;
  bool completed_greedily = false;  ///< Budget hit; tail filled by greedy descent.
  SearchStats stats;
};

/// @brief A* driver: open set, closed set, node arena, budgets.
///
/// Nodes are stored in an append-only arena and reference their parent by
/// index. Equal-f ties are broken by the lowest arena index so repeated
/// searches are identical. Each call owns its arena, open and closed sets.
class SearchEngine {
 public:
  using ExpansionObserver = std::function<void(const NodeState& node)>;

  /// @param generator Successor generator (must outlive the engine).
  /// @param cost_model Edge costs and heuristic bounds (must outlive the engine).
  /// @param limits Expansion/time/beam budgets.
  /// @param verbose Log a summary line to stderr.
  SearchEngine(const StateGenerator& generator, const CostModel& cost_model,
               const SearchLimits& limits, bool verbose = false);

  /// @brief Called with every node just before it is expanded.
  void setExpansionObserver(ExpansionObserver observer) { observer_ = std::move(observer); }

  /// @brief Search for the cheapest fingering of events.
  /// @param start Start configuration (event_index -1, g = 0).
  /// @param events Event sequence.
  /// @return Outcome, path and statistics.
  SearchResult search(const NodeState& start, const std::vector<MusicalEvent>& events) const;

 private:
  /// Extend the node at arena index from to the last event by always
  /// taking the cheapest successor. Returns the final arena index reached.
  int completeGreedily(std::vector<NodeState>& arena, int from,
                       const std::vector<MusicalEvent>& events) const;

  /// Best-effort tail after a budget hit: greedy completion from the
  /// deepest searched nodes (beam-dropped ones included), cheapest first,
  /// stopping at the first that reaches the last event. Otherwise returns
  /// the deepest tail reached.
  int bestEffortTail(std::vector<NodeState>& arena, const std::vector<MusicalEvent>& events) const;

  /// Collect the path ending at arena index tail (start node excluded).
  static std::vector<NodeState> reconstructPath(const std::vector<NodeState>& arena, int tail);

  const StateGenerator& generator_;
  const CostModel& cost_model_;
  SearchLimits limits_;
  bool verbose_ = false;
  ExpansionObserver observer_;
};

}  // namespace akkordio

#endif  // AKKORDIO_FINGERING_SEARCH_ENGINE_H
