// JSON boundary of the fingering engine: solve requests in, solutions out.

#ifndef AKKORDIO_FINGERING_FINGERING_JSON_H
#define AKKORDIO_FINGERING_FINGERING_JSON_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/json_parser.h"
#include "core/musical_event.h"
#include "fingering/fingering_config.h"
#include "fingering/fingering_engine.h"
#include "fingering/fingering_types.h"
#include "instrument/accordion/button_layout.h"

namespace akkordio {

/// Fractional digits kept for costs in JSON output.
constexpr int kJsonCostPrecision = 4;

/// @brief Everything needed for one solve.
struct FingeringRequest {
  ButtonLayout layout;
  std::vector<MusicalEvent> events;
  FingeringConfig config;
};

/// @brief Serialize a solution.
///
/// {"algorithm","total_cost","optimal","complete","expansions","layout",
///  "events":[{"index","measure","beat","bellows","cost",
///             "assignments":[{"midi","note","finger","row","column","crossing","held"}]}]}
std::string solutionToJson(const FingeringSolution& solution);

/// @brief Serialize a full result: status, error, statistics and solution.
std::string resultToJson(const FingeringResult& result);

/// @brief Parse a layout object.
///
/// Accepts {"preset": name}, {"system", "rows", "columns", "start_midi"} or
/// {"buttons": [{"row", "column", "midi"}, ...]}. "row_spacing",
/// "column_spacing" and "max_span" override the geometry in every form.
/// @return False with *error set on malformed input.
bool layoutFromJson(const JsonValue& json, ButtonLayout& out, std::string* error = nullptr);

/// @brief Parse an event array.
bool eventsFromJson(const JsonValue& json, std::vector<MusicalEvent>& out,
                    std::string* error = nullptr);

/// @brief Parse the "options" object into a configuration.
bool configFromJson(const JsonValue& json, FingeringConfig& out, std::string* error = nullptr);

/// @brief Parse a complete request {"layout", "events", "options"}.
/// "options" may be omitted; "layout" and "events" are required.
bool fingeringRequestFromJson(const char* json, size_t length, FingeringRequest& out,
                              std::string* error = nullptr);

}  // namespace akkordio

#endif  // AKKORDIO_FINGERING_FINGERING_JSON_H
