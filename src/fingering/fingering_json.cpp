// JSON request parsing and solution serialization.

#include "fingering/fingering_json.h"

#include <cstdint>
#include <limits>
#include <utility>

#include "core/json_helpers.h"

namespace akkordio {

namespace {

constexpr int kMaxGridIndex = 63;  // Rows/columns accepted from JSON
constexpr int kMaxChromaticRows = 8;
constexpr int kMaxChromaticColumns = 24;

bool fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

/// Read a whole number within [min_val, max_val]; fractions and
/// out-of-range values are rejected rather than truncated.
bool readInteger(const JsonValue* val, int64_t min_val, int64_t max_val, int64_t& out) {
  if (!val || !val->isInteger()) return false;
  if (val->number_val < static_cast<double>(min_val) ||
      val->number_val > static_cast<double>(max_val)) {
    return false;
  }
  out = static_cast<int64_t>(val->number_val);
  return true;
}

void writeSolution(JsonWriter& writer, const FingeringSolution& solution) {
  writer.beginObject();
  writer.field("algorithm", solution.algorithm);
  writer.field("total_cost", static_cast<double>(solution.total_cost));
  writer.field("optimal", solution.is_optimal);
  writer.field("complete", solution.is_complete);
  writer.field("expansions", solution.expansions);
  writer.field("layout", solution.layout_system);

  writer.key("events");
  writer.beginArray();
  for (const auto& event : solution.events) {
    writer.beginObject();
    writer.field("index", event.event_index);
    writer.field("measure", static_cast<int>(event.measure));
    writer.field("beat", static_cast<double>(event.beat));
    writer.field("bellows", bellowsDirectionToString(event.bellows));
    writer.field("cost", static_cast<double>(event.step_cost));

    writer.key("assignments");
    writer.beginArray();
    for (const auto& assignment : event.assignments) {
      writer.beginObject();
      writer.field("midi", static_cast<int>(assignment.pitch));
      writer.field("note", midiToNoteName(assignment.pitch));
      writer.field("finger", static_cast<int>(assignment.finger));
      writer.field("row", static_cast<int>(assignment.button.row));
      writer.field("column", static_cast<int>(assignment.button.column));
      writer.field("crossing", assignment.is_crossing);
      writer.field("held", assignment.is_held);
      writer.endObject();
    }
    writer.endArray();

    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
}

/// Read an optional bellows member; unknown strings are rejected.
bool readBellows(const JsonValue& object, const char* name, BellowsDirection& out,
                 std::string* error, const std::string& where) {
  const JsonValue* member = object.find(name);
  if (!member || member->isNull()) return true;
  if (!member->isString()) return fail(error, where + ": \"" + name + "\" must be a string");
  BellowsDirection parsed = bellowsDirectionFromString(member->string_val);
  if (parsed == BellowsDirection::Unspecified && member->string_val != "unspecified") {
    return fail(error, where + ": unknown bellows direction \"" + member->string_val + "\"");
  }
  out = parsed;
  return true;
}

/// Apply "row_spacing", "column_spacing" and "max_span" overrides.
bool readGeometry(const JsonValue& json, LayoutGeometry& geometry, std::string* error) {
  struct Member {
    const char* name;
    float* target;
  };
  const Member members[] = {{"row_spacing", &geometry.row_spacing_mm},
                            {"column_spacing", &geometry.column_spacing_mm},
                            {"max_span", &geometry.max_span_mm}};
  for (const auto& member : members) {
    const JsonValue* val = json.find(member.name);
    if (!val) continue;
    if (!val->isNumber() || !(val->number_val > 0.0)) {
      return fail(error, std::string("layout: \"") + member.name + "\" must be a positive number");
    }
    *member.target = static_cast<float>(val->number_val);
  }
  return true;
}

}  // namespace

std::string solutionToJson(const FingeringSolution& solution) {
  JsonWriter writer(kJsonCostPrecision);
  writeSolution(writer, solution);
  return writer.toString();
}

std::string resultToJson(const FingeringResult& result) {
  JsonWriter writer(kJsonCostPrecision);
  writer.beginObject();
  writer.field("success", result.success);
  writer.field("error", fingeringErrorToString(result.error));
  writer.field("message", result.error_message);

  writer.key("stats");
  writer.beginObject();
  writer.field("expansions", result.stats.expansions);
  writer.field("generated", result.stats.generated);
  writer.field("duplicates_skipped", result.stats.duplicates_skipped);
  writer.field("beam_dropped", result.stats.beam_dropped);
  writer.field("furthest_event", result.stats.furthest_event);
  writer.field("elapsed_ms", result.stats.elapsed_ms);
  writer.endObject();

  writer.key("solution");
  writeSolution(writer, result.solution);
  writer.endObject();
  return writer.toString();
}

bool layoutFromJson(const JsonValue& json, ButtonLayout& out, std::string* error) {
  if (!json.isObject()) return fail(error, "layout must be an object");

  const JsonValue* preset = json.find("preset");
  const JsonValue* buttons = json.find("buttons");
  const JsonValue* system_val = json.find("system");

  LayoutSystem system = LayoutSystem::Custom;
  if (system_val && !(system_val->isString() &&
                      layoutSystemFromString(system_val->string_val, system))) {
    return fail(error, "layout: unknown system \"" + system_val->asString() + "\"");
  }

  ButtonLayout layout;
  if (preset) {
    if (!preset->isString() || !ButtonLayout::fromPreset(preset->string_val, layout)) {
      return fail(error, "layout: unknown preset \"" + preset->asString() + "\"");
    }
  } else if (buttons) {
    if (!buttons->isArray()) return fail(error, "layout: \"buttons\" must be an array");
    layout = ButtonLayout(LayoutGeometry::standard(), system);
    for (size_t idx = 0; idx < buttons->items.size(); ++idx) {
      const JsonValue& entry = buttons->items[idx];
      const std::string where = "layout: button " + std::to_string(idx);
      if (!entry.isObject()) return fail(error, where + " must be an object");

      const JsonValue* row = entry.find("row");
      const JsonValue* column = entry.find("column");
      const JsonValue* midi = entry.find("midi");
      if (!row || !column || !midi) {
        return fail(error, where + " needs \"row\", \"column\" and \"midi\"");
      }
      int64_t row_val = 0;
      int64_t col_val = 0;
      int64_t midi_val = 0;
      if (!readInteger(row, 0, kMaxGridIndex, row_val) ||
          !readInteger(column, 0, kMaxGridIndex, col_val)) {
        return fail(error, where + " needs whole-number \"row\" and \"column\" in 0-63");
      }
      if (!readInteger(midi, 0, kMaxMidiPitch, midi_val)) {
        return fail(error, where + " needs a whole-number midi pitch in 0-127");
      }
      if (!layout.addButton(static_cast<uint8_t>(row_val), static_cast<uint8_t>(col_val),
                            static_cast<uint8_t>(midi_val))) {
        return fail(error, where + " duplicates position (" + std::to_string(row_val) + ", " +
                               std::to_string(col_val) + ")");
      }
    }
  } else if (system_val) {
    int64_t rows = 5;
    int64_t columns = 12;
    int64_t start = 48;
    const JsonValue* rows_val = json.find("rows");
    const JsonValue* columns_val = json.find("columns");
    const JsonValue* start_val = json.find("start_midi");
    if ((rows_val && !readInteger(rows_val, 1, kMaxChromaticRows, rows)) ||
        (columns_val && !readInteger(columns_val, 1, kMaxChromaticColumns, columns))) {
      return fail(error, "layout: rows must be 1-8 and columns 1-24");
    }
    if (start_val && !readInteger(start_val, 0, kMaxMidiPitch, start)) {
      return fail(error, "layout: \"start_midi\" must be 0-127");
    }
    layout = ButtonLayout::chromatic(system, static_cast<uint8_t>(rows),
                                     static_cast<uint8_t>(columns), static_cast<uint8_t>(start));
  } else {
    return fail(error, "layout needs \"preset\", \"buttons\" or \"system\"");
  }

  LayoutGeometry geometry = layout.geometry();
  if (!readGeometry(json, geometry, error)) return false;
  layout.setGeometry(geometry);

  if (layout.empty()) return fail(error, "layout has no buttons");
  out = std::move(layout);
  return true;
}

bool eventsFromJson(const JsonValue& json, std::vector<MusicalEvent>& out, std::string* error) {
  if (!json.isArray()) return fail(error, "events must be an array");

  std::vector<MusicalEvent> events;
  events.reserve(json.items.size());
  for (size_t idx = 0; idx < json.items.size(); ++idx) {
    const JsonValue& entry = json.items[idx];
    const std::string where = "event " + std::to_string(idx);
    if (!entry.isObject()) return fail(error, where + " must be an object");

    MusicalEvent event;
    const JsonValue* notes = entry.find("notes");
    if (notes && !notes->isNull()) {
      if (!notes->isArray()) return fail(error, where + ": \"notes\" must be an array");
      for (const auto& note_json : notes->items) {
        if (!note_json.isObject()) return fail(error, where + ": note must be an object");
        int64_t midi_val = 0;
        if (!readInteger(note_json.find("midi"), 0, kMaxMidiPitch, midi_val)) {
          return fail(error, where + ": note needs a whole-number \"midi\" in 0-127");
        }
        EventNote note;
        note.pitch = static_cast<uint8_t>(midi_val);
        if (const JsonValue* tied = note_json.find("tied")) note.tied_from_prev = tied->asBool(false);
        if (!readBellows(note_json, "bellows", note.bellows, error, where)) return false;
        event.notes.push_back(note);
      }
    }

    if (!readBellows(entry, "bellows", event.bellows, error, where)) return false;
    if (const JsonValue* downbeat = entry.find("downbeat")) {
      event.is_downbeat = downbeat->asBool(false);
    }
    if (const JsonValue* measure = entry.find("measure")) {
      int64_t measure_val = 0;
      if (!readInteger(measure, 0, std::numeric_limits<uint16_t>::max(), measure_val)) {
        return fail(error, where + ": \"measure\" must be a whole number in 0-65535");
      }
      event.measure = static_cast<uint16_t>(measure_val);
    }
    if (const JsonValue* beat = entry.find("beat")) {
      event.beat = static_cast<float>(beat->asDouble(0.0));
    }
    if (const JsonValue* duration = entry.find("duration")) {
      event.duration = static_cast<float>(duration->asDouble(0.0));
    }
    events.push_back(std::move(event));
  }

  out = std::move(events);
  return true;
}

bool configFromJson(const JsonValue& json, FingeringConfig& out, std::string* error) {
  if (!json.isObject()) return fail(error, "options must be an object");

  FingeringConfig config;
  if (const JsonValue* weights = json.find("weights")) {
    if (!weights->isString() || !weightsPresetFromString(weights->string_val, config.weights)) {
      return fail(error, "options: unknown weights profile \"" + weights->asString() + "\"");
    }
  }
  if (!readBellows(json, "start_bellows", config.start_bellows, error, "options")) return false;

  struct Limit {
    const char* name;
    uint32_t* target;
  };
  const Limit limits[] = {{"max_expansions", &config.limits.max_expansions},
                          {"time_limit_ms", &config.limits.time_limit_ms},
                          {"beam_width", &config.limits.beam_width}};
  for (const auto& limit : limits) {
    const JsonValue* val = json.find(limit.name);
    if (!val) continue;
    int64_t parsed = 0;
    if (!readInteger(val, 0, std::numeric_limits<uint32_t>::max(), parsed)) {
      return fail(error, std::string("options: \"") + limit.name +
                             "\" must be a non-negative whole number");
    }
    *limit.target = static_cast<uint32_t>(parsed);
  }
  if (const JsonValue* val = json.find("verbose")) config.verbose = val->asBool(false);

  if (const JsonValue* start = json.find("start_position")) {
    const JsonValue* row = start->find("row");
    const JsonValue* column = start->find("column");
    if (!row || !column || !row->isNumber() || !column->isNumber()) {
      return fail(error, "options: \"start_position\" needs numeric \"row\" and \"column\"");
    }
    config.has_start_position = true;
    config.start_position.row = static_cast<float>(row->number_val);
    config.start_position.column = static_cast<float>(column->number_val);
  }

  out = config;
  return true;
}

bool fingeringRequestFromJson(const char* json, size_t length, FingeringRequest& out,
                              std::string* error) {
  JsonValue root;
  std::string parse_error;
  if (!parseJson(json, length, root, &parse_error)) {
    return fail(error, "malformed JSON: " + parse_error);
  }
  if (!root.isObject()) return fail(error, "request must be an object");

  FingeringRequest request;
  const JsonValue* layout = root.find("layout");
  if (!layout) return fail(error, "request needs \"layout\"");
  if (!layoutFromJson(*layout, request.layout, error)) return false;

  const JsonValue* events = root.find("events");
  if (!events) return fail(error, "request needs \"events\"");
  if (!eventsFromJson(*events, request.events, error)) return false;

  if (const JsonValue* options = root.find("options")) {
    if (!configFromJson(*options, request.config, error)) return false;
  }

  out = std::move(request);
  return true;
}

}  // namespace akkordio
