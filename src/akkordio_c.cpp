// Implementation of C API for WASM and FFI bindings.

#include "akkordio_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include "core/version_info.h"
#include "fingering/fingering_engine.h"
#include "fingering/fingering_json.h"
#include "instrument/accordion/button_layout.h"

namespace {

/// @brief Internal state held per AkkordioHandle.
struct AkkordioInstance {
  akkordio::FingeringResult result;
  std::string result_json;
  std::string error_message;
  uint32_t event_count = 0;
  bool has_result = false;
};

AkkordioError errorCodeOf(akkordio::FingeringError error) {
  switch (error) {
    case akkordio::FingeringError::None:            return AKKORDIO_OK;
    case akkordio::FingeringError::UnmappablePitch: return AKKORDIO_ERROR_UNMAPPABLE_PITCH;
    case akkordio::FingeringError::NoFeasiblePath:  return AKKORDIO_ERROR_NO_FEASIBLE_PATH;
    case akkordio::FingeringError::TimeoutExceeded: return AKKORDIO_ERROR_TIMEOUT;
    case akkordio::FingeringError::InvalidInput:    return AKKORDIO_ERROR_INVALID_INPUT;
  }
  return AKKORDIO_ERROR_INVALID_INPUT;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

AkkordioHandle akkordio_create(void) {
  return new AkkordioInstance();
}

void akkordio_destroy(AkkordioHandle handle) {
  delete static_cast<AkkordioInstance*>(handle);
}

// ============================================================================
// Solving
// ============================================================================

AkkordioError akkordio_solve_from_json(AkkordioHandle handle, const char* json, size_t length) {
  if (!handle || !json) {
    return AKKORDIO_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<AkkordioInstance*>(handle);
  instance->has_result = false;
  instance->result = akkordio::FingeringResult{};
  instance->result_json.clear();
  instance->error_message.clear();
  instance->event_count = 0;

  // Parse request
  akkordio::FingeringRequest request;
  if (!akkordio::fingeringRequestFromJson(json, length, request, &instance->error_message)) {
    return AKKORDIO_ERROR_INVALID_INPUT;
  }
  instance->event_count = static_cast<uint32_t>(request.events.size());

  // Solve
  akkordio::FingeringEngine engine(std::move(request.layout), request.config);
  instance->result = engine.solve(request.events);
  instance->error_message = instance->result.error_message;

  // Keep partial solutions retrievable; an unmappable or invalid request has none.
  auto error = instance->result.error;
  if (error == akkordio::FingeringError::None || error == akkordio::FingeringError::NoFeasiblePath ||
      error == akkordio::FingeringError::TimeoutExceeded) {
    instance->result_json = akkordio::resultToJson(instance->result);
    instance->has_result = true;
  }

  if (instance->result.success) return AKKORDIO_OK;
  return errorCodeOf(error);
}

// ============================================================================
// Output Retrieval
// ============================================================================

AkkordioSolutionData* akkordio_get_solution(AkkordioHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<AkkordioInstance*>(handle);
  if (!instance->has_result) return nullptr;

  auto* result = static_cast<AkkordioSolutionData*>(malloc(sizeof(AkkordioSolutionData)));
  if (!result) return nullptr;

  result->length = instance->result_json.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, instance->result_json.c_str(), result->length + 1);
  return result;
}

void akkordio_free_solution(AkkordioSolutionData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

// Static buffer for info queries
static AkkordioInfo s_info;

AkkordioInfo* akkordio_get_info(AkkordioHandle handle) {
  s_info = {};
  if (!handle) return &s_info;

  auto* instance = static_cast<AkkordioInstance*>(handle);
  if (!instance->has_result) return &s_info;

  const auto& solution = instance->result.solution;
  s_info.event_count = instance->event_count;
  s_info.fingered_events = static_cast<uint32_t>(solution.events.size());
  s_info.expansions = solution.expansions;
  s_info.total_cost = solution.total_cost;
  s_info.optimal = solution.is_optimal ? 1 : 0;
  s_info.complete = solution.is_complete ? 1 : 0;

  return &s_info;
}

const char* akkordio_last_error_message(AkkordioHandle handle) {
  if (!handle) return "";
  return static_cast<AkkordioInstance*>(handle)->error_message.c_str();
}

// ============================================================================
// Layout Preset Enumeration
// ============================================================================

uint8_t akkordio_preset_count(void) {
  return static_cast<uint8_t>(akkordio::ButtonLayout::presetCount());
}

const char* akkordio_preset_name(uint8_t id) {
  return akkordio::ButtonLayout::presetName(id);
}

// ============================================================================
// Error Handling
// ============================================================================

const char* akkordio_error_string(AkkordioError error) {
  switch (error) {
    case AKKORDIO_OK: return "No error";
    case AKKORDIO_ERROR_INVALID_PARAM: return "Invalid parameter";
    case AKKORDIO_ERROR_INVALID_INPUT: return "Invalid request";
    case AKKORDIO_ERROR_UNMAPPABLE_PITCH: return "Pitch not available on the layout";
    case AKKORDIO_ERROR_NO_FEASIBLE_PATH: return "No feasible fingering";
    case AKKORDIO_ERROR_TIMEOUT: return "Search budget exceeded";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* akkordio_version(void) {
  return AKKORDIO_VERSION;
}

}  // extern "C"
