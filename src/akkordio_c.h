// C API for WASM and FFI bindings.

#ifndef AKKORDIO_C_H
#define AKKORDIO_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a fingering engine instance.
typedef void* AkkordioHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  AKKORDIO_OK = 0,
  AKKORDIO_ERROR_INVALID_PARAM = 1,
  AKKORDIO_ERROR_INVALID_INPUT = 2,
  AKKORDIO_ERROR_UNMAPPABLE_PITCH = 3,
  AKKORDIO_ERROR_NO_FEASIBLE_PATH = 4,
  AKKORDIO_ERROR_TIMEOUT = 5,
} AkkordioError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Solution JSON output.
typedef struct {
  char* json;     ///< JSON string
  size_t length;  ///< String length
} AkkordioSolutionData;

/// @brief Summary of the last solve.
typedef struct {
  uint32_t event_count;      ///< Events in the request
  uint32_t fingered_events;  ///< Events covered by the solution
  uint32_t expansions;       ///< Search node expansions
  float total_cost;          ///< Accumulated transition cost
  uint8_t optimal;           ///< 1 if the solution is proven optimal
  uint8_t complete;          ///< 1 if every event is fingered
} AkkordioInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new engine instance.
/// @return Handle (must be freed with akkordio_destroy)
AkkordioHandle akkordio_create(void);

/// @brief Destroy an engine instance.
/// @param handle Handle to destroy
void akkordio_destroy(AkkordioHandle handle);

// ============================================================================
// Solving
// ============================================================================

/// @brief Solve a fingering request given as JSON.
///
/// JSON fields:
///   layout: object, required
///     {"preset": "c_system_5row"}
///     {"system": "c-system", "rows": 5, "columns": 12, "start_midi": 48}
///     {"buttons": [{"row", "column", "midi"}, ...]}
///     optional "row_spacing", "column_spacing", "max_span" (mm)
///   events: array, required
///     [{"notes": [{"midi", "tied", "bellows"}], "bellows", "downbeat",
///       "measure", "beat", "duration"}]
///   options: object, optional
///     weights ("standard", "relaxed", "strict"), start_bellows,
///     max_expansions, time_limit_ms, beam_width, verbose, start_position
///
/// A partial solution stays retrievable after NO_FEASIBLE_PATH or TIMEOUT.
///
/// @param handle Engine handle
/// @param json JSON request string
/// @param length Length of the JSON string
/// @return AKKORDIO_OK on success
AkkordioError akkordio_solve_from_json(AkkordioHandle handle, const char* json, size_t length);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get the last result as JSON (status, statistics and solution).
/// @param handle Engine handle
/// @return SolutionData (must be freed with akkordio_free_solution)
AkkordioSolutionData* akkordio_get_solution(AkkordioHandle handle);

/// @brief Free solution data.
/// @param data Pointer returned by akkordio_get_solution
void akkordio_free_solution(AkkordioSolutionData* data);

/// @brief Get a summary of the last solve.
/// @param handle Engine handle
/// @return Pointer to static AkkordioInfo (valid until next call, do not free)
AkkordioInfo* akkordio_get_info(AkkordioHandle handle);

/// @brief Get the message of the last failed solve ("" if none).
/// @param handle Engine handle
/// @return Message owned by the handle (valid until the next solve)
const char* akkordio_last_error_message(AkkordioHandle handle);

// ============================================================================
// Layout Preset Enumeration
// ============================================================================

/// @brief Get number of layout presets. @return Count
uint8_t akkordio_preset_count(void);

/// @brief Get preset name. @param id Preset ID @return Name (e.g. "c_system_5row")
const char* akkordio_preset_name(uint8_t id);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* akkordio_error_string(AkkordioError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* akkordio_version(void);

#ifdef __cplusplus
}
#endif

#endif  // AKKORDIO_C_H
