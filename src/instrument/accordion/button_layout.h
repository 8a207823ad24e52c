// Treble button layout of a chromatic button accordion (pitch <-> button oracle).

#ifndef AKKORDIO_INSTRUMENT_ACCORDION_BUTTON_LAYOUT_H
#define AKKORDIO_INSTRUMENT_ACCORDION_BUTTON_LAYOUT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/musical_event.h"

namespace akkordio {

/// Highest row or column index a layout accepts.
constexpr uint8_t kMaxButtonIndex = 254;

/// @brief Integer (row, column) coordinate of a button.
struct ButtonPosition {
  uint8_t row = 0;
  uint8_t column = 0;

  bool operator==(const ButtonPosition& other) const {
    return row == other.row && column == other.column;
  }
  bool operator!=(const ButtonPosition& other) const { return !(*this == other); }
  bool operator<(const ButtonPosition& other) const {
    return row != other.row ? row < other.row : column < other.column;
  }
};

/// @brief Fractional (row, column) point, e.g. a hand centroid.
struct GridPoint {
  float row = 0.0f;
  float column = 0.0f;
};

/// @brief A physical button and the pitch it produces.
struct Button {
  ButtonPosition position;
  uint8_t pitch = 0;
};

/// @brief Physical spacing constants of a layout.
///
/// Use the static factory methods for the standard instrument families.
struct LayoutGeometry {
  float row_spacing_mm = 15.0f;     // Center-to-center distance between rows
  float column_spacing_mm = 18.0f;  // Center-to-center distance between columns
  float max_span_mm = 150.0f;       // Anatomical limit on pairwise finger distance

  /// @brief Treble C/B-system buttons.
  static LayoutGeometry standard() { return {15.0f, 18.0f, 150.0f}; }

  /// @brief Free-bass manual: smaller buttons, tighter spacing.
  static LayoutGeometry freeBass() { return {14.0f, 16.0f, 140.0f}; }
};

/// @brief Chromatic button system family.
enum class LayoutSystem : uint8_t {
  Custom,     // Built button by button from an external table
  CSystem,
  BSystem,    // Bayan
  FreeBassC,
  FreeBassB
};

/// @brief Convert LayoutSystem to string ("c-system", "b-system", ...).
const char* layoutSystemToString(LayoutSystem system);

/// @brief Parse a LayoutSystem from a string.
/// @param str System name such as "c-system" or "freebass-b".
/// @param system Output system (untouched when unrecognized).
/// @return True if the name was recognized.
bool layoutSystemFromString(const std::string& str, LayoutSystem& system);

/// @brief Pitch-to-button lookup for one keyboard.
///
/// Maps a MIDI pitch to the ordered set of candidate buttons producing it
/// (several rows can duplicate a pitch). Lookups are read-only and safe to
/// call concurrently.
class ButtonLayout {
 public:
  ButtonLayout() = default;

  /// @brief Create an empty layout with explicit geometry.
  explicit ButtonLayout(const LayoutGeometry& geometry,
                        LayoutSystem system = LayoutSystem::Custom);

  /// @brief Build a chromatic layout: pitch = start_pitch + row + 2 * column.
  /// @param system System family (selects the label only).
  /// @param rows Number of button rows (3-5 typical).
  /// @param columns Number of button columns (11-13 typical).
  /// @param start_pitch Pitch of the button at row 0, column 0.
  /// @param geometry Physical spacing constants.
  /// Buttons whose pitch would exceed 127 are omitted.
  static ButtonLayout chromatic(LayoutSystem system, uint8_t rows, uint8_t columns,
                                uint8_t start_pitch, const LayoutGeometry& geometry);

  /// @brief Build a chromatic layout with the system's default geometry.
  static ButtonLayout chromatic(LayoutSystem system, uint8_t rows, uint8_t columns,
                                uint8_t start_pitch);

  /// @brief Build a named preset layout (e.g. "c_system_5row").
  /// @param name Preset name.
  /// @param out Output layout (untouched when the name is unknown).
  /// @return False if the preset name is unknown.
  static bool fromPreset(const std::string& name, ButtonLayout& out);

  /// @brief Number of built-in presets.
  static size_t presetCount();

  /// @brief Name of the preset at index, or "" when out of range.
  static const char* presetName(size_t index);

  /// @brief Add one button.
  /// @return False if the pitch is above 127, the row or column is above
  /// kMaxButtonIndex, or the position is already taken.
  bool addButton(uint8_t row, uint8_t column, uint8_t pitch);

  /// @brief Candidate buttons for a pitch, ordered by row then column.
  /// @return Empty vector when the pitch is not on this layout.
  const std::vector<ButtonPosition>& candidates(uint8_t pitch) const;

  /// @brief Check whether a pitch has at least one button.
  bool isMapped(uint8_t pitch) const;

  /// @brief Pitch of the button at a position.
  /// @return 0 when there is no button at that position.
  uint8_t pitchAt(const ButtonPosition& position) const;

  /// @brief Lowest mapped pitch (0 for an empty layout).
  uint8_t lowestPitch() const;

  /// @brief Highest mapped pitch (0 for an empty layout).
  uint8_t highestPitch() const;

  /// @brief Geometric middle of the button field, used as the resting hand position.
  GridPoint physicalCenter() const;

  const std::vector<Button>& buttons() const { return buttons_; }
  const LayoutGeometry& geometry() const { return geometry_; }
  void setGeometry(const LayoutGeometry& geometry) { geometry_ = geometry; }
  LayoutSystem system() const { return system_; }
  uint8_t rowCount() const { return row_count_; }
  uint8_t columnCount() const { return column_count_; }
  bool empty() const { return buttons_.empty(); }

 private:
  std::vector<Button> buttons_;
  std::array<std::vector<ButtonPosition>, kMidiPitchCount> pitch_index_;
  LayoutGeometry geometry_;
  LayoutSystem system_ = LayoutSystem::Custom;
  uint8_t row_count_ = 0;
  uint8_t column_count_ = 0;
};

/// @brief Summary of how many event notes a layout can play.
struct MappingValidation {
  size_t total_notes = 0;
  size_t mapped_notes = 0;
  size_t unmapped_notes = 0;
  float success_rate = 0.0f;  // Percent, 0 when there are no notes
  bool valid = true;          // All notes mapped
  int first_unmapped_event = -1;
  uint8_t first_unmapped_pitch = 0;
};

/// @brief Check every note of a sequence against a layout.
MappingValidation validateEvents(const std::vector<MusicalEvent>& events,
                                 const ButtonLayout& layout);

}  // namespace akkordio

#endif  // AKKORDIO_INSTRUMENT_ACCORDION_BUTTON_LAYOUT_H
