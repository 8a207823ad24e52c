// Treble button layout implementation.

#include "instrument/accordion/button_layout.h"

#include <algorithm>

namespace akkordio {

namespace {

/// @brief Preset chromatic keyboards.
struct LayoutPreset {
  const char* name;
  LayoutSystem system;
  uint8_t rows;
  uint8_t columns;
  uint8_t start_pitch;
};

constexpr LayoutPreset kPresets[] = {
    {"c_system_5row", LayoutSystem::CSystem, 5, 12, 48},     // C3
    {"c_system_4row", LayoutSystem::CSystem, 4, 12, 48},
    {"c_system_3row", LayoutSystem::CSystem, 3, 11, 48},
    {"b_system_5row", LayoutSystem::BSystem, 5, 12, 47},     // B2
    {"b_system_4row", LayoutSystem::BSystem, 4, 12, 47},
    {"b_system_3row", LayoutSystem::BSystem, 3, 11, 47},
    {"freebass_c_5row", LayoutSystem::FreeBassC, 5, 12, 36}, // C2
    {"freebass_b_5row", LayoutSystem::FreeBassB, 5, 12, 35}, // B1
};

constexpr size_t kPresetCount = sizeof(kPresets) / sizeof(kPresets[0]);

const std::vector<ButtonPosition> kNoCandidates;

}  // namespace

const char* layoutSystemToString(LayoutSystem system) {
  switch (system) {
    case LayoutSystem::Custom:    return "custom";
    case LayoutSystem::CSystem:   return "c-system";
    case LayoutSystem::BSystem:   return "b-system";
    case LayoutSystem::FreeBassC: return "freebass-c";
    case LayoutSystem::FreeBassB: return "freebass-b";
  }
  return "custom";
}

bool layoutSystemFromString(const std::string& str, LayoutSystem& system) {
  if (str == "custom") {
    system = LayoutSystem::Custom;
  } else if (str == "c-system") {
    system = LayoutSystem::CSystem;
  } else if (str == "b-system") {
    system = LayoutSystem::BSystem;
  } else if (str == "freebass-c") {
    system = LayoutSystem::FreeBassC;
  } else if (str == "freebass-b") {
    system = LayoutSystem::FreeBassB;
  } else {
    return false;
  }
  return true;
}

ButtonLayout::ButtonLayout(const LayoutGeometry& geometry, LayoutSystem system)
    : geometry_(geometry), system_(system) {}

ButtonLayout ButtonLayout::chromatic(LayoutSystem system, uint8_t rows, uint8_t columns,
                                     uint8_t start_pitch, const LayoutGeometry& geometry) {
  ButtonLayout layout(geometry, system);
  for (uint8_t row = 0; row < rows; ++row) {
    for (uint8_t col = 0; col < columns; ++col) {
      // Rows step by a semitone, columns by a whole tone.
      int pitch = static_cast<int>(start_pitch) + row + 2 * col;
      if (pitch > kMaxMidiPitch) continue;
      layout.addButton(row, col, static_cast<uint8_t>(pitch));
    }
  }
  return layout;
}

ButtonLayout ButtonLayout::chromatic(LayoutSystem system, uint8_t rows, uint8_t columns,
                                     uint8_t start_pitch) {
  bool free_bass = system == LayoutSystem::FreeBassC || system == LayoutSystem::FreeBassB;
  return chromatic(system, rows, columns, start_pitch,
                   free_bass ? LayoutGeometry::freeBass() : LayoutGeometry::standard());
}

bool ButtonLayout::fromPreset(const std::string& name, ButtonLayout& out) {
  for (const auto& preset : kPresets) {
    if (name == preset.name) {
      out = chromatic(preset.system, preset.rows, preset.columns, preset.start_pitch);
      return true;
    }
  }
  return false;
}

size_t ButtonLayout::presetCount() { return kPresetCount; }

const char* ButtonLayout::presetName(size_t index) {
  if (index >= kPresetCount) return "";
  return kPresets[index].name;
}

bool ButtonLayout::addButton(uint8_t row, uint8_t column, uint8_t pitch) {
  if (pitch > kMaxMidiPitch) return false;
  // Row and column counts are stored in uint8_t.
  if (row > kMaxButtonIndex || column > kMaxButtonIndex) return false;

  ButtonPosition position{row, column};
  for (const auto& button : buttons_) {
    if (button.position == position) return false;
  }

  buttons_.push_back({position, pitch});

  auto& slot = pitch_index_[pitch];
  slot.insert(std::upper_bound(slot.begin(), slot.end(), position), position);

  row_count_ = std::max<uint8_t>(row_count_, static_cast<uint8_t>(row + 1));
  column_count_ = std::max<uint8_t>(column_count_, static_cast<uint8_t>(column + 1));
  return true;
}

const std::vector<ButtonPosition>& ButtonLayout::candidates(uint8_t pitch) const {
  if (pitch > kMaxMidiPitch) return kNoCandidates;
  return pitch_index_[pitch];
}

bool ButtonLayout::isMapped(uint8_t pitch) const {
  return pitch <= kMaxMidiPitch && !pitch_index_[pitch].empty();
}

uint8_t ButtonLayout::pitchAt(const ButtonPosition& position) const {
  for (const auto& button : buttons_) {
    if (button.position == position) return button.pitch;
  }
  return 0;
}

uint8_t ButtonLayout::lowestPitch() const {
  for (size_t pitch = 0; pitch < kMidiPitchCount; ++pitch) {
    if (!pitch_index_[pitch].empty()) return static_cast<uint8_t>(pitch);
  }
  return 0;
}

uint8_t ButtonLayout::highestPitch() const {
  for (size_t pitch = kMidiPitchCount; pitch > 0; --pitch) {
    if (!pitch_index_[pitch - 1].empty()) return static_cast<uint8_t>(pitch - 1);
  }
  return 0;
}

GridPoint ButtonLayout::physicalCenter() const {
  if (buttons_.empty()) return {};

  uint8_t min_row = buttons_.front().position.row;
  uint8_t max_row = min_row;
  uint8_t min_col = buttons_.front().position.column;
  uint8_t max_col = min_col;
  for (const auto& button : buttons_) {
    min_row = std::min(min_row, button.position.row);
    max_row = std::max(max_row, button.position.row);
    min_col = std::min(min_col, button.position.column);
    max_col = std::max(max_col, button.position.column);
  }

  GridPoint center;
  center.row = (static_cast<float>(min_row) + static_cast<float>(max_row)) / 2.0f;
  center.column = (static_cast<float>(min_col) + static_cast<float>(max_col)) / 2.0f;
  return center;
}

MappingValidation validateEvents(const std::vector<MusicalEvent>& events,
                                 const ButtonLayout& layout) {
  MappingValidation result;
  for (size_t idx = 0; idx < events.size(); ++idx) {
    for (const auto& note : events[idx].notes) {
      ++result.total_notes;
      if (layout.isMapped(note.pitch)) {
        ++result.mapped_notes;
      } else {
        ++result.unmapped_notes;
        if (result.first_unmapped_event < 0) {
          result.first_unmapped_event = static_cast<int>(idx);
          result.first_unmapped_pitch = note.pitch;
        }
      }
    }
  }

  result.valid = result.unmapped_notes == 0;
  if (result.total_notes > 0) {
    result.success_rate = static_cast<float>(result.mapped_notes) * 100.0f /
                          static_cast<float>(result.total_notes);
  }
  return result;
}

}  // namespace akkordio
