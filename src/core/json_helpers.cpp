/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace akkordio {

JsonWriter::JsonWriter(int float_precision)
    : float_precision_(float_precision < 0 ? -1 : (float_precision > 9 ? 9 : float_precision)) {}

void JsonWriter::beginObject() { open('{'); }

void JsonWriter::endObject() { close('}'); }

void JsonWriter::beginArray() { open('['); }

void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
  }
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value that follows belongs to this key: no comma before it.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = false;
  }
}

void JsonWriter::value(std::string_view val) {
  std::string quoted;
  quoted.reserve(val.size() + 2);
  quoted += '"';
  quoted += escapeString(val);
  quoted += '"';
  writeScalar(quoted);
}

void JsonWriter::value(const char* val) {
  if (val == nullptr) {
    valueNull();
    return;
  }
  value(std::string_view(val));
}

void JsonWriter::value(int val) { writeScalar(std::to_string(val)); }

void JsonWriter::value(uint32_t val) { writeScalar(std::to_string(val)); }

void JsonWriter::value(double val) {
  // JSON has no NaN / Infinity.
  if (std::isnan(val) || std::isinf(val)) {
    writeScalar("null");
    return;
  }
  std::ostringstream oss;
  if (float_precision_ >= 0) {
    double scale = std::pow(10.0, float_precision_);
    double rounded = std::round(val * scale) / scale;
    if (rounded == 0.0) rounded = 0.0;  // Normalize -0.
    oss << std::setprecision(15) << rounded;
  } else {
    oss << val;
  }
  writeScalar(oss.str());
}

void JsonWriter::value(bool val) { writeScalar(val ? "true" : "false"); }

void JsonWriter::valueNull() { writeScalar("null"); }

std::string JsonWriter::toString() const { return buffer_; }

void JsonWriter::open(char bracket) {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
  }
  buffer_ += bracket;
  needs_comma_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  // The closed container is itself an element of its parent.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

void JsonWriter::writeScalar(std::string_view text) {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
  }
  buffer_ += text;
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        // Control characters (0x00-0x1F) become \u00XX.
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace akkordio
