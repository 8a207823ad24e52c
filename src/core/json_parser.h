// Minimal JSON reader for solve requests (no external dependencies).
//
// Parses a complete JSON document (objects, arrays, strings, numbers,
// booleans, null) into a JsonValue tree. Object member order is preserved.

#ifndef AKKORDIO_CORE_JSON_PARSER_H
#define AKKORDIO_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace akkordio {

/// @brief A JSON value of any type.
struct JsonValue {
  enum Type { Null, Bool, Number, String, Array, Object };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// Array elements (type == Array).
  std::vector<JsonValue> items;

  /// Object members (type == Object), keys and values index-aligned.
  std::vector<std::string> member_keys;
  std::vector<JsonValue> member_values;

  bool isNull() const { return type == Null; }
  bool isObject() const { return type == Object; }
  bool isArray() const { return type == Array; }
  bool isNumber() const { return type == Number; }

  /// @brief True for a finite number with no fractional part.
  bool isInteger() const;
  bool isString() const { return type == String; }

  /// @brief Look up an object member.
  /// @return Pointer to the value, or nullptr if absent or not an object.
  const JsonValue* find(const std::string& key) const;

  /// @brief Get value as integer, with default (non-number or out of range -> default).
  int asInt(int default_val = 0) const;

  /// @brief Get value as unsigned integer, with default (out of uint32_t range -> default).
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// @brief Parse a JSON document.
/// @param json Pointer to JSON text.
/// @param length Length of the text in bytes.
/// @param out Parsed value (untouched on failure).
/// @param error If non-null, receives a message with the byte offset on failure.
/// @return True when the whole input is one well-formed JSON value.
bool parseJson(const char* json, size_t length, JsonValue& out,
               std::string* error = nullptr);

}  // namespace akkordio

#endif  // AKKORDIO_CORE_JSON_PARSER_H
