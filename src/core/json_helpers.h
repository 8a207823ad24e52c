// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for the
// FingeringSolution output consumed by the API layer and visualizer.

#ifndef AKKORDIO_CORE_JSON_HELPERS_H
#define AKKORDIO_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace akkordio {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("midi");
///   writer.value(60);
///   writer.key("note");
///   writer.value("C4");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"midi":60,"note":"C4"}
/// @endcode
///
/// Commas are inserted automatically. Structure is not validated; the caller
/// must match begin/end pairs.
class JsonWriter {
 public:
  JsonWriter() = default;

  /// @brief Create a writer that rounds floating-point values.
  /// @param float_precision Maximum number of fractional digits (0-9).
  explicit JsonWriter(int float_precision);

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C string value. Avoids the bool overload for literals.
  void value(const char* val);

  void value(int val);
  void value(uint32_t val);
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief Write `"name": val` in one call.
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

 private:
  /// Open a container with the given bracket.
  void open(char bracket);

  /// Close a container with the given bracket.
  void close(char bracket);

  /// Append raw scalar text, inserting a separating comma if needed.
  void writeScalar(std::string_view text);

  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;

  // -1 = shortest round-trippable representation (stream default).
  int float_precision_ = -1;
};

}  // namespace akkordio

#endif  // AKKORDIO_CORE_JSON_HELPERS_H
