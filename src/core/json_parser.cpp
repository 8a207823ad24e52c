// Implementation of the minimal JSON reader.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace akkordio {

const JsonValue* JsonValue::find(const std::string& key) const {
  if (type != Object) return nullptr;
  for (size_t idx = 0; idx < member_keys.size(); ++idx) {
    if (member_keys[idx] == key) return &member_values[idx];
  }
  return nullptr;
}

bool JsonValue::isInteger() const {
  return type == Number && std::isfinite(number_val) && std::trunc(number_val) == number_val;
}

int JsonValue::asInt(int default_val) const {
  // Casting an out-of-range double is undefined.
  if (type != Number || !(number_val >= static_cast<double>(std::numeric_limits<int>::min()) &&
                          number_val <= static_cast<double>(std::numeric_limits<int>::max()))) {
    return default_val;
  }
  return static_cast<int>(number_val);
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type != Number ||
      !(number_val >= 0.0 &&
        number_val <= static_cast<double>(std::numeric_limits<uint32_t>::max()))) {
    return default_val;
  }
  return static_cast<uint32_t>(number_val);
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// Nesting limit guarding the recursive descent.
constexpr int kMaxDepth = 64;

/// @brief Recursive-descent reader over a byte range.
class JsonReader {
 public:
  JsonReader(const char* json, size_t length) : json_(json), length_(length) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ != length_) return fail("trailing characters after JSON value");
    return true;
  }

  const std::string& error() const { return error_; }

 private:
  bool fail(const char* message) {
    if (error_.empty()) {
      error_ = std::string(message) + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  void skipWhitespace() {
    while (pos_ < length_ && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(const char* literal) {
    size_t start = pos_;
    for (const char* chr = literal; *chr != '\0'; ++chr) {
      if (pos_ >= length_ || json_[pos_] != *chr) {
        pos_ = start;
        return false;
      }
      ++pos_;
    }
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    if (pos_ >= length_) return fail("unexpected end of input");

    char chr = json_[pos_];
    if (chr == '{') return parseObject(out, depth);
    if (chr == '[') return parseArray(out, depth);
    if (chr == '"') {
      out.type = JsonValue::String;
      return parseString(out.string_val);
    }
    if (chr == 't') {
      if (!consumeLiteral("true")) return fail("invalid literal");
      out.type = JsonValue::Bool;
      out.bool_val = true;
      return true;
    }
    if (chr == 'f') {
      if (!consumeLiteral("false")) return fail("invalid literal");
      out.type = JsonValue::Bool;
      out.bool_val = false;
      return true;
    }
    if (chr == 'n') {
      if (!consumeLiteral("null")) return fail("invalid literal");
      out.type = JsonValue::Null;
      return true;
    }
    if (chr == '-' || std::isdigit(static_cast<unsigned char>(chr))) {
      return parseNumber(out);
    }
    return fail("unexpected character");
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // '{'
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == '}') {
      ++pos_;
      return true;
    }

    while (pos_ < length_) {
      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != '"') return fail("expected object key");
      std::string key;
      if (!parseString(key)) return false;

      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != ':') return fail("expected ':'");
      ++pos_;
      skipWhitespace();

      JsonValue member;
      if (!parseValue(member, depth + 1)) return false;
      out.member_keys.push_back(std::move(key));
      out.member_values.push_back(std::move(member));

      skipWhitespace();
      if (pos_ >= length_) break;
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or '}'");
    }
    return fail("unterminated object");
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // '['
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (pos_ < length_) {
      skipWhitespace();
      JsonValue item;
      if (!parseValue(item, depth + 1)) return false;
      out.items.push_back(std::move(item));

      skipWhitespace();
      if (pos_ >= length_) break;
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or ']'");
    }
    return fail("unterminated array");
  }

  bool parseHex4(uint32_t& code) {
    if (pos_ + 4 > length_) return fail("truncated \\u escape");
    code = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char chr = json_[pos_++];
      code <<= 4;
      if (chr >= '0' && chr <= '9') {
        code |= static_cast<uint32_t>(chr - '0');
      } else if (chr >= 'a' && chr <= 'f') {
        code |= static_cast<uint32_t>(chr - 'a' + 10);
      } else if (chr >= 'A' && chr <= 'F') {
        code |= static_cast<uint32_t>(chr - 'A' + 10);
      } else {
        return fail("invalid hex digit in \\u escape");
      }
    }
    return true;
  }

  static void appendUtf8(std::string& out, uint32_t code) {
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (code >> 18));
      out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
  }

  bool parseString(std::string& out) {
    ++pos_;  // opening quote
    out.clear();
    while (pos_ < length_) {
      char chr = json_[pos_++];
      if (chr == '"') return true;
      if (static_cast<unsigned char>(chr) < 0x20) return fail("control character in string");
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (pos_ >= length_) break;
      char esc = json_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          uint32_t code = 0;
          if (!parseHex4(code)) return false;
          // Surrogate pair.
          if (code >= 0xD800 && code <= 0xDBFF && pos_ + 6 <= length_ &&
              json_[pos_] == '\\' && json_[pos_ + 1] == 'u') {
            pos_ += 2;
            uint32_t low = 0;
            if (!parseHex4(low)) return false;
            if (low >= 0xDC00 && low <= 0xDFFF) {
              code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            }
          }
          appendUtf8(out, code);
          break;
        }
        default:
          return fail("invalid escape sequence");
      }
    }
    return fail("unterminated string");
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (json_[pos_] == '-') ++pos_;
    if (pos_ >= length_ || !std::isdigit(static_cast<unsigned char>(json_[pos_]))) {
      return fail("invalid number");
    }
    while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    if (pos_ < length_ && json_[pos_] == '.') {
      ++pos_;
      if (pos_ >= length_ || !std::isdigit(static_cast<unsigned char>(json_[pos_]))) {
        return fail("invalid number");
      }
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    }
    if (pos_ < length_ && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < length_ && (json_[pos_] == '+' || json_[pos_] == '-')) ++pos_;
      if (pos_ >= length_ || !std::isdigit(static_cast<unsigned char>(json_[pos_]))) {
        return fail("invalid number exponent");
      }
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    }

    std::string num_str(json_ + start, pos_ - start);
    out.type = JsonValue::Number;
    out.number_val = std::strtod(num_str.c_str(), nullptr);
    return true;
  }

  const char* json_;
  size_t length_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

bool parseJson(const char* json, size_t length, JsonValue& out, std::string* error) {
  if (json == nullptr || length == 0) {
    if (error) *error = "empty input";
    return false;
  }

  JsonReader reader(json, length);
  JsonValue parsed;
  if (!reader.parseDocument(parsed)) {
    if (error) *error = reader.error();
    return false;
  }
  out = std::move(parsed);
  return true;
}

}  // namespace akkordio
