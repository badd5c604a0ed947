#ifndef SAVEFILE_CORE_JSON_DOM_HPP_
#define SAVEFILE_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace savefile::core::json {

// Minimal DOM shared by the options loader, the batch item reader and text
// payload serialization. STL-only; object keys are kept sorted.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

// Returns the member named `key`, or nullptr when `object` is not an object or
// has no such member.
inline const Value* FindMember(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// Recursive-descent parser with line/column diagnostics.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value.type = Value::Type::kNull;
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  // Called after `\u` has been consumed. Surrogate pairs are combined; a lone
  // surrogate is rejected.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    if (!ReadHex4(code_point, error)) {
      return false;
    }

    if (code_point >= 0xD800U && code_point <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("high surrogate must be followed by a low surrogate", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in unicode escape", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code_point >= 0xDC00U && code_point <= 0xDFFFU) {
      return Fail("unexpected low surrogate in unicode escape", error);
    }

    AppendUtf8(code_point, output);
    return true;
  }

  bool ReadHex4(std::uint32_t& value, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated unicode escape", error);
    }
    const std::string_view digits = input_.substr(pos_, 4);
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
      return Fail("invalid hex digits in unicode escape", error);
    }
    AdvanceN(4);
    return true;
  }

  static void AppendUtf8(std::uint32_t cp, std::string& output) {
    if (cp < 0x80U) {
      output.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string_view text = input_.substr(start, pos_ - start);
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), output);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
      return Fail("invalid numeric value", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

// Shortest round-trip number text; integral values print without a fraction.
inline std::string FormatNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return "null";
  }
  return std::string(buffer, ptr);
}

namespace detail {

inline void AppendIndent(std::string& out, int indent, int depth) {
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent * depth), ' ');
}

inline void Serialize(const Value& value, int indent, int depth, std::string& out) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    out += FormatNumber(value.number_value);
    return;
  case Value::Type::kString:
    out += QuoteJson(value.string_value);
    return;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    bool first = true;
    for (const Value& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      if (indent > 0) {
        AppendIndent(out, indent, depth + 1);
      }
      Serialize(item, indent, depth + 1, out);
    }
    if (indent > 0) {
      AppendIndent(out, indent, depth);
    }
    out.push_back(']');
    return;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      if (indent > 0) {
        AppendIndent(out, indent, depth + 1);
      }
      out += QuoteJson(key);
      out += indent > 0 ? ": " : ":";
      Serialize(item, indent, depth + 1, out);
    }
    if (indent > 0) {
      AppendIndent(out, indent, depth);
    }
    out.push_back('}');
    return;
  }
  }
}

} // namespace detail

// Serializes `value`. indent == 0 yields compact single-line output; a
// positive indent pretty-prints with that many spaces per level.
inline std::string ToJson(const Value& value, int indent = 0) {
  std::string out;
  detail::Serialize(value, indent, 0, out);
  return out;
}

} // namespace savefile::core::json

#endif // SAVEFILE_CORE_JSON_DOM_HPP_
