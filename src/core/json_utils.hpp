#ifndef SAVEFILE_CORE_JSON_UTILS_HPP_
#define SAVEFILE_CORE_JSON_UTILS_HPP_

#include <string>
#include <string_view>

namespace savefile::core {

// Appends `input` to `out` as the body of a JSON string literal.
// Bytes >= 0x80 pass through untouched so UTF-8 file names and payload text
// survive as-is; other control bytes become \u00XX.
inline void AppendJsonEscaped(std::string& out, std::string_view input) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      continue;
    case '\\':
      out += "\\\\";
      continue;
    case '\b':
      out += "\\b";
      continue;
    case '\f':
      out += "\\f";
      continue;
    case '\n':
      out += "\\n";
      continue;
    case '\r':
      out += "\\r";
      continue;
    case '\t':
      out += "\\t";
      continue;
    default:
      break;
    }

    const auto byte = static_cast<unsigned char>(ch);
    if (byte >= 0x20U) {
      out.push_back(ch);
      continue;
    }
    out += "\\u00";
    out.push_back(kHexDigits[byte >> 4U]);
    out.push_back(kHexDigits[byte & 0x0FU]);
  }
}

inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  AppendJsonEscaped(out, input);
  return out;
}

inline std::string QuoteJson(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 2U);
  out.push_back('"');
  AppendJsonEscaped(out, input);
  out.push_back('"');
  return out;
}

} // namespace savefile::core

#endif // SAVEFILE_CORE_JSON_UTILS_HPP_
