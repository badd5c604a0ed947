#include "naming/counter_pattern.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace savefile::naming {

namespace {

constexpr std::string_view kRegexMetaChars = "\\^$.|?*+()[]{}";
constexpr std::string_view kCounterCapture = "(\\d+)";

std::string SanitizeChars(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    if (kUnsafeFilenameChars.find(c) != std::string_view::npos) {
      c = '-';
    }
  }
  return out;
}

std::string TrimLeft(std::string text) {
  std::size_t begin = 0U;
  while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  return text.substr(begin);
}

std::string TrimRight(std::string text) {
  std::size_t end = text.size();
  while (end > 0U && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
    --end;
  }
  text.resize(end);
  return text;
}

} // namespace

std::string EscapeRegex(std::string_view text) {
  std::string escaped;
  escaped.reserve(text.size() * 2U);
  for (const char c : text) {
    if (kRegexMetaChars.find(c) != std::string_view::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

std::optional<std::string> BuildCounterRegexSource(std::string_view pattern, std::string_view base,
                                                   std::string_view extension) {
  // Compose exactly as FormatFilename does; sanitizing and trimming happen on
  // the composed text, never on the base alone.
  std::string composed(pattern);
  ReplaceFirst(composed, kBaseToken, base);

  const std::size_t counter_pos = composed.find(kCounterToken);
  if (counter_pos == std::string::npos) {
    return std::nullopt;
  }

  // Sanitization is per character, so it distributes over the split; the
  // formatter's trim only touches the outer ends of the composed name.
  const std::string prefix = TrimLeft(SanitizeChars(composed.substr(0, counter_pos)));
  const std::string suffix =
      TrimRight(SanitizeChars(composed.substr(counter_pos + kCounterToken.size())));

  std::string source = EscapeRegex(prefix);
  source.append(kCounterCapture);
  source.append(EscapeRegex(suffix));
  if (!extension.empty()) {
    source.append("\\.");
    source.append(EscapeRegex(extension));
  }
  return source;
}

CounterPattern::CounterPattern(std::string_view pattern, std::string_view base,
                               std::string_view extension) {
  const std::optional<std::string> source = BuildCounterRegexSource(pattern, base, extension);
  if (!source.has_value()) {
    return;
  }
  regex_.emplace("^" + *source + "$", std::regex::ECMAScript | std::regex::optimize);
}

std::optional<std::uint64_t> CounterPattern::ParseCounter(const std::string& filename) const {
  if (!regex_.has_value()) {
    return std::nullopt;
  }

  std::smatch match;
  if (!std::regex_match(filename, match, *regex_) || match.size() < 2U || !match[1].matched) {
    return std::nullopt;
  }

  const std::string digits = match[1].str();
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace savefile::naming
