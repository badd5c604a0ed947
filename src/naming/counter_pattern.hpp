#ifndef SAVEFILE_NAMING_COUNTER_PATTERN_HPP_
#define SAVEFILE_NAMING_COUNTER_PATTERN_HPP_

#include "naming/filename_formatter.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace savefile::naming {

// Escapes ECMAScript regex metacharacters so `text` matches literally.
std::string EscapeRegex(std::string_view text);

// Builds the anchored regex source matching every name FormatFilename can
// produce for (pattern, base, *, *, extension), with the counter digits in
// capture group 1.
//
// `{base}` is replaced by the sanitized base. The literal text around
// `{counter}` is sanitized and trimmed exactly as the formatter does, then
// escaped. Returns std::nullopt when no `{counter}` token survives base
// substitution; such a pattern names a single file and yields no counters.
std::optional<std::string> BuildCounterRegexSource(std::string_view pattern, std::string_view base,
                                                   std::string_view extension);

// Matches directory entry names against one naming scheme.
class CounterPattern {
public:
  CounterPattern(std::string_view pattern, std::string_view base, std::string_view extension);
  explicit CounterPattern(const NamingConfig& config)
      : CounterPattern(config.pattern, config.base, config.extension) {}

  // Counter encoded in `filename`, or std::nullopt when the name does not
  // belong to this scheme or the digits do not fit in 64 bits.
  std::optional<std::uint64_t> ParseCounter(const std::string& filename) const;

  bool HasCounter() const {
    return regex_.has_value();
  }

private:
  std::optional<std::regex> regex_;
};

} // namespace savefile::naming

#endif // SAVEFILE_NAMING_COUNTER_PATTERN_HPP_
