#ifndef SAVEFILE_NAMING_FILENAME_FORMATTER_HPP_
#define SAVEFILE_NAMING_FILENAME_FORMATTER_HPP_

#include <cstdint>
#include <string>
#include <string_view>

namespace savefile::naming {

inline constexpr std::string_view kBaseToken = "{base}";
inline constexpr std::string_view kCounterToken = "{counter}";
inline constexpr std::string_view kDefaultPattern = "{base}_{counter}";

// Upper bound for counter padding: one filename component (NAME_MAX).
inline constexpr int kMaxCounterPadding = 255;

// Naming scheme for one save request.
//
// Only the first `{base}` and the first `{counter}` in `pattern` are
// substituted; later occurrences are left as literal text. When `{counter}`
// is absent every counter value formats to the same name.
struct NamingConfig {
  std::string pattern = std::string(kDefaultPattern);
  std::string base;
  // Without leading dot. Empty means "no extension".
  std::string extension;
  std::uint64_t counter_start = 1;
  // <= 0 means natural decimal representation. Values above
  // kMaxCounterPadding are clamped to it; option and flag parsing reject them.
  int counter_padding = 3;
};

// Characters replaced by '-' in every produced filename.
inline constexpr std::string_view kUnsafeFilenameChars = "/\\?%*:|\"<>";

// Replaces unsafe characters with '-' and trims surrounding whitespace.
std::string SanitizeFilename(std::string_view name);

// Left-pads with '0' to `padding` digits, at most kMaxCounterPadding. Never
// truncates.
std::string PadCounter(std::uint64_t counter, int padding);

// Replaces the first occurrence of `token` in `text`. Returns true when a
// replacement happened.
bool ReplaceFirst(std::string& text, std::string_view token, std::string_view replacement);

// Pure and deterministic: substitute tokens, sanitize the composed name,
// append ".<extension>" when the extension is non-empty.
std::string FormatFilename(std::string_view pattern, std::string_view base, std::uint64_t counter,
                           int padding, std::string_view extension);

inline std::string FormatFilename(const NamingConfig& config, std::uint64_t counter) {
  return FormatFilename(config.pattern, config.base, counter, config.counter_padding,
                        config.extension);
}

// True when the formatted name depends on the counter, i.e. a `{counter}`
// token survives base substitution.
bool CounterVaries(std::string_view pattern, std::string_view base);

} // namespace savefile::naming

#endif // SAVEFILE_NAMING_FILENAME_FORMATTER_HPP_
