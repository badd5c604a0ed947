#include "naming/filename_formatter.hpp"

#include <cctype>

namespace savefile::naming {

std::string SanitizeFilename(std::string_view name) {
  std::string sanitized(name);
  for (char& c : sanitized) {
    if (kUnsafeFilenameChars.find(c) != std::string_view::npos) {
      c = '-';
    }
  }

  std::size_t begin = 0U;
  while (begin < sanitized.size() &&
         std::isspace(static_cast<unsigned char>(sanitized[begin])) != 0) {
    ++begin;
  }
  std::size_t end = sanitized.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(sanitized[end - 1U])) != 0) {
    --end;
  }
  return sanitized.substr(begin, end - begin);
}

std::string PadCounter(std::uint64_t counter, int padding) {
  std::string digits = std::to_string(counter);
  if (padding > kMaxCounterPadding) {
    padding = kMaxCounterPadding;
  }
  if (padding <= 0 || digits.size() >= static_cast<std::size_t>(padding)) {
    return digits;
  }
  return std::string(static_cast<std::size_t>(padding) - digits.size(), '0') + digits;
}

bool ReplaceFirst(std::string& text, std::string_view token, std::string_view replacement) {
  const std::size_t pos = text.find(token);
  if (pos == std::string::npos) {
    return false;
  }
  text.replace(pos, token.size(), replacement);
  return true;
}

std::string FormatFilename(std::string_view pattern, std::string_view base, std::uint64_t counter,
                           int padding, std::string_view extension) {
  std::string name(pattern);
  ReplaceFirst(name, kBaseToken, base);
  ReplaceFirst(name, kCounterToken, PadCounter(counter, padding));

  std::string filename = SanitizeFilename(name);
  if (!extension.empty()) {
    filename.push_back('.');
    filename.append(extension);
  }
  return filename;
}

bool CounterVaries(std::string_view pattern, std::string_view base) {
  std::string name(pattern);
  ReplaceFirst(name, kBaseToken, base);
  return name.find(kCounterToken) != std::string::npos;
}

} // namespace savefile::naming
