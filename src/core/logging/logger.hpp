#pragma once

#include "core/json_utils.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace savefile::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline constexpr std::string_view kLogLevelChoices = "debug|info|warn|error";

// Case-insensitive; "warning" is accepted as an alias of "warn".
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  struct Name {
    std::string_view text;
    LogLevel level;
  };
  static constexpr std::array<Name, 5> kNames = {{
      {"debug", LogLevel::kDebug},
      {"info", LogLevel::kInfo},
      {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn},
      {"error", LogLevel::kError},
  }};

  error.clear();
  std::string lowered(raw);
  for (char& c : lowered) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }

  for (const Name& name : kNames) {
    if (lowered == name.text) {
      level = name.level;
      return true;
    }
  }

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kLogLevelChoices) + ")";
  } else {
    error = "invalid --log-level '" + std::string(raw) + "' (expected " +
            std::string(kLogLevelChoices) + ")";
  }
  return false;
}

// key=value line logger shared by the CLI, the batch runner and the saver.
//
// Line layout:
//   ts_utc=<iso8601> level=<LEVEL> <context fields> msg="<message>" <fields>
// Context fields (batch_id first) are attached to every line until changed.
// Values are quoted with JSON string escaping.
//
// Each line is assembled before the lock is taken and written in one call,
// so savers on different threads sharing a logger never interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {
    context_.emplace_back("batch_id", "-");
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetBatchId(std::string batch_id) {
    SetContext("batch_id", std::move(batch_id));
  }

  std::string BatchId() const {
    return Context("batch_id");
  }

  // Adds or replaces a context field. Insertion order is kept.
  void SetContext(std::string_view key, std::string value) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [existing_key, existing_value] : context_) {
      if (existing_key == key) {
        existing_value = std::move(value);
        return;
      }
    }
    context_.emplace_back(std::string(key), std::move(value));
  }

  std::string Context(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [existing_key, existing_value] : context_) {
      if (existing_key == key) {
        return existing_value;
      }
    }
    return "";
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string tail = " msg=";
    tail += QuoteJson(message);
    for (const LogFieldView& field : fields) {
      AppendField(tail, field.key, field.value);
    }
    tail.push_back('\n');

    std::string line = "ts_utc=";
    line += FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : context_) {
      AppendField(line, key, value);
    }
    line += tail;
    out_->write(line.data(), static_cast<std::streamsize>(line.size()));
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line.push_back(' ');
    line += key;
    line.push_back('=');
    line += QuoteJson(value);
  }

  // 2024-05-01T12:00:00.123Z
  static std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    const int millis_component = static_cast<int>((millis % 1000 + 1000) % 1000);

    const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
    std::tm utc_time{};
    if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
      return "";
    }

    char seconds_text[32];
    if (std::strftime(seconds_text, sizeof(seconds_text), "%Y-%m-%dT%H:%M:%S", &utc_time) == 0U) {
      return "";
    }
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", seconds_text, millis_component);
    return out;
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, std::string>> context_;
};

} // namespace savefile::core::logging
