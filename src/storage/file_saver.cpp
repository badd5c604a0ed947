#include "storage/file_saver.hpp"

#include "storage/counter_scan.hpp"

#include <limits>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace savefile::storage {

namespace {

void LogDebug(const SaveOptions& options, std::string_view message,
              std::initializer_list<core::logging::LogFieldView> fields) {
  if (options.logger != nullptr) {
    options.logger->Debug(message, fields);
  }
}

bool SaveOverwrite(const SaveRequest& request, const SaveOptions& options, fs::path& saved_path,
                   core::errors::SaveError& error) {
  const fs::path target =
      request.directory / naming::FormatFilename(request.naming, request.naming.counter_start);

  std::error_code ec;
  std::string message;
  if (!WriteTruncate(target, request.payload, options.io_ops, ec, message)) {
    error = core::errors::MakeIoFailure(message, ec);
    return false;
  }

  LogDebug(options, "file written in overwrite mode", {{"path", target.string()}});
  saved_path = target;
  return true;
}

} // namespace

bool CreateWithRetry(const fs::path& directory, const naming::NamingConfig& naming,
                     std::uint64_t first_counter, std::span<const std::uint8_t> payload,
                     const SaveOptions& options, fs::path& saved_path,
                     core::errors::SaveError& error) {
  std::uint64_t max_attempts = options.max_create_retries;
  if (!naming::CounterVaries(naming.pattern, naming.base)) {
    max_attempts = max_attempts > 0U ? 1U : 0U;
  }
  const std::uint64_t headroom = std::numeric_limits<std::uint64_t>::max() - first_counter;
  if (max_attempts > 0U && max_attempts - 1U > headroom) {
    max_attempts = headroom + 1U;
  }

  for (std::uint64_t attempt = 0; attempt < max_attempts; ++attempt) {
    const std::uint64_t counter = first_counter + attempt;
    const fs::path candidate = directory / naming::FormatFilename(naming, counter);

    std::error_code ec;
    std::string message;
    switch (CreateExclusive(candidate, payload, options.io_ops, ec, message)) {
    case CreateStatus::kCreated:
      LogDebug(options, "file created",
               {{"path", candidate.string()}, {"counter", std::to_string(counter)}});
      saved_path = candidate;
      return true;
    case CreateStatus::kAlreadyExists:
      LogDebug(options, "filename taken, advancing counter",
               {{"path", candidate.string()}, {"counter", std::to_string(counter)}});
      continue;
    case CreateStatus::kFailed:
      error = core::errors::MakeIoFailure(message, ec);
      return false;
    }
  }

  error = core::errors::MakeAllocationExhausted(
      "could not find free filename for base \"" + naming.base +
          "\" after scanning existing files and retrying " + std::to_string(max_attempts) +
          " times",
      naming.base, max_attempts);
  return false;
}

bool SaveFile(const SaveRequest& request, const SaveOptions& options, fs::path& saved_path,
              core::errors::SaveError& error) {
  if (request.overwrite) {
    return SaveOverwrite(request, options, saved_path, error);
  }

  ExistingCounterSet existing;
  std::error_code ec;
  std::string message;
  if (!ScanExistingCounters(request.directory, request.naming, existing, ec, message)) {
    error = core::errors::MakeIoFailure(message, ec);
    return false;
  }

  std::uint64_t counter = 0;
  if (!FindNextAvailableCounter(existing, request.naming.counter_start,
                                options.max_scan_attempts, counter)) {
    error = core::errors::MakeAllocationExhausted(
        "could not find free counter after " + std::to_string(options.max_scan_attempts) +
            " attempts starting from " + std::to_string(request.naming.counter_start) +
            " for base \"" + request.naming.base + "\"",
        request.naming.base, options.max_scan_attempts);
    return false;
  }

  LogDebug(options, "counter selected from folder scan",
           {{"folder", request.directory.string()},
            {"existing", std::to_string(existing.size())},
            {"counter", std::to_string(counter)}});

  return CreateWithRetry(request.directory, request.naming, counter, request.payload, options,
                         saved_path, error);
}

} // namespace savefile::storage
