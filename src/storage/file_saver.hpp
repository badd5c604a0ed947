#pragma once

#include "core/errors/save_error.hpp"
#include "core/logging/logger.hpp"
#include "naming/filename_formatter.hpp"
#include "storage/exclusive_file.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace savefile::storage {

inline constexpr std::uint64_t kDefaultMaxScanAttempts = 10000;
inline constexpr std::uint64_t kDefaultMaxCreateRetries = 100;

// One payload destined for `directory`. The directory is not created here;
// callers that want it created do so before saving.
struct SaveRequest {
  std::filesystem::path directory;
  naming::NamingConfig naming;
  std::vector<std::uint8_t> payload;
  bool overwrite = false;
};

struct SaveOptions {
  // Discovery bound: how many counters past counter_start may be skipped
  // because the directory listing shows them taken.
  std::uint64_t max_scan_attempts = kDefaultMaxScanAttempts;
  // Create bound: how many O_EXCL attempts may hit an existing file.
  std::uint64_t max_create_retries = kDefaultMaxCreateRetries;
  FileIoOps io_ops = FileIoOps::Default();
  // Optional; receives debug lines for collisions and chosen counters.
  core::logging::Logger* logger = nullptr;
};

// Saves `request.payload` under a name from `request.naming`.
//
// overwrite == true: formats with counter_start and create-or-truncates that
// path. No scan, no retry.
//
// overwrite == false:
// 1) scan the directory for counters already used by the scheme
// 2) pick the first free counter at or after counter_start
// 3) CreateWithRetry from that counter
//
// On success `saved_path` is directory / filename and the file holds exactly
// the payload. On failure `error.kind` is kIoFailure or kAllocationExhausted
// and no file of ours is left behind.
//
// The base is used as given. Whitespace is trimmed only from the ends of the
// composed name, so a base such as "rep " yields "rep _001" and discovery
// matches that same spelling.
bool SaveFile(const SaveRequest& request, const SaveOptions& options,
              std::filesystem::path& saved_path, core::errors::SaveError& error);

// Correctness-critical half of SaveFile: attempts O_EXCL creation at
// first_counter, first_counter + 1, ... and only moves on when the name is
// already taken. Any other failure is returned at once. When the pattern has
// no `{counter}` there is exactly one candidate name and one attempt.
bool CreateWithRetry(const std::filesystem::path& directory, const naming::NamingConfig& naming,
                     std::uint64_t first_counter, std::span<const std::uint8_t> payload,
                     const SaveOptions& options, std::filesystem::path& saved_path,
                     core::errors::SaveError& error);

} // namespace savefile::storage
