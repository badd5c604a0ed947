#pragma once

#include "core/errors/exit_codes.hpp"
#include "core/errors/save_error.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "payload/item_payload.hpp"
#include "savefile/config/save_options.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace savefile::batch {

inline constexpr std::string_view kSavedPathKey = "savedFilePath";
inline constexpr std::string_view kErrorKey = "error";

struct BatchResult {
  // One record per processed item, in input order.
  std::vector<core::json::Value> records;
  std::size_t saved_count = 0;
  std::size_t failed_count = 0;
};

// First failure that stopped the batch (continue_on_fail == false).
struct BatchError {
  std::size_t item_index = 0;
  core::errors::ExitCode exit_code = core::errors::ExitCode::kFailure;
  std::string message;
};

// Saves one already-extracted payload with the batch options.
//
// Ensures the folder first when `options.create_folders` is set; a failure
// there is reported as kIoFailure before any counter work happens. The base
// is sanitized before it reaches the saver.
bool SaveExtractedPayload(const payload::ExtractedPayload& extracted,
                          const config::SaveNodeOptions& options, core::logging::Logger* logger,
                          std::filesystem::path& saved_path, core::errors::SaveError& error);

// Processes `items` in order.
//
// Success record: the item's "json" object plus "savedFilePath".
// Failure with continue_on_fail: record {"error": "<message>"} and carry on.
// Failure without it: returns false with `error` set; `result` holds the
// records produced so far.
bool RunBatch(const std::vector<core::json::Value>& items, const config::SaveNodeOptions& options,
              const std::filesystem::path& source_root, core::logging::Logger& logger,
              BatchResult& result, BatchError& error);

// Newline-delimited compact JSON, one line per record.
std::string ToJsonl(const std::vector<core::json::Value>& records);

} // namespace savefile::batch
