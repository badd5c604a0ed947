#pragma once

#include "core/json_dom.hpp"
#include "naming/filename_formatter.hpp"
#include "payload/item_payload.hpp"
#include "storage/file_saver.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace savefile::config {

// Every knob of one save batch, with the defaults used when neither an options
// file nor a CLI flag sets a value.
struct SaveNodeOptions {
  std::filesystem::path folder_path = "/tmp/savefile-files";
  payload::InputMode input_mode = payload::InputMode::kBinary;
  std::string binary_property = "data";
  std::string data_field;
  std::string base_file_name = "file";
  std::string file_extension;
  int counter_padding = 3;
  std::uint64_t counter_start = 1;
  bool create_folders = true;
  std::string custom_pattern = std::string(naming::kDefaultPattern);
  bool overwrite = false;
  bool continue_on_fail = false;
  std::uint64_t max_scan_attempts = storage::kDefaultMaxScanAttempts;
  std::uint64_t max_create_retries = storage::kDefaultMaxCreateRetries;
};

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Applies the members of an options object on top of `options`.
//
// Contract:
// - Every key is optional; absent keys keep the current value.
// - Unknown keys, wrong types, negative or fractional counts and an invalid
//   input_mode are reported as issues; valid keys are still applied.
// - `report.valid` is true only when no issue was found.
void ApplyOptionsJson(const core::json::Value& root, SaveNodeOptions& options,
                      ValidationReport& report);

// Loads an options file and applies it on top of `options`.
//
// Contract:
// - Returns false only when the file cannot be read (`error` set).
// - Parse errors are reported as one issue under path `$`.
bool LoadOptionsFile(const std::filesystem::path& path, SaveNodeOptions& options,
                     ValidationReport& report, std::string& error);

// Pieces of the options consumed by the payload extractor and the saver.
payload::ItemPayloadOptions ToItemPayloadOptions(const SaveNodeOptions& options);
storage::SaveOptions ToStorageOptions(const SaveNodeOptions& options);

} // namespace savefile::config
