#include "savefile/config/save_options.hpp"

#include "core/fs_utils.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <utility>

namespace fs = std::filesystem;

namespace savefile::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (value.type != JsonValue::Type::kNumber) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

void ApplyString(const JsonValue& value, const std::string& path, std::string& target,
                 ValidationReport& report) {
  if (value.type != JsonValue::Type::kString) {
    AddIssue(report, path, "must be a string");
    return;
  }
  target = value.string_value;
}

void ApplyBool(const JsonValue& value, const std::string& path, bool& target,
               ValidationReport& report) {
  if (value.type != JsonValue::Type::kBool) {
    AddIssue(report, path, "must be a boolean");
    return;
  }
  target = value.bool_value;
}

void ApplyCount(const JsonValue& value, const std::string& path, std::uint64_t& target,
                ValidationReport& report) {
  if (!TryGetNonNegativeInteger(value, target)) {
    AddIssue(report, path, "must be a non-negative integer");
  }
}

void ApplyPositiveCount(const JsonValue& value, const std::string& path, std::uint64_t& target,
                        ValidationReport& report) {
  std::uint64_t parsed = 0;
  if (!TryGetNonNegativeInteger(value, parsed) || parsed == 0U) {
    AddIssue(report, path, "must be a positive integer");
    return;
  }
  target = parsed;
}

using FieldApplier =
    std::function<void(const JsonValue&, const std::string&, SaveNodeOptions&, ValidationReport&)>;

const std::map<std::string, FieldApplier>& FieldAppliers() {
  static const std::map<std::string, FieldApplier> appliers = {
      {"folder_path",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         std::string folder;
         ApplyString(v, p, folder, r);
         if (v.type == JsonValue::Type::kString) {
           if (folder.empty()) {
             AddIssue(r, p, "must not be empty");
           } else {
             o.folder_path = folder;
           }
         }
       }},
      {"input_mode",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         if (v.type != JsonValue::Type::kString ||
             !payload::ParseInputMode(v.string_value, o.input_mode)) {
           AddIssue(r, p, "must be one of: binary, text");
         }
       }},
      {"binary_property",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyString(v, p, o.binary_property, r);
       }},
      {"data_field",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyString(v, p, o.data_field, r);
       }},
      {"base_file_name",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyString(v, p, o.base_file_name, r);
       }},
      {"file_extension",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyString(v, p, o.file_extension, r);
       }},
      {"counter_padding",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         std::uint64_t padding = 0;
         if (!TryGetNonNegativeInteger(v, padding)) {
           AddIssue(r, p, "must be a non-negative integer");
           return;
         }
         if (padding > static_cast<std::uint64_t>(naming::kMaxCounterPadding)) {
           AddIssue(r, p, "must be at most " + std::to_string(naming::kMaxCounterPadding));
           return;
         }
         o.counter_padding = static_cast<int>(padding);
       }},
      {"counter_start",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyCount(v, p, o.counter_start, r);
       }},
      {"create_folders",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyBool(v, p, o.create_folders, r);
       }},
      {"custom_pattern",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyString(v, p, o.custom_pattern, r);
       }},
      {"overwrite",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyBool(v, p, o.overwrite, r);
       }},
      {"continue_on_fail",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyBool(v, p, o.continue_on_fail, r);
       }},
      {"max_scan_attempts",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyPositiveCount(v, p, o.max_scan_attempts, r);
       }},
      {"max_create_retries",
       [](const JsonValue& v, const std::string& p, SaveNodeOptions& o, ValidationReport& r) {
         ApplyPositiveCount(v, p, o.max_create_retries, r);
       }},
  };
  return appliers;
}

} // namespace

void ApplyOptionsJson(const JsonValue& root, SaveNodeOptions& options, ValidationReport& report) {
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(report, "$", "options must be a JSON object");
    report.valid = false;
    return;
  }

  const auto& appliers = FieldAppliers();
  for (const auto& [key, value] : root.object_value) {
    const std::string path = "$." + key;
    const auto it = appliers.find(key);
    if (it == appliers.end()) {
      AddIssue(report, path, "unknown option");
      continue;
    }
    it->second(value, path, options, report);
  }

  report.valid = report.issues.empty();
}

bool LoadOptionsFile(const fs::path& path, SaveNodeOptions& options, ValidationReport& report,
                     std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    report.valid = false;
    return true;
  }

  ApplyOptionsJson(root, options, report);
  return true;
}

payload::ItemPayloadOptions ToItemPayloadOptions(const SaveNodeOptions& options) {
  payload::ItemPayloadOptions out;
  out.mode = options.input_mode;
  out.binary_property = options.binary_property;
  out.data_field = options.data_field;
  out.base_file_name = options.base_file_name;
  out.file_extension = options.file_extension;
  return out;
}

storage::SaveOptions ToStorageOptions(const SaveNodeOptions& options) {
  storage::SaveOptions out;
  out.max_scan_attempts = options.max_scan_attempts;
  out.max_create_retries = options.max_create_retries;
  return out;
}

} // namespace savefile::config
