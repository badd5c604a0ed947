#include "savefile/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/errors/save_error.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "naming/filename_formatter.hpp"
#include "payload/item_payload.hpp"
#include "savefile/batch/batch_runner.hpp"
#include "savefile/config/save_options.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace savefile::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitOptionsInvalid = core::errors::ToInt(core::errors::ExitCode::kOptionsInvalid);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  savefile save --dir <folder> (--input <file> | --text <string>) [--base <name>] "
         "[--ext <ext>] [--pattern <pattern>] [--counter-start <n>] [--padding <n>] "
         "[--overwrite] [--no-create-folders] [--max-scan-attempts <n>] "
         "[--max-create-retries <n>] [--config <options.json>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  savefile batch <items.json> [--config <options.json>] [--dir <folder>] "
         "[--results <out.jsonl>] [--continue-on-fail] [same naming flags as save] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  savefile format --pattern <pattern> --base <name> --counter <n> [--padding <n>] "
         "[--ext <ext>]\n"
      << "  savefile version\n";
}

using OptionOverride = std::function<void(config::SaveNodeOptions&)>;

// Flags are collected as overrides and applied after the options file so the
// command line always wins regardless of flag order.
struct CommandOptions {
  std::optional<fs::path> config_path;
  std::vector<OptionOverride> overrides;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;

  // save
  std::optional<fs::path> input_path;
  std::optional<std::string> text;

  // batch
  fs::path items_path;
  std::optional<fs::path> results_path;
};

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::uint64_t& value,
                   std::string& error) {
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  return true;
}

bool ParsePadding(std::string_view raw, int& padding, std::string& error) {
  std::uint64_t value = 0;
  if (!ParseUnsigned("--padding", raw, value, error)) {
    return false;
  }
  if (value > static_cast<std::uint64_t>(naming::kMaxCounterPadding)) {
    error = "invalid value for --padding: '" + std::string(raw) + "' (maximum " +
            std::to_string(naming::kMaxCounterPadding) + ")";
    return false;
  }
  padding = static_cast<int>(value);
  return true;
}

// Handles the flags shared by `save` and `batch`. `recognized` tells whether
// `args[i]` was one of them (`i` is advanced past its value). Returns false
// with `error` set on a bad value.
bool ParseSharedFlag(const std::vector<std::string_view>& args, std::size_t& i,
                     CommandOptions& options, std::string& error, bool& recognized) {
  recognized = true;
  const std::string_view token = args[i];

  if (token == "--overwrite") {
    options.overrides.push_back([](config::SaveNodeOptions& o) { o.overwrite = true; });
    return true;
  }
  if (token == "--no-create-folders") {
    options.overrides.push_back([](config::SaveNodeOptions& o) { o.create_folders = false; });
    return true;
  }
  if (token == "--continue-on-fail") {
    options.overrides.push_back([](config::SaveNodeOptions& o) { o.continue_on_fail = true; });
    return true;
  }

  const bool takes_value = token == "--dir" || token == "--base" || token == "--ext" ||
                           token == "--pattern" || token == "--counter-start" ||
                           token == "--padding" || token == "--max-scan-attempts" ||
                           token == "--max-create-retries" || token == "--config" ||
                           token == "--log-level";
  if (!takes_value) {
    recognized = false;
    return true;
  }
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(token);
    return false;
  }
  const std::string value(args[++i]);

  if (token == "--dir") {
    if (value.empty()) {
      error = "--dir cannot be empty";
      return false;
    }
    options.overrides.push_back([value](config::SaveNodeOptions& o) { o.folder_path = value; });
    return true;
  }
  if (token == "--base") {
    options.overrides.push_back([value](config::SaveNodeOptions& o) { o.base_file_name = value; });
    return true;
  }
  if (token == "--ext") {
    options.overrides.push_back([value](config::SaveNodeOptions& o) { o.file_extension = value; });
    return true;
  }
  if (token == "--pattern") {
    options.overrides.push_back([value](config::SaveNodeOptions& o) { o.custom_pattern = value; });
    return true;
  }
  if (token == "--counter-start") {
    std::uint64_t start = 0;
    if (!ParseUnsigned(token, value, start, error)) {
      return false;
    }
    options.overrides.push_back([start](config::SaveNodeOptions& o) { o.counter_start = start; });
    return true;
  }
  if (token == "--padding") {
    int padding = 0;
    if (!ParsePadding(value, padding, error)) {
      return false;
    }
    options.overrides.push_back(
        [padding](config::SaveNodeOptions& o) { o.counter_padding = padding; });
    return true;
  }
  if (token == "--max-scan-attempts" || token == "--max-create-retries") {
    std::uint64_t bound = 0;
    if (!ParseUnsigned(token, value, bound, error)) {
      return false;
    }
    if (bound == 0U) {
      error = std::string(token) + " must be greater than 0";
      return false;
    }
    if (token == "--max-scan-attempts") {
      options.overrides.push_back(
          [bound](config::SaveNodeOptions& o) { o.max_scan_attempts = bound; });
    } else {
      options.overrides.push_back(
          [bound](config::SaveNodeOptions& o) { o.max_create_retries = bound; });
    }
    return true;
  }
  if (token == "--config") {
    options.config_path = fs::path(value);
    return true;
  }

  return core::logging::ParseLogLevel(value, options.log_level, error);
}

// Parse `save` args:
// - exactly one of --input / --text
// - without --dir the options file folder_path (or its default) is used
bool ParseSaveOptions(const std::vector<std::string_view>& args, CommandOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--input" || token == "--text") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      if (options.input_path.has_value() || options.text.has_value()) {
        error = "save accepts exactly one of --input or --text";
        return false;
      }
      if (token == "--input") {
        options.input_path = fs::path(args[++i]);
      } else {
        options.text = std::string(args[++i]);
      }
      continue;
    }

    bool recognized = false;
    if (!ParseSharedFlag(args, i, options, error, recognized)) {
      return false;
    }
    if (!recognized) {
      error = "unknown option: " + std::string(token);
      return false;
    }
  }

  if (!options.input_path.has_value() && !options.text.has_value()) {
    error = "save requires --input <file> or --text <string>";
    return false;
  }
  return true;
}

// Parse `batch` args: one positional items file plus shared flags.
bool ParseBatchOptions(const std::vector<std::string_view>& args, CommandOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--results") {
      if (i + 1 >= args.size()) {
        error = "missing value for --results";
        return false;
      }
      options.results_path = fs::path(args[++i]);
      continue;
    }

    bool recognized = false;
    if (!ParseSharedFlag(args, i, options, error, recognized)) {
      return false;
    }
    if (recognized) {
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.items_path.empty()) {
      error = "batch accepts exactly 1 items file";
      return false;
    }
    options.items_path = fs::path(token);
  }

  if (options.items_path.empty()) {
    error = "batch requires exactly 1 argument: <items.json>";
    return false;
  }
  return true;
}

// Options file first, then command-line overrides. Returns an exit code;
// kExitSuccess means `resolved` is ready.
int ResolveNodeOptions(const CommandOptions& options, config::SaveNodeOptions& resolved) {
  if (options.config_path.has_value()) {
    config::ValidationReport report;
    std::string error;
    if (!config::LoadOptionsFile(*options.config_path, resolved, report, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    if (!report.valid) {
      std::cerr << "invalid options: " << options.config_path->string() << '\n';
      for (const auto& issue : report.issues) {
        std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
      }
      return kExitOptionsInvalid;
    }
  }

  for (const OptionOverride& apply : options.overrides) {
    apply(resolved);
  }
  return kExitSuccess;
}

std::string MakeBatchId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "batch-" + std::to_string(millis);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "savefile 0.1.0\n";
  return kExitSuccess;
}

int CommandFormat(const std::vector<std::string_view>& args) {
  std::optional<std::string> pattern;
  std::optional<std::string> base;
  std::optional<std::uint64_t> counter;
  int padding = 0;
  std::string extension;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (i + 1 >= args.size()) {
      std::cerr << "error: missing value for " << token << '\n';
      return kExitUsage;
    }
    const std::string_view value = args[++i];
    if (token == "--pattern") {
      pattern = std::string(value);
    } else if (token == "--base") {
      base = std::string(value);
    } else if (token == "--counter") {
      std::uint64_t parsed = 0;
      if (!ParseUnsigned(token, value, parsed, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      counter = parsed;
    } else if (token == "--padding") {
      if (!ParsePadding(value, padding, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
    } else if (token == "--ext") {
      extension = std::string(value);
    } else {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
  }

  if (!pattern.has_value() || !base.has_value() || !counter.has_value()) {
    std::cerr << "error: format requires --pattern, --base and --counter\n";
    return kExitUsage;
  }

  std::cout << naming::FormatFilename(*pattern, *base, *counter, padding, extension) << '\n';
  return kExitSuccess;
}

int CommandSave(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseSaveOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::SaveNodeOptions node_options;
  // Without --base the name of the input file decides, like a binary item
  // carrying its original file name.
  if (options.input_path.has_value()) {
    node_options.base_file_name.clear();
  }
  if (const int code = ResolveNodeOptions(options, node_options); code != kExitSuccess) {
    return code;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetBatchId(MakeBatchId(std::chrono::system_clock::now()));
  logger.SetContext("command", "save");

  // Route the single payload through the same item extraction the batch uses.
  core::json::Value item;
  item.type = core::json::Value::Type::kObject;
  payload::ItemPayloadOptions payload_options = config::ToItemPayloadOptions(node_options);
  if (options.input_path.has_value()) {
    core::json::Value source;
    source.type = core::json::Value::Type::kObject;
    source.object_value["path"].type = core::json::Value::Type::kString;
    source.object_value["path"].string_value = options.input_path->string();
    source.object_value["file_name"].type = core::json::Value::Type::kString;
    source.object_value["file_name"].string_value = options.input_path->filename().string();

    item.object_value["binary"].type = core::json::Value::Type::kObject;
    item.object_value["binary"].object_value["data"] = std::move(source);
    payload_options.mode = payload::InputMode::kBinary;
    payload_options.binary_property = "data";
  } else {
    core::json::Value text;
    text.type = core::json::Value::Type::kString;
    text.string_value = *options.text;

    item.object_value["json"].type = core::json::Value::Type::kObject;
    item.object_value["json"].object_value["text"] = std::move(text);
    payload_options.mode = payload::InputMode::kText;
    payload_options.data_field = "text";
  }

  payload::ExtractedPayload extracted;
  if (!payload::ExtractPayload(item, 0U, payload_options, fs::path(), extracted, error)) {
    logger.Error("payload extraction failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("save requested",
              {{"folder", node_options.folder_path.string()},
               {"base", extracted.base},
               {"overwrite", node_options.overwrite ? "true" : "false"}});

  fs::path saved_path;
  core::errors::SaveError save_error;
  if (!batch::SaveExtractedPayload(extracted, node_options, &logger, saved_path, save_error)) {
    logger.Error("save failed",
                 {{"kind", core::errors::ToString(save_error.kind)}, {"error", save_error.message}});
    std::cerr << "error: " << save_error.message << '\n';
    return core::errors::ToInt(core::errors::ToExitCode(save_error.kind));
  }

  logger.Info("file saved", {{"path", saved_path.string()}});
  std::cout << saved_path.string() << '\n';
  return kExitSuccess;
}

int CommandBatch(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseBatchOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::SaveNodeOptions node_options;
  if (const int code = ResolveNodeOptions(options, node_options); code != kExitSuccess) {
    return code;
  }

  std::string items_text;
  if (!core::ReadTextFile(options.items_path, items_text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  core::json::Value items_root;
  if (!core::json::Parse(items_text, items_root, error)) {
    std::cerr << "error: invalid items file '" << options.items_path.string() << "': " << error
              << '\n';
    return kExitFailure;
  }
  if (items_root.type != core::json::Value::Type::kArray) {
    std::cerr << "error: items file must contain a JSON array, got "
              << core::json::ToString(items_root.type) << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetBatchId(MakeBatchId(std::chrono::system_clock::now()));
  logger.SetContext("command", "batch");
  logger.Info("batch started",
              {{"items", std::to_string(items_root.array_value.size())},
               {"folder", node_options.folder_path.string()},
               {"input_mode", payload::ToString(node_options.input_mode)}});

  batch::BatchResult result;
  batch::BatchError batch_error;
  const bool completed = batch::RunBatch(items_root.array_value, node_options,
                                         options.items_path.parent_path(), logger, result,
                                         batch_error);

  const std::string jsonl = batch::ToJsonl(result.records);
  if (options.results_path.has_value()) {
    if (!core::WriteTextFileAtomic(*options.results_path, jsonl, error)) {
      std::cerr << "error: failed to write results: " << error << '\n';
      return kExitFailure;
    }
  } else {
    std::cout << jsonl;
  }

  logger.Info("batch finished",
              {{"saved", std::to_string(result.saved_count)},
               {"failed", std::to_string(result.failed_count)}});

  if (!completed) {
    std::cerr << "error: " << batch_error.message << '\n';
    return core::errors::ToInt(batch_error.exit_code);
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "save") {
    return CommandSave(args);
  }

  if (command == "batch") {
    return CommandBatch(args);
  }

  if (command == "format") {
    return CommandFormat(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace savefile::cli
