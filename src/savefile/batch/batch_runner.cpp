#include "savefile/batch/batch_runner.hpp"

#include "core/fs_utils.hpp"
#include "naming/filename_formatter.hpp"
#include "storage/file_saver.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace savefile::batch {

namespace {

core::json::Value MakeStringValue(std::string text) {
  core::json::Value value;
  value.type = core::json::Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

core::json::Value MakeSuccessRecord(const core::json::Value& item, const fs::path& saved_path) {
  core::json::Value record;
  record.type = core::json::Value::Type::kObject;
  if (const core::json::Value* json = core::json::FindMember(item, "json");
      json != nullptr && json->type == core::json::Value::Type::kObject) {
    record.object_value = json->object_value;
  }
  record.object_value[std::string(kSavedPathKey)] = MakeStringValue(saved_path.string());
  return record;
}

core::json::Value MakeErrorRecord(const std::string& message) {
  core::json::Value record;
  record.type = core::json::Value::Type::kObject;
  record.object_value[std::string(kErrorKey)] = MakeStringValue(message);
  return record;
}

} // namespace

bool SaveExtractedPayload(const payload::ExtractedPayload& extracted,
                          const config::SaveNodeOptions& options, core::logging::Logger* logger,
                          fs::path& saved_path, core::errors::SaveError& error) {
  if (options.create_folders) {
    std::error_code ec;
    std::string message;
    if (!core::EnsureDirectory(options.folder_path, ec, message)) {
      error = core::errors::MakeIoFailure(message);
      error.cause = ec;
      return false;
    }
  }

  storage::SaveRequest request;
  request.directory = options.folder_path;
  request.naming.pattern = options.custom_pattern;
  request.naming.base = naming::SanitizeFilename(extracted.base);
  request.naming.extension = extracted.extension;
  request.naming.counter_start = options.counter_start;
  request.naming.counter_padding = options.counter_padding;
  request.payload = extracted.bytes;
  request.overwrite = options.overwrite;

  storage::SaveOptions save_options = config::ToStorageOptions(options);
  save_options.logger = logger;
  return storage::SaveFile(request, save_options, saved_path, error);
}

bool RunBatch(const std::vector<core::json::Value>& items, const config::SaveNodeOptions& options,
              const fs::path& source_root, core::logging::Logger& logger, BatchResult& result,
              BatchError& error) {
  result = BatchResult{};
  const payload::ItemPayloadOptions payload_options = config::ToItemPayloadOptions(options);

  for (std::size_t i = 0; i < items.size(); ++i) {
    const std::string index_text = std::to_string(i);
    std::string failure;
    core::errors::ExitCode failure_code = core::errors::ExitCode::kFailure;

    payload::ExtractedPayload extracted;
    fs::path saved_path;
    if (!payload::ExtractPayload(items[i], i, payload_options, source_root, extracted, failure)) {
      failure_code = core::errors::ExitCode::kFailure;
    } else {
      core::errors::SaveError save_error;
      if (SaveExtractedPayload(extracted, options, &logger, saved_path, save_error)) {
        logger.Info("item saved", {{"item", index_text}, {"path", saved_path.string()}});
        result.records.push_back(MakeSuccessRecord(items[i], saved_path));
        ++result.saved_count;
        continue;
      }
      failure = save_error.message;
      failure_code = core::errors::ToExitCode(save_error.kind);
      logger.Debug("save failed", {{"item", index_text}, {"kind", ToString(save_error.kind)}});
    }

    ++result.failed_count;
    if (options.continue_on_fail) {
      logger.Warn("item failed, continuing", {{"item", index_text}, {"error", failure}});
      result.records.push_back(MakeErrorRecord(failure));
      continue;
    }

    logger.Error("item failed", {{"item", index_text}, {"error", failure}});
    error.item_index = i;
    error.exit_code = failure_code;
    error.message = "item " + index_text + ": " + failure;
    return false;
  }

  return true;
}

std::string ToJsonl(const std::vector<core::json::Value>& records) {
  std::string out;
  for (const core::json::Value& record : records) {
    out += core::json::ToJson(record);
    out.push_back('\n');
  }
  return out;
}

} // namespace savefile::batch
