#include "payload/item_payload.hpp"

#include "core/base64.hpp"
#include "core/fs_utils.hpp"

namespace fs = std::filesystem;

namespace savefile::payload {

namespace {

constexpr int kTextJsonIndent = 2;

const core::json::Value* FindString(const core::json::Value& object, std::string_view key) {
  const core::json::Value* value = core::json::FindMember(object, key);
  if (value == nullptr || value->type != core::json::Value::Type::kString) {
    return nullptr;
  }
  return value;
}

bool ExtractBinary(const core::json::Value& item, std::size_t item_index,
                   const ItemPayloadOptions& options, const fs::path& source_root,
                   ExtractedPayload& extracted, std::string& error) {
  const core::json::Value* binary = core::json::FindMember(item, "binary");
  const core::json::Value* property =
      binary == nullptr ? nullptr : core::json::FindMember(*binary, options.binary_property);
  if (property == nullptr || property->type != core::json::Value::Type::kObject) {
    error = "No binary property '" + options.binary_property + "' found on item " +
            std::to_string(item_index) + ".";
    return false;
  }

  const std::string where = "binary property '" + options.binary_property + "' on item " +
                            std::to_string(item_index);
  const core::json::Value* inline_data = FindString(*property, "data");
  const core::json::Value* path_value = FindString(*property, "path");

  // Inline base64 "data" wins over a "path" reference.
  if (inline_data != nullptr) {
    std::string decode_error;
    if (!core::DecodeBase64(inline_data->string_value, extracted.bytes, decode_error)) {
      error = where + " has invalid base64 \"data\": " + decode_error;
      return false;
    }
  } else if (path_value != nullptr && !path_value->string_value.empty()) {
    fs::path source(path_value->string_value);
    if (source.is_relative() && !source_root.empty()) {
      source = source_root / source;
    }
    if (!core::ReadFileBytes(source, extracted.bytes, error)) {
      return false;
    }
  } else {
    error = where + " has neither \"data\" nor \"path\"";
    return false;
  }

  const core::json::Value* file_name = FindString(*property, "fileName");
  if (file_name == nullptr || file_name->string_value.empty()) {
    file_name = FindString(*property, "file_name");
  }
  extracted.base = options.base_file_name;
  extracted.extension = options.file_extension;
  if (file_name != nullptr && !file_name->string_value.empty()) {
    const fs::path original(file_name->string_value);
    if (extracted.base.empty()) {
      extracted.base = original.stem().string();
    }
    if (extracted.extension.empty()) {
      const std::string dotted = original.extension().string();
      extracted.extension = dotted.empty() ? std::string() : dotted.substr(1);
    }
  } else if (extracted.base.empty() && path_value != nullptr) {
    extracted.base = fs::path(path_value->string_value).stem().string();
  }
  if (extracted.base.empty()) {
    extracted.base = "file";
  }
  if (extracted.extension.empty()) {
    extracted.extension = "bin";
  }
  return true;
}

bool ExtractText(const core::json::Value& item, std::size_t item_index,
                 const ItemPayloadOptions& options, ExtractedPayload& extracted,
                 std::string& error) {
  const core::json::Value* json = core::json::FindMember(item, "json");
  if (json == nullptr) {
    error = "item " + std::to_string(item_index) + " has no \"json\" object";
    return false;
  }

  const core::json::Value* field = json;
  if (!options.data_field.empty()) {
    field = core::json::FindMember(*json, options.data_field);
    if (field == nullptr) {
      error = "No field '" + options.data_field + "' found on item " +
              std::to_string(item_index) + ".";
      return false;
    }
  }

  std::string text;
  std::string default_extension;
  if (field->type == core::json::Value::Type::kString) {
    text = field->string_value;
    default_extension = "txt";
  } else {
    text = core::json::ToJson(*field, kTextJsonIndent);
    default_extension = "json";
  }

  extracted.bytes.assign(text.begin(), text.end());
  extracted.base = options.base_file_name.empty() ? "file" : options.base_file_name;
  extracted.extension =
      options.file_extension.empty() ? default_extension : options.file_extension;
  return true;
}

} // namespace

const char* ToString(InputMode mode) {
  switch (mode) {
  case InputMode::kBinary:
    return "binary";
  case InputMode::kText:
    return "text";
  }
  return "binary";
}

bool ParseInputMode(std::string_view text, InputMode& mode) {
  if (text == "binary") {
    mode = InputMode::kBinary;
    return true;
  }
  if (text == "text") {
    mode = InputMode::kText;
    return true;
  }
  return false;
}

bool ExtractPayload(const core::json::Value& item, std::size_t item_index,
                    const ItemPayloadOptions& options, const fs::path& source_root,
                    ExtractedPayload& extracted, std::string& error) {
  extracted = ExtractedPayload{};
  if (item.type != core::json::Value::Type::kObject) {
    error = "item " + std::to_string(item_index) + " must be a JSON object";
    return false;
  }

  if (options.mode == InputMode::kBinary) {
    return ExtractBinary(item, item_index, options, source_root, extracted, error);
  }
  return ExtractText(item, item_index, options, extracted, error);
}

} // namespace savefile::payload
