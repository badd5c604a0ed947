#pragma once

#include "core/json_dom.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace savefile::payload {

enum class InputMode {
  kBinary = 0,
  kText,
};

const char* ToString(InputMode mode);
bool ParseInputMode(std::string_view text, InputMode& mode);

struct ItemPayloadOptions {
  InputMode mode = InputMode::kBinary;
  // Key under the item's "binary" object (binary mode).
  std::string binary_property = "data";
  // Key under the item's "json" object (text mode). Empty selects the whole
  // "json" object.
  std::string data_field;
  // Empty values are derived from the payload, see ExtractPayload.
  std::string base_file_name = "file";
  std::string file_extension;
};

struct ExtractedPayload {
  std::vector<std::uint8_t> bytes;
  std::string base;
  std::string extension;
};

// Turns one input item into payload bytes plus the base/extension to save
// under.
//
// Item shape:
//   { "json": { ... },
//     "binary": { "<prop>": { "data": "<base64>", "fileName": "...",
//                             "path": "...", "file_name": "..." } } }
//
// Binary mode takes the bytes from inline base64 "data" when present,
// otherwise from the file at "path" (relative paths resolve against
// `source_root`). The original name comes from "fileName" or "file_name".
// An empty base falls back to the stem of that name (of "path" when there is
// no name), then to "file". An empty extension falls back to the extension of
// that name, then to "bin". Malformed base64 is an item error.
//
// Text mode takes json[<data_field>]. Strings are written verbatim with
// default extension "txt"; other values are pretty-printed JSON with default
// extension "json".
bool ExtractPayload(const core::json::Value& item, std::size_t item_index,
                    const ItemPayloadOptions& options, const std::filesystem::path& source_root,
                    ExtractedPayload& extracted, std::string& error);

} // namespace savefile::payload
