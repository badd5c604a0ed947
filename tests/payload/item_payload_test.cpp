#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/json_dom.hpp"
#include "payload/item_payload.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using savefile::payload::ExtractedPayload;
using savefile::payload::ExtractPayload;
using savefile::payload::InputMode;
using savefile::payload::ItemPayloadOptions;

namespace {

savefile::core::json::Value ParseItem(const std::string& text) {
  savefile::core::json::Value item;
  std::string error;
  REQUIRE(savefile::core::json::Parse(text, item, error));
  return item;
}

std::string AsText(const ExtractedPayload& extracted) {
  return std::string(extracted.bytes.begin(), extracted.bytes.end());
}

} // namespace

TEST_CASE("Text mode writes string fields verbatim as txt", "[payload][text]") {
  ItemPayloadOptions options;
  options.mode = InputMode::kText;
  options.data_field = "body";
  options.base_file_name = "note";

  ExtractedPayload extracted;
  std::string error;
  REQUIRE(ExtractPayload(ParseItem(R"({"json":{"body":"hello\nworld"}})"), 0, options, fs::path(),
                         extracted, error));
  REQUIRE(AsText(extracted) == "hello\nworld");
  REQUIRE(extracted.base == "note");
  REQUIRE(extracted.extension == "txt");
}

TEST_CASE("Text mode pretty-prints non-string fields as json", "[payload][text]") {
  ItemPayloadOptions options;
  options.mode = InputMode::kText;
  options.data_field = "meta";

  ExtractedPayload extracted;
  std::string error;
  REQUIRE(ExtractPayload(ParseItem(R"({"json":{"meta":{"b":2,"a":[true,null]}}})"), 0, options,
                         fs::path(), extracted, error));
  REQUIRE(AsText(extracted) == "{\n  \"a\": [\n    true,\n    null\n  ],\n  \"b\": 2\n}");
  REQUIRE(extracted.extension == "json");
  REQUIRE(extracted.base == "file");
}

TEST_CASE("Text mode without a data field uses the whole json object", "[payload][text]") {
  ItemPayloadOptions options;
  options.mode = InputMode::kText;
  options.file_extension = "dump";

  ExtractedPayload extracted;
  std::string error;
  REQUIRE(ExtractPayload(ParseItem(R"({"json":{"k":"v"}})"), 0, options, fs::path(), extracted,
                         error));
  REQUIRE(AsText(extracted) == "{\n  \"k\": \"v\"\n}");
  REQUIRE(extracted.extension == "dump");
}

TEST_CASE("Text mode reports a missing field with the item index", "[payload][text]") {
  ItemPayloadOptions options;
  options.mode = InputMode::kText;
  options.data_field = "body";

  ExtractedPayload extracted;
  std::string error;
  REQUIRE_FALSE(ExtractPayload(ParseItem(R"({"json":{"other":1}})"), 4, options, fs::path(),
                               extracted, error));
  REQUIRE(error == "No field 'body' found on item 4.");
}

TEST_CASE("Binary mode reads the referenced file", "[payload][binary]") {
  const fs::path root = savefile::tests::common::CreateUniqueTempDir("savefile-payload-test");
  savefile::tests::common::WriteFixture(root / "scan.png", std::string("\x89PNG\0\x01", 6));

  ItemPayloadOptions options;
  options.base_file_name.clear();

  ExtractedPayload extracted;
  std::string error;
  const bool ok = ExtractPayload(
      ParseItem(R"({"binary":{"data":{"path":"scan.png","file_name":"original.scan.png"}}})"), 0,
      options, root, extracted, error);
  savefile::tests::common::RemovePathBestEffort(root);

  REQUIRE(ok);
  REQUIRE(extracted.bytes.size() == 6U);
  REQUIRE(extracted.bytes[0] == 0x89);
  REQUIRE(extracted.bytes[4] == 0x00);
  REQUIRE(extracted.base == "original.scan");
  REQUIRE(extracted.extension == "png");
}

TEST_CASE("Binary mode prefers configured base and extension", "[payload][binary]") {
  const fs::path root = savefile::tests::common::CreateUniqueTempDir("savefile-payload-test");
  savefile::tests::common::WriteFixture(root / "blob", "abc");

  ItemPayloadOptions options;
  options.binary_property = "attachment";
  options.base_file_name = "invoice";
  options.file_extension = "pdf";

  ExtractedPayload extracted;
  std::string error;
  const bool ok = ExtractPayload(
      ParseItem(R"({"binary":{"attachment":{"path":"blob","file_name":"x.bin"}}})"), 0, options,
      root, extracted, error);
  savefile::tests::common::RemovePathBestEffort(root);

  REQUIRE(ok);
  REQUIRE(AsText(extracted) == "abc");
  REQUIRE(extracted.base == "invoice");
  REQUIRE(extracted.extension == "pdf");
}

TEST_CASE("Binary mode without file_name uses the path stem and bin", "[payload][binary]") {
  const fs::path root = savefile::tests::common::CreateUniqueTempDir("savefile-payload-test");
  savefile::tests::common::WriteFixture(root / "raw", "z");

  ItemPayloadOptions options;
  options.base_file_name.clear();

  ExtractedPayload extracted;
  std::string error;
  const bool ok = ExtractPayload(ParseItem(R"({"binary":{"data":{"path":"raw"}}})"), 0, options,
                                 root, extracted, error);
  savefile::tests::common::RemovePathBestEffort(root);

  REQUIRE(ok);
  REQUIRE(extracted.base == "raw");
  REQUIRE(extracted.extension == "bin");
}

TEST_CASE("Binary mode decodes inline base64 data", "[payload][binary]") {
  ItemPayloadOptions options;
  options.base_file_name.clear();

  ExtractedPayload extracted;
  std::string error;
  // "iVBORw0KGgo=" is the 8-byte PNG signature.
  REQUIRE(ExtractPayload(
      ParseItem(R"({"binary":{"data":{"data":"iVBORw0KGgo=","fileName":"photo.png"}}})"), 0,
      options, fs::path(), extracted, error));
  REQUIRE(extracted.bytes.size() == 8U);
  REQUIRE(extracted.bytes[0] == 0x89);
  REQUIRE(extracted.bytes[1] == 'P');
  REQUIRE(extracted.bytes[7] == 0x0A);
  REQUIRE(extracted.base == "photo");
  REQUIRE(extracted.extension == "png");
}

TEST_CASE("Binary mode prefers inline data over a path", "[payload][binary]") {
  ItemPayloadOptions options;
  options.base_file_name = "doc";

  ExtractedPayload extracted;
  std::string error;
  REQUIRE(ExtractPayload(
      ParseItem(
          R"({"binary":{"data":{"data":"aGVsbG8=","path":"/nonexistent/savefile/x.bin"}}})"),
      0, options, fs::path(), extracted, error));
  REQUIRE(AsText(extracted) == "hello");
  REQUIRE(extracted.base == "doc");
  REQUIRE(extracted.extension == "bin");
}

TEST_CASE("Binary mode rejects malformed base64 data", "[payload][binary]") {
  ItemPayloadOptions options;
  ExtractedPayload extracted;
  std::string error;
  REQUIRE_FALSE(ExtractPayload(ParseItem(R"({"binary":{"data":{"data":"ab$="}}})"), 3, options,
                               fs::path(), extracted, error));
  REQUIRE(error.find("item 3") != std::string::npos);
  REQUIRE(error.find("invalid base64") != std::string::npos);

  REQUIRE_FALSE(ExtractPayload(ParseItem(R"({"binary":{"data":{"data":"abc"}}})"), 0, options,
                               fs::path(), extracted, error));
  REQUIRE(error.find("multiple of 4") != std::string::npos);
}

TEST_CASE("Binary mode needs data or path", "[payload][binary]") {
  ItemPayloadOptions options;
  ExtractedPayload extracted;
  std::string error;
  REQUIRE_FALSE(ExtractPayload(ParseItem(R"({"binary":{"data":{"fileName":"a.txt"}}})"), 1,
                               options, fs::path(), extracted, error));
  REQUIRE(error == "binary property 'data' on item 1 has neither \"data\" nor \"path\"");
}

TEST_CASE("Binary mode reports a missing property", "[payload][binary]") {
  ItemPayloadOptions options;
  ExtractedPayload extracted;
  std::string error;
  REQUIRE_FALSE(ExtractPayload(ParseItem(R"({"json":{}})"), 2, options, fs::path(), extracted,
                               error));
  REQUIRE(error == "No binary property 'data' found on item 2.");
}

TEST_CASE("Binary mode reports an unreadable source file", "[payload][binary]") {
  ItemPayloadOptions options;
  ExtractedPayload extracted;
  std::string error;
  REQUIRE_FALSE(ExtractPayload(
      ParseItem(R"({"binary":{"data":{"path":"/nonexistent/savefile/input.bin"}}})"), 0, options,
      fs::path(), extracted, error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("Items must be objects", "[payload]") {
  ItemPayloadOptions options;
  ExtractedPayload extracted;
  std::string error;
  REQUIRE_FALSE(ExtractPayload(ParseItem("[1,2]"), 7, options, fs::path(), extracted, error));
  REQUIRE(error == "item 7 must be a JSON object");
}

TEST_CASE("ParseInputMode accepts the two modes only", "[payload]") {
  InputMode mode = InputMode::kBinary;
  REQUIRE(savefile::payload::ParseInputMode("text", mode));
  REQUIRE(mode == InputMode::kText);
  REQUIRE(savefile::payload::ParseInputMode("binary", mode));
  REQUIRE(mode == InputMode::kBinary);
  REQUIRE_FALSE(savefile::payload::ParseInputMode("Binary", mode));
  REQUIRE(std::string(savefile::payload::ToString(InputMode::kText)) == "text");
}
