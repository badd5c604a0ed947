#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "storage/file_saver.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using savefile::tests::common::AssertEquals;
using savefile::tests::common::AssertTrue;
using savefile::tests::common::Fail;

savefile::storage::SaveRequest MakeRequest(const fs::path& dir, const std::string& text,
                                           bool overwrite) {
  savefile::storage::SaveRequest request;
  request.directory = dir;
  request.naming.pattern = "{base}_{counter}";
  request.naming.base = "report";
  request.naming.extension = "pdf";
  request.naming.counter_start = 1;
  request.naming.counter_padding = 3;
  request.payload.assign(text.begin(), text.end());
  request.overwrite = overwrite;
  return request;
}

fs::path SaveOrFail(const savefile::storage::SaveRequest& request) {
  fs::path saved_path;
  savefile::core::errors::SaveError error;
  if (!savefile::storage::SaveFile(request, savefile::storage::SaveOptions{}, saved_path, error)) {
    Fail("SaveFile failed: " + error.message);
  }
  return saved_path;
}

} // namespace

int main() {
  const fs::path root = savefile::tests::common::CreateUniqueTempDir("savefile-overwrite-smoke");

  const fs::path first = SaveOrFail(MakeRequest(root, "first payload that is longer", true));
  const fs::path second = SaveOrFail(MakeRequest(root, "second", true));
  AssertEquals(first.string(), (root / "report_001.pdf").string(), "first overwrite path");
  AssertEquals(second.string(), first.string(), "overwrite reuses the start counter");
  // Truncated, not merged with the longer first payload.
  AssertEquals(savefile::tests::common::ReadFileToString(second), "second", "last writer wins");

  std::vector<std::string> names = savefile::tests::common::ListFilenames(root);
  AssertTrue(names.size() == 1U, "overwrite must leave exactly one file");

  // Overwrite ignores the scan: existing 1..3 does not move the target.
  savefile::tests::common::WriteFixture(root / "report_002.pdf", "two");
  savefile::tests::common::WriteFixture(root / "report_003.pdf", "three");
  const fs::path third = SaveOrFail(MakeRequest(root, "third", true));
  AssertEquals(third.filename().string(), "report_001.pdf", "overwrite skips discovery");
  AssertEquals(savefile::tests::common::ReadFileToString(root / "report_002.pdf"), "two",
               "neighbour untouched");

  // A non-overwrite save after that continues past the occupied range.
  const fs::path fresh = SaveOrFail(MakeRequest(root, "fresh", false));
  AssertEquals(fresh.filename().string(), "report_004.pdf", "non-overwrite after overwrite");

  // Overwrite with a custom start counter targets that counter.
  savefile::storage::SaveRequest custom = MakeRequest(root, "custom", true);
  custom.naming.counter_start = 10;
  const fs::path custom_path = SaveOrFail(custom);
  AssertEquals(custom_path.filename().string(), "report_010.pdf", "overwrite start counter");

  // Overwrite into a missing folder is an I/O failure.
  fs::path saved_path;
  savefile::core::errors::SaveError error;
  AssertTrue(!savefile::storage::SaveFile(MakeRequest(root / "missing", "x", true),
                                          savefile::storage::SaveOptions{}, saved_path, error),
             "overwrite into missing folder should fail");
  AssertTrue(error.kind == savefile::core::errors::SaveErrorKind::kIoFailure,
             "overwrite failure kind");

  names = savefile::tests::common::ListFilenames(root);
  AssertTrue(names.size() == 5U, "unexpected file count after overwrite checks");

  savefile::tests::common::RemovePathBestEffort(root);
  std::cout << "overwrite_smoke: ok\n";
  return 0;
}
