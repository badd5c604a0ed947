#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/save_error.hpp"
#include "storage/file_saver.hpp"

#include <cerrno>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using savefile::core::errors::SaveErrorKind;
using savefile::tests::common::AssertContains;
using savefile::tests::common::AssertTrue;
using savefile::tests::common::WriteFixture;

savefile::storage::SaveRequest MakeRequest(const fs::path& dir) {
  savefile::storage::SaveRequest request;
  request.directory = dir;
  request.naming.pattern = "{base}_{counter}";
  request.naming.base = "report";
  request.naming.extension = "pdf";
  request.naming.counter_start = 1;
  request.naming.counter_padding = 3;
  request.payload = {'x'};
  return request;
}

} // namespace

int main() {
  const fs::path root = savefile::tests::common::CreateUniqueTempDir("savefile-exhaustion-smoke");
  for (int i = 1; i <= 5; ++i) {
    WriteFixture(root / ("report_00" + std::to_string(i) + ".pdf"), "taken");
  }

  // Discovery bound: five attempts from 1 all land on taken counters.
  savefile::storage::SaveOptions options;
  options.max_scan_attempts = 5;
  fs::path saved_path;
  savefile::core::errors::SaveError error;
  AssertTrue(!savefile::storage::SaveFile(MakeRequest(root), options, saved_path, error),
             "scan exhaustion should fail");
  AssertTrue(error.kind == SaveErrorKind::kAllocationExhausted, "scan exhaustion kind");
  AssertTrue(error.attempts == 5U, "scan exhaustion attempts");
  AssertTrue(error.base == "report", "scan exhaustion base");
  AssertContains(error.message, "could not find free counter after 5 attempts");
  AssertTrue(savefile::core::errors::ToExitCode(error.kind) ==
                 savefile::core::errors::ExitCode::kAllocationExhausted,
             "scan exhaustion exit code");
  AssertTrue(savefile::tests::common::ListFilenames(root).size() == 5U,
             "scan exhaustion must not create a file");

  // One more attempt finds 6.
  options.max_scan_attempts = 6;
  AssertTrue(savefile::storage::SaveFile(MakeRequest(root), options, saved_path, error),
             "sixth attempt should succeed");
  AssertTrue(saved_path.filename().string() == "report_006.pdf", "sixth counter");

  // Create bound: every O_EXCL open reports EEXIST as if other writers keep
  // winning the race.
  int open_calls = 0;
  savefile::storage::SaveOptions racing;
  racing.io_ops.open_fn = [&open_calls](const char*, int, mode_t) {
    ++open_calls;
    errno = EEXIST;
    return -1;
  };
  AssertTrue(!savefile::storage::SaveFile(MakeRequest(root), racing, saved_path, error),
             "create exhaustion should fail");
  AssertTrue(error.kind == SaveErrorKind::kAllocationExhausted, "create exhaustion kind");
  AssertTrue(error.attempts == savefile::storage::kDefaultMaxCreateRetries,
             "create exhaustion attempts");
  AssertTrue(open_calls == static_cast<int>(savefile::storage::kDefaultMaxCreateRetries),
             "create exhaustion open calls");
  AssertContains(error.message, "after scanning existing files and retrying 100 times");

  // Without a counter token there is one name and one attempt.
  WriteFixture(root / "single.txt", "existing");
  savefile::storage::SaveRequest single = MakeRequest(root);
  single.naming.pattern = "{base}";
  single.naming.base = "single";
  single.naming.extension = "txt";
  AssertTrue(!savefile::storage::SaveFile(single, savefile::storage::SaveOptions{}, saved_path,
                                          error),
             "fixed name collision should fail");
  AssertTrue(error.kind == SaveErrorKind::kAllocationExhausted, "fixed name kind");
  AssertTrue(error.attempts == 1U, "fixed name attempts");
  AssertTrue(savefile::tests::common::ReadFileToString(root / "single.txt") == "existing",
             "fixed name collision must not overwrite");

  savefile::tests::common::RemovePathBestEffort(root);
  std::cout << "exhaustion_smoke: ok\n";
  return 0;
}
