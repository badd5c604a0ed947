#pragma once

namespace savefile::core::errors {

// Process exit codes of the savefile CLI.
//
// 0, 1 and 2 keep their usual shell meanings (success, failure, bad usage).
// 10 rejects an options file. 20 and 30 mirror SaveErrorKind so a wrapper can
// tell a saturated counter range from a filesystem problem without reading
// stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kOptionsInvalid = 10,
  kAllocationExhausted = 20,
  kIoFailure = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace savefile::core::errors
