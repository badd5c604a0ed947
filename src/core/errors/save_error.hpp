#ifndef SAVEFILE_CORE_ERRORS_SAVE_ERROR_HPP_
#define SAVEFILE_CORE_ERRORS_SAVE_ERROR_HPP_

#include "core/errors/exit_codes.hpp"

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace savefile::core::errors {

// Failure classes surfaced by the save pipeline.
//
// kIoFailure: any filesystem error other than "already exists" on create,
//   including listing, write and close failures.
// kAllocationExhausted: no free counter inside the discovery bound or the
//   create-retry bound.
enum class SaveErrorKind {
  kIoFailure,
  kAllocationExhausted,
};

inline const char* ToString(SaveErrorKind kind) {
  switch (kind) {
  case SaveErrorKind::kIoFailure:
    return "io_failure";
  case SaveErrorKind::kAllocationExhausted:
    return "allocation_exhausted";
  }
  return "io_failure";
}

struct SaveError {
  SaveErrorKind kind = SaveErrorKind::kIoFailure;
  std::string message;
  // Populated for kAllocationExhausted.
  std::string base;
  std::uint64_t attempts = 0;
  // Populated for kIoFailure when the failure came from the OS.
  std::error_code cause;
};

inline SaveError MakeIoFailure(std::string message, std::error_code cause = {}) {
  SaveError error;
  error.kind = SaveErrorKind::kIoFailure;
  error.message = std::move(message);
  if (cause) {
    error.message += ": " + cause.message();
  }
  error.cause = cause;
  return error;
}

inline SaveError MakeAllocationExhausted(std::string message, std::string base,
                                         std::uint64_t attempts) {
  SaveError error;
  error.kind = SaveErrorKind::kAllocationExhausted;
  error.message = std::move(message);
  error.base = std::move(base);
  error.attempts = attempts;
  return error;
}

constexpr ExitCode ToExitCode(SaveErrorKind kind) {
  return kind == SaveErrorKind::kAllocationExhausted ? ExitCode::kAllocationExhausted
                                                     : ExitCode::kIoFailure;
}

} // namespace savefile::core::errors

#endif // SAVEFILE_CORE_ERRORS_SAVE_ERROR_HPP_
