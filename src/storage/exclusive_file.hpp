#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <sys/types.h>
#include <system_error>

namespace savefile::storage {

// Outcome of one create-if-absent attempt.
enum class CreateStatus {
  kCreated = 0,
  // The path was already taken. The only outcome the caller may retry.
  kAlreadyExists,
  kFailed,
};

const char* ToString(CreateStatus status);

// POSIX descriptor operations used to create and fill output files.
//
// Every function follows the syscall convention: -1 with errno set on
// failure. Tests inject fakes to simulate races (EEXIST) and mid-write
// failures (ENOSPC) without a special filesystem.
struct FileIoOps {
  std::function<int(const char* path, int flags, mode_t mode)> open_fn;
  std::function<ssize_t(int fd, const void* data, std::size_t size)> write_fn;
  std::function<int(int fd)> close_fn;
  std::function<int(const char* path)> unlink_fn;

  static FileIoOps Default();
};

// Atomically creates `path` (O_CREAT | O_EXCL) and writes all of `payload`.
//
// - kCreated: the file exists and holds exactly `payload`.
// - kAlreadyExists: nothing was touched.
// - kFailed: `ec`/`error` describe the failure. If the file had been created
//   before the failure it has been unlinked again.
// The descriptor is closed on every path.
CreateStatus CreateExclusive(const std::filesystem::path& path,
                             std::span<const std::uint8_t> payload, const FileIoOps& ops,
                             std::error_code& ec, std::string& error);

// Create-or-truncate write used by overwrite mode. Last writer wins.
bool WriteTruncate(const std::filesystem::path& path, std::span<const std::uint8_t> payload,
                   const FileIoOps& ops, std::error_code& ec, std::string& error);

} // namespace savefile::storage
