#include "storage/exclusive_file.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace savefile::storage {

namespace {

constexpr mode_t kOutputFileMode = 0666;

std::error_code LastErrno() {
  return std::error_code(errno, std::generic_category());
}

// Owns one descriptor. Close() reports the close result; the destructor is
// the fallback for early returns.
class ScopedFd {
public:
  ScopedFd(int fd, const FileIoOps& ops) : fd_(fd), ops_(&ops) {}

  ~ScopedFd() {
    if (fd_ >= 0) {
      (void)ops_->close_fn(fd_);
    }
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int Get() const {
    return fd_;
  }

  bool Close(std::error_code& ec) {
    const int fd = fd_;
    fd_ = -1;
    if (ops_->close_fn(fd) != 0) {
      ec = LastErrno();
      return false;
    }
    return true;
  }

private:
  int fd_ = -1;
  const FileIoOps* ops_ = nullptr;
};

// Each call hands the whole remaining buffer to write(); regular files
// normally take it in one call.
bool WriteAll(int fd, std::span<const std::uint8_t> payload, const FileIoOps& ops,
              std::error_code& ec) {
  std::size_t offset = 0U;
  while (offset < payload.size()) {
    const ssize_t written = ops.write_fn(fd, payload.data() + offset, payload.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = LastErrno();
      return false;
    }
    if (written == 0) {
      ec = std::make_error_code(std::errc::io_error);
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

} // namespace

const char* ToString(CreateStatus status) {
  switch (status) {
  case CreateStatus::kCreated:
    return "created";
  case CreateStatus::kAlreadyExists:
    return "already_exists";
  case CreateStatus::kFailed:
    return "failed";
  }
  return "failed";
}

FileIoOps FileIoOps::Default() {
  FileIoOps ops;
  ops.open_fn = [](const char* path, const int flags, const mode_t mode) {
    return ::open(path, flags, mode);
  };
  ops.write_fn = [](const int fd, const void* data, const std::size_t size) {
    return ::write(fd, data, size);
  };
  ops.close_fn = [](const int fd) { return ::close(fd); };
  ops.unlink_fn = [](const char* path) { return ::unlink(path); };
  return ops;
}

CreateStatus CreateExclusive(const fs::path& path, std::span<const std::uint8_t> payload,
                             const FileIoOps& ops, std::error_code& ec, std::string& error) {
  ec.clear();
  const int fd = ops.open_fn(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                             kOutputFileMode);
  if (fd < 0) {
    ec = LastErrno();
    if (ec == std::errc::file_exists) {
      return CreateStatus::kAlreadyExists;
    }
    error = "failed to create file '" + path.string() + "'";
    return CreateStatus::kFailed;
  }

  ScopedFd file(fd, ops);
  const bool written = WriteAll(file.Get(), payload, ops, ec);
  std::error_code close_ec;
  const bool closed = file.Close(close_ec);
  if (written && closed) {
    return CreateStatus::kCreated;
  }

  if (written) {
    ec = close_ec;
    error = "failed to close file '" + path.string() + "'";
  } else {
    error = "failed while writing file '" + path.string() + "'";
  }

  // The name is ours since O_EXCL succeeded; drop it so no partial payload
  // is left behind under a counter value.
  if (ops.unlink_fn(path.c_str()) != 0) {
    error += " (cleanup unlink failed: " + LastErrno().message() + ")";
  }
  return CreateStatus::kFailed;
}

bool WriteTruncate(const fs::path& path, std::span<const std::uint8_t> payload,
                   const FileIoOps& ops, std::error_code& ec, std::string& error) {
  ec.clear();
  const int fd = ops.open_fn(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                             kOutputFileMode);
  if (fd < 0) {
    ec = LastErrno();
    error = "failed to open file '" + path.string() + "' for writing";
    return false;
  }

  ScopedFd file(fd, ops);
  if (!WriteAll(file.Get(), payload, ops, ec)) {
    error = "failed while writing file '" + path.string() + "'";
    return false;
  }
  if (!file.Close(ec)) {
    error = "failed to close file '" + path.string() + "'";
    return false;
  }
  return true;
}

} // namespace savefile::storage
