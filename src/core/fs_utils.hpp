#ifndef SAVEFILE_CORE_FS_UTILS_HPP_
#define SAVEFILE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace savefile::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Recursively creates `dir`. Existing directories are not an error.
inline bool EnsureDirectory(const std::filesystem::path& dir, std::error_code& ec,
                            std::string& error) {
  ec.clear();
  if (dir.empty()) {
    error = "folder path cannot be empty";
    return false;
  }

  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create folder '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  return EnsureDirectory(parent_dir, ec, error);
}

inline bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& bytes,
                          std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open input file '" + path.string() + "'";
    return false;
  }

  bytes.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading input file '" + path.string() + "'";
    return false;
  }
  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& text,
                         std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open file '" + path.string() + "'";
    return false;
  }

  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  return true;
}

// Publishes a whole text artifact (result reports) in one step:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// A reader never sees a half-written report; on failure the temp file is
// removed.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      out_file.close();
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace savefile::core

#endif // SAVEFILE_CORE_FS_UTILS_HPP_
