#ifndef MODELPUSH_CORE_FS_UTILS_HPP_
#define MODELPUSH_CORE_FS_UTILS_HPP_

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

namespace modelpush::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

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
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Writes to a temporary sibling and renames it over `output_path`, so a
// checkpoint reader never observes a half-written file. Falls back to
// remove+rename where rename-overwrite is refused.
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
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read text file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading text file: " + path.string();
    return false;
  }
  return true;
}

// Reads a whole regular file into memory. Distinguishes "missing" from
// "unreadable" so artifact errors stay actionable.
inline bool ReadBinaryFile(const std::filesystem::path& path, std::vector<std::uint8_t>& bytes,
                           std::string& error) {
  bytes.clear();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    error = "file not found: " + path.string();
    return false;
  }
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "path must point to a regular file: " + path.string();
    return false;
  }

  const std::uintmax_t expected_size = std::filesystem::file_size(path, ec);
  if (ec) {
    error = "unable to stat file '" + path.string() + "': " + ec.message();
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to open file for reading: " + path.string();
    return false;
  }

  bytes.resize(static_cast<std::size_t>(expected_size));
  if (expected_size > 0U) {
    file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (file.gcount() != static_cast<std::streamsize>(bytes.size())) {
      bytes.clear();
      error = "short read on file '" + path.string() + "' (expected " +
              std::to_string(expected_size) + " bytes)";
      return false;
    }
  }

  return true;
}

} // namespace modelpush::core

#endif // MODELPUSH_CORE_FS_UTILS_HPP_
