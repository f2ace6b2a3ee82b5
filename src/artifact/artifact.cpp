#include "artifact/artifact.hpp"

#include "core/fs_utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace modelpush::artifact {

bool ExceedsSizeLimit(const fs::path& path, std::uint64_t& size_bytes) {
  size_bytes = 0;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    return false;
  }
  const std::uintmax_t size = fs::file_size(path, ec);
  if (ec) {
    return false;
  }
  size_bytes = static_cast<std::uint64_t>(size);
  return size_bytes > kMaxArtifactSizeBytes;
}

bool LoadArtifact(const fs::path& path, Artifact& artifact, std::string& error) {
  if (path.empty()) {
    error = "artifact path cannot be empty";
    return false;
  }

  std::error_code ec;
  const bool exists = fs::exists(path, ec);
  if (ec || !exists) {
    error = "artifact not found: " + path.string();
    return false;
  }
  std::uint64_t size_bytes = 0;
  if (ExceedsSizeLimit(path, size_bytes)) {
    error = "artifact '" + path.string() + "' is " + std::to_string(size_bytes) +
            " bytes, above the registry limit of " + std::to_string(kMaxArtifactSizeBytes);
    return false;
  }

  std::vector<std::uint8_t> bytes;
  if (!core::ReadBinaryFile(path, bytes, error)) {
    return false;
  }
  if (bytes.empty()) {
    error = "artifact is empty: " + path.string();
    return false;
  }

  artifact = Artifact(path, std::move(bytes));
  return true;
}

} // namespace modelpush::artifact
