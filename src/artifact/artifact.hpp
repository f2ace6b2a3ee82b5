#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace modelpush::artifact {

// Registry hard limit on `model_content_size_in_bytes`.
constexpr std::uint64_t kMaxArtifactSizeBytes = 4'000'000'000ULL;

// Immutable in-memory copy of the packaged archive. Produced once by
// LoadArtifact and then only read; the upload orchestrator owns it for the
// lifetime of a session.
class Artifact {
public:
  Artifact() = default;
  Artifact(std::filesystem::path source_path, std::vector<std::uint8_t> bytes)
      : source_path_(std::move(source_path)), bytes_(std::move(bytes)) {}

  Artifact(const Artifact&) = delete;
  Artifact& operator=(const Artifact&) = delete;
  Artifact(Artifact&&) = default;
  Artifact& operator=(Artifact&&) = default;

  std::span<const std::uint8_t> Bytes() const {
    return std::span<const std::uint8_t>(bytes_.data(), bytes_.size());
  }

  std::uint64_t SizeBytes() const {
    return static_cast<std::uint64_t>(bytes_.size());
  }

  const std::filesystem::path& SourcePath() const {
    return source_path_;
  }

private:
  std::filesystem::path source_path_;
  std::vector<std::uint8_t> bytes_;
};

// True when `path` is a regular file larger than kMaxArtifactSizeBytes;
// `size_bytes` receives its size. Missing or unreadable files are not over
// the limit (LoadArtifact reports those).
bool ExceedsSizeLimit(const std::filesystem::path& path, std::uint64_t& size_bytes);

// Reads the archive at `path`. Fails on missing/unreadable files, on empty
// files and on archives above kMaxArtifactSizeBytes.
bool LoadArtifact(const std::filesystem::path& path, Artifact& artifact, std::string& error);

} // namespace modelpush::artifact
