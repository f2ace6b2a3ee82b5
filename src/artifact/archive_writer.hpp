#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace modelpush::artifact {

// Member name used for the tokenizer configuration inside every archive.
constexpr const char* kTokenizerMemberName = "tokenizer.json";

struct ArchiveMember {
  std::string name;
  std::uint32_t crc32 = 0;
  std::uint32_t size_bytes = 0;
};

// Packages one exported model into the upload archive.
//
// Contract:
// - exactly two members, in this order: the model binary (stored under its own
//   file name, e.g. `model.pt` / `model.onnx`) and `tokenizer.json`.
// - entries are stored without compression; the registry treats the archive
//   as opaque bytes and the serialized model does not compress meaningfully.
// - zip32 only: each member and the whole archive must stay below 4 GiB.
// - the archive is written to a temp sibling and renamed into place.
// - returns false and sets `error` on failure; `members` describes what was
//   written on success.
bool WriteModelArchive(const std::filesystem::path& model_path,
                       const std::filesystem::path& tokenizer_path,
                       const std::filesystem::path& archive_path,
                       std::vector<ArchiveMember>& members, std::string& error);

// Reads the central directory of an existing archive and checks the
// two-member layout (one model binary plus `tokenizer.json`).
bool InspectModelArchive(const std::filesystem::path& archive_path,
                         std::vector<ArchiveMember>& members, std::string& error);

} // namespace modelpush::artifact
