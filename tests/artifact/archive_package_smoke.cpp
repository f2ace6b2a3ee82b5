#include "artifact/archive_writer.hpp"
#include "artifact/artifact.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using modelpush::tests::common::AssertContains;
using modelpush::tests::common::Fail;

void WriteFile(const fs::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to create fixture file: " + path.string());
  }
  out << contents;
}

} // namespace

int main() {
  const fs::path temp_root = modelpush::tests::common::CreateUniqueTempDir("modelpush-archive");
  const fs::path model_path = temp_root / "model.pt";
  const fs::path tokenizer_path = temp_root / "tokenizer.json";
  const fs::path archive_path = temp_root / "bundle" / "model.zip";

  // CRC-32 check value for "123456789" is 0xCBF43926.
  WriteFile(model_path, "123456789");
  WriteFile(tokenizer_path, R"({"version":"1.0","model":{"type":"WordPiece"}})");

  std::vector<modelpush::artifact::ArchiveMember> members;
  std::string error;
  if (!modelpush::artifact::WriteModelArchive(model_path, tokenizer_path, archive_path, members,
                                              error)) {
    Fail("archive packaging failed: " + error);
  }
  if (members.size() != 2U || members[0].name != "model.pt" ||
      members[1].name != modelpush::artifact::kTokenizerMemberName) {
    Fail("archive must hold the model binary followed by tokenizer.json");
  }
  if (members[0].crc32 != 0xCBF43926U || members[0].size_bytes != 9U) {
    Fail("model member CRC-32 or size mismatch");
  }

  // Stored entries keep the payload verbatim inside the archive.
  const std::string archive_text = modelpush::tests::common::ReadFileToString(archive_path);
  AssertContains(archive_text, "123456789");
  AssertContains(archive_text, "\"WordPiece\"");
  if (archive_text.compare(0, 4, "PK\x03\x04") != 0) {
    Fail("archive must start with a zip local file header");
  }

  std::vector<modelpush::artifact::ArchiveMember> inspected;
  if (!modelpush::artifact::InspectModelArchive(archive_path, inspected, error)) {
    Fail("archive inspection failed: " + error);
  }
  if (inspected.size() != 2U || inspected[0].name != members[0].name ||
      inspected[0].crc32 != members[0].crc32 || inspected[1].crc32 != members[1].crc32 ||
      inspected[1].size_bytes != members[1].size_bytes) {
    Fail("central directory must describe the written members");
  }

  modelpush::artifact::Artifact loaded;
  if (!modelpush::artifact::LoadArtifact(archive_path, loaded, error)) {
    Fail("packaged archive must load as an artifact: " + error);
  }
  if (loaded.SizeBytes() != archive_text.size() || loaded.SourcePath() != archive_path) {
    Fail("loaded artifact must mirror the archive file");
  }

  const fs::path empty_tokenizer = temp_root / "empty.json";
  WriteFile(empty_tokenizer, "");
  if (modelpush::artifact::WriteModelArchive(model_path, empty_tokenizer,
                                             temp_root / "bad.zip", members, error)) {
    Fail("an empty tokenizer must be rejected");
  }
  AssertContains(error, "empty");

  if (modelpush::artifact::WriteModelArchive(temp_root / "missing.pt", tokenizer_path,
                                             temp_root / "bad.zip", members, error)) {
    Fail("a missing model binary must be rejected");
  }
  AssertContains(error, "missing.pt");
  if (fs::exists(temp_root / "bad.zip")) {
    Fail("failed packaging must not publish an archive");
  }

  const fs::path not_zip = temp_root / "not_zip.zip";
  WriteFile(not_zip, std::string(64U, 'x'));
  if (modelpush::artifact::InspectModelArchive(not_zip, inspected, error)) {
    Fail("inspection must reject files without an end-of-central-directory record");
  }
  AssertContains(error, "end-of-central-directory");

  if (modelpush::artifact::LoadArtifact(temp_root / "nope.zip", loaded, error)) {
    Fail("loading a missing artifact must fail");
  }
  AssertContains(error, "artifact not found");
  if (modelpush::artifact::LoadArtifact(empty_tokenizer, loaded, error)) {
    Fail("loading an empty artifact must fail");
  }
  AssertContains(error, "artifact is empty");

  modelpush::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "archive_package_smoke: ok\n";
  return 0;
}
