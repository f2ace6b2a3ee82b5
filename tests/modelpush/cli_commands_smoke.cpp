#include "hashing/digest.hpp"
#include "registry/registry_factory.hpp"

#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using modelpush::tests::common::AssertContains;
using modelpush::tests::common::DispatchArgsCaptured;
using modelpush::tests::common::Fail;

void WriteFile(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << text;
  if (!out) {
    Fail("failed to write fixture: " + path.string());
  }
}

std::string MakeConfigJson(const std::string& backend_fields) {
  return R"json({
  "model": {
    "name": "cli-smoke-model",
    "version": 2,
    "model_format": "TORCH_SCRIPT",
    "model_task_type": "TEXT_EMBEDDING",
    "model_config": {
      "model_type": "bert",
      "embedding_dimension": 384,
      "framework_type": "SENTENCE_TRANSFORMERS",
      "all_config": "{}"
    }
  },
  "artifact": {
    "archive_path": "dist/model.zip",
    "model_path": "model.pt",
    "tokenizer_path": "tokenizer.json"
  },
  "registry": {)json" +
         backend_fields + R"json(}
})json";
}

void CheckUsageAndVersion() {
  auto result = DispatchArgsCaptured({"modelpush"});
  if (result.exit_code != 2) {
    Fail("missing subcommand must be a usage error");
  }
  AssertContains(result.stderr_text, "usage:");

  result = DispatchArgsCaptured({"modelpush", "push"});
  if (result.exit_code != 2) {
    Fail("unknown subcommand must be a usage error");
  }
  AssertContains(result.stderr_text, "unknown subcommand: push");

  result = DispatchArgsCaptured({"modelpush", "--help"});
  if (result.exit_code != 0) {
    Fail("--help must succeed");
  }
  AssertContains(result.stdout_text, "modelpush upload <config.json>");

  result = DispatchArgsCaptured({"modelpush", "version"});
  if (result.exit_code != 0) {
    Fail("version must succeed");
  }
  AssertContains(result.stdout_text, "modelpush 0.1.0");
  AssertContains(result.stdout_text,
                 "http_registry: " +
                     std::string(modelpush::registry::HttpRegistryAvailabilityStatusText()));

  result = DispatchArgsCaptured({"modelpush", "version", "extra"});
  if (result.exit_code != 2) {
    Fail("version must reject arguments");
  }
}

void CheckValidate(const fs::path& temp_root) {
  const fs::path valid_path = temp_root / "valid.json";
  WriteFile(valid_path, MakeConfigJson(R"json("backend": "sim")json"));
  auto result = DispatchArgsCaptured({"modelpush", "validate", valid_path.string()});
  if (result.exit_code != 0) {
    Fail("validate must accept a valid config:\n" + result.stderr_text);
  }
  AssertContains(result.stdout_text, "valid: " + valid_path.string());

  const fs::path invalid_path = temp_root / "invalid.json";
  WriteFile(invalid_path, R"json({"model": {"name": "x"}, "registry": {"backend": "carrier-pigeon"}})json");
  result = DispatchArgsCaptured({"modelpush", "validate", invalid_path.string()});
  if (result.exit_code != 10) {
    Fail("validate must exit 10 for an invalid config");
  }
  AssertContains(result.stderr_text, "invalid config: " + invalid_path.string());
  AssertContains(result.stderr_text, "model.version: is required");
  AssertContains(result.stderr_text, "artifact: is required");
  AssertContains(result.stderr_text, "registry.backend:");

  result = DispatchArgsCaptured({"modelpush", "validate", (temp_root / "absent.json").string()});
  if (result.exit_code != 1) {
    Fail("validate must exit 1 when the config cannot be read");
  }

  result = DispatchArgsCaptured({"modelpush", "validate"});
  if (result.exit_code != 2) {
    Fail("validate without a path must be a usage error");
  }
}

void CheckPackageAndDigest(const fs::path& temp_root) {
  const fs::path project = temp_root / "project";
  WriteFile(project / "model.pt", std::string(5'000, 'w'));
  WriteFile(project / "tokenizer.json", R"json({"version":"1.0","model":{"type":"WordPiece"}})json");
  const fs::path config_path = project / "upload.json";
  WriteFile(config_path, MakeConfigJson(R"json("backend": "sim")json"));

  auto result = DispatchArgsCaptured({"modelpush", "package", config_path.string()});
  if (result.exit_code != 0) {
    Fail("package failed:\n" + result.stderr_text);
  }
  const fs::path archive_path = project / "dist" / "model.zip";
  if (!fs::exists(archive_path)) {
    Fail("package must write the archive next to the config");
  }
  AssertContains(result.stdout_text, "member: model.pt size_bytes=5000");
  AssertContains(result.stdout_text, "member: tokenizer.json");

  result = DispatchArgsCaptured(
      {"modelpush", "digest", archive_path.string(), "--chunk-size", "1024"});
  if (result.exit_code != 0) {
    Fail("digest failed:\n" + result.stderr_text);
  }
  modelpush::hashing::Digest digest;
  std::string error;
  if (!modelpush::hashing::ComputeFileDigest(archive_path, digest, error)) {
    Fail("ComputeFileDigest failed: " + error);
  }
  const auto archive_size = fs::file_size(archive_path);
  AssertContains(result.stdout_text, "sha256: " + modelpush::hashing::ToHex(digest));
  AssertContains(result.stdout_text, "size_bytes: " + std::to_string(archive_size));
  AssertContains(result.stdout_text, "chunk_size_bytes: 1024");
  AssertContains(result.stdout_text,
                 "total_chunks: " + std::to_string((archive_size + 1023U) / 1024U));

  result = DispatchArgsCaptured({"modelpush", "digest", archive_path.string(), "--chunk-size", "0"});
  if (result.exit_code != 2) {
    Fail("digest must reject a zero chunk size");
  }
  result = DispatchArgsCaptured({"modelpush", "digest", (project / "missing.zip").string()});
  if (result.exit_code != 20) {
    Fail("digest must exit 20 for an unreadable archive");
  }

  const fs::path no_sources = temp_root / "no_sources.json";
  WriteFile(no_sources, R"json({
  "model": {"name": "m", "version": 1, "model_format": "ONNX", "model_task_type": "TEXT_EMBEDDING",
            "model_config": {"model_type": "bert", "embedding_dimension": 8,
                             "framework_type": "HUGGINGFACE_TRANSFORMERS", "all_config": ""}},
  "artifact": {"archive_path": "model.zip"},
  "registry": {"backend": "sim"}
})json");
  result = DispatchArgsCaptured({"modelpush", "package", no_sources.string()});
  if (result.exit_code != 10) {
    Fail("package without model/tokenizer paths must exit 10");
  }
}

} // namespace

int main() {
  const modelpush::tests::common::ScopedTempDir temp_dir("modelpush-cli");
  const fs::path& temp_root = temp_dir.Path();
  CheckUsageAndVersion();
  CheckValidate(temp_root);
  CheckPackageAndDigest(temp_root);
  std::cout << "cli_commands_smoke: ok\n";
  return 0;
}
