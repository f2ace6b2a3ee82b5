#pragma once

#include "registry/model_metadata.hpp"
#include "registry/registry_factory.hpp"
#include "upload/retry_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modelpush::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

struct ArtifactConfig {
  std::filesystem::path archive_path;
  // Both set when the archive should be packaged before upload.
  std::optional<std::filesystem::path> model_path;
  std::optional<std::filesystem::path> tokenizer_path;

  bool NeedsPackaging() const {
    return model_path.has_value() && tokenizer_path.has_value();
  }
};

struct RegistryConfig {
  registry::RegistryBackend backend = registry::RegistryBackend::kHttp;
  registry::HttpRegistryOptions http;
};

struct UploadConfig {
  registry::ModelMetadata model;
  ArtifactConfig artifact;
  RegistryConfig registry;
  std::uint64_t chunk_size_bytes = 0;
  upload::RetryPolicy retry;
  std::uint32_t max_in_flight = 1;
  std::filesystem::path source_path;
};

// Validates upload config JSON text.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Returns false only for internal failures outside the validation flow.
// - Populates `report.valid` and every issue found, not just the first.
// - On parse errors, emits one issue under path `$`.
bool ValidateUploadConfig(std::string_view json_text, ValidationReport& report,
                          std::string& error);

// Loads, validates and resolves an upload config file. Relative artifact
// paths are resolved against the config file's directory.
//
// Contract:
// - Returns false with `error` set on file I/O failure or when the report is
//   invalid (`report` then lists the issues).
// - An existing prebuilt archive above the registry size limit is reported
//   under `artifact.archive_path`.
bool LoadUploadConfig(const std::filesystem::path& config_path, UploadConfig& config,
                      ValidationReport& report, std::string& error);

// "path: message" lines, one per issue.
std::string FormatValidationIssues(const ValidationReport& report);

} // namespace modelpush::config
