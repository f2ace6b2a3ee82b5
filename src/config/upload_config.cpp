#include "config/upload_config.hpp"

#include "artifact/artifact.hpp"
#include "chunking/chunker.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "registry/rest_protocol.hpp"
#include "upload/orchestrator.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace modelpush::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsString(const JsonValue* value) {
  return value != nullptr && value->type == JsonValue::Type::kString;
}

const JsonValue* RequireObject(const JsonValue& root, std::string_view key, const std::string& path,
                               ValidationReport& report) {
  const JsonValue* field = core::json::FindField(root, key);
  if (field == nullptr) {
    AddIssue(report, path, "is required");
    return nullptr;
  }
  if (!field->IsObject()) {
    AddIssue(report, path, "must be an object");
    return nullptr;
  }
  return field;
}

// Returns the string value, or nullopt after recording an issue.
std::optional<std::string> ReadString(const JsonValue& object, std::string_view key,
                                      const std::string& path, bool required, bool allow_empty,
                                      ValidationReport& report) {
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    if (required) {
      AddIssue(report, path, "is required");
    }
    return std::nullopt;
  }
  if (!IsString(field)) {
    AddIssue(report, path, "must be a string");
    return std::nullopt;
  }
  if (!allow_empty && field->string_value.empty()) {
    AddIssue(report, path, "must not be empty");
    return std::nullopt;
  }
  return field->string_value;
}

// Integer in [min_value, max_value]; `value` keeps its default when absent
// and `required` is false.
template <typename Integer>
void ReadInteger(const JsonValue& object, std::string_view key, const std::string& path,
                 bool required, std::uint64_t min_value, std::uint64_t max_value, Integer& value,
                 ValidationReport& report) {
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    if (required) {
      AddIssue(report, path, "is required");
    }
    return;
  }
  if (!core::json::IsNonNegativeInteger(*field)) {
    AddIssue(report, path, "must be a non-negative integer");
    return;
  }
  const auto parsed = static_cast<std::uint64_t>(field->number_value);
  if (parsed < min_value || parsed > max_value) {
    AddIssue(report, path,
             "must be in [" + std::to_string(min_value) + ", " + std::to_string(max_value) + "]");
    return;
  }
  value = static_cast<Integer>(parsed);
}

void ReadMilliseconds(const JsonValue& object, std::string_view key, const std::string& path,
                      std::uint64_t min_value, std::chrono::milliseconds& value,
                      ValidationReport& report) {
  std::uint64_t raw = static_cast<std::uint64_t>(value.count());
  ReadInteger(object, key, path, false, min_value, 86'400'000ULL, raw, report);
  value = std::chrono::milliseconds(static_cast<std::int64_t>(raw));
}

void ParseModel(const JsonValue& root, registry::ModelMetadata& model, ValidationReport& report) {
  const JsonValue* object = RequireObject(root, "model", "model", report);
  if (object == nullptr) {
    return;
  }

  if (auto name = ReadString(*object, "name", "model.name", true, false, report)) {
    model.name = std::move(*name);
  }
  ReadInteger(*object, "version", "model.version", true, 1U,
              std::numeric_limits<std::uint32_t>::max(), model.version, report);

  std::string error;
  if (auto format = ReadString(*object, "model_format", "model.model_format", true, false, report)) {
    if (!registry::ParseModelFormat(*format, model.model_format, error)) {
      AddIssue(report, "model.model_format", error);
    }
  }
  if (auto task = ReadString(*object, "model_task_type", "model.model_task_type", true, false,
                             report)) {
    if (!registry::ParseModelTaskType(*task, model.model_task_type, error)) {
      AddIssue(report, "model.model_task_type", error);
    }
  }
  if (auto description = ReadString(*object, "description", "model.description", false, true,
                                    report)) {
    model.description = std::move(*description);
  }

  const JsonValue* model_config = RequireObject(*object, "model_config", "model.model_config",
                                                report);
  if (model_config == nullptr) {
    return;
  }
  if (auto model_type = ReadString(*model_config, "model_type", "model.model_config.model_type",
                                   true, false, report)) {
    model.model_config.model_type = std::move(*model_type);
  }
  ReadInteger(*model_config, "embedding_dimension", "model.model_config.embedding_dimension", true,
              1U, std::numeric_limits<std::uint32_t>::max(), model.model_config.embedding_dimension,
              report);
  if (auto framework = ReadString(*model_config, "framework_type",
                                  "model.model_config.framework_type", true, false, report)) {
    if (!registry::ParseFrameworkType(*framework, model.model_config.framework_type, error)) {
      AddIssue(report, "model.model_config.framework_type", error);
    }
  }
  if (auto all_config = ReadString(*model_config, "all_config", "model.model_config.all_config",
                                   true, true, report)) {
    model.model_config.all_config = std::move(*all_config);
  }
}

void ParseArtifact(const JsonValue& root, ArtifactConfig& artifact, ValidationReport& report) {
  const JsonValue* object = RequireObject(root, "artifact", "artifact", report);
  if (object == nullptr) {
    return;
  }
  if (auto archive = ReadString(*object, "archive_path", "artifact.archive_path", true, false,
                                report)) {
    artifact.archive_path = *archive;
  }
  auto model_path = ReadString(*object, "model_path", "artifact.model_path", false, false, report);
  auto tokenizer_path =
      ReadString(*object, "tokenizer_path", "artifact.tokenizer_path", false, false, report);
  if (model_path.has_value() != tokenizer_path.has_value()) {
    AddIssue(report, "artifact",
             "model_path and tokenizer_path must be provided together to package an archive");
    return;
  }
  if (model_path.has_value()) {
    artifact.model_path = fs::path(*model_path);
    artifact.tokenizer_path = fs::path(*tokenizer_path);
  }
}

void ParseRegistry(const JsonValue& root, RegistryConfig& registry_config,
                   ValidationReport& report) {
  const JsonValue* object = RequireObject(root, "registry", "registry", report);
  if (object == nullptr) {
    return;
  }

  std::string error;
  if (auto backend = ReadString(*object, "backend", "registry.backend", true, false, report)) {
    if (!registry::ParseRegistryBackend(*backend, registry_config.backend, error)) {
      AddIssue(report, "registry.backend", error);
    }
  }

  registry::HttpRegistryOptions& http = registry_config.http;
  const bool base_url_required = registry_config.backend == registry::RegistryBackend::kHttp;
  if (auto base_url = ReadString(*object, "base_url", "registry.base_url", base_url_required,
                                 false, report)) {
    http.base_url = *base_url;
    std::string origin;
    std::string prefix;
    if (!registry::rest::SplitBaseUrl(http.base_url, origin, prefix, error)) {
      AddIssue(report, "registry.base_url", error);
    }
  }
  if (auto authorization = ReadString(*object, "authorization", "registry.authorization", false,
                                      false, report)) {
    http.authorization = *authorization;
  }
  ReadMilliseconds(*object, "register_timeout_ms", "registry.register_timeout_ms", 1U,
                   http.register_timeout, report);
  ReadMilliseconds(*object, "chunk_timeout_ms", "registry.chunk_timeout_ms", 1U, http.chunk_timeout,
                   report);
  ReadMilliseconds(*object, "finalize_poll_interval_ms", "registry.finalize_poll_interval_ms", 0U,
                   http.finalize_poll_interval, report);
  ReadInteger(*object, "finalize_poll_limit", "registry.finalize_poll_limit", false, 1U, 100'000U,
              http.finalize_poll_limit, report);
}

void ParseUploadSection(const JsonValue& root, UploadConfig& config, ValidationReport& report) {
  const JsonValue* object = core::json::FindField(root, "upload");
  if (object == nullptr) {
    return;
  }
  if (!object->IsObject()) {
    AddIssue(report, "upload", "must be an object");
    return;
  }

  ReadInteger(*object, "chunk_size_bytes", "upload.chunk_size_bytes", false, 1U,
              artifact::kMaxArtifactSizeBytes, config.chunk_size_bytes, report);
  ReadInteger(*object, "max_attempts", "upload.max_attempts", false, 1U, 100U,
              config.retry.max_attempts, report);
  ReadMilliseconds(*object, "initial_backoff_ms", "upload.initial_backoff_ms", 0U,
                   config.retry.initial_backoff, report);
  ReadMilliseconds(*object, "max_backoff_ms", "upload.max_backoff_ms", 0U, config.retry.max_backoff,
                   report);
  ReadInteger(*object, "max_in_flight", "upload.max_in_flight", false, 1U,
              upload::kMaxInFlightLimit, config.max_in_flight, report);

  const JsonValue* multiplier = core::json::FindField(*object, "backoff_multiplier");
  if (multiplier != nullptr) {
    if (multiplier->type != JsonValue::Type::kNumber || !std::isfinite(multiplier->number_value) ||
        multiplier->number_value < 1.0) {
      AddIssue(report, "upload.backoff_multiplier", "must be a number >= 1.0");
    } else {
      config.retry.backoff_multiplier = multiplier->number_value;
    }
  }
  if (config.retry.max_backoff < config.retry.initial_backoff) {
    AddIssue(report, "upload.max_backoff_ms", "must be >= upload.initial_backoff_ms");
  }
}

void ParseUploadConfig(std::string_view json_text, UploadConfig& config,
                       ValidationReport& report) {
  report = ValidationReport{};
  config = UploadConfig{};
  config.chunk_size_bytes = chunking::kDefaultChunkSizeBytes;

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", "invalid JSON: " + parse_error);
    return;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be a JSON object");
    return;
  }

  static const std::set<std::string> kKnownSections = {"model", "artifact", "registry", "upload"};
  for (const auto& [key, value] : root.object_value) {
    if (kKnownSections.count(key) == 0U) {
      AddIssue(report, key, "unknown field (expected model|artifact|registry|upload)");
    }
  }

  ParseModel(root, config.model, report);
  ParseArtifact(root, config.artifact, report);
  ParseRegistry(root, config.registry, report);
  ParseUploadSection(root, config, report);

  report.valid = report.issues.empty();
}

fs::path ResolveAgainst(const fs::path& base_dir, const fs::path& path) {
  if (path.empty() || path.is_absolute() || base_dir.empty()) {
    return path;
  }
  return base_dir / path;
}

} // namespace

bool ValidateUploadConfig(std::string_view json_text, ValidationReport& report,
                          std::string& error) {
  (void)error;
  UploadConfig ignored;
  ParseUploadConfig(json_text, ignored, report);
  return true;
}

bool LoadUploadConfig(const fs::path& config_path, UploadConfig& config, ValidationReport& report,
                      std::string& error) {
  std::string text;
  if (!core::ReadTextFile(config_path, text, error)) {
    return false;
  }
  ParseUploadConfig(text, config, report);
  if (!report.valid) {
    error = "upload config '" + config_path.string() + "' is invalid:\n" +
            FormatValidationIssues(report);
    return false;
  }

  const fs::path base_dir = config_path.parent_path();
  config.source_path = config_path;
  config.artifact.archive_path = ResolveAgainst(base_dir, config.artifact.archive_path);
  if (config.artifact.NeedsPackaging()) {
    config.artifact.model_path = ResolveAgainst(base_dir, config.artifact.model_path.value());
    config.artifact.tokenizer_path =
        ResolveAgainst(base_dir, config.artifact.tokenizer_path.value());
  }

  // A packaged archive is rewritten before upload, so only a prebuilt one is
  // checked against the registry limit here.
  std::uint64_t archive_size = 0;
  if (!config.artifact.NeedsPackaging() &&
      artifact::ExceedsSizeLimit(config.artifact.archive_path, archive_size)) {
    AddIssue(report, "artifact.archive_path",
             "archive is " + std::to_string(archive_size) +
                 " bytes, above the registry limit of " +
                 std::to_string(artifact::kMaxArtifactSizeBytes));
    report.valid = false;
    error = "upload config '" + config_path.string() + "' is invalid:\n" +
            FormatValidationIssues(report);
    return false;
  }
  return true;
}

std::string FormatValidationIssues(const ValidationReport& report) {
  std::string text;
  for (const ValidationIssue& issue : report.issues) {
    text += "  - " + issue.path + ": " + issue.message + "\n";
  }
  return text;
}

} // namespace modelpush::config
