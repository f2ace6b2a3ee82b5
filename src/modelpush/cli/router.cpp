#include "modelpush/cli/router.hpp"

#include "artifact/archive_writer.hpp"
#include "artifact/artifact.hpp"
#include "chunking/chunker.hpp"
#include "config/upload_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/upload_error.hpp"
#include "hashing/digest.hpp"
#include "registry/registry_factory.hpp"
#include "upload/checkpoint_store.hpp"
#include "upload/orchestrator.hpp"
#include "upload/upload_summary_writer.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace modelpush::cli {

namespace {

using core::errors::ExitCode;

constexpr int kExitSuccess = core::errors::ToInt(ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(ExitCode::kConfigInvalid);
constexpr int kExitArtifactRead = core::errors::ToInt(ExitCode::kArtifactRead);

constexpr std::string_view kVersion = "0.1.0";
constexpr const char* kDefaultOutputDir = "out";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  modelpush package <config.json>\n"
      << "  modelpush digest <archive.zip> [--chunk-size <bytes>]\n"
      << "  modelpush validate <config.json>\n"
      << "  modelpush upload <config.json> [--out <dir>] [--resume <upload_checkpoint.json>] "
         "[--stop-file <path>] [--log-level <debug|info|warn|error>]\n"
      << "  modelpush version\n";
}

bool ParseByteCount(std::string_view raw, std::uint64_t& value, std::string& error) {
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid byte count: '" + std::string(raw) + "'";
    return false;
  }
  return true;
}

bool ReadOptionValue(const std::vector<std::string_view>& args, std::size_t& i,
                     std::string_view flag, std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[++i];
  return true;
}

void PrintValidationReport(const fs::path& config_path, const config::ValidationReport& report) {
  std::cerr << "invalid config: " << config_path.string() << '\n';
  std::cerr << config::FormatValidationIssues(report);
}

// Loads the config; prints issues and returns the exit code on failure.
bool LoadConfigOrReport(const fs::path& config_path, config::UploadConfig& upload_config,
                        int& exit_code) {
  config::ValidationReport report;
  std::string error;
  if (config::LoadUploadConfig(config_path, upload_config, report, error)) {
    return true;
  }
  if (!report.issues.empty()) {
    PrintValidationReport(config_path, report);
  } else {
    std::cerr << "error: " << error << '\n';
  }
  exit_code = kExitConfigInvalid;
  return false;
}

bool PackageArchive(const config::ArtifactConfig& artifact_config,
                    std::vector<artifact::ArchiveMember>& members, std::string& error) {
  return artifact::WriteModelArchive(artifact_config.model_path.value(),
                                     artifact_config.tokenizer_path.value(),
                                     artifact_config.archive_path, members, error);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "modelpush " << kVersion << '\n';
  std::cout << "http_registry: " << registry::HttpRegistryAvailabilityStatusText() << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  config::UploadConfig upload_config;
  config::ValidationReport report;
  std::string error;
  if (!config::LoadUploadConfig(config_path, upload_config, report, error)) {
    if (report.issues.empty()) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    PrintValidationReport(config_path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

int CommandPackage(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: package requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  config::UploadConfig upload_config;
  int exit_code = kExitSuccess;
  if (!LoadConfigOrReport(config_path, upload_config, exit_code)) {
    return exit_code;
  }
  if (!upload_config.artifact.NeedsPackaging()) {
    std::cerr << "error: artifact.model_path and artifact.tokenizer_path are required to "
                 "package an archive\n";
    return kExitConfigInvalid;
  }

  std::vector<artifact::ArchiveMember> members;
  std::string error;
  if (!PackageArchive(upload_config.artifact, members, error)) {
    std::cerr << "error: failed to package archive: " << error << '\n';
    return kExitArtifactRead;
  }

  std::cout << "archive: " << upload_config.artifact.archive_path.string() << '\n';
  for (const auto& member : members) {
    std::cout << "  member: " << member.name << " size_bytes=" << member.size_bytes
              << " crc32=" << member.crc32 << '\n';
  }
  return kExitSuccess;
}

int CommandDigest(const std::vector<std::string_view>& args) {
  fs::path archive_path;
  std::uint64_t chunk_size = chunking::kDefaultChunkSizeBytes;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--chunk-size") {
      std::string_view value;
      if (!ReadOptionValue(args, i, token, value, error) ||
          !ParseByteCount(value, chunk_size, error) ||
          !chunking::ValidateChunkSize(chunk_size, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    if (!archive_path.empty()) {
      std::cerr << "error: digest accepts exactly 1 archive path\n";
      return kExitUsage;
    }
    archive_path = fs::path(token);
  }
  if (archive_path.empty()) {
    std::cerr << "error: digest requires exactly 1 argument: <archive.zip>\n";
    return kExitUsage;
  }

  hashing::Digest digest;
  if (!hashing::ComputeFileDigest(archive_path, digest, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitArtifactRead;
  }
  std::error_code ec;
  const std::uintmax_t size_bytes = fs::file_size(archive_path, ec);
  if (ec) {
    std::cerr << "error: unable to stat archive '" << archive_path.string()
              << "': " << ec.message() << '\n';
    return kExitArtifactRead;
  }

  std::cout << "sha256: " << hashing::ToHex(digest) << '\n';
  std::cout << "size_bytes: " << size_bytes << '\n';
  std::cout << "chunk_size_bytes: " << chunk_size << '\n';
  std::cout << "total_chunks: " << chunking::ComputeChunkCount(size_bytes, chunk_size) << '\n';
  if (size_bytes > artifact::kMaxArtifactSizeBytes) {
    std::cerr << "warning: archive exceeds the registry limit of "
              << artifact::kMaxArtifactSizeBytes << " bytes\n";
  }
  return kExitSuccess;
}

bool ParseUploadOptions(const std::vector<std::string_view>& args, UploadCommandOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--out") {
      if (!ReadOptionValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--resume") {
      if (!ReadOptionValue(args, i, token, value, error)) {
        return false;
      }
      options.resume_checkpoint = fs::path(value);
      continue;
    }
    if (token == "--stop-file") {
      if (!ReadOptionValue(args, i, token, value, error)) {
        return false;
      }
      options.stop_file = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!ReadOptionValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.config_path.empty()) {
      error = "upload accepts exactly 1 config path";
      return false;
    }
    options.config_path = fs::path(token);
  }

  if (options.config_path.empty()) {
    error = "upload requires exactly 1 argument: <config.json>";
    return false;
  }
  return true;
}

void PrintUploadFailure(const UploadCommandOptions& options, const upload::UploadOutcome& outcome) {
  const core::errors::UploadError& failure = outcome.error.value();
  std::cerr << "upload failed: " << core::errors::FormatUploadError(failure) << '\n';
  if (core::errors::IsResumable(failure.kind) && !outcome.checkpoint_path.empty()) {
    std::cerr << "resume with: modelpush upload " << options.config_path.string()
              << " --resume " << outcome.checkpoint_path.string() << '\n';
  }
}

int CommandUpload(const std::vector<std::string_view>& args) {
  UploadCommandOptions options;
  std::string error;
  if (!ParseUploadOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.Info("upload requested",
              {{"config_path", options.config_path.string()},
               {"resume", options.resume_checkpoint.has_value() ? "true" : "false"}});

  config::UploadConfig upload_config;
  int exit_code = kExitSuccess;
  if (!LoadConfigOrReport(options.config_path, upload_config, exit_code)) {
    logger.Error("config load failed", {{"config_path", options.config_path.string()}});
    return exit_code;
  }

  upload::UploadOptions upload_options;
  upload_options.chunk_size_bytes = upload_config.chunk_size_bytes;
  upload_options.retry = upload_config.retry;
  upload_options.max_in_flight = upload_config.max_in_flight;
  upload_options.config_path = options.config_path;
  upload_options.output_dir = options.output_dir.value_or(fs::path(kDefaultOutputDir));

  if (options.resume_checkpoint.has_value()) {
    upload::CheckpointState checkpoint;
    if (!upload::LoadCheckpoint(options.resume_checkpoint.value(), checkpoint, error)) {
      logger.Error("checkpoint load failed",
                   {{"checkpoint", options.resume_checkpoint->string()}, {"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitConfigInvalid;
    }
    // Keep session artifacts beside the checkpoint unless --out says otherwise.
    if (!options.output_dir.has_value()) {
      upload_options.output_dir = options.resume_checkpoint->parent_path();
    }
    upload_options.resume = std::move(checkpoint);
  } else if (upload_config.artifact.NeedsPackaging()) {
    std::vector<artifact::ArchiveMember> members;
    if (!PackageArchive(upload_config.artifact, members, error)) {
      logger.Error("archive packaging failed", {{"error", error}});
      std::cerr << "error: failed to package archive: " << error << '\n';
      return kExitArtifactRead;
    }
    logger.Info("archive packaged",
                {{"archive_path", upload_config.artifact.archive_path.string()},
                 {"members", std::to_string(members.size())}});
  }

  std::uint64_t archive_size = 0;
  if (artifact::ExceedsSizeLimit(upload_config.artifact.archive_path, archive_size)) {
    logger.Error("archive exceeds registry size limit",
                 {{"archive_path", upload_config.artifact.archive_path.string()},
                  {"size_bytes", std::to_string(archive_size)}});
    std::cerr << "error: archive '" << upload_config.artifact.archive_path.string() << "' is "
              << archive_size << " bytes, above the registry limit of "
              << artifact::kMaxArtifactSizeBytes << " bytes\n";
    return kExitConfigInvalid;
  }

  artifact::Artifact archive;
  if (!artifact::LoadArtifact(upload_config.artifact.archive_path, archive, error)) {
    logger.Error("artifact load failed",
                 {{"archive_path", upload_config.artifact.archive_path.string()},
                  {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitArtifactRead;
  }

  std::unique_ptr<registry::IRegistryClient> registry_client;
  if (!registry::CreateRegistryClient(upload_config.registry.backend, upload_config.registry.http,
                                      registry_client, error)) {
    logger.Error("registry selection failed",
                 {{"backend", registry::ToString(upload_config.registry.backend)},
                  {"error", error}});
    std::cerr << "error: registry selection failed: " << error << '\n';
    return kExitFailure;
  }

  upload::UploadHooks hooks;
  if (options.stop_file.has_value()) {
    const fs::path stop_file = options.stop_file.value();
    hooks.should_stop = [stop_file]() {
      std::error_code ec;
      return fs::exists(stop_file, ec) && !ec;
    };
  }
  hooks.on_progress = [](const upload::UploadProgress& progress) {
    std::cout << "progress: " << progress.acknowledged_count << "/" << progress.total_count
              << " (index " << progress.current_index << ")\n";
  };

  upload::UploadOrchestrator orchestrator(*registry_client, logger);
  upload::UploadOutcome outcome;
  if (!orchestrator.Run(upload_config.model, archive, upload_options, hooks, outcome)) {
    if (!outcome.error.has_value()) {
      std::cerr << "upload failed: session ended in state " << upload::ToString(outcome.state)
                << '\n';
      return kExitFailure;
    }
    PrintUploadFailure(options, outcome);
    return core::errors::ToInt(core::errors::ExitCodeFor(outcome.error->kind));
  }

  std::cout << "upload complete: model_id=" << outcome.model_id << '\n';
  std::cout << "digest_sha256: " << outcome.digest_hex << '\n';
  std::cout << "chunks: " << outcome.acknowledged_count << "/" << outcome.total_chunks << '\n';
  std::cout << "summary: " << (upload_options.output_dir / upload::kUploadSummaryFileName).string()
            << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "package") {
    return CommandPackage(args);
  }
  if (command == "digest") {
    return CommandDigest(args);
  }
  if (command == "upload") {
    return CommandUpload(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace modelpush::cli
