#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>

namespace modelpush::cli {

// Options for `modelpush upload`. The config file owns model, artifact,
// registry and retry settings; these flags only steer the local session.
struct UploadCommandOptions {
  std::filesystem::path config_path;
  std::optional<std::filesystem::path> output_dir;
  std::optional<std::filesystem::path> resume_checkpoint;
  std::optional<std::filesystem::path> stop_file;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `modelpush` subcommands and returns process exit codes with a stable
// contract for scripts and CI (see core/errors/exit_codes.hpp):
//   0 => success
//   1 => command failed after valid invocation
//   2 => usage error (unknown command / invalid args)
//   10..70 => upload failure class
int Dispatch(int argc, char** argv);

} // namespace modelpush::cli
