#pragma once

#include "core/errors/exit_codes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace modelpush::core::errors {

// Failure classes for one upload session. Every terminal FAILED outcome
// carries exactly one of these.
enum class UploadErrorKind {
  kArtifactRead,
  kConfiguration,
  kRegistration,
  kChunkUpload,
  kDigestMismatch,
  kFinalization,
  kCancelled,
};

// Grep-friendly code, e.g. "CHUNK_UPLOAD_ERROR".
std::string_view ToStableErrorCode(UploadErrorKind kind);

// Whether a session that failed with `kind` can be resumed against the same
// registry record (chunk and cancel failures leave acked chunks valid).
bool IsResumable(UploadErrorKind kind);

ExitCode ExitCodeFor(UploadErrorKind kind);

// Enough context to diagnose and resume: which model, which chunk, how many
// attempts were spent.
struct UploadError {
  UploadErrorKind kind = UploadErrorKind::kConfiguration;
  std::string message;
  std::string detail;
  std::string model_name;
  std::optional<std::uint64_t> model_version;
  std::string model_id;
  std::optional<std::uint64_t> chunk_index;
  std::uint32_t attempts = 0;
};

UploadError MakeUploadError(UploadErrorKind kind, std::string message, std::string detail = {});

// Single-line contract text:
//   "<CODE>: <message> [model=<name>@v<version>] [model_id=<id>] [index=<i>]
//    [attempts=<n>] detail: <detail>"
// Bracketed parts and the detail suffix are omitted when empty.
std::string FormatUploadError(const UploadError& error);

} // namespace modelpush::core::errors
