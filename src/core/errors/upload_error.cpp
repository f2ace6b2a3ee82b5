#include "core/errors/upload_error.hpp"

#include <utility>

namespace modelpush::core::errors {

std::string_view ToStableErrorCode(const UploadErrorKind kind) {
  switch (kind) {
  case UploadErrorKind::kArtifactRead:
    return "ARTIFACT_READ_ERROR";
  case UploadErrorKind::kConfiguration:
    return "CONFIGURATION_ERROR";
  case UploadErrorKind::kRegistration:
    return "REGISTRATION_ERROR";
  case UploadErrorKind::kChunkUpload:
    return "CHUNK_UPLOAD_ERROR";
  case UploadErrorKind::kDigestMismatch:
    return "DIGEST_MISMATCH_ERROR";
  case UploadErrorKind::kFinalization:
    return "FINALIZATION_ERROR";
  case UploadErrorKind::kCancelled:
    return "SESSION_CANCELLED";
  }
  return "CONFIGURATION_ERROR";
}

bool IsResumable(const UploadErrorKind kind) {
  return kind == UploadErrorKind::kChunkUpload || kind == UploadErrorKind::kCancelled ||
         kind == UploadErrorKind::kFinalization;
}

ExitCode ExitCodeFor(const UploadErrorKind kind) {
  switch (kind) {
  case UploadErrorKind::kArtifactRead:
    return ExitCode::kArtifactRead;
  case UploadErrorKind::kConfiguration:
    return ExitCode::kConfigInvalid;
  case UploadErrorKind::kRegistration:
    return ExitCode::kRegistration;
  case UploadErrorKind::kChunkUpload:
    return ExitCode::kChunkUpload;
  case UploadErrorKind::kDigestMismatch:
    return ExitCode::kDigestMismatch;
  case UploadErrorKind::kFinalization:
    return ExitCode::kFinalization;
  case UploadErrorKind::kCancelled:
    return ExitCode::kCancelled;
  }
  return ExitCode::kFailure;
}

UploadError MakeUploadError(const UploadErrorKind kind, std::string message, std::string detail) {
  UploadError error;
  error.kind = kind;
  error.message = std::move(message);
  error.detail = std::move(detail);
  return error;
}

std::string FormatUploadError(const UploadError& error) {
  std::string text(ToStableErrorCode(error.kind));
  text += ": ";
  text += error.message;

  if (!error.model_name.empty()) {
    text += " model=" + error.model_name;
    if (error.model_version.has_value()) {
      text += "@v" + std::to_string(error.model_version.value());
    }
  }
  if (!error.model_id.empty()) {
    text += " model_id=" + error.model_id;
  }
  if (error.chunk_index.has_value()) {
    text += " index=" + std::to_string(error.chunk_index.value());
  }
  if (error.attempts > 0U) {
    text += " attempts=" + std::to_string(error.attempts);
  }
  if (!error.detail.empty()) {
    text += " detail: " + error.detail;
  }
  return text;
}

} // namespace modelpush::core::errors
