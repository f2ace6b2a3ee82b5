#pragma once

namespace modelpush::core::errors {

// Stable process-exit contract for CLI automation.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values map one-to-one onto upload failure classes so CI
// wrappers can branch (for example, resume on 40, re-export on 50) without
// scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kArtifactRead = 20,
  kRegistration = 30,
  kChunkUpload = 40,
  kDigestMismatch = 50,
  kFinalization = 60,
  kCancelled = 70,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace modelpush::core::errors
