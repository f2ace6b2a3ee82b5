#pragma once

#include <string>
#include <string_view>

namespace modelpush::registry {

// Stable classification for registry failures.
//
// Raw transport strings and HTTP bodies vary between cluster versions; the
// orchestrator branches only on these codes (retry vs. fail, digest mismatch
// vs. generic finalize failure).
enum class RegistryErrorCode {
  kTimeout,
  kTransport,
  kThrottled,
  kRejected,
  kNotFound,
  kInvalidState,
  kDuplicate,
  kDigestMismatch,
  kDisabled,
  kUnknown,
};

std::string_view ToStableErrorCode(RegistryErrorCode code);

// Timeouts, connection-level failures and throttling are worth retrying with
// backoff; everything else is a definitive answer from the registry.
bool IsTransient(RegistryErrorCode code);

struct RegistryError {
  RegistryErrorCode code = RegistryErrorCode::kUnknown;
  std::string message;
  // 0 when the failure happened below HTTP (connect, read timeout, ...).
  int http_status = 0;
};

RegistryError MakeRegistryError(RegistryErrorCode code, std::string message, int http_status = 0);

// Maps a non-2xx HTTP status to a code.
RegistryErrorCode MapHttpStatus(int http_status);

// Keyword classification of raw transport error text (socket/client library
// messages). Unrecognized text maps to kTransport.
RegistryErrorCode ClassifyTransportError(std::string_view detail);

// Returns single-line contract text:
//   "<STABLE_CODE>: <message> [http_status=<n>]"
std::string FormatRegistryError(const RegistryError& error);

} // namespace modelpush::registry
