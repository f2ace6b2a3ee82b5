#include "registry/registry_error.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace modelpush::registry {

namespace {

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (!needle.empty() && haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string_view ToStableErrorCode(const RegistryErrorCode code) {
  switch (code) {
  case RegistryErrorCode::kTimeout:
    return "REGISTRY_TIMEOUT";
  case RegistryErrorCode::kTransport:
    return "REGISTRY_TRANSPORT";
  case RegistryErrorCode::kThrottled:
    return "REGISTRY_THROTTLED";
  case RegistryErrorCode::kRejected:
    return "REGISTRY_REJECTED";
  case RegistryErrorCode::kNotFound:
    return "REGISTRY_NOT_FOUND";
  case RegistryErrorCode::kInvalidState:
    return "REGISTRY_INVALID_STATE";
  case RegistryErrorCode::kDuplicate:
    return "REGISTRY_DUPLICATE";
  case RegistryErrorCode::kDigestMismatch:
    return "REGISTRY_DIGEST_MISMATCH";
  case RegistryErrorCode::kDisabled:
    return "REGISTRY_DISABLED";
  case RegistryErrorCode::kUnknown:
  default:
    return "REGISTRY_UNKNOWN_ERROR";
  }
}

bool IsTransient(const RegistryErrorCode code) {
  return code == RegistryErrorCode::kTimeout || code == RegistryErrorCode::kTransport ||
         code == RegistryErrorCode::kThrottled;
}

RegistryError MakeRegistryError(const RegistryErrorCode code, std::string message,
                                const int http_status) {
  RegistryError error;
  error.code = code;
  error.message = std::move(message);
  error.http_status = http_status;
  return error;
}

RegistryErrorCode MapHttpStatus(const int http_status) {
  if (http_status == 408 || http_status == 504) {
    return RegistryErrorCode::kTimeout;
  }
  if (http_status == 429) {
    return RegistryErrorCode::kThrottled;
  }
  if (http_status == 404) {
    return RegistryErrorCode::kNotFound;
  }
  if (http_status == 409) {
    return RegistryErrorCode::kDuplicate;
  }
  if (http_status >= 500 && http_status <= 599) {
    return RegistryErrorCode::kTransport;
  }
  if (http_status >= 400 && http_status <= 499) {
    return RegistryErrorCode::kRejected;
  }
  return RegistryErrorCode::kUnknown;
}

RegistryErrorCode ClassifyTransportError(std::string_view detail) {
  const std::string normalized = ToLowerAscii(std::string(detail));
  if (normalized.empty()) {
    return RegistryErrorCode::kTransport;
  }

  if (ContainsAny(normalized, {"disabled at build time"})) {
    return RegistryErrorCode::kDisabled;
  }
  if (ContainsAny(normalized, {"timeout", "timed out", "time out", "deadline exceeded"})) {
    return RegistryErrorCode::kTimeout;
  }
  // Socket read/write failures surface this way when the peer stops
  // answering within the configured read/write timeout.
  if (normalized == "read" || normalized == "write" ||
      ContainsAny(normalized, {"failed to read", "failed to write"})) {
    return RegistryErrorCode::kTimeout;
  }
  if (ContainsAny(normalized, {"too many requests", "throttl", "rate limit"})) {
    return RegistryErrorCode::kThrottled;
  }
  if (ContainsAny(normalized, {"digest", "hash mismatch", "checksum"})) {
    return RegistryErrorCode::kDigestMismatch;
  }
  return RegistryErrorCode::kTransport;
}

std::string FormatRegistryError(const RegistryError& error) {
  std::string formatted = std::string(ToStableErrorCode(error.code)) + ": " + error.message;
  if (error.http_status != 0) {
    formatted += " http_status=" + std::to_string(error.http_status);
  }
  return formatted;
}

} // namespace modelpush::registry
