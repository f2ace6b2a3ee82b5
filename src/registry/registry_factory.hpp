#pragma once

#include "registry/registry_client.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace modelpush::registry {

enum class RegistryBackend {
  kHttp,
  kSim,
};

const char* ToString(RegistryBackend backend);
bool ParseRegistryBackend(std::string_view raw, RegistryBackend& backend, std::string& error);

struct HttpRegistryOptions {
  std::string base_url;
  // Pre-built `Authorization` header value, passed through untouched.
  std::string authorization;
  std::chrono::milliseconds register_timeout{30'000};
  std::chrono::milliseconds chunk_timeout{60'000};
  std::chrono::milliseconds finalize_poll_interval{1'000};
  std::uint32_t finalize_poll_limit = 30;
};

// Returns whether the HTTP registry client was compiled in.
bool IsHttpRegistryEnabledAtBuild();

// Human-readable status text for `modelpush version`.
std::string_view HttpRegistryAvailabilityStatusText();

// Creates the effective registry client.
// - sim: in-process SimRegistry, faults from `MODELPUSH_TEST_SIM_*`
// - http: HttpRegistryClient, or a "disabled at build time" error when the
//   build has no HTTP transport
bool CreateRegistryClient(RegistryBackend backend, const HttpRegistryOptions& http_options,
                          std::unique_ptr<IRegistryClient>& client, std::string& error);

} // namespace modelpush::registry
