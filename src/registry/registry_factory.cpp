#include "registry/registry_factory.hpp"

#include "registry/sim_registry.hpp"

#include <utility>

#ifndef MODELPUSH_ENABLE_HTTP_REGISTRY
#define MODELPUSH_ENABLE_HTTP_REGISTRY 0
#endif

#ifndef MODELPUSH_HTTP_REGISTRY_REQUESTED
#define MODELPUSH_HTTP_REGISTRY_REQUESTED 0
#endif

#if MODELPUSH_ENABLE_HTTP_REGISTRY
#include "registry/http_registry_client.hpp"
#endif

namespace modelpush::registry {

const char* ToString(const RegistryBackend backend) {
  switch (backend) {
  case RegistryBackend::kHttp:
    return "http";
  case RegistryBackend::kSim:
    return "sim";
  }
  return "http";
}

bool ParseRegistryBackend(std::string_view raw, RegistryBackend& backend, std::string& error) {
  if (raw == "http") {
    backend = RegistryBackend::kHttp;
    return true;
  }
  if (raw == "sim") {
    backend = RegistryBackend::kSim;
    return true;
  }
  error = "unknown registry backend '" + std::string(raw) + "' (expected http|sim)";
  return false;
}

bool IsHttpRegistryEnabledAtBuild() {
#if MODELPUSH_ENABLE_HTTP_REGISTRY
  return true;
#else
  return false;
#endif
}

std::string_view HttpRegistryAvailabilityStatusText() {
#if MODELPUSH_ENABLE_HTTP_REGISTRY
  return "enabled";
#elif MODELPUSH_HTTP_REGISTRY_REQUESTED
  return "disabled (cpp-httplib not found)";
#else
  return "disabled (build option OFF)";
#endif
}

bool CreateRegistryClient(const RegistryBackend backend, const HttpRegistryOptions& http_options,
                          std::unique_ptr<IRegistryClient>& client, std::string& error) {
  client.reset();
  if (backend == RegistryBackend::kSim) {
    SimFaultPlan plan;
    if (!LoadSimFaultPlanFromEnv(plan, error)) {
      return false;
    }
    client = std::make_unique<SimRegistry>(std::move(plan));
    return true;
  }

#if MODELPUSH_ENABLE_HTTP_REGISTRY
  auto http_client = std::make_unique<HttpRegistryClient>(http_options);
  if (!http_client->IsValid(error)) {
    return false;
  }
  client = std::move(http_client);
  return true;
#else
  (void)http_options;
  error = "http registry backend is disabled at build time (set "
          "-DMODELPUSH_ENABLE_HTTP_REGISTRY=ON with cpp-httplib installed)";
  return false;
#endif
}

} // namespace modelpush::registry
