#pragma once

#include "registry/registry_client.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace modelpush::registry::rest {

// ml-commons model registry endpoints.
constexpr const char* kRegisterPath = "/_plugins/_ml/models/meta";
constexpr const char* kSearchPath = "/_plugins/_ml/models/_search";

// Splits "http://host:9200/prefix/" into origin "http://host:9200" and path
// prefix "/prefix". Only http and https schemes are accepted.
bool SplitBaseUrl(std::string_view base_url, std::string& origin, std::string& path_prefix,
                  std::string& error);

std::string BuildModelPath(std::string_view model_id);
std::string BuildChunkPath(std::string_view model_id, std::uint64_t index);

// Search for non-chunk model documents with a given name and version.
std::string BuildSearchJson(std::string_view name, std::uint32_t version);

// `{"model_id": "...", "status": "CREATED"}`
bool ParseRegisterResponse(std::string_view body, std::string& model_id, std::string& error);

// `{"status": "Uploaded"}`
bool ParseChunkResponse(std::string_view body, std::string& status, std::string& error);

// Maps a registry `model_state` onto the record lifecycle. Deployment states
// imply a completed upload. Returns false for unknown states.
bool MapModelState(std::string_view model_state, RecordState& state);

// GET model document -> record. `model_id` is not echoed by the registry.
bool ParseModelStateResponse(std::string_view body, std::string_view model_id,
                             RegistrationRecord& record, std::string& error);

// Search response -> newest matching record, if any.
bool ParseSearchResponse(std::string_view body, std::optional<RegistrationRecord>& record,
                         std::string& error);

} // namespace modelpush::registry::rest
