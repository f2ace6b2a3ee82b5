#include "registry/rest_protocol.hpp"

#include "core/json_dom.hpp"

#include <charconv>
#include <utility>

namespace modelpush::registry::rest {

namespace json = core::json;

namespace {

bool ParseObject(std::string_view body, json::Value& root, std::string& error) {
  if (!json::Parse(body, root, error)) {
    error = "registry response is not valid JSON: " + error;
    return false;
  }
  if (!root.IsObject()) {
    error = "registry response must be a JSON object";
    return false;
  }
  return true;
}

// The registry stores versions as strings; older clusters return numbers.
bool TryGetVersion(const json::Value& object, std::string_view key, std::uint32_t& version) {
  const json::Value* field = json::FindField(object, key);
  if (field == nullptr) {
    return false;
  }
  if (json::IsNonNegativeInteger(*field) && field->number_value <= 4294967295.0) {
    version = static_cast<std::uint32_t>(field->number_value);
    return true;
  }
  if (field->type == json::Value::Type::kString) {
    const std::string& text = field->string_value;
    std::uint32_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
      version = parsed;
      return true;
    }
  }
  return false;
}

bool FillRecordFromSource(const json::Value& source, std::string_view model_id,
                          RegistrationRecord& record, std::string& error) {
  std::string model_state;
  if (!json::TryGetString(source, "model_state", model_state)) {
    error = "registry model document has no model_state";
    return false;
  }
  RecordState state = RecordState::kCreated;
  if (!MapModelState(model_state, state)) {
    error = "registry reported unknown model_state '" + model_state + "'";
    return false;
  }

  record = RegistrationRecord{};
  record.model_id = std::string(model_id);
  record.state = state;
  (void)json::TryGetString(source, "name", record.name);
  (void)TryGetVersion(source, "model_version", record.version);
  (void)json::TryGetString(source, "model_content_hash_value", record.digest_hex);
  (void)json::TryGetUnsigned(source, "model_content_size_in_bytes", record.size_bytes);
  (void)json::TryGetUnsigned(source, "total_chunks", record.total_chunks);
  return true;
}

} // namespace

bool SplitBaseUrl(std::string_view base_url, std::string& origin, std::string& path_prefix,
                  std::string& error) {
  const std::size_t scheme_end = base_url.find("://");
  if (scheme_end == std::string_view::npos) {
    error = "registry base_url '" + std::string(base_url) + "' has no scheme";
    return false;
  }
  const std::string_view scheme = base_url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") {
    error = "registry base_url scheme must be http or https (got '" + std::string(scheme) + "')";
    return false;
  }

  const std::size_t host_begin = scheme_end + 3U;
  const std::size_t path_begin = base_url.find('/', host_begin);
  const std::string_view host_port = base_url.substr(
      host_begin, path_begin == std::string_view::npos ? std::string_view::npos
                                                       : path_begin - host_begin);
  if (host_port.empty()) {
    error = "registry base_url '" + std::string(base_url) + "' has no host";
    return false;
  }

  origin = std::string(base_url.substr(0, host_begin)) + std::string(host_port);
  path_prefix.clear();
  if (path_begin != std::string_view::npos) {
    path_prefix = std::string(base_url.substr(path_begin));
    while (!path_prefix.empty() && path_prefix.back() == '/') {
      path_prefix.pop_back();
    }
  }
  return true;
}

std::string BuildModelPath(std::string_view model_id) {
  return "/_plugins/_ml/models/" + std::string(model_id);
}

std::string BuildChunkPath(std::string_view model_id, const std::uint64_t index) {
  return BuildModelPath(model_id) + "/chunk/" + std::to_string(index);
}

std::string BuildSearchJson(std::string_view name, const std::uint32_t version) {
  json::Value name_term = json::Value::MakeObject();
  name_term.object_value["name.keyword"] = json::Value::MakeString(std::string(name));
  json::Value version_term = json::Value::MakeObject();
  version_term.object_value["model_version"] = json::Value::MakeString(std::to_string(version));

  json::Value must = json::Value::MakeArray();
  json::Value term = json::Value::MakeObject();
  term.object_value["term"] = std::move(name_term);
  must.array_value.push_back(term);
  term.object_value["term"] = std::move(version_term);
  must.array_value.push_back(term);

  // Chunk documents share the index with model documents.
  json::Value exists = json::Value::MakeObject();
  exists.object_value["field"] = json::Value::MakeString("chunk_number");
  json::Value must_not = json::Value::MakeObject();
  must_not.object_value["exists"] = std::move(exists);

  json::Value bool_query = json::Value::MakeObject();
  bool_query.object_value["must"] = std::move(must);
  bool_query.object_value["must_not"] = std::move(must_not);
  json::Value query = json::Value::MakeObject();
  query.object_value["bool"] = std::move(bool_query);

  json::Value body = json::Value::MakeObject();
  body.object_value["query"] = std::move(query);
  body.object_value["size"] = json::Value::MakeNumber(10);
  return json::Serialize(body);
}

bool ParseRegisterResponse(std::string_view body, std::string& model_id, std::string& error) {
  json::Value root;
  if (!ParseObject(body, root, error)) {
    return false;
  }
  if (!json::TryGetString(root, "model_id", model_id) || model_id.empty()) {
    error = "registration response has no model_id";
    return false;
  }
  return true;
}

bool ParseChunkResponse(std::string_view body, std::string& status, std::string& error) {
  json::Value root;
  if (!ParseObject(body, root, error)) {
    return false;
  }
  if (!json::TryGetString(root, "status", status)) {
    error = "chunk response has no status";
    return false;
  }
  if (status != "Uploaded") {
    error = "chunk was not accepted (status '" + status + "')";
    return false;
  }
  return true;
}

bool MapModelState(std::string_view model_state, RecordState& state) {
  if (model_state == "CREATED") {
    state = RecordState::kCreated;
    return true;
  }
  if (model_state == "REGISTERING") {
    state = RecordState::kUploading;
    return true;
  }
  if (model_state == "REGISTERED" || model_state == "UPLOADED" || model_state == "DEPLOYING" ||
      model_state == "DEPLOYED" || model_state == "PARTIALLY_DEPLOYED" ||
      model_state == "UNDEPLOYED" || model_state == "DEPLOY_FAILED") {
    state = RecordState::kUploaded;
    return true;
  }
  if (model_state == "REGISTER_FAILED" || model_state == "FAILED") {
    state = RecordState::kFailed;
    return true;
  }
  return false;
}

bool ParseModelStateResponse(std::string_view body, std::string_view model_id,
                             RegistrationRecord& record, std::string& error) {
  json::Value root;
  if (!ParseObject(body, root, error)) {
    return false;
  }
  return FillRecordFromSource(root, model_id, record, error);
}

bool ParseSearchResponse(std::string_view body, std::optional<RegistrationRecord>& record,
                         std::string& error) {
  record.reset();
  json::Value root;
  if (!ParseObject(body, root, error)) {
    return false;
  }
  const json::Value* outer_hits = json::FindField(root, "hits");
  const json::Value* hits = outer_hits == nullptr ? nullptr : json::FindField(*outer_hits, "hits");
  if (hits == nullptr || hits->type != json::Value::Type::kArray) {
    error = "search response has no hits.hits array";
    return false;
  }

  for (const json::Value& hit : hits->array_value) {
    std::string id;
    const json::Value* source = json::FindField(hit, "_source");
    if (!json::TryGetString(hit, "_id", id) || source == nullptr) {
      continue;
    }
    RegistrationRecord candidate;
    std::string candidate_error;
    if (!FillRecordFromSource(*source, id, candidate, candidate_error)) {
      continue;
    }
    if (!record.has_value() || AcceptsChunks(candidate.state)) {
      record = std::move(candidate);
    }
  }
  return true;
}

} // namespace modelpush::registry::rest
