#include "registry/http_registry_client.hpp"

#include "registry/rest_protocol.hpp"

#include <httplib.h>

#include <memory>
#include <thread>
#include <utility>

namespace modelpush::registry {

namespace {

std::unique_ptr<httplib::Client> MakeClient(const std::string& origin,
                                            const std::string& authorization,
                                            const std::chrono::milliseconds timeout) {
  auto client = std::make_unique<httplib::Client>(origin);
  if (!client->is_valid()) {
    return nullptr;
  }
  const auto sec = static_cast<time_t>(timeout.count() / 1000);
  const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
  client->set_connection_timeout(sec, usec);
  client->set_read_timeout(sec, usec);
  client->set_write_timeout(sec, usec);
  client->set_keep_alive(false);
  if (!authorization.empty()) {
    client->set_default_headers(httplib::Headers{{"Authorization", authorization}});
  }
  return client;
}

bool CheckResult(const httplib::Result& result, std::string_view what, int& status,
                 std::string& body, RegistryError& error) {
  if (!result) {
    const std::string detail = httplib::to_string(result.error());
    error = MakeRegistryError(ClassifyTransportError(detail),
                              std::string(what) + " failed: " + detail);
    return false;
  }
  status = result->status;
  body = result->body;
  if (status < 200 || status > 299) {
    error = MakeRegistryError(MapHttpStatus(status), std::string(what) + " returned " +
                                                         std::to_string(status) + ": " + body,
                              status);
    return false;
  }
  return true;
}

} // namespace

HttpRegistryClient::HttpRegistryClient(HttpRegistryOptions options)
    : options_(std::move(options)) {
  if (!rest::SplitBaseUrl(options_.base_url, origin_, path_prefix_, url_error_)) {
    origin_.clear();
  }
}

bool HttpRegistryClient::IsValid(std::string& error) const {
  if (!url_error_.empty()) {
    error = url_error_;
    return false;
  }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
  if (origin_.rfind("https://", 0) == 0) {
    error = "https registry base_url requires cpp-httplib built with OpenSSL support";
    return false;
  }
#endif
  return true;
}

bool HttpRegistryClient::PostJson(const std::string& path, const std::string& body,
                                  const std::chrono::milliseconds timeout, Response& response,
                                  RegistryError& error) const {
  auto client = MakeClient(origin_, options_.authorization, timeout);
  if (client == nullptr) {
    error = MakeRegistryError(RegistryErrorCode::kTransport, "invalid registry origin " + origin_);
    return false;
  }
  const httplib::Result result = client->Post(path_prefix_ + path, body, "application/json");
  return CheckResult(result, "POST " + path, response.status, response.body, error);
}

bool HttpRegistryClient::PostBytes(const std::string& path, std::span<const std::uint8_t> payload,
                                   const std::chrono::milliseconds timeout, Response& response,
                                   RegistryError& error) const {
  auto client = MakeClient(origin_, options_.authorization, timeout);
  if (client == nullptr) {
    error = MakeRegistryError(RegistryErrorCode::kTransport, "invalid registry origin " + origin_);
    return false;
  }
  const httplib::Result result =
      client->Post(path_prefix_ + path, reinterpret_cast<const char*>(payload.data()),
                   payload.size(), "application/octet-stream");
  return CheckResult(result, "POST " + path, response.status, response.body, error);
}

bool HttpRegistryClient::Get(const std::string& path, const std::chrono::milliseconds timeout,
                             Response& response, RegistryError& error) const {
  auto client = MakeClient(origin_, options_.authorization, timeout);
  if (client == nullptr) {
    error = MakeRegistryError(RegistryErrorCode::kTransport, "invalid registry origin " + origin_);
    return false;
  }
  const httplib::Result result = client->Get(path_prefix_ + path);
  return CheckResult(result, "GET " + path, response.status, response.body, error);
}

bool HttpRegistryClient::Register(const RegistrationRequest& request, std::string& model_id,
                                  RegistryError& error) {
  std::string validation_error;
  if (!ValidateRegistrationRequest(request, validation_error)) {
    error = MakeRegistryError(RegistryErrorCode::kRejected, validation_error);
    return false;
  }

  Response response;
  if (!PostJson(rest::kRegisterPath, BuildRegistrationJson(request), options_.register_timeout,
                response, error)) {
    return false;
  }
  std::string parse_error;
  if (!rest::ParseRegisterResponse(response.body, model_id, parse_error)) {
    error = MakeRegistryError(RegistryErrorCode::kUnknown, parse_error, response.status);
    return false;
  }
  return true;
}

bool HttpRegistryClient::FindRegistration(const std::string& name, const std::uint32_t version,
                                          std::optional<RegistrationRecord>& record,
                                          RegistryError& error) {
  record.reset();
  Response response;
  if (!PostJson(rest::kSearchPath, rest::BuildSearchJson(name, version),
                options_.register_timeout, response, error)) {
    // A missing model index means nothing was ever registered.
    if (error.code == RegistryErrorCode::kNotFound) {
      return true;
    }
    return false;
  }
  std::string parse_error;
  if (!rest::ParseSearchResponse(response.body, record, parse_error)) {
    error = MakeRegistryError(RegistryErrorCode::kUnknown, parse_error, response.status);
    return false;
  }
  return true;
}

bool HttpRegistryClient::UploadChunk(const std::string& model_id, const std::uint64_t index,
                                     std::span<const std::uint8_t> payload, ChunkAck& ack,
                                     RegistryError& error) {
  Response response;
  if (!PostBytes(rest::BuildChunkPath(model_id, index), payload, options_.chunk_timeout, response,
                 error)) {
    return false;
  }
  std::string status;
  std::string parse_error;
  if (!rest::ParseChunkResponse(response.body, status, parse_error)) {
    error = MakeRegistryError(RegistryErrorCode::kRejected, parse_error, response.status);
    return false;
  }
  ack.index = index;
  ack.status = status;
  ack.size_bytes = static_cast<std::uint64_t>(payload.size());
  return true;
}

bool HttpRegistryClient::Finalize(const std::string& model_id, FinalizeResult& result,
                                  RegistryError& error) {
  const std::uint32_t poll_limit = options_.finalize_poll_limit == 0U ? 1U
                                                                      : options_.finalize_poll_limit;
  for (std::uint32_t poll = 0; poll < poll_limit; ++poll) {
    if (poll > 0U && options_.finalize_poll_interval.count() > 0) {
      std::this_thread::sleep_for(options_.finalize_poll_interval);
    }

    RegistrationRecord record;
    if (!QueryStatus(model_id, record, error)) {
      return false;
    }
    if (record.state == RecordState::kUploaded) {
      result.state = RecordState::kUploaded;
      result.detail = "registry verified content";
      return true;
    }
    if (record.state == RecordState::kFailed) {
      result.state = RecordState::kFailed;
      error = MakeRegistryError(RegistryErrorCode::kDigestMismatch,
                                "registry rejected the merged content of " + model_id +
                                    " during verification");
      return false;
    }
    if (record.state == RecordState::kExpired) {
      error = MakeRegistryError(RegistryErrorCode::kInvalidState, "record " + model_id +
                                                                      " expired");
      return false;
    }
  }

  error = MakeRegistryError(RegistryErrorCode::kTimeout,
                            "record " + model_id + " still registering after " +
                                std::to_string(poll_limit) + " status polls");
  return false;
}

bool HttpRegistryClient::QueryStatus(const std::string& model_id, RegistrationRecord& record,
                                     RegistryError& error) {
  Response response;
  if (!Get(rest::BuildModelPath(model_id), options_.register_timeout, response, error)) {
    return false;
  }
  std::string parse_error;
  if (!rest::ParseModelStateResponse(response.body, model_id, record, parse_error)) {
    error = MakeRegistryError(RegistryErrorCode::kUnknown, parse_error, response.status);
    return false;
  }
  return true;
}

} // namespace modelpush::registry
