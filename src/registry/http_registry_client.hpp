#pragma once

#include "registry/registry_client.hpp"
#include "registry/registry_factory.hpp"

#include <string>

namespace modelpush::registry {

// Registry client for the ml-commons REST API.
//
// Each call opens its own connection so concurrent chunk uploads do not
// serialize behind one keep-alive socket. Finalization is implicit on the
// server once the last chunk lands; `Finalize` polls the model document until
// it leaves REGISTERING or the poll budget runs out.
class HttpRegistryClient final : public IRegistryClient {
public:
  explicit HttpRegistryClient(HttpRegistryOptions options);

  // Reports a malformed base_url before any request is attempted.
  bool IsValid(std::string& error) const;

  bool Register(const RegistrationRequest& request, std::string& model_id,
                RegistryError& error) override;
  bool FindRegistration(const std::string& name, std::uint32_t version,
                        std::optional<RegistrationRecord>& record, RegistryError& error) override;
  bool UploadChunk(const std::string& model_id, std::uint64_t index,
                   std::span<const std::uint8_t> payload, ChunkAck& ack,
                   RegistryError& error) override;
  bool Finalize(const std::string& model_id, FinalizeResult& result,
                RegistryError& error) override;
  bool QueryStatus(const std::string& model_id, RegistrationRecord& record,
                   RegistryError& error) override;

private:
  struct Response {
    int status = 0;
    std::string body;
  };

  bool PostJson(const std::string& path, const std::string& body,
                std::chrono::milliseconds timeout, Response& response, RegistryError& error) const;
  bool PostBytes(const std::string& path, std::span<const std::uint8_t> payload,
                 std::chrono::milliseconds timeout, Response& response,
                 RegistryError& error) const;
  bool Get(const std::string& path, std::chrono::milliseconds timeout, Response& response,
           RegistryError& error) const;

  HttpRegistryOptions options_;
  std::string origin_;
  std::string path_prefix_;
  std::string url_error_;
};

} // namespace modelpush::registry
