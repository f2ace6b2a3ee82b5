#pragma once

#include "registry/model_metadata.hpp"
#include "registry/registry_error.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace modelpush::registry {

// Lifecycle of one registry-side Model Registration Record.
//
//   CREATED -> UPLOADING -> UPLOADED
//      |           |
//      +-----------+--> FAILED | EXPIRED
enum class RecordState {
  kCreated,
  kUploading,
  kUploaded,
  kFailed,
  kExpired,
};

const char* ToString(RecordState state);

// Chunk uploads are accepted only while the record is CREATED or UPLOADING.
bool AcceptsChunks(RecordState state);

struct RegistrationRecord {
  std::string model_id;
  std::string name;
  std::uint32_t version = 0;
  std::string digest_hex;
  std::uint64_t size_bytes = 0;
  std::uint64_t total_chunks = 0;
  std::uint64_t acknowledged_chunks = 0;
  RecordState state = RecordState::kCreated;
};

struct ChunkAck {
  std::uint64_t index = 0;
  // Registry status text, "Uploaded" on success.
  std::string status;
  std::uint64_t size_bytes = 0;

  bool operator==(const ChunkAck&) const = default;
};

struct FinalizeResult {
  RecordState state = RecordState::kCreated;
  std::string detail;
};

// Registry contract used by the upload orchestrator.
//
// Contract goals:
// - registration never leaves a partial record behind on a definitive failure
// - `UploadChunk` is idempotent per index: re-sending an acknowledged index
//   returns the original acknowledgment and changes nothing
// - `Finalize` succeeds only when every index is acknowledged and the
//   registry-side digest over the received bytes equals the registered one
//
// Implementations must tolerate concurrent `UploadChunk` calls for distinct
// indices of the same record.
class IRegistryClient {
public:
  virtual ~IRegistryClient() = default;

  // Creates a record and returns its registry-assigned id.
  virtual bool Register(const RegistrationRequest& request, std::string& model_id,
                        RegistryError& error) = 0;

  // Looks up an existing record by name/version. `record` is reset when no
  // record exists; that is not an error.
  virtual bool FindRegistration(const std::string& name, std::uint32_t version,
                                std::optional<RegistrationRecord>& record,
                                RegistryError& error) = 0;

  virtual bool UploadChunk(const std::string& model_id, std::uint64_t index,
                           std::span<const std::uint8_t> payload, ChunkAck& ack,
                           RegistryError& error) = 0;

  virtual bool Finalize(const std::string& model_id, FinalizeResult& result,
                        RegistryError& error) = 0;

  virtual bool QueryStatus(const std::string& model_id, RegistrationRecord& record,
                           RegistryError& error) = 0;
};

} // namespace modelpush::registry
