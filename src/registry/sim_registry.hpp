#pragma once

#include "registry/registry_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace modelpush::registry {

// Deterministic fault script for the in-process registry.
struct SimFaultPlan {
  // index -> number of leading upload attempts that time out before the
  // registry accepts that index.
  std::map<std::uint64_t, std::uint32_t> chunk_timeouts;
  // Number of leading Register calls that time out.
  std::uint32_t register_timeouts = 0;
  // When set, a timed-out Register still commits the record, as if the
  // response was lost on the way back.
  bool register_commits_before_timeout = false;
  // Flips one byte of the reassembled artifact before the finalize digest.
  bool corrupt_on_finalize = false;
  // Per-call delay inside UploadChunk, used to overlap concurrent uploads.
  std::chrono::milliseconds chunk_latency{0};
};

// Reads the `MODELPUSH_TEST_SIM_*` environment hooks:
// - MODELPUSH_TEST_SIM_CHUNK_TIMEOUTS="<index>:<count>[,<index>:<count>...]"
// - MODELPUSH_TEST_SIM_REGISTER_TIMEOUTS="<count>"
// - MODELPUSH_TEST_SIM_CORRUPT_DIGEST="1"
bool LoadSimFaultPlanFromEnv(SimFaultPlan& plan, std::string& error);

// Hardware-free registry with full record semantics.
//
// Enforces name/version uniqueness among live records, idempotent per-index
// acknowledgment, digest recomputation over the received bytes at finalize,
// and expiry. Thread-safe.
class SimRegistry final : public IRegistryClient {
public:
  explicit SimRegistry(SimFaultPlan plan = {});

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

  // Moves a record to EXPIRED; later chunk uploads against it are refused.
  bool ExpireRecord(const std::string& model_id, std::string& error);

  // Inspection hooks for tests.
  std::uint32_t UploadAttempts(const std::string& model_id, std::uint64_t index) const;
  std::uint64_t StoredChunkCount(const std::string& model_id) const;
  std::size_t RecordCount() const;
  std::uint32_t PeakConcurrentUploads() const;

private:
  struct Record {
    RegistrationRecord info;
    hashing::Digest digest;
    std::map<std::uint64_t, std::vector<std::uint8_t>> chunks;
    std::map<std::uint64_t, ChunkAck> acks;
    std::map<std::uint64_t, std::uint32_t> attempts;
    RegistryErrorCode failure_code = RegistryErrorCode::kUnknown;
  };

  Record* FindRecordLocked(const std::string& model_id);
  const Record* FindRecordLocked(const std::string& model_id) const;
  std::string NextModelIdLocked();
  void CreateRecordLocked(const RegistrationRequest& request, std::string& model_id);

  mutable std::mutex mutex_;
  SimFaultPlan plan_;
  std::map<std::string, Record> records_;
  std::uint64_t next_id_ = 1;
  std::atomic<std::uint32_t> uploads_in_flight_{0};
  std::atomic<std::uint32_t> peak_uploads_in_flight_{0};
};

} // namespace modelpush::registry
