#pragma once

#include "artifact/artifact.hpp"
#include "core/errors/upload_error.hpp"
#include "registry/registry_client.hpp"
#include "upload/checkpoint_store.hpp"
#include "upload/retry_policy.hpp"
#include "upload/session_state.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace modelpush::core::logging {
class Logger;
}

namespace modelpush::upload {

constexpr std::uint32_t kMaxInFlightLimit = 16U;

struct UploadProgress {
  // Index that was just acknowledged.
  std::uint64_t current_index = 0;
  std::uint64_t acknowledged_count = 0;
  std::uint64_t total_count = 0;
};

using ProgressCallback = std::function<void(const UploadProgress&)>;

struct UploadOptions {
  std::uint64_t chunk_size_bytes = 0;
  RetryPolicy retry;
  // 1 keeps the strictly ordered index loop; >1 uploads with bounded
  // parallelism and finalizes once every index is acknowledged.
  std::uint32_t max_in_flight = 1;
  // Session artifacts (events.jsonl, upload_checkpoint.json,
  // upload_summary.json) are written here when non-empty.
  std::filesystem::path output_dir;
  // Only used for the resume hint inside the checkpoint.
  std::filesystem::path config_path;
  // Continue an earlier session against the same registry record.
  std::optional<CheckpointState> resume;
};

// Hooks run on worker threads when max_in_flight > 1 and must be safe to call
// concurrently. `on_progress` calls are serialized by the orchestrator and run
// outside the session lock, so other workers keep recording acknowledgments
// while a progress callback is busy.
struct UploadHooks {
  ProgressCallback on_progress;
  StopPredicate should_stop;
  // Defaults to a real-time sleeper.
  Sleeper sleeper;
};

struct UploadOutcome {
  SessionState state = SessionState::kInit;
  std::string session_id;
  std::string model_id;
  std::string digest_hex;
  std::uint64_t size_bytes = 0;
  std::uint64_t chunk_size_bytes = 0;
  std::uint64_t total_chunks = 0;
  std::uint64_t acknowledged_count = 0;
  std::vector<std::uint32_t> chunk_attempts;
  bool resumed = false;
  bool reused_registration = false;
  std::optional<core::errors::UploadError> error;
  std::filesystem::path checkpoint_path;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
};

// Drives one upload session: hash, register (lookup-or-create), upload every
// chunk with per-index retry, finalize with digest verification.
//
// Run returns true only when the session reaches DONE. On false,
// `outcome.error` names the failure class plus model, index and attempts.
class UploadOrchestrator {
public:
  UploadOrchestrator(registry::IRegistryClient& registry, core::logging::Logger& logger);

  bool Run(const registry::ModelMetadata& metadata, const artifact::Artifact& artifact,
           const UploadOptions& options, const UploadHooks& hooks, UploadOutcome& outcome);

private:
  registry::IRegistryClient& registry_;
  core::logging::Logger& logger_;
};

} // namespace modelpush::upload
