#pragma once

#include "upload/session_state.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace modelpush::upload {

constexpr const char* kCheckpointFileName = "upload_checkpoint.json";

// Persisted upload session state so a cancelled or failed session can resume
// against the same registry record without re-sending acknowledged chunks.
struct CheckpointState {
  std::string session_id;
  std::string model_name;
  std::uint32_t model_version = 0;
  std::string model_id;
  std::filesystem::path archive_path;
  std::filesystem::path config_path;
  std::string digest_hex;
  std::uint64_t size_bytes = 0;
  std::uint64_t chunk_size_bytes = 0;
  std::uint64_t total_chunks = 0;
  std::set<std::uint64_t> acknowledged_indices;
  // Attempts spent per index across all runs of the session; size total_chunks.
  std::vector<std::uint32_t> chunk_attempts;
  SessionState state = SessionState::kInit;
  std::chrono::system_clock::time_point updated_at{};
};

// Writes one checkpoint JSON payload atomically to an explicit path.
bool WriteCheckpointJson(const CheckpointState& state, const std::filesystem::path& output_path,
                         std::string& error);

// Loads and cross-checks a checkpoint (indices in range, chunk count
// consistent with size and chunk size).
bool LoadCheckpoint(const std::filesystem::path& checkpoint_path, CheckpointState& state,
                    std::string& error);

} // namespace modelpush::upload
