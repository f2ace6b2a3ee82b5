#include "../common/assertions.hpp"
#include "../common/scoped_env.hpp"
#include "../common/temp_dir.hpp"
#include "upload/checkpoint_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using modelpush::tests::common::Fail;

modelpush::upload::CheckpointState BuildCheckpointState(const fs::path& temp_root) {
  modelpush::upload::CheckpointState state;
  state.session_id = "session-1700000000000";
  state.model_name = "all-MiniLM-L6-v2";
  state.model_version = 3U;
  state.model_id = "sim-model-000001";
  state.archive_path = temp_root / "model.zip";
  state.config_path = temp_root / "upload.json";
  state.digest_hex = std::string(64U, 'a');
  state.size_bytes = 10'000U;
  state.chunk_size_bytes = 4'096U;
  state.total_chunks = 3U;
  state.acknowledged_indices = {0U, 2U};
  state.chunk_attempts = {1U, 4U, 2U};
  state.state = modelpush::upload::SessionState::kUploading;
  state.updated_at =
      std::chrono::system_clock::time_point(std::chrono::milliseconds(1'700'000'000'000));
  return state;
}

void WriteRawCheckpoint(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to create checkpoint fixture");
  }
  out << text;
}

} // namespace

int main() {
  using modelpush::tests::common::AssertContains;
  using modelpush::tests::common::CreateUniqueTempDir;
  using modelpush::tests::common::ReadFileToString;
  using modelpush::tests::common::RemovePathBestEffort;

  const fs::path temp_root = CreateUniqueTempDir("modelpush-checkpoint");
  const fs::path checkpoint_path = temp_root / "out" / modelpush::upload::kCheckpointFileName;
  const modelpush::upload::CheckpointState original = BuildCheckpointState(temp_root);

  std::string error;
  if (!modelpush::upload::WriteCheckpointJson(original, checkpoint_path, error)) {
    Fail("checkpoint write failed: " + error);
  }

  const std::string text = ReadFileToString(checkpoint_path);
  AssertContains(text, "\"state\": \"UPLOADING\"");
  AssertContains(text, "\"acknowledged_indices\": [0,2]");
  AssertContains(text, "\"chunk_attempts\": [1,4,2]");
  AssertContains(text, "\"acknowledged_count\": 2");
  AssertContains(text, "\"resume_hint\": \"modelpush upload ");

  modelpush::upload::CheckpointState loaded;
  if (!modelpush::upload::LoadCheckpoint(checkpoint_path, loaded, error)) {
    Fail("checkpoint load failed: " + error);
  }
  if (loaded.model_id != original.model_id || loaded.model_version != 3U ||
      loaded.acknowledged_indices != original.acknowledged_indices ||
      loaded.chunk_attempts != original.chunk_attempts || loaded.total_chunks != 3U ||
      loaded.state != original.state || loaded.archive_path != original.archive_path ||
      loaded.updated_at != original.updated_at) {
    Fail("loaded checkpoint does not match what was written");
  }

  // An interrupted publish must leave the previous checkpoint intact.
  {
    modelpush::tests::common::ScopedEnvOverride interrupt(
        "MODELPUSH_TEST_INTERRUPT_CHECKPOINT_WRITE", "1");
    modelpush::upload::CheckpointState next = original;
    next.acknowledged_indices.insert(1U);
    next.state = modelpush::upload::SessionState::kDone;
    if (modelpush::upload::WriteCheckpointJson(next, checkpoint_path, error)) {
      Fail("interrupted checkpoint write must report failure");
    }
    AssertContains(error, "simulated interrupted checkpoint write");
  }
  if (!modelpush::upload::LoadCheckpoint(checkpoint_path, loaded, error) ||
      loaded.acknowledged_indices.size() != 2U ||
      loaded.state != modelpush::upload::SessionState::kUploading) {
    Fail("previous checkpoint must survive an interrupted write");
  }

  modelpush::upload::CheckpointState no_id = original;
  no_id.model_id.clear();
  if (modelpush::upload::WriteCheckpointJson(no_id, temp_root / "no_id.json", error)) {
    Fail("checkpoint without a model_id must be refused");
  }

  const fs::path broken_path = temp_root / "broken.json";
  WriteRawCheckpoint(broken_path, "{\n  \"session_id\": \"broken\"\n");
  if (modelpush::upload::LoadCheckpoint(broken_path, loaded, error)) {
    Fail("malformed checkpoint must fail to load");
  }
  AssertContains(error, "invalid checkpoint JSON");

  std::string inconsistent = text;
  const std::string needle = "\"total_chunks\": 3";
  inconsistent.replace(inconsistent.find(needle), needle.size(), "\"total_chunks\": 4");
  WriteRawCheckpoint(broken_path, inconsistent);
  if (modelpush::upload::LoadCheckpoint(broken_path, loaded, error)) {
    Fail("checkpoint with an inconsistent chunk count must fail");
  }
  AssertContains(error, "total_chunks is inconsistent");

  std::string out_of_range = text;
  const std::string indices = "\"acknowledged_indices\": [0,2]";
  out_of_range.replace(out_of_range.find(indices), indices.size(),
                       "\"acknowledged_indices\": [0,7]");
  WriteRawCheckpoint(broken_path, out_of_range);
  if (modelpush::upload::LoadCheckpoint(broken_path, loaded, error)) {
    Fail("checkpoint with an out-of-range index must fail");
  }

  RemovePathBestEffort(temp_root);
  std::cout << "checkpoint_store_smoke: ok\n";
  return 0;
}
