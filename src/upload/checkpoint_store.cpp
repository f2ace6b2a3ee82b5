#include "upload/checkpoint_store.hpp"

#include "chunking/chunker.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/time_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace modelpush::upload {

namespace {

using JsonValue = core::json::Value;

bool IsInterruptedWriteSimulationEnabled() {
  const char* raw = std::getenv("MODELPUSH_TEST_INTERRUPT_CHECKPOINT_WRITE");
  return raw != nullptr && std::string_view(raw) == "1";
}

bool WriteCheckpointTextAtomic(const fs::path& output_path, std::string_view text,
                               std::string& error) {
  if (!IsInterruptedWriteSimulationEnabled()) {
    return core::WriteTextFileAtomic(output_path, text, error);
  }

  // Test-only failure injection: the payload reaches a temp file but is never
  // published, as if the process died before rename.
  if (!core::EnsureParentDirectory(output_path, error)) {
    return false;
  }
  const fs::path temp_path = output_path.string() + ".tmp.interrupted";
  std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
  out_file << text;
  error = "simulated interrupted checkpoint write before publish";
  return false;
}

bool ParseRequiredString(const JsonValue& root, std::string_view key, std::string& value,
                         std::string& error) {
  if (!core::json::TryGetString(root, key, value)) {
    error = "checkpoint missing required string field '" + std::string(key) + "'";
    return false;
  }
  return true;
}

bool ParseRequiredUnsigned(const JsonValue& root, std::string_view key, std::uint64_t& value,
                           std::string& error) {
  if (!core::json::TryGetUnsigned(root, key, value)) {
    error = "checkpoint field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  return true;
}

bool ParseUnsignedArray(const JsonValue& root, std::string_view key,
                        std::vector<std::uint64_t>& values, std::string& error) {
  values.clear();
  const JsonValue* field = core::json::FindField(root, key);
  if (field == nullptr || field->type != JsonValue::Type::kArray) {
    error = "checkpoint field '" + std::string(key) + "' must be an array";
    return false;
  }
  for (const JsonValue& item : field->array_value) {
    if (!core::json::IsNonNegativeInteger(item)) {
      error = "checkpoint field '" + std::string(key) + "' must contain non-negative integers";
      return false;
    }
    values.push_back(static_cast<std::uint64_t>(item.number_value));
  }
  return true;
}

template <typename Container>
void WriteUnsignedArray(std::ostringstream& out, const Container& values) {
  out << '[';
  bool first = true;
  for (const auto value : values) {
    if (!first) {
      out << ',';
    }
    out << value;
    first = false;
  }
  out << ']';
}

} // namespace

bool WriteCheckpointJson(const CheckpointState& state, const fs::path& output_path,
                         std::string& error) {
  error.clear();
  if (state.model_id.empty()) {
    error = "upload checkpoint model_id cannot be empty";
    return false;
  }
  if (output_path.empty()) {
    error = "upload checkpoint output path cannot be empty";
    return false;
  }

  using core::json::EscapeJson;
  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\": \"1.0\",\n"
      << "  \"session_id\": \"" << EscapeJson(state.session_id) << "\",\n"
      << "  \"state\": \"" << ToString(state.state) << "\",\n"
      << "  \"model_name\": \"" << EscapeJson(state.model_name) << "\",\n"
      << "  \"model_version\": " << state.model_version << ",\n"
      << "  \"model_id\": \"" << EscapeJson(state.model_id) << "\",\n"
      << "  \"archive_path\": \"" << EscapeJson(state.archive_path.string()) << "\",\n"
      << "  \"config_path\": \"" << EscapeJson(state.config_path.string()) << "\",\n"
      << "  \"digest_sha256\": \"" << EscapeJson(state.digest_hex) << "\",\n"
      << "  \"size_bytes\": " << state.size_bytes << ",\n"
      << "  \"chunk_size_bytes\": " << state.chunk_size_bytes << ",\n"
      << "  \"total_chunks\": " << state.total_chunks << ",\n"
      << "  \"acknowledged_count\": " << state.acknowledged_indices.size() << ",\n"
      << "  \"acknowledged_indices\": ";
  WriteUnsignedArray(out, state.acknowledged_indices);
  out << ",\n  \"chunk_attempts\": ";
  WriteUnsignedArray(out, state.chunk_attempts);
  out << ",\n"
      << "  \"updated_at_epoch_ms\": " << core::ToEpochMilliseconds(state.updated_at) << ",\n"
      << "  \"resume_hint\": \"modelpush upload " << EscapeJson(state.config_path.string())
      << " --resume " << EscapeJson(output_path.string()) << "\"\n"
      << "}\n";

  if (!WriteCheckpointTextAtomic(output_path, out.str(), error)) {
    error = "failed while writing upload checkpoint '" + output_path.string() + "' (" + error +
            ")";
    return false;
  }
  return true;
}

bool LoadCheckpoint(const fs::path& checkpoint_path, CheckpointState& state, std::string& error) {
  state = CheckpointState{};

  std::string text;
  if (!core::ReadTextFile(checkpoint_path, text, error)) {
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid checkpoint JSON '" + checkpoint_path.string() + "': " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "checkpoint root must be a JSON object";
    return false;
  }

  std::string state_text;
  std::string archive_path;
  std::string config_path;
  std::uint64_t model_version = 0;
  std::uint64_t updated_at_epoch_ms = 0;
  std::vector<std::uint64_t> acknowledged;
  std::vector<std::uint64_t> attempts;
  if (!ParseRequiredString(root, "session_id", state.session_id, error) ||
      !ParseRequiredString(root, "state", state_text, error) ||
      !ParseRequiredString(root, "model_name", state.model_name, error) ||
      !ParseRequiredUnsigned(root, "model_version", model_version, error) ||
      !ParseRequiredString(root, "model_id", state.model_id, error) ||
      !ParseRequiredString(root, "archive_path", archive_path, error) ||
      !ParseRequiredString(root, "digest_sha256", state.digest_hex, error) ||
      !ParseRequiredUnsigned(root, "size_bytes", state.size_bytes, error) ||
      !ParseRequiredUnsigned(root, "chunk_size_bytes", state.chunk_size_bytes, error) ||
      !ParseRequiredUnsigned(root, "total_chunks", state.total_chunks, error) ||
      !ParseUnsignedArray(root, "acknowledged_indices", acknowledged, error) ||
      !ParseUnsignedArray(root, "chunk_attempts", attempts, error) ||
      !ParseRequiredUnsigned(root, "updated_at_epoch_ms", updated_at_epoch_ms, error)) {
    error = "checkpoint parse failed for '" + checkpoint_path.string() + "': " + error;
    return false;
  }
  (void)core::json::TryGetString(root, "config_path", config_path);

  if (!ParseSessionState(state_text, state.state)) {
    error = "checkpoint has unsupported state value: " + state_text;
    return false;
  }
  if (state.model_id.empty() || state.model_name.empty() || archive_path.empty()) {
    error = "checkpoint contains empty required identity fields";
    return false;
  }
  if (model_version == 0U || model_version > 0xFFFFFFFFULL) {
    error = "checkpoint model_version is out of range";
    return false;
  }
  if (state.chunk_size_bytes == 0U ||
      chunking::ComputeChunkCount(state.size_bytes, state.chunk_size_bytes) != state.total_chunks) {
    error = "checkpoint total_chunks is inconsistent with size_bytes and chunk_size_bytes";
    return false;
  }
  if (attempts.size() != state.total_chunks) {
    error = "checkpoint chunk_attempts must have one entry per chunk";
    return false;
  }

  for (const std::uint64_t index : acknowledged) {
    if (index >= state.total_chunks) {
      error = "checkpoint acknowledged index " + std::to_string(index) + " is out of range";
      return false;
    }
    state.acknowledged_indices.insert(index);
  }
  for (const std::uint64_t count : attempts) {
    state.chunk_attempts.push_back(static_cast<std::uint32_t>(count));
  }

  state.model_version = static_cast<std::uint32_t>(model_version);
  state.archive_path = fs::path(archive_path);
  state.config_path = fs::path(config_path);
  state.updated_at = core::FromEpochMilliseconds(static_cast<std::int64_t>(updated_at_epoch_ms));
  return true;
}

} // namespace modelpush::upload
