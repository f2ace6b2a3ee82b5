#include "registry/sim_registry.hpp"

#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <thread>
#include <utility>

namespace modelpush::registry {

namespace {

// Tracks the number of UploadChunk calls currently inside the registry.
class InFlightGuard {
public:
  InFlightGuard(std::atomic<std::uint32_t>& in_flight, std::atomic<std::uint32_t>& peak)
      : in_flight_(in_flight) {
    const std::uint32_t now = in_flight_.fetch_add(1U) + 1U;
    std::uint32_t observed = peak.load();
    while (now > observed && !peak.compare_exchange_weak(observed, now)) {
    }
  }

  ~InFlightGuard() {
    in_flight_.fetch_sub(1U);
  }

  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
  std::atomic<std::uint32_t>& in_flight_;
};

bool ParseUnsignedToken(std::string_view token, std::uint64_t& value) {
  if (token.empty()) {
    return false;
  }
  const char* begin = token.data();
  const char* end = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

bool ParseChunkTimeouts(std::string_view raw, std::map<std::uint64_t, std::uint32_t>& timeouts,
                        std::string& error) {
  while (!raw.empty()) {
    const std::size_t comma = raw.find(',');
    const std::string_view entry = raw.substr(0, comma);
    raw = comma == std::string_view::npos ? std::string_view{} : raw.substr(comma + 1U);

    const std::size_t colon = entry.find(':');
    std::uint64_t index = 0;
    std::uint64_t count = 0;
    if (colon == std::string_view::npos || !ParseUnsignedToken(entry.substr(0, colon), index) ||
        !ParseUnsignedToken(entry.substr(colon + 1U), count) || count > 0xFFFFFFFFULL) {
      error = "invalid MODELPUSH_TEST_SIM_CHUNK_TIMEOUTS entry '" + std::string(entry) +
              "' (expected <index>:<count>)";
      return false;
    }
    timeouts[index] = static_cast<std::uint32_t>(count);
  }
  return true;
}

} // namespace

bool LoadSimFaultPlanFromEnv(SimFaultPlan& plan, std::string& error) {
  if (const char* raw = std::getenv("MODELPUSH_TEST_SIM_CHUNK_TIMEOUTS"); raw != nullptr) {
    if (!ParseChunkTimeouts(raw, plan.chunk_timeouts, error)) {
      return false;
    }
  }
  if (const char* raw = std::getenv("MODELPUSH_TEST_SIM_REGISTER_TIMEOUTS"); raw != nullptr) {
    std::uint64_t count = 0;
    if (!ParseUnsignedToken(raw, count) || count > 0xFFFFFFFFULL) {
      error = "invalid MODELPUSH_TEST_SIM_REGISTER_TIMEOUTS value '" + std::string(raw) + "'";
      return false;
    }
    plan.register_timeouts = static_cast<std::uint32_t>(count);
  }
  if (const char* raw = std::getenv("MODELPUSH_TEST_SIM_CORRUPT_DIGEST"); raw != nullptr) {
    plan.corrupt_on_finalize = std::string_view(raw) == "1";
  }
  return true;
}

SimRegistry::SimRegistry(SimFaultPlan plan) : plan_(std::move(plan)) {}

bool SimRegistry::Register(const RegistrationRequest& request, std::string& model_id,
                           RegistryError& error) {
  std::string validation_error;
  if (!ValidateRegistrationRequest(request, validation_error)) {
    error = MakeRegistryError(RegistryErrorCode::kRejected, validation_error, 400);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, record] : records_) {
    if (record.info.name == request.metadata.name &&
        record.info.version == request.metadata.version &&
        record.info.state != RecordState::kFailed && record.info.state != RecordState::kExpired) {
      error = MakeRegistryError(RegistryErrorCode::kDuplicate,
                                "model " + request.metadata.name + " version " +
                                    std::to_string(request.metadata.version) +
                                    " is already registered as " + id,
                                409);
      return false;
    }
  }

  if (plan_.register_timeouts > 0U) {
    --plan_.register_timeouts;
    if (plan_.register_commits_before_timeout) {
      std::string committed_id;
      CreateRecordLocked(request, committed_id);
    }
    error = MakeRegistryError(RegistryErrorCode::kTimeout, "sim registry: register timed out");
    return false;
  }

  CreateRecordLocked(request, model_id);
  return true;
}

bool SimRegistry::FindRegistration(const std::string& name, const std::uint32_t version,
                                   std::optional<RegistrationRecord>& record,
                                   RegistryError& error) {
  (void)error;
  std::lock_guard<std::mutex> lock(mutex_);
  record.reset();
  for (const auto& [id, candidate] : records_) {
    if (candidate.info.name != name || candidate.info.version != version) {
      continue;
    }
    // Prefer a live record; ids are ordered so the newest match wins.
    if (!record.has_value() || AcceptsChunks(candidate.info.state) ||
        !AcceptsChunks(record->state)) {
      record = candidate.info;
    }
  }
  return true;
}

bool SimRegistry::UploadChunk(const std::string& model_id, const std::uint64_t index,
                              std::span<const std::uint8_t> payload, ChunkAck& ack,
                              RegistryError& error) {
  InFlightGuard guard(uploads_in_flight_, peak_uploads_in_flight_);
  if (plan_.chunk_latency.count() > 0) {
    std::this_thread::sleep_for(plan_.chunk_latency);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Record* record = FindRecordLocked(model_id);
  if (record == nullptr) {
    error = MakeRegistryError(RegistryErrorCode::kNotFound, "unknown model_id " + model_id, 404);
    return false;
  }
  ++record->attempts[index];

  const auto prior = record->acks.find(index);
  if (prior != record->acks.end()) {
    ack = prior->second;
    return true;
  }

  if (!AcceptsChunks(record->info.state)) {
    error = MakeRegistryError(RegistryErrorCode::kInvalidState,
                              "record " + model_id + " is " + ToString(record->info.state) +
                                  " and no longer accepts chunks",
                              400);
    return false;
  }
  if (index >= record->info.total_chunks) {
    error = MakeRegistryError(RegistryErrorCode::kRejected,
                              "chunk index " + std::to_string(index) + " is out of range [0, " +
                                  std::to_string(record->info.total_chunks) + ")",
                              400);
    return false;
  }
  if (payload.empty()) {
    error = MakeRegistryError(RegistryErrorCode::kRejected,
                              "chunk " + std::to_string(index) + " payload is empty", 400);
    return false;
  }

  const auto timeout_it = plan_.chunk_timeouts.find(index);
  if (timeout_it != plan_.chunk_timeouts.end() && timeout_it->second > 0U) {
    --timeout_it->second;
    error = MakeRegistryError(RegistryErrorCode::kTimeout,
                              "sim registry: chunk " + std::to_string(index) + " timed out");
    return false;
  }

  record->chunks[index] = std::vector<std::uint8_t>(payload.begin(), payload.end());
  ChunkAck stored;
  stored.index = index;
  stored.status = "Uploaded";
  stored.size_bytes = static_cast<std::uint64_t>(payload.size());
  record->acks[index] = stored;
  record->info.acknowledged_chunks = static_cast<std::uint64_t>(record->acks.size());
  record->info.state = RecordState::kUploading;
  ack = stored;
  return true;
}

bool SimRegistry::Finalize(const std::string& model_id, FinalizeResult& result,
                           RegistryError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  Record* record = FindRecordLocked(model_id);
  if (record == nullptr) {
    error = MakeRegistryError(RegistryErrorCode::kNotFound, "unknown model_id " + model_id, 404);
    return false;
  }

  switch (record->info.state) {
  case RecordState::kUploaded:
    result.state = RecordState::kUploaded;
    result.detail = "already finalized";
    return true;
  case RecordState::kFailed:
    error = MakeRegistryError(record->failure_code,
                              "record " + model_id + " already failed verification");
    return false;
  case RecordState::kExpired:
    error = MakeRegistryError(RegistryErrorCode::kInvalidState, "record " + model_id + " expired");
    return false;
  case RecordState::kCreated:
  case RecordState::kUploading:
    break;
  }

  if (record->acks.size() != record->info.total_chunks) {
    error = MakeRegistryError(RegistryErrorCode::kInvalidState,
                              "only " + std::to_string(record->acks.size()) + " of " +
                                  std::to_string(record->info.total_chunks) +
                                  " chunks acknowledged");
    return false;
  }

  std::vector<std::uint8_t> reassembled;
  reassembled.reserve(static_cast<std::size_t>(record->info.size_bytes));
  for (const auto& [index, bytes] : record->chunks) {
    reassembled.insert(reassembled.end(), bytes.begin(), bytes.end());
  }
  if (plan_.corrupt_on_finalize && !reassembled.empty()) {
    reassembled[reassembled.size() / 2U] ^= 0xFFU;
  }

  hashing::Digest recomputed;
  std::string hash_error;
  if (!hashing::ComputeDigest(reassembled, recomputed, hash_error)) {
    error = MakeRegistryError(RegistryErrorCode::kUnknown, hash_error);
    return false;
  }

  if (reassembled.size() != record->info.size_bytes || !(recomputed == record->digest)) {
    record->info.state = RecordState::kFailed;
    record->failure_code = RegistryErrorCode::kDigestMismatch;
    error = MakeRegistryError(RegistryErrorCode::kDigestMismatch,
                              "registered digest " + record->info.digest_hex +
                                  " does not match received content digest " +
                                  hashing::ToHex(recomputed));
    return false;
  }

  record->info.state = RecordState::kUploaded;
  result.state = RecordState::kUploaded;
  result.detail = "digest verified";
  return true;
}

bool SimRegistry::QueryStatus(const std::string& model_id, RegistrationRecord& record,
                              RegistryError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Record* found = FindRecordLocked(model_id);
  if (found == nullptr) {
    error = MakeRegistryError(RegistryErrorCode::kNotFound, "unknown model_id " + model_id, 404);
    return false;
  }
  record = found->info;
  return true;
}

bool SimRegistry::ExpireRecord(const std::string& model_id, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  Record* record = FindRecordLocked(model_id);
  if (record == nullptr) {
    error = "unknown model_id " + model_id;
    return false;
  }
  if (record->info.state == RecordState::kUploaded) {
    error = "record " + model_id + " is already UPLOADED";
    return false;
  }
  record->info.state = RecordState::kExpired;
  return true;
}

std::uint32_t SimRegistry::UploadAttempts(const std::string& model_id,
                                          const std::uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Record* record = FindRecordLocked(model_id);
  if (record == nullptr) {
    return 0U;
  }
  const auto it = record->attempts.find(index);
  return it == record->attempts.end() ? 0U : it->second;
}

std::uint64_t SimRegistry::StoredChunkCount(const std::string& model_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Record* record = FindRecordLocked(model_id);
  return record == nullptr ? 0U : static_cast<std::uint64_t>(record->chunks.size());
}

std::size_t SimRegistry::RecordCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::uint32_t SimRegistry::PeakConcurrentUploads() const {
  return peak_uploads_in_flight_.load();
}

SimRegistry::Record* SimRegistry::FindRecordLocked(const std::string& model_id) {
  const auto it = records_.find(model_id);
  return it == records_.end() ? nullptr : &it->second;
}

const SimRegistry::Record* SimRegistry::FindRecordLocked(const std::string& model_id) const {
  const auto it = records_.find(model_id);
  return it == records_.end() ? nullptr : &it->second;
}

std::string SimRegistry::NextModelIdLocked() {
  std::ostringstream out;
  out << "sim-model-" << std::setw(6) << std::setfill('0') << next_id_++;
  return out.str();
}

void SimRegistry::CreateRecordLocked(const RegistrationRequest& request, std::string& model_id) {
  Record record;
  record.info.model_id = NextModelIdLocked();
  record.info.name = request.metadata.name;
  record.info.version = request.metadata.version;
  record.info.digest_hex = hashing::ToHex(request.digest);
  record.info.size_bytes = request.size_bytes;
  record.info.total_chunks = request.total_chunks;
  record.info.state = RecordState::kCreated;
  record.digest = request.digest;
  model_id = record.info.model_id;
  records_.emplace(model_id, std::move(record));
}

} // namespace modelpush::registry
