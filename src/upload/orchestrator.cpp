#include "upload/orchestrator.hpp"

#include "chunking/chunker.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "events/jsonl_writer.hpp"
#include "hashing/digest.hpp"
#include "upload/upload_summary_writer.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace modelpush::upload {

namespace {

using core::errors::UploadError;
using core::errors::UploadErrorKind;

// Mutable state of one Run call. Worker threads share it through `mutex`.
class Session {
public:
  Session(registry::IRegistryClient& registry, core::logging::Logger& logger,
          const registry::ModelMetadata& metadata, const artifact::Artifact& artifact,
          const UploadOptions& options, const UploadHooks& hooks, UploadOutcome& outcome)
      : registry_(registry), logger_(logger), metadata_(metadata), artifact_(artifact),
        options_(options), hooks_(hooks), outcome_(outcome),
        chunker_(artifact.Bytes(), options.chunk_size_bytes),
        event_log_(options.output_dir) {
    if (!hooks_.sleeper) {
      hooks_.sleeper = ThreadSleeper();
    }
  }

  bool Run() {
    outcome_ = UploadOutcome{};
    outcome_.started_at = std::chrono::system_clock::now();
    outcome_.resumed = options_.resume.has_value();
    outcome_.session_id = outcome_.resumed ? options_.resume->session_id
                                           : core::MakeSessionId(outcome_.started_at);
    outcome_.size_bytes = artifact_.SizeBytes();
    outcome_.chunk_size_bytes = options_.chunk_size_bytes;
    if (HasOutputDir()) {
      outcome_.checkpoint_path = options_.output_dir / kCheckpointFileName;
    }
    logger_.SetSessionId(outcome_.session_id);
    logger_.SetModel(metadata_.name + "@v" + std::to_string(metadata_.version));

    const bool succeeded = ValidateInputs() && Hash() && Register() && UploadChunks() &&
                           Finalize();
    outcome_.finished_at = std::chrono::system_clock::now();
    outcome_.acknowledged_count = static_cast<std::uint64_t>(acknowledged_.size());
    outcome_.chunk_attempts = attempts_;
    WriteSummary();
    return succeeded;
  }

private:
  bool HasOutputDir() const {
    return !options_.output_dir.empty();
  }

  bool ShouldStop() const {
    return hooks_.should_stop && hooks_.should_stop();
  }

  void Transition(const SessionState to) {
    if (!IsValidTransition(outcome_.state, to)) {
      logger_.Warn("unexpected session state transition",
                   {{"from", ToString(outcome_.state)}, {"to", ToString(to)}});
    }
    if (outcome_.state != to) {
      logger_.Debug("session state transition",
                    {{"from", ToString(outcome_.state)}, {"to", ToString(to)}});
    }
    outcome_.state = to;
  }

  void EmitLocked(events::EventType type, std::map<std::string, std::string> payload) {
    if (!HasOutputDir()) {
      return;
    }
    events::Event event;
    event.ts = std::chrono::system_clock::now();
    event.type = type;
    payload["session_id"] = outcome_.session_id;
    event.payload = std::move(payload);
    std::string error;
    if (!event_log_.Append(event, error)) {
      logger_.Warn("failed to append session event",
                   {{"event", events::ToJson(type)}, {"error", error}});
    }
  }

  void WriteCheckpointLocked() {
    if (!HasOutputDir() || outcome_.model_id.empty()) {
      return;
    }
    CheckpointState checkpoint;
    checkpoint.session_id = outcome_.session_id;
    checkpoint.model_name = metadata_.name;
    checkpoint.model_version = metadata_.version;
    checkpoint.model_id = outcome_.model_id;
    checkpoint.archive_path = artifact_.SourcePath();
    checkpoint.config_path = options_.config_path;
    checkpoint.digest_hex = outcome_.digest_hex;
    checkpoint.size_bytes = outcome_.size_bytes;
    checkpoint.chunk_size_bytes = chunker_.ChunkSize();
    checkpoint.total_chunks = chunker_.TotalCount();
    checkpoint.acknowledged_indices = acknowledged_;
    checkpoint.chunk_attempts = attempts_;
    checkpoint.state = outcome_.state;
    checkpoint.updated_at = std::chrono::system_clock::now();

    std::string error;
    if (!WriteCheckpointJson(checkpoint, outcome_.checkpoint_path, error)) {
      logger_.Warn("checkpoint write failed; resume will repeat unsaved chunks",
                   {{"error", error}});
    }
  }

  void WriteSummary() {
    if (!HasOutputDir()) {
      return;
    }
    std::string error;
    if (!WriteUploadSummaryJson(metadata_, outcome_, options_.output_dir, error)) {
      logger_.Warn("failed to write upload summary", {{"error", error}});
    }
  }

  UploadError MakeError(UploadErrorKind kind, std::string message, std::string detail = {}) const {
    UploadError error = core::errors::MakeUploadError(kind, std::move(message), std::move(detail));
    error.model_name = metadata_.name;
    error.model_version = metadata_.version;
    error.model_id = outcome_.model_id;
    return error;
  }

  // Records the terminal failure. Caller holds `mutex_` or runs single-threaded.
  bool FailLocked(UploadError error) {
    const bool cancelled = error.kind == UploadErrorKind::kCancelled;
    Transition(SessionState::kFailed);
    const std::string formatted = core::errors::FormatUploadError(error);
    std::map<std::string, std::string> payload = {
        {"error_code", std::string(core::errors::ToStableErrorCode(error.kind))},
        {"error", formatted},
        {"acknowledged_count", std::to_string(acknowledged_.size())},
        {"total_chunks", std::to_string(chunker_.TotalCount())},
    };
    if (error.chunk_index.has_value()) {
      payload["index"] = std::to_string(error.chunk_index.value());
    }
    EmitLocked(cancelled ? events::EventType::kSessionCancelled : events::EventType::kSessionFailed,
               std::move(payload));
    WriteCheckpointLocked();
    if (cancelled) {
      logger_.Warn("upload session cancelled",
                   {{"model_id", outcome_.model_id},
                    {"acknowledged_count", std::to_string(acknowledged_.size())},
                    {"resumable", core::errors::IsResumable(error.kind) ? "true" : "false"}});
    } else {
      logger_.Error("upload session failed",
                    {{"error_code", std::string(core::errors::ToStableErrorCode(error.kind))},
                     {"error", formatted}});
    }
    outcome_.error = std::move(error);
    return false;
  }

  bool ValidateInputs() {
    std::string error;
    if (!registry::ValidateModelMetadata(metadata_, error)) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration, "invalid model metadata", error));
    }
    if (!chunking::ValidateChunkSize(options_.chunk_size_bytes, error)) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration, "invalid chunk size", error));
    }
    if (!ValidateRetryPolicy(options_.retry, error)) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration, "invalid retry policy", error));
    }
    if (options_.max_in_flight == 0U || options_.max_in_flight > kMaxInFlightLimit) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration,
                                  "max_in_flight must be in [1, " +
                                      std::to_string(kMaxInFlightLimit) + "]"));
    }
    if (artifact_.SizeBytes() == 0U) {
      return FailLocked(MakeError(UploadErrorKind::kArtifactRead, "artifact is empty",
                                  artifact_.SourcePath().string()));
    }
    if (artifact_.SizeBytes() > artifact::kMaxArtifactSizeBytes) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration,
                                  "artifact exceeds the registry size limit",
                                  std::to_string(artifact_.SizeBytes()) + " > " +
                                      std::to_string(artifact::kMaxArtifactSizeBytes)));
    }
    return true;
  }

  bool Hash() {
    Transition(SessionState::kHashing);
    EmitLocked(events::EventType::kSessionStarted,
               {{"model_name", metadata_.name},
                {"model_version", std::to_string(metadata_.version)},
                {"archive_path", artifact_.SourcePath().string()},
                {"size_bytes", std::to_string(artifact_.SizeBytes())},
                {"chunk_size_bytes", std::to_string(options_.chunk_size_bytes)},
                {"max_in_flight", std::to_string(options_.max_in_flight)},
                {"resume", outcome_.resumed ? "true" : "false"}});
    logger_.Info("upload session started",
                 {{"size_bytes", std::to_string(artifact_.SizeBytes())},
                  {"chunk_size_bytes", std::to_string(options_.chunk_size_bytes)},
                  {"resume", outcome_.resumed ? "true" : "false"}});

    std::string error;
    if (!hashing::ComputeDigest(artifact_.Bytes(), digest_, error)) {
      return FailLocked(MakeError(UploadErrorKind::kArtifactRead, "failed to hash artifact", error));
    }
    outcome_.digest_hex = hashing::ToHex(digest_);
    EmitLocked(events::EventType::kDigestComputed,
               {{"digest_sha256", outcome_.digest_hex},
                {"size_bytes", std::to_string(artifact_.SizeBytes())}});
    logger_.Info("artifact digest computed", {{"digest_sha256", outcome_.digest_hex}});

    if (options_.resume.has_value()) {
      return AdoptCheckpoint(options_.resume.value());
    }
    attempts_.assign(static_cast<std::size_t>(chunker_.TotalCount()), 0U);
    outcome_.total_chunks = chunker_.TotalCount();
    return true;
  }

  // Resume keeps the chunk geometry the record was registered with; any
  // attempt to change it is a protocol violation.
  bool AdoptCheckpoint(const CheckpointState& checkpoint) {
    if (checkpoint.state == SessionState::kDone) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration,
                                  "checkpoint session already completed",
                                  "model_id=" + checkpoint.model_id));
    }
    if (checkpoint.model_name != metadata_.name || checkpoint.model_version != metadata_.version) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration,
                                  "checkpoint belongs to a different model",
                                  checkpoint.model_name + "@v" +
                                      std::to_string(checkpoint.model_version)));
    }
    if (checkpoint.digest_hex != outcome_.digest_hex ||
        checkpoint.size_bytes != artifact_.SizeBytes()) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration,
                                  "artifact changed since the checkpoint was written",
                                  "checkpoint digest " + checkpoint.digest_hex));
    }

    std::string error;
    if (!chunker_.SetChunkSize(checkpoint.chunk_size_bytes, error)) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration, "invalid checkpoint", error));
    }
    chunker_.Lock();
    if (!chunker_.SetChunkSize(options_.chunk_size_bytes, error)) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration,
                                  "chunk size changed mid-session", error));
    }
    if (chunker_.TotalCount() != checkpoint.total_chunks) {
      return FailLocked(MakeError(UploadErrorKind::kConfiguration,
                                  "checkpoint chunk count does not match the artifact"));
    }

    outcome_.model_id = checkpoint.model_id;
    outcome_.total_chunks = checkpoint.total_chunks;
    acknowledged_ = checkpoint.acknowledged_indices;
    attempts_ = checkpoint.chunk_attempts;
    attempts_.resize(static_cast<std::size_t>(checkpoint.total_chunks), 0U);
    return true;
  }

  bool RecordMatches(const registry::RegistrationRecord& record) const {
    return (record.digest_hex.empty() || record.digest_hex == outcome_.digest_hex) &&
           (record.size_bytes == 0U || record.size_bytes == artifact_.SizeBytes()) &&
           (record.total_chunks == 0U || record.total_chunks == chunker_.TotalCount());
  }

  // Reuse an earlier record for the same name/version when it describes the
  // same bytes and still accepts chunks. Returns false only if the lookup
  // itself failed.
  bool LookupExisting(std::string& model_id, bool& found, registry::RegistryError& error) {
    found = false;
    std::optional<registry::RegistrationRecord> record;
    if (!registry_.FindRegistration(metadata_.name, metadata_.version, record, error)) {
      return false;
    }
    if (!record.has_value() || !registry::AcceptsChunks(record->state) || !RecordMatches(*record)) {
      return true;
    }
    model_id = record->model_id;
    outcome_.reused_registration = true;
    found = true;
    return true;
  }

  void LogRetry(std::string_view operation, const std::optional<std::uint64_t> index,
                const std::uint32_t attempt, const registry::RegistryError& error,
                const std::chrono::milliseconds backoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string index_text = index.has_value() ? std::to_string(index.value()) : "-";
    logger_.Warn("transient registry failure; retrying",
                 {{"operation", operation},
                  {"model_id", outcome_.model_id},
                  {"index", index_text},
                  {"attempt", std::to_string(attempt)},
                  {"max_attempts", std::to_string(options_.retry.max_attempts)},
                  {"backoff_ms", std::to_string(backoff.count())},
                  {"error", registry::FormatRegistryError(error)}});
    if (index.has_value()) {
      EmitLocked(events::EventType::kChunkRetry,
                 {{"model_id", outcome_.model_id},
                  {"index", index_text},
                  {"attempt", std::to_string(attempt)},
                  {"backoff_ms", std::to_string(backoff.count())},
                  {"error_code", std::string(registry::ToStableErrorCode(error.code))}});
    }
  }

  bool Register() {
    Transition(SessionState::kRegistering);
    if (ShouldStop()) {
      return FailLocked(MakeError(UploadErrorKind::kCancelled, "cancelled before registration"));
    }

    registry::RegistrationRequest request;
    request.metadata = metadata_;
    request.digest = digest_;
    request.size_bytes = artifact_.SizeBytes();
    request.total_chunks = chunker_.TotalCount();

    std::string model_id;
    std::uint32_t call_count = 0;
    const auto operation = [&](registry::RegistryError& error) {
      if (outcome_.resumed) {
        return VerifyResumableRecord(error);
      }
      ++call_count;
      // A retried registration may have committed on the registry even though
      // the response was lost, so look before creating again.
      bool found = false;
      if (call_count > 1U) {
        if (!LookupExisting(model_id, found, error)) {
          return false;
        }
        if (found) {
          return true;
        }
      }
      if (registry_.Register(request, model_id, error)) {
        return true;
      }
      if (error.code == registry::RegistryErrorCode::kDuplicate) {
        registry::RegistryError lookup_error;
        if (LookupExisting(model_id, found, lookup_error) && found) {
          return true;
        }
      }
      return false;
    };
    const auto on_retry = [&](const std::uint32_t attempt, const registry::RegistryError& error,
                              const std::chrono::milliseconds backoff) {
      LogRetry(outcome_.resumed ? "query_status" : "register", std::nullopt, attempt, error,
               backoff);
    };

    const RetryAttemptResult result =
        ExecuteWithRetry(options_.retry, operation, on_retry, hooks_.sleeper, hooks_.should_stop);
    if (result.cancelled) {
      return FailLocked(MakeError(UploadErrorKind::kCancelled, "cancelled during registration"));
    }
    if (!result.succeeded) {
      UploadError error = MakeError(UploadErrorKind::kRegistration,
                                    outcome_.resumed ? "registry record is not resumable"
                                                     : "model registration failed",
                                    registry::FormatRegistryError(result.last_error));
      error.attempts = result.attempts_used_total;
      return FailLocked(std::move(error));
    }

    if (!outcome_.resumed) {
      outcome_.model_id = model_id;
    }
    chunker_.Lock();
    Transition(SessionState::kUploading);

    std::lock_guard<std::mutex> lock(mutex_);
    EmitLocked(events::EventType::kModelRegistered,
               {{"model_id", outcome_.model_id},
                {"total_chunks", std::to_string(chunker_.TotalCount())},
                {"reused_registration", outcome_.reused_registration ? "true" : "false"},
                {"resume", outcome_.resumed ? "true" : "false"}});
    logger_.Info(outcome_.resumed ? "resuming registered model" : "model registered",
                 {{"model_id", outcome_.model_id},
                  {"total_chunks", std::to_string(chunker_.TotalCount())},
                  {"already_acknowledged", std::to_string(acknowledged_.size())},
                  {"reused_registration", outcome_.reused_registration ? "true" : "false"}});
    WriteCheckpointLocked();
    return true;
  }

  bool VerifyResumableRecord(registry::RegistryError& error) {
    registry::RegistrationRecord record;
    if (!registry_.QueryStatus(outcome_.model_id, record, error)) {
      return false;
    }
    const bool usable = registry::AcceptsChunks(record.state) ||
                        (record.state == registry::RecordState::kUploaded &&
                         acknowledged_.size() == chunker_.TotalCount());
    if (!usable) {
      error = registry::MakeRegistryError(registry::RegistryErrorCode::kInvalidState,
                                          "record " + outcome_.model_id + " is " +
                                              registry::ToString(record.state));
      return false;
    }
    if (!RecordMatches(record)) {
      error = registry::MakeRegistryError(registry::RegistryErrorCode::kRejected,
                                          "record " + outcome_.model_id +
                                              " was registered for different content");
      return false;
    }
    return true;
  }

  // Uploads one chunk with per-index retry. Returns false on failure or
  // cancellation; `failure_` / `cancelled_` tell which.
  bool UploadOne(const chunking::Chunk& chunk) {
    registry::ChunkAck ack;
    const auto operation = [&](registry::RegistryError& error) {
      return registry_.UploadChunk(outcome_.model_id, chunk.index, chunk.payload, ack, error);
    };
    const auto on_retry = [&](const std::uint32_t attempt, const registry::RegistryError& error,
                              const std::chrono::milliseconds backoff) {
      LogRetry("upload_chunk", chunk.index, attempt, error, backoff);
    };
    const RetryAttemptResult result =
        ExecuteWithRetry(options_.retry, operation, on_retry, hooks_.sleeper, hooks_.should_stop);

    std::unique_lock<std::mutex> lock(mutex_);
    attempts_[static_cast<std::size_t>(chunk.index)] += result.attempts_used_total;

    if (result.succeeded) {
      acknowledged_.insert(chunk.index);
      Transition(SessionState::kUploading);
      EmitLocked(events::EventType::kChunkAcknowledged,
                 {{"model_id", outcome_.model_id},
                  {"index", std::to_string(chunk.index)},
                  {"total_chunks", std::to_string(chunk.total_count)},
                  {"size_bytes", std::to_string(chunk.payload.size())},
                  {"status", ack.status},
                  {"attempts", std::to_string(attempts_[static_cast<std::size_t>(chunk.index)])}});
      logger_.Debug("chunk acknowledged",
                    {{"index", std::to_string(chunk.index)},
                     {"acknowledged_count", std::to_string(acknowledged_.size())},
                     {"total_chunks", std::to_string(chunk.total_count)}});
      WriteCheckpointLocked();
      if (hooks_.on_progress) {
        UploadProgress progress;
        progress.current_index = chunk.index;
        progress.acknowledged_count = static_cast<std::uint64_t>(acknowledged_.size());
        progress.total_count = chunk.total_count;
        // The progress lock is taken before the session lock is released so
        // reports keep acknowledgment order; the hook itself runs unlocked.
        std::lock_guard<std::mutex> progress_lock(progress_mutex_);
        lock.unlock();
        hooks_.on_progress(progress);
      }
      return true;
    }

    if (result.cancelled) {
      cancelled_ = true;
      return false;
    }
    if (!failure_.has_value()) {
      UploadError error = MakeError(UploadErrorKind::kChunkUpload, "chunk upload failed",
                                    registry::FormatRegistryError(result.last_error));
      error.chunk_index = chunk.index;
      error.attempts = attempts_[static_cast<std::size_t>(chunk.index)];
      failure_ = std::move(error);
    }
    return false;
  }

  bool ShouldHaltLocked() {
    if (failure_.has_value() || cancelled_) {
      return true;
    }
    if (ShouldStop()) {
      cancelled_ = true;
      return true;
    }
    return false;
  }

  void UploadSequential() {
    chunker_.Reset();
    chunking::Chunk chunk;
    while (chunker_.Next(chunk)) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ShouldHaltLocked()) {
          return;
        }
        if (acknowledged_.count(chunk.index) != 0U) {
          continue;
        }
      }
      if (!UploadOne(chunk)) {
        return;
      }
    }
  }

  void UploadConcurrent(const std::vector<std::uint64_t>& pending) {
    std::size_t next = 0;
    const auto worker = [&]() {
      while (true) {
        chunking::Chunk chunk;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          if (next >= pending.size() || ShouldHaltLocked()) {
            return;
          }
          std::string error;
          if (!chunker_.ChunkAt(pending[next], chunk, error)) {
            if (!failure_.has_value()) {
              UploadError failure = MakeError(UploadErrorKind::kChunkUpload,
                                              "chunk index out of range", error);
              failure.chunk_index = pending[next];
              failure_ = std::move(failure);
            }
            return;
          }
          ++next;
        }
        if (!UploadOne(chunk)) {
          return;
        }
      }
    };

    const std::size_t worker_count =
        std::min<std::size_t>(options_.max_in_flight, pending.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
      thread.join();
    }
  }

  bool UploadChunks() {
    std::vector<std::uint64_t> pending;
    for (std::uint64_t index = 0; index < chunker_.TotalCount(); ++index) {
      if (acknowledged_.count(index) == 0U) {
        pending.push_back(index);
      }
    }
    logger_.Info("uploading chunks",
                 {{"model_id", outcome_.model_id},
                  {"pending", std::to_string(pending.size())},
                  {"total_chunks", std::to_string(chunker_.TotalCount())},
                  {"max_in_flight", std::to_string(options_.max_in_flight)}});

    if (options_.max_in_flight <= 1U || pending.size() <= 1U) {
      UploadSequential();
    } else {
      UploadConcurrent(pending);
    }

    if (failure_.has_value()) {
      return FailLocked(std::move(failure_.value()));
    }
    if (cancelled_) {
      return FailLocked(MakeError(UploadErrorKind::kCancelled, "cancelled during chunk upload",
                                  std::to_string(acknowledged_.size()) + " of " +
                                      std::to_string(chunker_.TotalCount()) +
                                      " chunks acknowledged"));
    }
    if (acknowledged_.size() != chunker_.TotalCount()) {
      return FailLocked(MakeError(UploadErrorKind::kChunkUpload,
                                  "not every chunk index was acknowledged"));
    }
    return true;
  }

  bool Finalize() {
    if (ShouldStop()) {
      return FailLocked(MakeError(UploadErrorKind::kCancelled, "cancelled before finalize"));
    }
    Transition(SessionState::kFinalizing);

    registry::FinalizeResult finalize_result;
    const auto operation = [&](registry::RegistryError& error) {
      return registry_.Finalize(outcome_.model_id, finalize_result, error);
    };
    const auto on_retry = [&](const std::uint32_t attempt, const registry::RegistryError& error,
                              const std::chrono::milliseconds backoff) {
      LogRetry("finalize", std::nullopt, attempt, error, backoff);
    };
    const RetryAttemptResult result =
        ExecuteWithRetry(options_.retry, operation, on_retry, hooks_.sleeper, hooks_.should_stop);
    if (result.cancelled) {
      return FailLocked(MakeError(UploadErrorKind::kCancelled, "cancelled during finalize"));
    }
    if (!result.succeeded) {
      const bool mismatch = result.last_error.code == registry::RegistryErrorCode::kDigestMismatch;
      UploadError error = MakeError(mismatch ? UploadErrorKind::kDigestMismatch
                                             : UploadErrorKind::kFinalization,
                                    mismatch ? "registry digest does not match uploaded content"
                                             : "finalize failed",
                                    registry::FormatRegistryError(result.last_error));
      error.attempts = result.attempts_used_total;
      return FailLocked(std::move(error));
    }
    if (finalize_result.state != registry::RecordState::kUploaded) {
      return FailLocked(MakeError(UploadErrorKind::kFinalization,
                                  "registry did not report UPLOADED",
                                  registry::ToString(finalize_result.state)));
    }

    Transition(SessionState::kDone);
    std::lock_guard<std::mutex> lock(mutex_);
    EmitLocked(events::EventType::kSessionFinalized,
               {{"model_id", outcome_.model_id},
                {"record_state", registry::ToString(finalize_result.state)},
                {"digest_sha256", outcome_.digest_hex},
                {"total_chunks", std::to_string(chunker_.TotalCount())}});
    WriteCheckpointLocked();
    logger_.Info("upload session finalized",
                 {{"model_id", outcome_.model_id},
                  {"record_state", registry::ToString(finalize_result.state)},
                  {"detail", finalize_result.detail}});
    return true;
  }

  registry::IRegistryClient& registry_;
  core::logging::Logger& logger_;
  const registry::ModelMetadata& metadata_;
  const artifact::Artifact& artifact_;
  const UploadOptions& options_;
  UploadHooks hooks_;
  UploadOutcome& outcome_;

  chunking::Chunker chunker_;
  events::EventLog event_log_;
  hashing::Digest digest_;

  std::mutex mutex_;
  std::mutex progress_mutex_;
  std::set<std::uint64_t> acknowledged_;
  std::vector<std::uint32_t> attempts_;
  std::optional<UploadError> failure_;
  bool cancelled_ = false;
};

} // namespace

UploadOrchestrator::UploadOrchestrator(registry::IRegistryClient& registry,
                                       core::logging::Logger& logger)
    : registry_(registry), logger_(logger) {}

bool UploadOrchestrator::Run(const registry::ModelMetadata& metadata,
                             const artifact::Artifact& artifact, const UploadOptions& options,
                             const UploadHooks& hooks, UploadOutcome& outcome) {
  Session session(registry_, logger_, metadata, artifact, options, hooks, outcome);
  return session.Run();
}

} // namespace modelpush::upload
