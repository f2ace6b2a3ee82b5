#include "core/errors/upload_error.hpp"
#include "core/logging/logger.hpp"
#include "events/jsonl_writer.hpp"
#include "registry/sim_registry.hpp"
#include "upload/orchestrator.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/upload_fixtures.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using modelpush::core::errors::UploadErrorKind;
using modelpush::tests::common::AssertContains;
using modelpush::tests::common::Fail;

// Index 1 times out twice and is accepted on the third attempt.
void RunTransientTimeoutRecovers() {
  const fs::path out_dir = modelpush::tests::common::CreateUniqueTempDir("modelpush-chunk-retry");
  modelpush::registry::SimFaultPlan plan;
  plan.chunk_timeouts[1U] = 2U;
  modelpush::registry::SimRegistry registry(plan);
  std::ostringstream log_stream;
  modelpush::core::logging::Logger logger(modelpush::core::logging::LogLevel::kInfo, log_stream);

  const auto metadata = modelpush::tests::common::MakeTestMetadata();
  const auto artifact = modelpush::tests::common::MakeTestArtifact(10'000U);
  const auto options = modelpush::tests::common::MakeTestUploadOptions(4'096U, out_dir);
  modelpush::tests::common::RecordingSleeper sleeper;
  modelpush::upload::UploadHooks hooks;
  hooks.sleeper = sleeper.AsSleeper();

  modelpush::upload::UploadOrchestrator orchestrator(registry, logger);
  modelpush::upload::UploadOutcome outcome;
  if (!orchestrator.Run(metadata, artifact, options, hooks, outcome)) {
    Fail("upload must recover from two transient timeouts");
  }
  if (outcome.state != modelpush::upload::SessionState::kDone) {
    Fail("session must reach DONE");
  }
  if (outcome.chunk_attempts != std::vector<std::uint32_t>{1U, 3U, 1U}) {
    Fail("index 1 must record exactly three attempts");
  }
  if (registry.UploadAttempts(outcome.model_id, 1U) != 3U) {
    Fail("registry must have seen three attempts for index 1");
  }
  // 10ms initial backoff doubling: 10, 20.
  if (sleeper.waits != std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(10),
                                                               std::chrono::milliseconds(20)}) {
    Fail("backoff waits must grow exponentially");
  }

  const std::string events =
      modelpush::tests::common::ReadFileToString(out_dir / modelpush::events::kEventsFileName);
  AssertContains(events, "\"type\":\"CHUNK_RETRY\"");
  AssertContains(events, "\"error_code\":\"REGISTRY_TIMEOUT\"");
  AssertContains(events, "\"attempts\":\"3\"");
  AssertContains(log_stream.str(), "transient registry failure; retrying");
  modelpush::tests::common::RemovePathBestEffort(out_dir);
}

// Index 2 never recovers within a budget of three attempts.
void RunRetryExhaustionFails() {
  modelpush::registry::SimFaultPlan plan;
  plan.chunk_timeouts[2U] = 10U;
  modelpush::registry::SimRegistry registry(plan);
  std::ostringstream log_stream;
  modelpush::core::logging::Logger logger(modelpush::core::logging::LogLevel::kInfo, log_stream);

  const auto metadata = modelpush::tests::common::MakeTestMetadata();
  const auto artifact = modelpush::tests::common::MakeTestArtifact(10'000U);
  auto options = modelpush::tests::common::MakeTestUploadOptions(4'096U);
  options.retry.max_attempts = 3U;
  modelpush::tests::common::RecordingSleeper sleeper;
  modelpush::upload::UploadHooks hooks;
  hooks.sleeper = sleeper.AsSleeper();

  modelpush::upload::UploadOrchestrator orchestrator(registry, logger);
  modelpush::upload::UploadOutcome outcome;
  if (orchestrator.Run(metadata, artifact, options, hooks, outcome)) {
    Fail("upload must fail once the retry budget is spent");
  }
  if (outcome.state != modelpush::upload::SessionState::kFailed || !outcome.error.has_value()) {
    Fail("exhausted session must be FAILED with an error");
  }
  const auto& error = outcome.error.value();
  if (error.kind != UploadErrorKind::kChunkUpload || error.chunk_index != 2U ||
      error.attempts != 3U) {
    Fail("chunk failure must carry index 2 and 3 attempts");
  }
  if (error.model_name != metadata.name || error.model_version != metadata.version ||
      error.model_id != outcome.model_id) {
    Fail("chunk failure must identify the model");
  }
  if (!modelpush::core::errors::IsResumable(error.kind)) {
    Fail("chunk failures must be resumable");
  }
  const std::string formatted = modelpush::core::errors::FormatUploadError(error);
  AssertContains(formatted, "CHUNK_UPLOAD_ERROR");
  AssertContains(formatted, "index=2");
  AssertContains(formatted, "attempts=3");
  AssertContains(formatted, "REGISTRY_TIMEOUT");

  modelpush::registry::RegistrationRecord record;
  modelpush::registry::RegistryError registry_error;
  if (!registry.QueryStatus(outcome.model_id, record, registry_error) ||
      record.state == modelpush::registry::RecordState::kUploaded) {
    Fail("a record with a missing chunk must never be finalized");
  }
  if (outcome.acknowledged_count != 2U) {
    Fail("indices 0 and 1 must stay acknowledged");
  }
  AssertContains(log_stream.str(), "level=ERROR");
}

} // namespace

int main() {
  RunTransientTimeoutRecovers();
  RunRetryExhaustionFails();
  std::cout << "upload_chunk_retry_smoke: ok\n";
  return 0;
}
