#include "core/logging/logger.hpp"
#include "events/jsonl_writer.hpp"
#include "registry/sim_registry.hpp"
#include "upload/orchestrator.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/upload_fixtures.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using modelpush::tests::common::Fail;

namespace {

std::size_t CountAcknowledgedEvents(const fs::path& events_path) {
  std::size_t count = 0;
  for (const std::string& line : modelpush::tests::common::ReadNonEmptyLines(events_path)) {
    if (line.find("\"type\":\"CHUNK_ACKNOWLEDGED\"") != std::string::npos) {
      ++count;
    }
  }
  return count;
}

// While the first progress callback is busy, the other worker must still be
// able to record its acknowledgment.
void CheckSlowProgressHookDoesNotStallWorkers(const fs::path& out_dir) {
  modelpush::registry::SimRegistry registry;
  std::ostringstream log_stream;
  modelpush::core::logging::Logger logger(modelpush::core::logging::LogLevel::kInfo, log_stream);

  const auto metadata = modelpush::tests::common::MakeTestMetadata("slow-progress-model");
  const auto artifact = modelpush::tests::common::MakeTestArtifact(4U * 512U);
  auto options = modelpush::tests::common::MakeTestUploadOptions(512U, out_dir);
  options.max_in_flight = 2U;

  bool first_report = true;
  bool saw_other_ack = false;
  modelpush::upload::UploadHooks hooks;
  hooks.on_progress = [&](const modelpush::upload::UploadProgress&) {
    if (!first_report) {
      return;
    }
    first_report = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (CountAcknowledgedEvents(out_dir / modelpush::events::kEventsFileName) >= 2U) {
        saw_other_ack = true;
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  };

  modelpush::upload::UploadOrchestrator orchestrator(registry, logger);
  modelpush::upload::UploadOutcome outcome;
  if (!orchestrator.Run(metadata, artifact, options, hooks, outcome)) {
    Fail("upload with a slow progress callback should succeed: " + log_stream.str());
  }
  if (!saw_other_ack) {
    Fail("a busy progress callback must not block acknowledgments from other workers");
  }
  if (outcome.acknowledged_count != 4U) {
    Fail("every index must still be acknowledged");
  }
}

} // namespace

int main() {
  const fs::path out_dir = modelpush::tests::common::CreateUniqueTempDir("modelpush-concurrency");
  modelpush::registry::SimFaultPlan plan;
  plan.chunk_latency = std::chrono::milliseconds(5);
  plan.chunk_timeouts[3U] = 1U;
  plan.chunk_timeouts[11U] = 2U;
  modelpush::registry::SimRegistry registry(plan);
  std::ostringstream log_stream;
  modelpush::core::logging::Logger logger(modelpush::core::logging::LogLevel::kDebug, log_stream);

  const auto metadata = modelpush::tests::common::MakeTestMetadata();
  // 16 chunks, the last one short.
  const auto artifact = modelpush::tests::common::MakeTestArtifact(15U * 1'024U + 100U);
  auto options = modelpush::tests::common::MakeTestUploadOptions(1'024U, out_dir);
  options.max_in_flight = 4U;

  std::atomic<std::uint32_t> sleeps{0};
  std::mutex progress_mutex;
  std::set<std::uint64_t> progressed;
  std::uint64_t last_acknowledged = 0;
  bool progress_monotonic = true;
  modelpush::upload::UploadHooks hooks;
  hooks.sleeper = [&](std::chrono::milliseconds) { ++sleeps; };
  hooks.on_progress = [&](const modelpush::upload::UploadProgress& progress) {
    std::lock_guard<std::mutex> lock(progress_mutex);
    progressed.insert(progress.current_index);
    if (progress.acknowledged_count != last_acknowledged + 1U) {
      progress_monotonic = false;
    }
    last_acknowledged = progress.acknowledged_count;
  };

  modelpush::upload::UploadOrchestrator orchestrator(registry, logger);
  modelpush::upload::UploadOutcome outcome;
  if (!orchestrator.Run(metadata, artifact, options, hooks, outcome)) {
    Fail("concurrent upload should succeed: " + log_stream.str());
  }
  if (outcome.state != modelpush::upload::SessionState::kDone || outcome.total_chunks != 16U ||
      outcome.acknowledged_count != 16U) {
    Fail("every index must be acknowledged before DONE");
  }
  if (progressed.size() != 16U || !progress_monotonic) {
    Fail("progress must be reported once per index with a growing count");
  }
  if (outcome.chunk_attempts[3] != 2U || outcome.chunk_attempts[11] != 3U ||
      outcome.chunk_attempts[0] != 1U) {
    Fail("per-index attempts must be tracked independently under concurrency");
  }
  if (sleeps.load() != 3U) {
    Fail("expected one backoff per transient failure");
  }

  const std::uint32_t peak = registry.PeakConcurrentUploads();
  if (peak == 0U || peak > options.max_in_flight) {
    Fail("in-flight uploads must never exceed max_in_flight (peak " + std::to_string(peak) + ")");
  }

  const std::vector<std::string> lines =
      modelpush::tests::common::ReadNonEmptyLines(out_dir / modelpush::events::kEventsFileName);
  std::size_t acknowledged_events = 0;
  for (const std::string& line : lines) {
    if (line.find("\"type\":\"CHUNK_ACKNOWLEDGED\"") != std::string::npos) {
      ++acknowledged_events;
    }
    if (line.front() != '{' || line.back() != '}') {
      Fail("concurrent event writes must not interleave: " + line);
    }
  }
  if (acknowledged_events != 16U) {
    Fail("expected one CHUNK_ACKNOWLEDGED event per index");
  }

  CheckSlowProgressHookDoesNotStallWorkers(out_dir / "slow_progress");

  modelpush::tests::common::RemovePathBestEffort(out_dir);
  std::cout << "upload_concurrency_smoke: ok\n";
  return 0;
}
