#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

using modelpush::events::Event;
using modelpush::events::EventType;
using modelpush::tests::common::AssertContains;
using modelpush::tests::common::Fail;

Event MakeEvent(std::int64_t ts_ms, EventType type, std::map<std::string, std::string> payload) {
  Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(ts_ms));
  event.type = type;
  event.payload = std::move(payload);
  return event;
}

void CheckAppendOrder(const fs::path& out_dir) {
  const std::vector<Event> timeline = {
      MakeEvent(1'000, EventType::kSessionStarted,
                {{"model_name", "all-MiniLM-L6-v2"}, {"model_version", "1"}}),
      MakeEvent(2'000, EventType::kChunkRetry,
                {{"index", "3"}, {"attempt", "1"}, {"error", "upload timed out \"slow\""}}),
      MakeEvent(3'000, EventType::kSessionFinalized, {{"model_id", "sim-model-000001"}}),
  };

  fs::path written_path;
  std::string error;
  for (const Event& event : timeline) {
    if (!modelpush::events::AppendEventJsonl(event, out_dir, written_path, error)) {
      Fail("failed to append event: " + error);
    }
  }
  if (written_path != out_dir / modelpush::events::kEventsFileName) {
    Fail("events must be written to events.jsonl in the output directory");
  }

  const auto lines = modelpush::tests::common::ReadNonEmptyLines(written_path);
  if (lines.size() != 3U) {
    Fail("expected exactly 3 lines in events.jsonl");
  }
  AssertContains(lines[0], "\"ts_utc\":\"1970-01-01T00:00:01.000Z\"");
  AssertContains(lines[0], "\"type\":\"SESSION_STARTED\"");
  AssertContains(lines[0], "\"model_name\":\"all-MiniLM-L6-v2\"");
  AssertContains(lines[1], "\"type\":\"CHUNK_RETRY\"");
  AssertContains(lines[1], "upload timed out \\\"slow\\\"");
  AssertContains(lines[2], "\"type\":\"SESSION_FINALIZED\"");

  // Append mode: a resumed session extends the same timeline.
  if (!modelpush::events::AppendEventJsonl(
          MakeEvent(4'000, EventType::kSessionCancelled, {}), out_dir, written_path, error)) {
    Fail("failed to append resumed event: " + error);
  }
  if (modelpush::tests::common::ReadNonEmptyLines(written_path).size() != 4U) {
    Fail("expected append mode to keep earlier events");
  }
}

void CheckConcurrentEventLog(const fs::path& out_dir) {
  modelpush::events::EventLog log(out_dir);
  constexpr int kWorkers = 4;
  constexpr int kEventsPerWorker = 25;

  std::vector<std::thread> workers;
  for (int worker = 0; worker < kWorkers; ++worker) {
    workers.emplace_back([&log, worker]() {
      for (int i = 0; i < kEventsPerWorker; ++i) {
        std::string error;
        const Event event =
            MakeEvent(5'000 + i, EventType::kChunkAcknowledged,
                      {{"index", std::to_string(worker * kEventsPerWorker + i)}});
        if (!log.Append(event, error)) {
          Fail("concurrent append failed: " + error);
        }
      }
    });
  }
  for (std::thread& worker : workers) {
    worker.join();
  }

  if (log.WrittenCount() != static_cast<std::uint64_t>(kWorkers * kEventsPerWorker)) {
    Fail("unexpected written count from EventLog");
  }
  const auto lines = modelpush::tests::common::ReadNonEmptyLines(log.Path());
  if (lines.size() != static_cast<std::size_t>(kWorkers * kEventsPerWorker)) {
    Fail("concurrent appends must produce one line per event");
  }
  for (const std::string& line : lines) {
    if (line.front() != '{' || line.back() != '}') {
      Fail("interleaved event line: " + line);
    }
    AssertContains(line, "\"type\":\"CHUNK_ACKNOWLEDGED\"");
  }
}

} // namespace

int main() {
  const modelpush::tests::common::ScopedTempDir temp_dir("modelpush-events");
  const fs::path& temp_root = temp_dir.Path();
  CheckAppendOrder(temp_root / "timeline");
  CheckConcurrentEventLog(temp_root / "concurrent");

  std::string error;
  fs::path written_path;
  if (modelpush::events::AppendEventJsonl(MakeEvent(0, EventType::kSessionFailed, {}), fs::path(),
                                          written_path, error)) {
    Fail("expected empty output directory to be rejected");
  }

  std::cout << "events_jsonl_smoke: ok\n";
  return 0;
}
