#pragma once

#include "events/event_model.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace modelpush::events {

constexpr const char* kEventsFileName = "events.jsonl";

// Appends one JSON-serialized event per line to `<output_dir>/events.jsonl`.
//
// Contract:
// - Creates `output_dir` if needed.
// - Opens `events.jsonl` in append mode, so a resumed session extends the
//   timeline of the interrupted one.
// - Writes exactly one line per call.
// - Returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

// Session-scoped event sink. Chunk workers append concurrently, so writes are
// serialized and each event stays on its own line.
class EventLog {
public:
  explicit EventLog(std::filesystem::path output_dir);

  bool Append(const Event& event, std::string& error);

  std::filesystem::path Path() const;
  std::uint64_t WrittenCount() const;

private:
  std::filesystem::path output_dir_;
  mutable std::mutex mutex_;
  std::uint64_t written_count_ = 0;
};

} // namespace modelpush::events
