#pragma once

#include <chrono>
#include <map>
#include <string>

namespace modelpush::events {

// Upload session timeline categories. Names are part of the events.jsonl
// contract; add new values instead of renaming existing ones.
enum class EventType {
  kSessionStarted,
  kDigestComputed,
  kModelRegistered,
  kChunkAcknowledged,
  kChunkRetry,
  kSessionFinalized,
  kSessionFailed,
  kSessionCancelled,
};

// Canonical timeline event contract.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: lightweight string key/value attributes for context.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kSessionStarted;
  std::map<std::string, std::string> payload;
};

// JSON serializers used by JSONL writers and tests.
std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace modelpush::events
