#include "events/event_model.hpp"

#include "core/json_dom.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace modelpush::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kSessionStarted:
    return "SESSION_STARTED";
  case EventType::kDigestComputed:
    return "DIGEST_COMPUTED";
  case EventType::kModelRegistered:
    return "MODEL_REGISTERED";
  case EventType::kChunkAcknowledged:
    return "CHUNK_ACKNOWLEDGED";
  case EventType::kChunkRetry:
    return "CHUNK_RETRY";
  case EventType::kSessionFinalized:
    return "SESSION_FINALIZED";
  case EventType::kSessionFailed:
    return "SESSION_FAILED";
  case EventType::kSessionCancelled:
    return "SESSION_CANCELLED";
  }

  return "UNKNOWN";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  // `payload` is a std::map, so key order is stable across runs.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << "\"" << core::json::EscapeJson(key) << "\":\"" << core::json::EscapeJson(value) << "\"";
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace modelpush::events
