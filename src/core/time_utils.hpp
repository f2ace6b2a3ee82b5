#ifndef MODELPUSH_CORE_TIME_UTILS_HPP_
#define MODELPUSH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace modelpush::core {

// Canonical UTC timestamp formatter shared by the logger, event stream and
// session artifacts. Millisecond precision, `Z` suffix.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::int64_t ToEpochMilliseconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point FromEpochMilliseconds(std::int64_t epoch_ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(epoch_ms));
}

// Session ids look like `session-<epoch_ms>` so bundle folders sort by start.
inline std::string MakeSessionId(std::chrono::system_clock::time_point now) {
  return "session-" + std::to_string(ToEpochMilliseconds(now));
}

} // namespace modelpush::core

#endif // MODELPUSH_CORE_TIME_UTILS_HPP_
