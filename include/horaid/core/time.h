#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace horaid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// format_unix_millis_iso8601 renders milliseconds since the Unix epoch as a UTC
// calendar datetime: "YYYY-MM-DDTHH:MM:SS.mmmZ".
// Negative inputs (before 1970) are rendered with the millisecond part floored.
[[nodiscard]] std::string format_unix_millis_iso8601(std::int64_t unix_millis);

}  // namespace horaid::core
