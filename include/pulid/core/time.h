#pragma once

#include <chrono>
#include <cstdint>

namespace pulid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
// Millisecond-precision time point. Covers the full 48-bit identifier time range, which
// overflows the nanosecond ticks of Timestamp past year 2262.
using TimestampMs = std::chrono::time_point<Clock, std::chrono::milliseconds>;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline std::int64_t to_unix_millis(const TimestampMs ts) { return ts.time_since_epoch().count(); }

inline TimestampMs from_unix_millis(const std::uint64_t ms) {
  return TimestampMs{std::chrono::milliseconds{static_cast<std::int64_t>(ms)}};
}

}  // namespace pulid::core
