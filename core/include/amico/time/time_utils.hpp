#pragma once

#include <chrono>
#include <cstdint>

namespace amico {

// Wall-clock point used for SystemContext start times and handler
// bookkeeping.
using Timestamp = std::chrono::system_clock::time_point;

// -------------------------------------------------------------------------
// ms_to_timestamp / timestamp_to_ms
// -------------------------------------------------------------------------
// Conversions between Timestamp and the epoch-millisecond integers used by
// ITimeProvider and the AgentEvent JSON form.
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Elapsed time as fractional milliseconds, for metrics and logs.
template <typename Rep, typename Period>
double to_millis(std::chrono::duration<Rep, Period> d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace amico
