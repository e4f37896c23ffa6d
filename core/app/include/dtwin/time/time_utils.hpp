#pragma once

#include <chrono>
#include <cstdint>

namespace dtwin {

// Wall-clock instant carried by domain records and events.
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between Timestamp and int64_t
//         milliseconds since epoch.
//
// @details
// ITimeProvider returns epoch milliseconds, event structs and domain records
// carry a Timestamp, and the JSON codec writes milliseconds. These helpers
// bridge the representations.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// minutes_between
// -------------------------------------------------------------------------
// @brief  Signed wall-clock distance from `from` to `to` in minutes.
//
// @details
// Used by calibration when an event pair carries no simulated time and the
// stage duration has to be derived from the recording timestamps.
// -------------------------------------------------------------------------
inline double minutes_between(Timestamp from, Timestamp to) {
  return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

}  // namespace dtwin
