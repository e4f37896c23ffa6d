#pragma once

#include <cstdint>

namespace dtwin {

// -----------------------------------------------------------------------------
// ITimeProvider — wall clock for event stamps
// -----------------------------------------------------------------------------
// Simulated time lives on the EventScheduler and is never read from here.
// This only supplies the wall-clock stamp every recorded event carries next
// to its simulated time, and the creation/completion stamps of orders.
//
//   LiveTimeProvider    system_clock
//   ManualTimeProvider  whatever the caller set; two runs with the same seed
//                       and the same start value record identical streams
//
// Reads may come from the simulation and the telemetry thread at once.
// Holders keep a const reference and never own the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace dtwin
