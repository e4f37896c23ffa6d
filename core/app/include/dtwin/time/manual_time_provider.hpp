#pragma once

#include "dtwin/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace dtwin {

// -----------------------------------------------------------------------------
// ManualTimeProvider — caller-driven wall clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the caller last set.
//
// @details
// Determinism tests inject one instance per run, both starting from the same
// value, so that recorded events agree on their wall-clock stamps as well as
// on everything else. Calibration tests use set_time()/advance() to build
// event logs whose stage durations come purely from the wall clock.
//
// Thread model:
//   Reads and writes go through std::atomic<int64_t>; no mutex needed.
// -----------------------------------------------------------------------------
class ManualTimeProvider final : public ITimeProvider {
 public:
  ManualTimeProvider() = default;
  explicit ManualTimeProvider(std::int64_t start_ms) : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is the caller's responsibility.
  void set_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace dtwin
