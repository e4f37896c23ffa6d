#pragma once

#include "dtwin/eventbus/event_bus.hpp"
#include "dtwin/events/event.hpp"
#include "dtwin/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// EventRecorder — bounded, append-only event log
// -----------------------------------------------------------------------------
//
// @brief  Stamps and stores every state transition, keeping only the most
//         recent `capacity` events.
//
// @details
// record() assigns the next sequence id (starting at 1), the wall-clock
// timestamp from the injected ITimeProvider and the simulated time passed
// by the caller, stores the event and publishes it on the optional
// EventBus. When the buffer is full the oldest event is evicted; sequence
// ids keep counting, so a consumer can spot the gap.
//
// Thread model:
//   record() runs on the simulation thread. snapshot()/recent() may be
//   called from any thread (the telemetry STATUS command does). A mutex
//   guards the buffer; the bus is published to outside the lock.
//
// Ownership:
//   Borrows the time provider and the bus; both must outlive the recorder.
// -----------------------------------------------------------------------------
class EventRecorder {
 public:
  EventRecorder(std::size_t capacity, const ITimeProvider& clock,
                EventBus* bus = nullptr);

  EventRecorder(const EventRecorder&) = delete;
  EventRecorder& operator=(const EventRecorder&) = delete;

  // Stamps `event` and stores it. Returns the stamped copy.
  Event record(Event event, std::optional<double> sim_time);

  // Buffered events, oldest first.
  std::vector<Event> snapshot() const;

  // Up to `n` most recent events, oldest first.
  std::vector<Event> recent(std::size_t n) const;

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  std::uint64_t totalRecorded() const;
  std::uint64_t evicted() const;
  std::uint64_t lastSequenceId() const;

 private:
  const std::size_t capacity_;
  const ITimeProvider& clock_;
  EventBus* bus_;

  mutable std::mutex mutex_;
  std::deque<Event> buffer_;
  std::uint64_t next_sequence_id_{1};
  std::uint64_t evicted_{0};
};

}  // namespace sim
}  // namespace dtwin
