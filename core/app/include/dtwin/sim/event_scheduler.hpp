#pragma once

#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// EventScheduler — future-event list of one simulation run
// -----------------------------------------------------------------------------
//
// @brief  Single-threaded discrete-event clock. Continuations are scheduled
//         at a simulated time and executed in (time, insertion order).
//
// @details
// Every order activity is a chain of continuations: waiting for a resource
// grant, waiting out a sampled duration and waiting for stock are all
// expressed as "schedule this callback later". Ties on time resolve in
// insertion order, so a run is reproducible for a fixed seed without any
// dependence on container iteration order or addresses.
//
// The clock only moves forward. Scheduling into the past throws
// SimulationError; a callback that throws aborts the run and the exception
// propagates out of runUntil().
//
// Thread model:
//   Not thread-safe. Owned and driven by one Simulation on one thread.
// -----------------------------------------------------------------------------
class EventScheduler {
 public:
  using Callback = std::function<void()>;

  EventScheduler() = default;

  EventScheduler(const EventScheduler&) = delete;
  EventScheduler& operator=(const EventScheduler&) = delete;

  // Current simulated time.
  double now() const { return now_; }

  // Runs `callback` after `delay` (>= 0) time units.
  void schedule(double delay, Callback callback);

  // Runs `callback` at absolute time `time` (>= now()).
  void scheduleAt(double time, Callback callback);

  // -------------------------------------------------------------------------
  // runUntil(horizon)
  // -------------------------------------------------------------------------
  // Executes every continuation whose time is strictly below `horizon`,
  // then leaves the clock at `horizon`. Continuations scheduled at or after
  // the horizon stay pending. Returns the number executed.
  // -------------------------------------------------------------------------
  std::size_t runUntil(double horizon);

  // Drops every pending continuation (and whatever they captured).
  void clear();

  std::size_t pending() const { return queue_.size(); }
  std::uint64_t executed() const { return executed_; }

 private:
  struct Entry {
    double time;
    std::uint64_t seq;
    Callback callback;
  };

  // Min-heap on (time, seq).
  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.time != b.time) {
        return a.time > b.time;
      }
      return a.seq > b.seq;
    }
  };

  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  double now_{0.0};
  std::uint64_t next_seq_{0};
  std::uint64_t executed_{0};
};

}  // namespace sim
}  // namespace dtwin
