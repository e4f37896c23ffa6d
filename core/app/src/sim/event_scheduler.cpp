#include "dtwin/sim/event_scheduler.hpp"
#include "dtwin/common/errors.hpp"

#include <cmath>
#include <sstream>

namespace dtwin {
namespace sim {

void EventScheduler::schedule(double delay, Callback callback) {
  if (!(delay >= 0.0) || !std::isfinite(delay)) {
    std::ostringstream oss;
    oss << "cannot schedule with delay " << delay << " at t=" << now_;
    throw SimulationError(oss.str());
  }
  scheduleAt(now_ + delay, std::move(callback));
}

void EventScheduler::scheduleAt(double time, Callback callback) {
  if (time < now_ || !std::isfinite(time)) {
    std::ostringstream oss;
    oss << "cannot schedule at t=" << time << " (clock is at " << now_ << ")";
    throw SimulationError(oss.str());
  }
  queue_.push(Entry{time, next_seq_++, std::move(callback)});
}

std::size_t EventScheduler::runUntil(double horizon) {
  std::size_t count = 0;
  while (!queue_.empty() && queue_.top().time < horizon) {
    // top() is const; copy the entry out before popping so the callback
    // may schedule further work.
    Entry entry = queue_.top();
    queue_.pop();
    now_ = entry.time;
    entry.callback();
    ++count;
    ++executed_;
  }
  if (horizon > now_) {
    now_ = horizon;
  }
  return count;
}

void EventScheduler::clear() {
  // Swap into a local so callbacks destroyed here cannot observe a
  // half-cleared queue.
  std::priority_queue<Entry, std::vector<Entry>, Later> doomed;
  doomed.swap(queue_);
}

}  // namespace sim
}  // namespace dtwin
