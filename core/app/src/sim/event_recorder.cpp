#include "dtwin/sim/event_recorder.hpp"
#include "dtwin/common/errors.hpp"
#include "dtwin/time/time_utils.hpp"

#include <algorithm>

namespace dtwin {
namespace sim {

EventRecorder::EventRecorder(std::size_t capacity, const ITimeProvider& clock,
                             EventBus* bus)
    : capacity_(capacity), clock_(clock), bus_(bus) {
  if (capacity_ == 0) {
    throw ConfigError("event buffer capacity must be >= 1");
  }
}

Event EventRecorder::record(Event event, std::optional<double> sim_time) {
  {
    std::lock_guard lock(mutex_);
    EventHeader& header = headerOf(event);
    header.sequence_id = next_sequence_id_++;
    header.sim_time = sim_time;
    header.timestamp = ms_to_timestamp(clock_.now_ms());

    if (buffer_.size() == capacity_) {
      buffer_.pop_front();
      ++evicted_;
    }
    buffer_.push_back(event);
  }

  if (bus_ != nullptr) {
    bus_->publish(event);
  }
  return event;
}

std::vector<Event> EventRecorder::snapshot() const {
  std::lock_guard lock(mutex_);
  return std::vector<Event>(buffer_.begin(), buffer_.end());
}

std::vector<Event> EventRecorder::recent(std::size_t n) const {
  std::lock_guard lock(mutex_);
  std::size_t take = std::min(n, buffer_.size());
  return std::vector<Event>(buffer_.end() - static_cast<std::ptrdiff_t>(take),
                            buffer_.end());
}

std::size_t EventRecorder::size() const {
  std::lock_guard lock(mutex_);
  return buffer_.size();
}

std::uint64_t EventRecorder::totalRecorded() const {
  std::lock_guard lock(mutex_);
  return next_sequence_id_ - 1;
}

std::uint64_t EventRecorder::evicted() const {
  std::lock_guard lock(mutex_);
  return evicted_;
}

std::uint64_t EventRecorder::lastSequenceId() const {
  std::lock_guard lock(mutex_);
  return next_sequence_id_ - 1;
}

}  // namespace sim
}  // namespace dtwin
