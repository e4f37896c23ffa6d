#include "dtwin/time/manual_time_provider.hpp"

namespace dtwin {

std::int64_t ManualTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void ManualTimeProvider::set_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void ManualTimeProvider::advance(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace dtwin
