#include "dtwin/eventbus/event_bus.hpp"

#include <algorithm>

namespace dtwin {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

EventBus::SubscriptionId EventBus::subscribeKind(EventKind kind,
                                                 GenericCallback callback) {
  GenericCallback filtered = [kind, cb = std::move(callback)](
                                 const Event& event) {
    if (kindOf(event) == kind) {
      cb(event);
    }
  };
  return subscribe(std::move(filtered));
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  for (const auto& [id, callback] : copy) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace dtwin
