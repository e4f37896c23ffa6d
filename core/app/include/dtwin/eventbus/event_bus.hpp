#pragma once

#include "dtwin/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace dtwin {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish/subscribe fan-out of recorded events. The
// EventRecorder publishes every event it stores; the TwinEngine, the
// telemetry bridge and tests subscribe.
//
// The simulation itself never reads from the bus. Nothing a subscriber does
// can influence event ordering inside a run.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and
// publish. Callbacks run synchronously on the publishing thread (the
// simulation thread during a run). A callback that needs to cross threads
// pushes into a ThreadSafeQueue.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  // Callback invoked only for events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Callback invoked only for events of the given flat kind
  // (e.g. WORKER_ASSIGNED, which shares a struct with three other kinds).
  SubscriptionId subscribeKind(EventKind kind, GenericCallback callback);

  void unsubscribe(SubscriptionId id);

  // Copies the subscriber list under the lock and invokes callbacks without
  // it, so a callback may publish or unsubscribe.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace dtwin
