#include "dtwin/events/event.hpp"

#include <type_traits>

namespace dtwin {

const char* toString(EventSource source) {
  switch (source) {
    case EventSource::Simulation: return "simulation";
    case EventSource::Erp:        return "erp";
  }
  return "unknown";
}

const char* toString(ResourceType type) {
  switch (type) {
    case ResourceType::Worker:   return "worker";
    case ResourceType::Forklift: return "forklift";
  }
  return "unknown";
}

const char* toString(EventKind kind) {
  switch (kind) {
    case EventKind::OrderCreated:       return "ORDER_CREATED";
    case EventKind::OrderStatusChanged: return "ORDER_STATUS_CHANGED";
    case EventKind::InventoryUpdated:   return "INVENTORY_UPDATED";
    case EventKind::WorkerAssigned:     return "WORKER_ASSIGNED";
    case EventKind::WorkerReleased:     return "WORKER_RELEASED";
    case EventKind::ResourceAllocated:  return "RESOURCE_ALLOCATED";
    case EventKind::ResourceReleased:   return "RESOURCE_RELEASED";
    case EventKind::PickShortage:       return "PICK_SHORTAGE";
    case EventKind::CalibrationTrigger: return "CALIBRATION_TRIGGER";
  }
  return "UNKNOWN";
}

std::optional<EventKind> eventKindFromString(const std::string& name) {
  static const EventKind kAll[] = {
      EventKind::OrderCreated,      EventKind::OrderStatusChanged,
      EventKind::InventoryUpdated,  EventKind::WorkerAssigned,
      EventKind::WorkerReleased,    EventKind::ResourceAllocated,
      EventKind::ResourceReleased,  EventKind::PickShortage,
      EventKind::CalibrationTrigger};
  for (EventKind kind : kAll) {
    if (name == toString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

EventKind kindOf(const Event& event) {
  return std::visit(
      [](const auto& e) -> EventKind {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OrderCreatedEvent>) {
          return EventKind::OrderCreated;
        } else if constexpr (std::is_same_v<T, OrderStatusChangedEvent>) {
          return EventKind::OrderStatusChanged;
        } else if constexpr (std::is_same_v<T, InventoryUpdatedEvent>) {
          return EventKind::InventoryUpdated;
        } else if constexpr (std::is_same_v<T, ResourceEvent>) {
          bool assigned = e.action == ResourceEvent::Action::Assigned;
          if (e.resource == ResourceType::Worker) {
            return assigned ? EventKind::WorkerAssigned
                            : EventKind::WorkerReleased;
          }
          return assigned ? EventKind::ResourceAllocated
                          : EventKind::ResourceReleased;
        } else if constexpr (std::is_same_v<T, PickShortageEvent>) {
          return EventKind::PickShortage;
        } else {
          return EventKind::CalibrationTrigger;
        }
      },
      event);
}

const EventHeader& headerOf(const Event& event) {
  return std::visit(
      [](const auto& e) -> const EventHeader& { return e.header; }, event);
}

EventHeader& headerOf(Event& event) {
  return std::visit([](auto& e) -> EventHeader& { return e.header; }, event);
}

std::optional<domain::OrderId> orderIdOf(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<domain::OrderId> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, InventoryUpdatedEvent>) {
          return e.order_id;
        } else if constexpr (std::is_same_v<T, CalibrationTriggerEvent>) {
          return std::nullopt;
        } else {
          if (e.order_id.empty()) {
            return std::nullopt;
          }
          return e.order_id;
        }
      },
      event);
}

}  // namespace dtwin
