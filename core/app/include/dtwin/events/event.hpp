#pragma once

#include "dtwin/events/event_types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace dtwin {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type for everything the recorder stores and the bus
// carries. Dispatch with std::visit or std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderCreatedEvent,
    OrderStatusChangedEvent,
    InventoryUpdatedEvent,
    ResourceEvent,
    PickShortageEvent,
    CalibrationTriggerEvent>;

// -----------------------------------------------------------------------------
// EventKind
// -----------------------------------------------------------------------------
// Flat event kind as it appears in logs and telemetry. ResourceEvent maps to
// four kinds depending on resource type and action.
// -----------------------------------------------------------------------------
enum class EventKind {
  OrderCreated,
  OrderStatusChanged,
  InventoryUpdated,
  WorkerAssigned,
  WorkerReleased,
  ResourceAllocated,
  ResourceReleased,
  PickShortage,
  CalibrationTrigger,
};

// "ORDER_CREATED", "WORKER_ASSIGNED", ...
const char* toString(EventKind kind);
std::optional<EventKind> eventKindFromString(const std::string& name);

EventKind kindOf(const Event& event);

const EventHeader& headerOf(const Event& event);
EventHeader& headerOf(Event& event);

// Order the event refers to, if any.
std::optional<domain::OrderId> orderIdOf(const Event& event);

}  // namespace dtwin
