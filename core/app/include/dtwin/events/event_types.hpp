#pragma once

#include "dtwin/domain/order.hpp"
#include "dtwin/domain/order_status.hpp"
#include "dtwin/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dtwin {

// -----------------------------------------------------------------------------
// EventSource
// -----------------------------------------------------------------------------
// Where an event originated: inside a simulation run or at the ERP boundary.
// Calibration does not care, drift and telemetry subscribers sometimes do.
// -----------------------------------------------------------------------------
enum class EventSource {
  Simulation,
  Erp,
};

const char* toString(EventSource source);

// -----------------------------------------------------------------------------
// EventHeader
// -----------------------------------------------------------------------------
// Fields shared by every recorded event.
//
//   sequence_id  Strictly increasing per recorder, starting at 1. Gaps in a
//                log handed to calibration mean events were evicted or lost.
//   sim_time     Simulated clock at emission, in the run's time unit. Unset
//                for events that did not come from a simulation run.
//   timestamp    Wall-clock time at emission (from the injected
//                ITimeProvider).
// -----------------------------------------------------------------------------
struct EventHeader {
  std::uint64_t sequence_id{0};
  std::optional<double> sim_time;
  Timestamp timestamp{};
  EventSource source{EventSource::Simulation};
};

// -----------------------------------------------------------------------------
// OrderCreatedEvent
// -----------------------------------------------------------------------------
// Recorded when an order enters the warehouse (generated arrival, ERP backlog
// release or ERP-side creation). Calibration uses it as the start of the
// pick stage.
// -----------------------------------------------------------------------------
struct OrderCreatedEvent {
  EventHeader header;
  domain::OrderId order_id;
  std::string customer_id;
  int num_lines{0};
  int total_items{0};
  int priority{1};
};

// -----------------------------------------------------------------------------
// OrderStatusChangedEvent
// -----------------------------------------------------------------------------
// Exactly one per status mutation. total_time is set on the transition to
// Completed and holds the simulated cycle time from arrival to completion.
// -----------------------------------------------------------------------------
struct OrderStatusChangedEvent {
  EventHeader header;
  domain::OrderId order_id;
  domain::OrderStatus old_status{domain::OrderStatus::Received};
  domain::OrderStatus new_status{domain::OrderStatus::Received};
  std::optional<double> total_time;
};

// -----------------------------------------------------------------------------
// InventoryUpdatedEvent
// -----------------------------------------------------------------------------
// Exactly one per stock mutation. delta is signed (negative on pick);
// new_quantity is the on-hand quantity after the change and never negative.
// reason is "pick", "replenishment" or "erp_update".
// -----------------------------------------------------------------------------
struct InventoryUpdatedEvent {
  EventHeader header;
  std::string sku;
  int delta{0};
  int new_quantity{0};
  std::string reason;
  std::optional<domain::OrderId> order_id;
};

// -----------------------------------------------------------------------------
// ResourceEvent
// -----------------------------------------------------------------------------
// Grant or release of one pool unit, recorded when resource tracing is on.
// Worker events surface as WORKER_ASSIGNED / WORKER_RELEASED, forklift
// events as RESOURCE_ALLOCATED / RESOURCE_RELEASED. in_use is the pool's
// busy count after the grant or release.
// -----------------------------------------------------------------------------
enum class ResourceType {
  Worker,
  Forklift,
};

const char* toString(ResourceType type);

struct ResourceEvent {
  enum class Action { Assigned, Released };

  EventHeader header;
  ResourceType resource{ResourceType::Worker};
  Action action{Action::Assigned};
  domain::OrderId order_id;
  int in_use{0};
  int capacity{0};
};

// -----------------------------------------------------------------------------
// PickShortageEvent
// -----------------------------------------------------------------------------
// A line could not be served from stock under the fail-the-line policy.
// Stock is untouched; the line is marked short on the order.
// -----------------------------------------------------------------------------
struct PickShortageEvent {
  EventHeader header;
  domain::OrderId order_id;
  std::string sku;
  int requested{0};
  int available{0};
};

// -----------------------------------------------------------------------------
// CalibrationTriggerEvent
// -----------------------------------------------------------------------------
// Advisory: the drift detector measured a ratio above the threshold.
// Nothing in the engine reacts to it automatically.
// -----------------------------------------------------------------------------
struct CalibrationTriggerEvent {
  EventHeader header;
  double drift_ratio{0.0};
  double threshold{0.0};
};

}  // namespace dtwin
