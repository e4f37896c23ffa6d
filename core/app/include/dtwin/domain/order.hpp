#pragma once

#include "dtwin/domain/order_status.hpp"
#include "dtwin/time/time_utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dtwin {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// ERP systems hand out textual ids ("ORD-000012", "SIM-000003"), so the id is
// a string rather than a counter.
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// OrderLine
// -----------------------------------------------------------------------------
// One SKU requested by an order.
//
// location is the storage slot the picker has to travel to. An empty location
// means the goods are staged at the pick face and no forklift trip is needed.
// short_picked is set when the line could not be served under the
// fail-the-line stock policy; picked_quantity then stays 0.
// -----------------------------------------------------------------------------
struct OrderLine {
  std::string sku;
  int quantity{0};
  int picked_quantity{0};
  std::string location;
  bool short_picked{false};
};

// -----------------------------------------------------------------------------
// StageTimes
// -----------------------------------------------------------------------------
// Simulated start/end of one processing stage, in the engine's time unit.
// Each field is written exactly once by the lifecycle machine; an unset
// optional means the stage has not started (or not finished) yet.
// -----------------------------------------------------------------------------
struct StageTimes {
  std::optional<double> start;
  std::optional<double> end;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  Warehouse order travelling through pick, pack and ship.
//
// @details
// Created by the ArrivalGenerator (or fetched from the ERP backlog) in status
// Received. From then on only the FulfillmentProcess mutates it, and only
// through OrderLifecycle so that status moves and stage timestamps keep their
// invariants. After completion the order is handed to the MetricsAggregator
// and dropped; nothing persists it.
//
// Priority ranges from 1 (low) to 5 (high). It decides the release order of
// an ERP backlog at the start of a run and nothing else; resource pools are
// strictly first-come first-served.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;
  std::string customer_id;
  std::vector<OrderLine> lines;
  int priority{1};
  OrderStatus status{OrderStatus::Received};

  StageTimes pick;
  StageTimes pack;
  StageTimes ship;

  Timestamp created_at{};
  std::optional<Timestamp> completed_at;

  // Sum of requested quantities over all lines.
  int totalItems() const;

  // Sum of quantities actually taken from stock.
  int pickedItems() const;

  // True once every line has been picked in full.
  bool isFullyPicked() const;

  // True if at least one line lives in a storage location that needs a
  // forklift trip.
  bool requiresTransport() const;
};

}  // namespace domain
}  // namespace dtwin
