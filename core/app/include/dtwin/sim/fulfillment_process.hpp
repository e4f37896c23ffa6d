#pragma once

#include "dtwin/domain/order.hpp"
#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/sim/event_recorder.hpp"
#include "dtwin/sim/event_scheduler.hpp"
#include "dtwin/sim/inventory.hpp"
#include "dtwin/sim/metrics_aggregator.hpp"
#include "dtwin/sim/resource_pool.hpp"
#include "dtwin/sim/time_sampler.hpp"
#include "dtwin/time/i_time_provider.hpp"

#include <functional>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// SimulationContext
// -----------------------------------------------------------------------------
// Non-owning view of everything an order activity touches. Built by
// Simulation, which owns every referenced object and outlives every
// activity.
// -----------------------------------------------------------------------------
struct SimulationContext {
  const domain::SimulationConfig& config;
  EventScheduler& scheduler;
  ResourcePool& workers;
  ResourcePool& forklifts;
  Inventory& inventory;
  EventRecorder& recorder;
  MetricsAggregator& metrics;
  const ITimeProvider& clock;
};

// -----------------------------------------------------------------------------
// FulfillmentProcess — drives orders through pick, pack and ship
// -----------------------------------------------------------------------------
//
// @brief  Launches one independent activity per order and moves it through
//         the lifecycle, contending for workers, forklifts and stock.
//
// @details
// Per order:
//   1. Record ORDER_CREATED.
//   2. Acquire a worker → PICKING. For each line: if it has a storage
//      location, acquire a forklift and travel (transport time); pick
//      (pick time scaled by line quantity); take stock; return the
//      forklift. The worker is held across all lines.
//   3. PICKED, worker returned.
//   4. Acquire a worker → PACKING; pack time scaled by picked items
//      (at least 1); PACKED, worker returned.
//   5. SHIPPING; hand-off time, no resource; COMPLETED, metrics recorded.
//
// Each status change records one ORDER_STATUS_CHANGED; the transition to
// COMPLETED carries the total cycle time.
//
// Insufficient stock follows SimulationConfig::stock_policy. FailLine marks
// the line short and records PICK_SHORTAGE; Block keeps the worker and
// forklift and resumes once a replenishment covers the line. A SKU that is
// not stocked at all is always failed, since nothing can replenish it.
//
// Each activity lives in a shared_ptr captured by its pending continuations
// and pool requests; it is destroyed (returning any leases) when the last
// continuation has run or been dropped.
// -----------------------------------------------------------------------------
class FulfillmentProcess {
 public:
  explicit FulfillmentProcess(SimulationContext& ctx);

  FulfillmentProcess(const FulfillmentProcess&) = delete;
  FulfillmentProcess& operator=(const FulfillmentProcess&) = delete;

  // Starts an order at the current simulated time. `rng` supplies every
  // service-time draw of this order.
  void launch(domain::Order order, TimeSampler rng,
              EventSource source = EventSource::Simulation);

  int launched() const { return launched_; }

 private:
  SimulationContext& ctx_;
  int launched_{0};
};

}  // namespace sim
}  // namespace dtwin
