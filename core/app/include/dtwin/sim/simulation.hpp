#pragma once

#include "dtwin/domain/inventory_item.hpp"
#include "dtwin/domain/order.hpp"
#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/eventbus/event_bus.hpp"
#include "dtwin/sim/arrival_generator.hpp"
#include "dtwin/sim/event_recorder.hpp"
#include "dtwin/sim/event_scheduler.hpp"
#include "dtwin/sim/fulfillment_process.hpp"
#include "dtwin/sim/inventory.hpp"
#include "dtwin/sim/metrics_aggregator.hpp"
#include "dtwin/sim/resource_pool.hpp"
#include "dtwin/time/i_time_provider.hpp"

#include <memory>
#include <vector>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// RunResult — structured outcome of one simulation run
// -----------------------------------------------------------------------------
// Plain data. `config` is the exact configuration the run used.
// Pending requests are those still waiting when the horizon was reached;
// they are a valid outcome, not a failure.
// -----------------------------------------------------------------------------
struct RunResult {
  domain::SimulationConfig config;
  MetricsSnapshot metrics;
  domain::InventoryMap final_inventory;

  double end_time{0.0};
  int orders_generated{0};
  int arrivals_skipped{0};
  int backlog_released{0};
  int replenishments{0};

  std::size_t pending_worker_requests{0};
  std::size_t pending_forklift_requests{0};
  std::size_t pending_stock_requests{0};

  std::uint64_t events_recorded{0};
  std::uint64_t events_evicted{0};
};

// -----------------------------------------------------------------------------
// Simulation — one self-contained run
// -----------------------------------------------------------------------------
//
// @brief  Owns the scheduler, the two resource pools, the run's inventory,
//         the event recorder and the metrics of exactly one run.
//
// @details
// The constructor validates the configuration (ConfigError before anything
// is scheduled) and copies it; nothing outside the Simulation can change it
// afterwards. run() may be called once:
//
//   t = 0   ERP backlog orders (status Received) are launched, highest
//           priority first, ties in fetch order.
//   t > 0   Poisson arrivals until the horizon.
//   end     Metrics are finalized from whatever completed; activities still
//           in flight are torn down with their leases returned.
//
// Teardown order (also on exceptions and in the destructor): close the
// pools and the inventory so nothing new is granted, then drop every
// pending continuation. Activities die with their continuations and return
// their leases to pools that are still alive.
//
// Thread model:
//   Single-threaded. Independent Simulation objects may run on different
//   threads provided each has its own EventBus (or none).
// -----------------------------------------------------------------------------
class Simulation {
 public:
  Simulation(domain::SimulationConfig config, domain::InventoryMap inventory,
             const ITimeProvider& clock, EventBus* bus = nullptr,
             std::vector<domain::Order> backlog = {});
  ~Simulation();

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  RunResult run();

  const domain::SimulationConfig& config() const { return config_; }
  const EventRecorder& recorder() const { return recorder_; }
  std::vector<Event> events() const { return recorder_.snapshot(); }

 private:
  void releaseBacklog();
  void traceResource(ResourceType type, ResourcePool::Change change,
                     const std::string& holder, int in_use, int capacity);
  void shutdown();

  const domain::SimulationConfig config_;
  const ITimeProvider& clock_;

  // Declaration order matters: the scheduler outlives the pools and the
  // inventory that hold references to it.
  EventScheduler scheduler_;
  EventRecorder recorder_;
  ResourcePool workers_;
  ResourcePool forklifts_;
  Inventory inventory_;
  MetricsAggregator metrics_;
  SimulationContext ctx_;
  FulfillmentProcess fulfillment_;
  ArrivalGenerator arrivals_;

  std::vector<domain::Order> backlog_;
  bool started_{false};
  bool shut_down_{false};
};

// Validates `config` and runs one simulation on a fresh copy of `inventory`.
RunResult runSimulation(const domain::SimulationConfig& config,
                        const domain::InventoryMap& inventory,
                        const ITimeProvider& clock, EventBus* bus = nullptr);

}  // namespace sim
}  // namespace dtwin
