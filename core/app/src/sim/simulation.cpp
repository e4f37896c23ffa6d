#include "dtwin/sim/simulation.hpp"
#include "dtwin/common/errors.hpp"

#include <algorithm>
#include <iostream>

namespace dtwin {
namespace sim {

namespace {

// Validates before any member that depends on the configuration is built.
domain::SimulationConfig validated(domain::SimulationConfig config) {
  domain::validate(config);
  return config;
}

}  // namespace

Simulation::Simulation(domain::SimulationConfig config,
                       domain::InventoryMap inventory,
                       const ITimeProvider& clock, EventBus* bus,
                       std::vector<domain::Order> backlog)
    : config_(validated(std::move(config))),
      clock_(clock),
      recorder_(static_cast<std::size_t>(config_.event_buffer_size), clock,
                bus),
      workers_("workers", config_.num_workers, scheduler_),
      forklifts_("forklifts", config_.num_forklifts, scheduler_),
      inventory_(std::move(inventory), scheduler_, recorder_,
                 config_.replenishment_lead_time),
      ctx_{config_,   scheduler_, workers_, forklifts_,
           inventory_, recorder_,  metrics_, clock_},
      fulfillment_(ctx_),
      arrivals_(config_, scheduler_, inventory_, clock_,
                [this](domain::Order order, TimeSampler rng) {
                  fulfillment_.launch(std::move(order), std::move(rng));
                }),
      backlog_(std::move(backlog)) {
  if (config_.trace_resources) {
    workers_.setTraceHook([this](ResourcePool::Change change,
                                 const std::string& holder, int in_use) {
      traceResource(ResourceType::Worker, change, holder, in_use,
                    workers_.capacity());
    });
    forklifts_.setTraceHook([this](ResourcePool::Change change,
                                   const std::string& holder, int in_use) {
      traceResource(ResourceType::Forklift, change, holder, in_use,
                    forklifts_.capacity());
    });
  }
}

Simulation::~Simulation() { shutdown(); }

void Simulation::traceResource(ResourceType type, ResourcePool::Change change,
                               const std::string& holder, int in_use,
                               int capacity) {
  ResourceEvent event;
  event.resource = type;
  event.action = change == ResourcePool::Change::Granted
                     ? ResourceEvent::Action::Assigned
                     : ResourceEvent::Action::Released;
  event.order_id = holder;
  event.in_use = in_use;
  event.capacity = capacity;
  recorder_.record(event, scheduler_.now());
}

void Simulation::releaseBacklog() {
  std::stable_sort(backlog_.begin(), backlog_.end(),
                   [](const domain::Order& a, const domain::Order& b) {
                     return a.priority > b.priority;
                   });
  std::uint64_t index = 0;
  for (auto& order : backlog_) {
    TimeSampler rng(config_.random_seed, TimeSampler::kBacklogStream, index++);
    fulfillment_.launch(std::move(order), std::move(rng), EventSource::Erp);
  }
  backlog_.clear();
}

RunResult Simulation::run() {
  if (started_) {
    throw SimulationError("a Simulation can only be run once");
  }
  started_ = true;

  std::cout << "[Simulation] Starting run: horizon=" << config_.simulation_time
            << " " << domain::toString(config_.time_unit)
            << " workers=" << config_.num_workers
            << " forklifts=" << config_.num_forklifts
            << " rate=" << config_.order_arrival_rate << "/h"
            << " seed=" << config_.random_seed << "\n";

  RunResult result;
  try {
    std::size_t backlog_size = backlog_.size();
    releaseBacklog();
    arrivals_.start();
    scheduler_.runUntil(config_.simulation_time);

    double units_per_hour = domain::unitsPerHour(config_.time_unit);
    result.config = config_;
    result.metrics = metrics_.finalize(
        config_.simulation_time, units_per_hour,
        workers_.utilisation(config_.simulation_time),
        forklifts_.utilisation(config_.simulation_time));
    result.final_inventory = inventory_.items();
    result.end_time = scheduler_.now();
    result.orders_generated = arrivals_.generated();
    result.arrivals_skipped = arrivals_.skipped();
    result.backlog_released = static_cast<int>(backlog_size);
    result.replenishments = inventory_.replenishments();
    result.pending_worker_requests = workers_.queueLength();
    result.pending_forklift_requests = forklifts_.queueLength();
    result.pending_stock_requests = inventory_.waitingRequests();
  } catch (const std::exception& e) {
    std::cerr << "[Simulation] ERROR: run aborted at t=" << scheduler_.now()
              << ": " << e.what() << "\n";
    shutdown();
    throw;
  }

  shutdown();
  result.events_recorded = recorder_.totalRecorded();
  result.events_evicted = recorder_.evicted();

  std::cout << "[Simulation] Run complete: "
            << result.metrics.orders_completed << " of "
            << result.metrics.orders_created << " orders completed, "
            << result.metrics.orders_in_progress << " in progress, "
            << result.metrics.lines_short << " short line(s), throughput "
            << result.metrics.throughput_per_hour << "/h\n";
  return result;
}

void Simulation::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  workers_.close();
  forklifts_.close();
  inventory_.close();
  scheduler_.clear();
}

RunResult runSimulation(const domain::SimulationConfig& config,
                        const domain::InventoryMap& inventory,
                        const ITimeProvider& clock, EventBus* bus) {
  Simulation simulation(config, inventory, clock, bus);
  return simulation.run();
}

}  // namespace sim
}  // namespace dtwin
