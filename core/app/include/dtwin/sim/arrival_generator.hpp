#pragma once

#include "dtwin/domain/order.hpp"
#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/sim/event_scheduler.hpp"
#include "dtwin/sim/inventory.hpp"
#include "dtwin/sim/time_sampler.hpp"
#include "dtwin/time/i_time_provider.hpp"

#include <functional>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// ArrivalGenerator — Poisson order source
// -----------------------------------------------------------------------------
//
// @brief  Schedules arrivals with exponential gaps for the whole horizon
//         and hands every new order to a sink.
//
// @details
// Rate per time unit = order_arrival_rate / unitsPerHour(time_unit); the
// conversion is done once in the constructor. Gaps come from the arrival
// stream; the content of order k (SKUs, quantities, customer, priority)
// and all of its later service times come from its own order stream, so
// that changing a capacity never reshuffles demand.
//
// Order content:
//   lines     max(1, floor(sample(items_per_order_mean, items_per_order_std)))
//             distinct SKUs drawn without replacement from in-stock SKUs
//             (capped at the number in stock)
//   quantity  uniform 1..3 per line
//   customer  CUST-0001 .. CUST-0100
//   priority  uniform 1..5
//   id        SIM-000001, SIM-000002, ...
// If nothing is in stock the arrival is skipped (counted, not an error).
// -----------------------------------------------------------------------------
class ArrivalGenerator {
 public:
  using Sink = std::function<void(domain::Order, TimeSampler)>;

  ArrivalGenerator(const domain::SimulationConfig& config,
                   EventScheduler& scheduler, const Inventory& inventory,
                   const ITimeProvider& clock, Sink sink);

  ArrivalGenerator(const ArrivalGenerator&) = delete;
  ArrivalGenerator& operator=(const ArrivalGenerator&) = delete;

  // Schedules the first arrival. Call once, at t = 0.
  void start();

  double ratePerUnit() const { return rate_per_unit_; }
  int generated() const { return generated_; }
  int skipped() const { return skipped_; }

 private:
  void scheduleNext();
  void arrive();
  domain::Order makeOrder(TimeSampler& rng, std::uint64_t index) const;

  const domain::SimulationConfig& config_;
  EventScheduler& scheduler_;
  const Inventory& inventory_;
  const ITimeProvider& clock_;
  Sink sink_;

  TimeSampler arrivals_;
  double rate_per_unit_;
  std::uint64_t next_index_{1};
  int generated_{0};
  int skipped_{0};
};

}  // namespace sim
}  // namespace dtwin
