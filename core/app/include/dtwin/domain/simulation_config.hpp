#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dtwin {
namespace domain {

// -----------------------------------------------------------------------------
// TimeUnit — native unit of the simulated clock
// -----------------------------------------------------------------------------
// Every duration in SimulationConfig (horizon, stage means and spreads, lead
// times) is expressed in this unit. Hourly quantities such as the arrival
// rate and the reported throughput are converted with unitsPerHour().
// -----------------------------------------------------------------------------
enum class TimeUnit {
  Seconds,
  Minutes,
  Hours,
};

const char* toString(TimeUnit unit);
std::optional<TimeUnit> timeUnitFromString(const std::string& name);

// Number of native time units in one hour (3600, 60 or 1).
double unitsPerHour(TimeUnit unit);

// -----------------------------------------------------------------------------
// StockPolicy — what a picker does when a line cannot be served
// -----------------------------------------------------------------------------
//   FailLine  The line is marked short, stock is left untouched and the order
//             continues with whatever was picked.
//   Block     The picker keeps its worker (and forklift) and waits until a
//             replenishment brings enough stock, bounded by the horizon.
//             Requires replenishment_lead_time > 0.
// Stock is never clamped: neither policy lets quantity drop below zero.
// -----------------------------------------------------------------------------
enum class StockPolicy {
  FailLine,
  Block,
};

const char* toString(StockPolicy policy);
std::optional<StockPolicy> stockPolicyFromString(const std::string& name);

// -----------------------------------------------------------------------------
// SimulationConfig — parameters of one simulation run
// -----------------------------------------------------------------------------
//
// @brief  Plain value object holding every knob that alters run behaviour.
//
// @details
// A run receives its own copy and treats it as read-only. What-if scenarios
// and sensitivity sweeps never touch a shared instance: they copy, override
// through the closed parameter schema (config_schema.hpp) and validate the
// copy. validate() must pass before a Simulation is constructed.
//
// Defaults describe an eight-hour shift in a 100-location warehouse.
// -----------------------------------------------------------------------------
struct SimulationConfig {
  // --- Simulation --------------------------------------------------------
  double simulation_time{480.0};
  TimeUnit time_unit{TimeUnit::Minutes};
  std::uint64_t random_seed{42};

  // --- Warehouse ---------------------------------------------------------
  int num_storage_locations{100};
  int num_workers{5};
  int num_forklifts{2};

  // --- Stage timing (mean / standard deviation per unit of work) ---------
  double pick_time_mean{2.0};
  double pick_time_std{0.5};
  double pack_time_mean{3.0};
  double pack_time_std{0.8};
  double transport_time_mean{1.5};
  double transport_time_std{0.3};
  double ship_time_mean{1.0};
  double ship_time_std{0.2};

  // --- Demand ------------------------------------------------------------
  double order_arrival_rate{5.0};  // orders per hour
  double items_per_order_mean{3.0};
  double items_per_order_std{1.5};

  // --- ERP integration and synchronisation -------------------------------
  double erp_sync_interval{60.0};  // seconds, wall clock
  int event_buffer_size{1000};
  double sync_threshold{0.05};     // drift ratio that triggers calibration
  int calibration_window{100};

  // --- Stock handling ----------------------------------------------------
  StockPolicy stock_policy{StockPolicy::FailLine};
  double replenishment_lead_time{30.0};  // 0 disables automatic reorder

  // --- Tracing -----------------------------------------------------------
  // Record WORKER_ASSIGNED / WORKER_RELEASED (and forklift allocation)
  // events for every grant and release.
  bool trace_resources{true};
};

// Throws ConfigError naming the first offending field.
void validate(const SimulationConfig& config);

bool operator==(const SimulationConfig& lhs, const SimulationConfig& rhs);
bool operator!=(const SimulationConfig& lhs, const SimulationConfig& rhs);

}  // namespace domain
}  // namespace dtwin
