#pragma once

#include "dtwin/config/config_schema.hpp"
#include "dtwin/domain/inventory_item.hpp"
#include "dtwin/domain/order.hpp"
#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/eventbus/event_bus.hpp"
#include "dtwin/sim/simulation.hpp"
#include "dtwin/time/i_time_provider.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dtwin {
namespace scenario {

// Overrides applied and the run they produced.
struct ScenarioResult {
  Overrides overrides;
  sim::RunResult result;
};

// One point of a sensitivity sweep.
struct SweepPoint {
  std::string parameter;
  ParamValue value;
  sim::RunResult result;
};

// Scenario relative to baseline. Percentages are (scenario - baseline) /
// baseline * 100, and 0 when the baseline value is 0.
struct ScenarioComparison {
  double baseline_throughput{0.0};
  double scenario_throughput{0.0};
  double throughput_change_pct{0.0};
  std::optional<double> baseline_order_time;
  std::optional<double> scenario_order_time;
  double order_time_change_pct{0.0};
  int completed_delta{0};
};

// -----------------------------------------------------------------------------
// ScenarioRunner — isolated what-if runs and sensitivity sweeps
// -----------------------------------------------------------------------------
//
// @brief  Runs the model under transient overrides without ever touching
//         the baseline configuration.
//
// @details
// The runner holds its baseline by value and only ever reads it. A what-if
// run copies the baseline, applies the overrides through the closed schema,
// validates the copy and hands it to a brand-new Simulation: fresh pools,
// fresh metrics, fresh inventory from the InventorySource. Because nothing
// shared is mutated there is nothing to restore, on success or on failure;
// errors simply propagate (ConfigError for bad overrides, whatever the
// inventory source or the run throws otherwise).
//
// sweep() is runWhatIf() once per value, in the given order, each point
// starting from the baseline again.
//
// Thread model:
//   All methods are const and share no mutable state; concurrent calls are
//   safe as long as the InventorySource and the EventBus are.
// -----------------------------------------------------------------------------
class ScenarioRunner {
 public:
  // Produces the starting inventory for a run configured with `config`.
  using InventorySource =
      std::function<domain::InventoryMap(const domain::SimulationConfig&)>;

  ScenarioRunner(domain::SimulationConfig baseline, InventorySource inventory,
                 const ITimeProvider& clock, EventBus* bus = nullptr,
                 std::vector<domain::Order> backlog = {});

  // Seeded synthetic inventory sized by num_storage_locations.
  static InventorySource seededInventory();

  const domain::SimulationConfig& baseline() const { return baseline_; }

  sim::RunResult runBaseline() const;

  ScenarioResult runWhatIf(const Overrides& overrides) const;

  std::vector<SweepPoint> sweep(const std::string& parameter,
                                const std::vector<ParamValue>& values) const;

  // Convenience for numeric parameters.
  std::vector<SweepPoint> sweep(const std::string& parameter,
                                const std::vector<double>& values) const;

  static ScenarioComparison compare(const sim::RunResult& baseline,
                                    const sim::RunResult& scenario);

 private:
  sim::RunResult runWith(const domain::SimulationConfig& config) const;

  const domain::SimulationConfig baseline_;
  InventorySource inventory_;
  // Orders released at t=0 of every run, baseline and what-if alike.
  const std::vector<domain::Order> backlog_;
  const ITimeProvider& clock_;
  EventBus* bus_;
};

}  // namespace scenario
}  // namespace dtwin
