#include "dtwin/scenario/scenario_runner.hpp"
#include "dtwin/common/errors.hpp"
#include "dtwin/sim/inventory.hpp"

#include <iostream>
#include <utility>

namespace dtwin {
namespace scenario {

namespace {

double percentChange(double from, double to) {
  if (from == 0.0) {
    return 0.0;
  }
  return (to - from) / from * 100.0;
}

}  // namespace

ScenarioRunner::ScenarioRunner(domain::SimulationConfig baseline,
                               InventorySource inventory,
                               const ITimeProvider& clock, EventBus* bus,
                               std::vector<domain::Order> backlog)
    : baseline_(std::move(baseline)),
      inventory_(std::move(inventory)),
      backlog_(std::move(backlog)),
      clock_(clock),
      bus_(bus) {
  domain::validate(baseline_);
  if (!inventory_) {
    inventory_ = seededInventory();
  }
}

ScenarioRunner::InventorySource ScenarioRunner::seededInventory() {
  return [](const domain::SimulationConfig& config) {
    return sim::seedInventory(config.num_storage_locations,
                              config.random_seed);
  };
}

sim::RunResult ScenarioRunner::runWith(
    const domain::SimulationConfig& config) const {
  sim::Simulation simulation(config, inventory_(config), clock_, bus_,
                             backlog_);
  return simulation.run();
}

sim::RunResult ScenarioRunner::runBaseline() const {
  return runWith(baseline_);
}

ScenarioResult ScenarioRunner::runWhatIf(const Overrides& overrides) const {
  std::cout << "[ScenarioRunner] What-if: " << describe(overrides) << "\n";
  domain::SimulationConfig config = withOverrides(baseline_, overrides);
  return ScenarioResult{overrides, runWith(config)};
}

std::vector<SweepPoint> ScenarioRunner::sweep(
    const std::string& parameter, const std::vector<ParamValue>& values) const {
  if (!isKnownParameter(parameter)) {
    throw ConfigError("unknown configuration parameter '" + parameter + "'");
  }
  std::cout << "[ScenarioRunner] Sweeping " << parameter << " over "
            << values.size() << " value(s)\n";

  std::vector<SweepPoint> points;
  points.reserve(values.size());
  for (const auto& value : values) {
    ScenarioResult run = runWhatIf(Overrides{{parameter, value}});
    points.push_back(SweepPoint{parameter, value, std::move(run.result)});
  }
  return points;
}

std::vector<SweepPoint> ScenarioRunner::sweep(
    const std::string& parameter, const std::vector<double>& values) const {
  std::vector<ParamValue> wrapped(values.begin(), values.end());
  return sweep(parameter, wrapped);
}

ScenarioComparison ScenarioRunner::compare(const sim::RunResult& baseline,
                                           const sim::RunResult& scenario) {
  ScenarioComparison c;
  c.baseline_throughput = baseline.metrics.throughput_per_hour;
  c.scenario_throughput = scenario.metrics.throughput_per_hour;
  c.throughput_change_pct =
      percentChange(c.baseline_throughput, c.scenario_throughput);
  if (baseline.metrics.order_time) {
    c.baseline_order_time = baseline.metrics.order_time->mean;
  }
  if (scenario.metrics.order_time) {
    c.scenario_order_time = scenario.metrics.order_time->mean;
  }
  if (c.baseline_order_time && c.scenario_order_time) {
    c.order_time_change_pct =
        percentChange(*c.baseline_order_time, *c.scenario_order_time);
  }
  c.completed_delta =
      scenario.metrics.orders_completed - baseline.metrics.orders_completed;
  return c;
}

}  // namespace scenario
}  // namespace dtwin
