#pragma once

#include "dtwin/analysis/calibration_engine.hpp"
#include "dtwin/scenario/scenario_runner.hpp"
#include "dtwin/sim/metrics_aggregator.hpp"
#include "dtwin/sim/simulation.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>

namespace dtwin {

// -----------------------------------------------------------------------------
// Result records as JSON
// -----------------------------------------------------------------------------
// Structured, lossless views of the plain result structs for the demo
// binary and the telemetry command socket. Missing aggregates are null.
// RunResult's inventory is truncated to the first `inventory_sample` SKUs
// (0 = all) to keep messages small.
// -----------------------------------------------------------------------------

nlohmann::json summaryToJson(const std::optional<sim::SummaryStats>& stats);

nlohmann::json metricsToJson(const sim::MetricsSnapshot& metrics,
                             bool include_samples = false);

nlohmann::json runResultToJson(const sim::RunResult& result,
                               std::size_t inventory_sample = 10);

nlohmann::json scenarioResultToJson(const scenario::ScenarioResult& result);

nlohmann::json sweepToJson(const std::vector<scenario::SweepPoint>& points);

nlohmann::json comparisonToJson(const scenario::ScenarioComparison& c);

nlohmann::json calibrationReportToJson(
    const analysis::CalibrationReport& report);

}  // namespace dtwin
