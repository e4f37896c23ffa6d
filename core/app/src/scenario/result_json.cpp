#include "dtwin/scenario/result_json.hpp"
#include "dtwin/config/config_json.hpp"

namespace dtwin {

namespace {

nlohmann::json paramValueToJson(const ParamValue& value) {
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  return std::get<std::string>(value);
}

nlohmann::json optionalToJson(const std::optional<double>& v) {
  if (v.has_value()) {
    return *v;
  }
  return nullptr;
}

}  // namespace

nlohmann::json summaryToJson(const std::optional<sim::SummaryStats>& stats) {
  if (!stats.has_value()) {
    return nullptr;
  }
  nlohmann::json j;
  j["count"] = stats->count;
  j["mean"] = stats->mean;
  j["std"] = stats->std;
  j["min"] = stats->min;
  j["max"] = stats->max;
  j["median"] = stats->median;
  j["p90"] = stats->p90;
  j["p95"] = stats->p95;
  return j;
}

nlohmann::json metricsToJson(const sim::MetricsSnapshot& m,
                             bool include_samples) {
  nlohmann::json j;
  j["orders_created"] = m.orders_created;
  j["orders_completed"] = m.orders_completed;
  j["orders_in_progress"] = m.orders_in_progress;
  j["items_requested"] = m.items_requested;
  j["items_picked"] = m.items_picked;
  j["lines_short"] = m.lines_short;
  j["order_time"] = summaryToJson(m.order_time);
  j["wait_time"] = summaryToJson(m.wait_time);
  j["pick_time"] = summaryToJson(m.pick_time);
  j["pack_time"] = summaryToJson(m.pack_time);
  j["ship_time"] = summaryToJson(m.ship_time);
  j["throughput_per_hour"] = m.throughput_per_hour;
  j["items_per_hour"] = m.items_per_hour;
  j["worker_utilisation"] = m.worker_utilisation;
  j["forklift_utilisation"] = m.forklift_utilisation;
  if (include_samples) {
    j["samples"] = {{"order_times", m.order_times},
                    {"wait_times", m.wait_times},
                    {"pick_times", m.pick_times},
                    {"pack_times", m.pack_times},
                    {"ship_times", m.ship_times}};
  }
  return j;
}

nlohmann::json runResultToJson(const sim::RunResult& r,
                               std::size_t inventory_sample) {
  nlohmann::json j;
  j["config"] = configToJson(r.config);
  j["metrics"] = metricsToJson(r.metrics);
  j["end_time"] = r.end_time;
  j["orders_generated"] = r.orders_generated;
  j["arrivals_skipped"] = r.arrivals_skipped;
  j["backlog_released"] = r.backlog_released;
  j["replenishments"] = r.replenishments;
  j["pending_requests"] = {{"workers", r.pending_worker_requests},
                           {"forklifts", r.pending_forklift_requests},
                           {"stock", r.pending_stock_requests}};
  j["events_recorded"] = r.events_recorded;
  j["events_evicted"] = r.events_evicted;

  nlohmann::json inventory = nlohmann::json::object();
  std::size_t n = 0;
  for (const auto& [sku, item] : r.final_inventory) {
    if (inventory_sample != 0 && n++ >= inventory_sample) {
      break;
    }
    inventory[sku] = {{"name", item.name},
                      {"quantity", item.quantity},
                      {"location", item.location},
                      {"min_stock", item.min_stock},
                      {"max_stock", item.max_stock},
                      {"unit_cost", item.unit_cost}};
  }
  j["inventory_snapshot"] = std::move(inventory);
  return j;
}

nlohmann::json scenarioResultToJson(const scenario::ScenarioResult& result) {
  nlohmann::json j;
  j["scenario_params"] = overridesToJson(result.overrides);
  j["results"] = runResultToJson(result.result);
  return j;
}

nlohmann::json sweepToJson(const std::vector<scenario::SweepPoint>& points) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& p : points) {
    const auto& m = p.result.metrics;
    arr.push_back({{"parameter", p.parameter},
                   {"value", paramValueToJson(p.value)},
                   {"orders_completed", m.orders_completed},
                   {"throughput_per_hour", m.throughput_per_hour},
                   {"avg_order_time", m.order_time
                                          ? nlohmann::json(m.order_time->mean)
                                          : nlohmann::json(nullptr)},
                   {"worker_utilisation", m.worker_utilisation}});
  }
  return arr;
}

nlohmann::json comparisonToJson(const scenario::ScenarioComparison& c) {
  nlohmann::json j;
  j["baseline_throughput"] = c.baseline_throughput;
  j["scenario_throughput"] = c.scenario_throughput;
  j["throughput_change_pct"] = c.throughput_change_pct;
  j["baseline_order_time"] = optionalToJson(c.baseline_order_time);
  j["scenario_order_time"] = optionalToJson(c.scenario_order_time);
  j["order_time_change_pct"] = c.order_time_change_pct;
  j["completed_delta"] = c.completed_delta;
  return j;
}

nlohmann::json calibrationReportToJson(
    const analysis::CalibrationReport& report) {
  nlohmann::json j;
  j["calibrated_params"] = report.parameters;
  j["sample_counts"] = report.sample_counts;
  j["order_time_mean"] = optionalToJson(report.order_time_mean);
  j["num_events"] = report.num_events;
  j["sequence_gaps"] = report.sequence_gaps;
  j["orphaned_orders"] = report.orphaned_orders;
  return j;
}

}  // namespace dtwin
