#pragma once

#include "dtwin/domain/order.hpp"

#include <optional>
#include <vector>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// SummaryStats — descriptive statistics of one sample sequence
// -----------------------------------------------------------------------------
// std is the sample standard deviation (n - 1); 0 for a single sample.
// Percentiles use linear interpolation between closest ranks.
// -----------------------------------------------------------------------------
struct SummaryStats {
  std::size_t count{0};
  double mean{0.0};
  double std{0.0};
  double min{0.0};
  double max{0.0};
  double median{0.0};
  double p90{0.0};
  double p95{0.0};
};

// -----------------------------------------------------------------------------
// MetricsSnapshot — immutable result of one run
// -----------------------------------------------------------------------------
// Sample vectors are in completion order. Aggregates are unset when their
// sample vector is empty. Throughput is per hour:
//   throughput_per_hour = unitsPerHour / mean order time
//   items_per_hour      = items picked by completed orders / horizon hours
// Both are 0 when nothing completed.
// -----------------------------------------------------------------------------
struct MetricsSnapshot {
  int orders_created{0};
  int orders_completed{0};
  int orders_in_progress{0};
  int items_requested{0};
  int items_picked{0};
  int lines_short{0};

  std::vector<double> order_times;
  std::vector<double> wait_times;
  std::vector<double> pick_times;
  std::vector<double> pack_times;
  std::vector<double> ship_times;

  std::optional<SummaryStats> order_time;
  std::optional<SummaryStats> wait_time;
  std::optional<SummaryStats> pick_time;
  std::optional<SummaryStats> pack_time;
  std::optional<SummaryStats> ship_time;

  double throughput_per_hour{0.0};
  double items_per_hour{0.0};

  double worker_utilisation{0.0};
  double forklift_utilisation{0.0};
};

bool operator==(const SummaryStats& lhs, const SummaryStats& rhs);
bool operator==(const MetricsSnapshot& lhs, const MetricsSnapshot& rhs);

// -----------------------------------------------------------------------------
// MetricsAggregator
// -----------------------------------------------------------------------------
// Accumulates counts and samples while a run is in progress; finalize()
// derives the aggregates and returns a snapshot. The aggregator belongs to
// exactly one run.
// -----------------------------------------------------------------------------
class MetricsAggregator {
 public:
  void orderCreated(const domain::Order& order);
  void lineShort();

  // `arrived_at` is the simulated arrival time of the order.
  void orderCompleted(const domain::Order& order, double arrived_at,
                      double completed_at);

  int ordersCompleted() const { return orders_completed_; }
  int ordersInProgress() const { return orders_created_ - orders_completed_; }

  MetricsSnapshot finalize(double horizon, double units_per_hour,
                           double worker_utilisation,
                           double forklift_utilisation) const;

  static std::optional<SummaryStats> summarize(std::vector<double> samples);

  // p in [0, 100]; `sorted` must be non-empty and ascending.
  static double percentile(const std::vector<double>& sorted, double p);

 private:
  int orders_created_{0};
  int orders_completed_{0};
  int items_requested_{0};
  int items_picked_{0};
  int lines_short_{0};

  std::vector<double> order_times_;
  std::vector<double> wait_times_;
  std::vector<double> pick_times_;
  std::vector<double> pack_times_;
  std::vector<double> ship_times_;
};

}  // namespace sim
}  // namespace dtwin
