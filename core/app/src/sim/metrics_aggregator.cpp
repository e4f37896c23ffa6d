#include "dtwin/sim/metrics_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <tuple>

namespace dtwin {
namespace sim {

bool operator==(const SummaryStats& a, const SummaryStats& b) {
  return std::tie(a.count, a.mean, a.std, a.min, a.max, a.median, a.p90,
                  a.p95) == std::tie(b.count, b.mean, b.std, b.min, b.max,
                                     b.median, b.p90, b.p95);
}

bool operator==(const MetricsSnapshot& a, const MetricsSnapshot& b) {
  auto tie = [](const MetricsSnapshot& m) {
    return std::tie(m.orders_created, m.orders_completed, m.orders_in_progress,
                    m.items_requested, m.items_picked, m.lines_short,
                    m.order_times, m.wait_times, m.pick_times, m.pack_times,
                    m.ship_times, m.order_time, m.wait_time, m.pick_time,
                    m.pack_time, m.ship_time, m.throughput_per_hour,
                    m.items_per_hour, m.worker_utilisation,
                    m.forklift_utilisation);
  };
  return tie(a) == tie(b);
}

void MetricsAggregator::orderCreated(const domain::Order& order) {
  ++orders_created_;
  items_requested_ += order.totalItems();
}

void MetricsAggregator::lineShort() { ++lines_short_; }

void MetricsAggregator::orderCompleted(const domain::Order& order,
                                       double arrived_at,
                                       double completed_at) {
  ++orders_completed_;
  items_picked_ += order.pickedItems();
  order_times_.push_back(completed_at - arrived_at);

  if (order.pick.start && order.pick.end) {
    wait_times_.push_back(*order.pick.start - arrived_at);
    pick_times_.push_back(*order.pick.end - *order.pick.start);
  }
  if (order.pack.start && order.pack.end) {
    pack_times_.push_back(*order.pack.end - *order.pack.start);
  }
  if (order.ship.start && order.ship.end) {
    ship_times_.push_back(*order.ship.end - *order.ship.start);
  }
}

double MetricsAggregator::percentile(const std::vector<double>& sorted,
                                     double p) {
  if (sorted.size() == 1) {
    return sorted.front();
  }
  double rank = (p / 100.0) * static_cast<double>(sorted.size() - 1);
  auto lo = static_cast<std::size_t>(std::floor(rank));
  auto hi = static_cast<std::size_t>(std::ceil(rank));
  double frac = rank - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

std::optional<SummaryStats> MetricsAggregator::summarize(
    std::vector<double> samples) {
  if (samples.empty()) {
    return std::nullopt;
  }
  std::sort(samples.begin(), samples.end());

  SummaryStats s;
  s.count = samples.size();
  double n = static_cast<double>(samples.size());
  s.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / n;
  if (samples.size() > 1) {
    double sq = 0.0;
    for (double v : samples) {
      sq += (v - s.mean) * (v - s.mean);
    }
    s.std = std::sqrt(sq / (n - 1.0));
  }
  s.min = samples.front();
  s.max = samples.back();
  s.median = percentile(samples, 50.0);
  s.p90 = percentile(samples, 90.0);
  s.p95 = percentile(samples, 95.0);
  return s;
}

MetricsSnapshot MetricsAggregator::finalize(double horizon,
                                            double units_per_hour,
                                            double worker_utilisation,
                                            double forklift_utilisation) const {
  MetricsSnapshot m;
  m.orders_created = orders_created_;
  m.orders_completed = orders_completed_;
  m.orders_in_progress = orders_created_ - orders_completed_;
  m.items_requested = items_requested_;
  m.items_picked = items_picked_;
  m.lines_short = lines_short_;

  m.order_times = order_times_;
  m.wait_times = wait_times_;
  m.pick_times = pick_times_;
  m.pack_times = pack_times_;
  m.ship_times = ship_times_;

  m.order_time = summarize(order_times_);
  m.wait_time = summarize(wait_times_);
  m.pick_time = summarize(pick_times_);
  m.pack_time = summarize(pack_times_);
  m.ship_time = summarize(ship_times_);

  if (m.order_time && m.order_time->mean > 0.0) {
    m.throughput_per_hour = units_per_hour / m.order_time->mean;
  }
  double horizon_hours = horizon / units_per_hour;
  if (horizon_hours > 0.0) {
    m.items_per_hour = static_cast<double>(items_picked_) / horizon_hours;
  }

  m.worker_utilisation = worker_utilisation;
  m.forklift_utilisation = forklift_utilisation;
  return m;
}

}  // namespace sim
}  // namespace dtwin
