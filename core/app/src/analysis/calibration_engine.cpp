#include "dtwin/analysis/calibration_engine.hpp"

#include <cmath>
#include <iostream>
#include <numeric>

namespace dtwin {
namespace analysis {

using domain::OrderStatus;

namespace {

// Boundary instant: simulated time when present, wall clock otherwise.
struct Mark {
  std::optional<double> sim_time;
  Timestamp wall{};
};

Mark markOf(const EventHeader& header) {
  return Mark{header.sim_time, header.timestamp};
}

double elapsed(const Mark& from, const Mark& to) {
  if (from.sim_time && to.sim_time) {
    return *to.sim_time - *from.sim_time;
  }
  return minutes_between(from.wall, to.wall);
}

// Boundary marks of one order, in log order.
struct OrderMarks {
  std::optional<Mark> created;
  std::optional<Mark> picked;
  std::optional<Mark> packed;
  std::optional<Mark> completed;
};

double mean(const std::vector<double>& v) {
  return std::accumulate(v.begin(), v.end(), 0.0) /
         static_cast<double>(v.size());
}

}  // namespace

double CalibrationEngine::sampleStd(const std::vector<double>& samples,
                                    double mu) {
  if (samples.size() < 2) {
    return kDefaultStd;
  }
  double sq = 0.0;
  for (double v : samples) {
    sq += (v - mu) * (v - mu);
  }
  return std::sqrt(sq / static_cast<double>(samples.size() - 1));
}

CalibrationReport CalibrationEngine::calibrate(
    const std::vector<Event>& events) const {
  CalibrationReport report;
  report.num_events = events.size();

  // --- Sequence continuity ---------------------------------------------------
  std::optional<std::uint64_t> previous;
  for (const auto& event : events) {
    std::uint64_t seq = headerOf(event).sequence_id;
    if (previous && seq > *previous + 1) {
      report.sequence_gaps += seq - *previous - 1;
    }
    previous = seq;
  }

  // --- Boundary extraction ---------------------------------------------------
  std::map<std::string, OrderMarks> orders;
  for (const auto& event : events) {
    if (const auto* created = std::get_if<OrderCreatedEvent>(&event)) {
      auto& marks = orders[created->order_id];
      if (!marks.created) {
        marks.created = markOf(created->header);
      }
      continue;
    }
    const auto* changed = std::get_if<OrderStatusChangedEvent>(&event);
    if (changed == nullptr) {
      continue;
    }
    OrderMarks& marks = orders[changed->order_id];
    Mark mark = markOf(changed->header);
    switch (changed->new_status) {
      case OrderStatus::Picked:    marks.picked = mark; break;
      case OrderStatus::Packed:    marks.packed = mark; break;
      case OrderStatus::Completed: marks.completed = mark; break;
      default: break;
    }
  }

  std::vector<double> pick, pack, ship, total;
  for (const auto& [order_id, marks] : orders) {
    bool has_boundary = marks.picked || marks.packed || marks.completed;
    if (!marks.created && has_boundary) {
      report.orphaned_orders.push_back(order_id);
    }
    if (marks.created && marks.picked) {
      pick.push_back(elapsed(*marks.created, *marks.picked));
    }
    if (marks.picked && marks.packed) {
      pack.push_back(elapsed(*marks.picked, *marks.packed));
    }
    if (marks.packed && marks.completed) {
      ship.push_back(elapsed(*marks.packed, *marks.completed));
    }
    if (marks.created && marks.completed) {
      total.push_back(elapsed(*marks.created, *marks.completed));
    }
  }

  auto estimate = [&report](const char* stage, const char* prefix,
                            const std::vector<double>& samples) {
    report.sample_counts[stage] = samples.size();
    if (samples.empty()) {
      return;
    }
    double mu = mean(samples);
    report.parameters[std::string(prefix) + "_mean"] = mu;
    report.parameters[std::string(prefix) + "_std"] = sampleStd(samples, mu);
  };
  estimate("pick", "pick_time", pick);
  estimate("pack", "pack_time", pack);
  estimate("ship", "ship_time", ship);
  report.sample_counts["order"] = total.size();
  if (!total.empty()) {
    report.order_time_mean = mean(total);
  }

  if (report.sequence_gaps > 0 || !report.orphaned_orders.empty()) {
    std::cerr << "[CalibrationEngine] WARNING: event log is incomplete: "
              << report.sequence_gaps << " missing sequence id(s), "
              << report.orphaned_orders.size()
              << " order(s) without a creation event. Estimates use the "
                 "remaining samples.\n";
  }

  std::cout << "[CalibrationEngine] Calibrated from " << report.num_events
            << " events: pick=" << pick.size() << " pack=" << pack.size()
            << " ship=" << ship.size() << " sample(s)\n";
  return report;
}

domain::SimulationConfig CalibrationEngine::apply(
    const domain::SimulationConfig& base, const CalibratedParameters& params) {
  return withCalibration(base, params);
}

}  // namespace analysis
}  // namespace dtwin
