#include "dtwin/analysis/drift_detector.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>

namespace dtwin {
namespace analysis {

QuantityMap quantitiesOf(const domain::InventoryMap& inventory) {
  QuantityMap out;
  for (const auto& [sku, item] : inventory) {
    out.emplace(sku, item.quantity);
  }
  return out;
}

double DriftDetector::measure(const QuantityMap& simulated,
                              const QuantityMap& reported) {
  std::set<std::string> skus;
  for (const auto& [sku, qty] : simulated) skus.insert(sku);
  for (const auto& [sku, qty] : reported) skus.insert(sku);

  auto lookup = [](const QuantityMap& m, const std::string& sku) -> long long {
    auto it = m.find(sku);
    return it == m.end() ? 0 : it->second;
  };

  long long diff = 0;
  long long reported_total = 0;
  for (const auto& sku : skus) {
    long long sim_qty = lookup(simulated, sku);
    long long rep_qty = lookup(reported, sku);
    diff += std::llabs(sim_qty - rep_qty);
    reported_total += rep_qty;
  }

  if (reported_total <= 0) {
    return diff == 0 ? 0.0 : 1.0;
  }
  double ratio = static_cast<double>(diff) / static_cast<double>(reported_total);
  return std::clamp(ratio, 0.0, 1.0);
}

double DriftDetector::check(const QuantityMap& simulated,
                            const QuantityMap& reported,
                            sim::EventRecorder* recorder,
                            std::optional<double> sim_time) const {
  double ratio = measure(simulated, reported);
  if (exceeds(ratio)) {
    std::cout << "[DriftDetector] Drift " << ratio << " exceeds threshold "
              << threshold_ << ", calibration advised\n";
    if (recorder != nullptr) {
      CalibrationTriggerEvent trigger;
      trigger.drift_ratio = ratio;
      trigger.threshold = threshold_;
      recorder->record(trigger, sim_time);
    }
  }
  return ratio;
}

}  // namespace analysis
}  // namespace dtwin
