#pragma once

#include "dtwin/domain/inventory_item.hpp"
#include "dtwin/sim/event_recorder.hpp"

#include <map>
#include <optional>
#include <string>

namespace dtwin {
namespace analysis {

using QuantityMap = std::map<std::string, int>;

// Projects an inventory onto SKU → on-hand quantity.
QuantityMap quantitiesOf(const domain::InventoryMap& inventory);

// -----------------------------------------------------------------------------
// DriftDetector — simulated vs reported stock divergence
// -----------------------------------------------------------------------------
//
// @brief  Measures how far the twin's inventory has drifted from the one the
//         ERP reports.
//
// @details
//   ratio = sum over the union of SKUs of |simulated - reported|
//           -----------------------------------------------------
//                      sum of reported quantities
// clamped to [0, 1]. A SKU missing on one side counts as 0 there. When the
// reported total is 0 the ratio is 0 if both sides agree and 1 otherwise.
//
// check() additionally records a CALIBRATION_TRIGGER event when the ratio is
// strictly above the threshold. The event is advisory; the detector never
// changes inventory.
// -----------------------------------------------------------------------------
class DriftDetector {
 public:
  explicit DriftDetector(double threshold) : threshold_(threshold) {}

  static double measure(const QuantityMap& simulated,
                        const QuantityMap& reported);

  // Measures and, above the threshold, records a trigger on `recorder`.
  double check(const QuantityMap& simulated, const QuantityMap& reported,
               sim::EventRecorder* recorder,
               std::optional<double> sim_time = std::nullopt) const;

  bool exceeds(double ratio) const { return ratio > threshold_; }
  double threshold() const { return threshold_; }

 private:
  double threshold_;
};

}  // namespace analysis
}  // namespace dtwin
