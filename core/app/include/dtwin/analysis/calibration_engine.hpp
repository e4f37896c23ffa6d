#pragma once

#include "dtwin/config/config_schema.hpp"
#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/events/event.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dtwin {
namespace analysis {

// -----------------------------------------------------------------------------
// CalibrationReport
// -----------------------------------------------------------------------------
// parameters     Estimated schema fields (pick/pack/ship mean and std). A
//                stage with no samples contributes no entry.
// sample_counts  Number of duration samples per stage ("pick", "pack",
//                "ship", "order").
// order_time     Mean created → completed time, when any order completed.
// sequence_gaps  Number of sequence ids missing between the first and last
//                event (events evicted from the ring buffer or lost).
// orphaned_orders Orders that have stage boundary events but no creation
//                event, typically because their creation was evicted.
// -----------------------------------------------------------------------------
struct CalibrationReport {
  CalibratedParameters parameters;
  std::map<std::string, std::size_t> sample_counts;
  std::optional<double> order_time_mean;
  std::size_t num_events{0};
  std::uint64_t sequence_gaps{0};
  std::vector<std::string> orphaned_orders;
};

// -----------------------------------------------------------------------------
// CalibrationEngine — timing parameters from historical events
// -----------------------------------------------------------------------------
//
// @brief  Estimates per-stage duration mean and standard deviation from an
//         ordered event log.
//
// @details
// Stage boundaries per order:
//   pick  ORDER_CREATED            → status PICKED     (pick_time_*)
//   pack  status PICKED            → status PACKED     (pack_time_*)
//   ship  status PACKED            → status COMPLETED  (ship_time_*)
// A duration uses simulated time when both boundary events carry it and
// wall-clock minutes otherwise.
//
// Estimates: arithmetic mean and sample standard deviation (n - 1). A stage
// with a single sample gets std = kDefaultStd. Small samples are accepted;
// deciding whether to trust them (>= 30 orders is a sensible floor) is the
// caller's business.
//
// Gaps: if sequence ids are not contiguous, or an order has boundary events
// but no creation event, a WARNING is logged and the counts are reported.
// Calibration still completes on whatever data is present.
//
// calibrate() never touches a configuration. apply() is the separate,
// explicit step that produces a new validated configuration.
// -----------------------------------------------------------------------------
class CalibrationEngine {
 public:
  static constexpr double kDefaultStd = 0.5;

  CalibrationReport calibrate(const std::vector<Event>& events) const;

  // Copy of `base` with `params` applied through the closed schema.
  static domain::SimulationConfig apply(const domain::SimulationConfig& base,
                                        const CalibratedParameters& params);

  // Sample standard deviation; kDefaultStd for fewer than two samples.
  static double sampleStd(const std::vector<double>& samples, double mean);
};

}  // namespace analysis
}  // namespace dtwin
