#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/common/errors.hpp"

#include <sstream>
#include <tuple>

namespace dtwin {
namespace domain {

namespace {

// Builds "<field> must be <rule> (got <value>)" and throws ConfigError.
template <typename T>
[[noreturn]] void reject(const char* field, const char* rule, T value) {
  std::ostringstream oss;
  oss << "invalid configuration: " << field << " must be " << rule
      << " (got " << value << ")";
  throw ConfigError(oss.str());
}

void requirePositive(const char* field, double value) {
  if (!(value > 0.0)) {
    reject(field, "> 0", value);
  }
}

void requireNonNegative(const char* field, double value) {
  if (!(value >= 0.0)) {
    reject(field, ">= 0", value);
  }
}

void requireAtLeastOne(const char* field, int value) {
  if (value < 1) {
    reject(field, ">= 1", value);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// TimeUnit helpers
// -----------------------------------------------------------------------------
const char* toString(TimeUnit unit) {
  switch (unit) {
    case TimeUnit::Seconds: return "seconds";
    case TimeUnit::Minutes: return "minutes";
    case TimeUnit::Hours:   return "hours";
  }
  return "unknown";
}

std::optional<TimeUnit> timeUnitFromString(const std::string& name) {
  if (name == "seconds") return TimeUnit::Seconds;
  if (name == "minutes") return TimeUnit::Minutes;
  if (name == "hours") return TimeUnit::Hours;
  return std::nullopt;
}

double unitsPerHour(TimeUnit unit) {
  switch (unit) {
    case TimeUnit::Seconds: return 3600.0;
    case TimeUnit::Minutes: return 60.0;
    case TimeUnit::Hours:   return 1.0;
  }
  return 60.0;
}

// -----------------------------------------------------------------------------
// StockPolicy helpers
// -----------------------------------------------------------------------------
const char* toString(StockPolicy policy) {
  switch (policy) {
    case StockPolicy::FailLine: return "fail_line";
    case StockPolicy::Block:    return "block";
  }
  return "unknown";
}

std::optional<StockPolicy> stockPolicyFromString(const std::string& name) {
  if (name == "fail_line") return StockPolicy::FailLine;
  if (name == "block") return StockPolicy::Block;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// validate(): fail fast on the first field that breaks an invariant
// -----------------------------------------------------------------------------
void validate(const SimulationConfig& c) {
  requirePositive("simulation_time", c.simulation_time);

  // num_storage_locations may be 0: an empty warehouse is a legal (if dull)
  // scenario in which no order can be generated.
  if (c.num_storage_locations < 0) {
    reject("num_storage_locations", ">= 0", c.num_storage_locations);
  }
  requireAtLeastOne("num_workers", c.num_workers);
  requireAtLeastOne("num_forklifts", c.num_forklifts);

  requirePositive("pick_time_mean", c.pick_time_mean);
  requireNonNegative("pick_time_std", c.pick_time_std);
  requirePositive("pack_time_mean", c.pack_time_mean);
  requireNonNegative("pack_time_std", c.pack_time_std);
  requirePositive("transport_time_mean", c.transport_time_mean);
  requireNonNegative("transport_time_std", c.transport_time_std);
  requirePositive("ship_time_mean", c.ship_time_mean);
  requireNonNegative("ship_time_std", c.ship_time_std);

  requirePositive("order_arrival_rate", c.order_arrival_rate);
  requirePositive("items_per_order_mean", c.items_per_order_mean);
  requireNonNegative("items_per_order_std", c.items_per_order_std);

  requirePositive("erp_sync_interval", c.erp_sync_interval);
  requireAtLeastOne("event_buffer_size", c.event_buffer_size);
  if (!(c.sync_threshold >= 0.0 && c.sync_threshold <= 1.0)) {
    reject("sync_threshold", "within [0, 1]", c.sync_threshold);
  }
  requireAtLeastOne("calibration_window", c.calibration_window);
  requireNonNegative("replenishment_lead_time", c.replenishment_lead_time);
  // Without automatic reorder nothing ever wakes a blocked picker.
  if (c.stock_policy == StockPolicy::Block &&
      !(c.replenishment_lead_time > 0.0)) {
    reject("replenishment_lead_time", "> 0 when stock_policy is block",
           c.replenishment_lead_time);
  }
}

// -----------------------------------------------------------------------------
// Field-for-field equality
// -----------------------------------------------------------------------------
bool operator==(const SimulationConfig& a, const SimulationConfig& b) {
  auto tie = [](const SimulationConfig& c) {
    return std::tie(c.simulation_time, c.time_unit, c.random_seed,
                    c.num_storage_locations, c.num_workers, c.num_forklifts,
                    c.pick_time_mean, c.pick_time_std, c.pack_time_mean,
                    c.pack_time_std, c.transport_time_mean,
                    c.transport_time_std, c.ship_time_mean, c.ship_time_std,
                    c.order_arrival_rate, c.items_per_order_mean,
                    c.items_per_order_std, c.erp_sync_interval,
                    c.event_buffer_size, c.sync_threshold,
                    c.calibration_window, c.stock_policy,
                    c.replenishment_lead_time, c.trace_resources);
  };
  return tie(a) == tie(b);
}

bool operator!=(const SimulationConfig& a, const SimulationConfig& b) {
  return !(a == b);
}

}  // namespace domain
}  // namespace dtwin
