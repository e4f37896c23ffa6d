#include "dtwin/config/config_schema.hpp"
#include "dtwin/common/errors.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <sstream>

namespace dtwin {

using domain::SimulationConfig;

namespace {

// One row of the schema: a name plus typed accessors.
struct FieldAccessor {
  const char* name;
  std::function<void(SimulationConfig&, const ParamValue&)> set;
  std::function<ParamValue(const SimulationConfig&)> get;
};

double requireNumber(const char* field, const ParamValue& value) {
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  throw ConfigError(std::string("parameter '") + field +
                    "' expects a number, got string '" +
                    std::get<std::string>(value) + "'");
}

const std::string& requireString(const char* field, const ParamValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return *s;
  }
  std::ostringstream oss;
  oss << "parameter '" << field << "' expects a name, got number "
      << std::get<double>(value);
  throw ConfigError(oss.str());
}

// Integer fields accept doubles only when they hold an exact integer.
long long requireIntegral(const char* field, const ParamValue& value,
                          long long lo, long long hi) {
  double d = requireNumber(field, value);
  if (!std::isfinite(d) || std::floor(d) != d || d < static_cast<double>(lo) ||
      d > static_cast<double>(hi)) {
    std::ostringstream oss;
    oss << "parameter '" << field << "' expects an integer, got " << d;
    throw ConfigError(oss.str());
  }
  return static_cast<long long>(d);
}

FieldAccessor doubleField(const char* name, double SimulationConfig::*member) {
  return FieldAccessor{
      name,
      [name, member](SimulationConfig& c, const ParamValue& v) {
        c.*member = requireNumber(name, v);
      },
      [member](const SimulationConfig& c) { return ParamValue{c.*member}; }};
}

FieldAccessor intField(const char* name, int SimulationConfig::*member) {
  return FieldAccessor{
      name,
      [name, member](SimulationConfig& c, const ParamValue& v) {
        c.*member = static_cast<int>(
            requireIntegral(name, v, std::numeric_limits<int>::min(),
                            std::numeric_limits<int>::max()));
      },
      [member](const SimulationConfig& c) {
        return ParamValue{static_cast<double>(c.*member)};
      }};
}

// The schema, in SimulationConfig declaration order. Built once.
const std::vector<FieldAccessor>& schema() {
  static const std::vector<FieldAccessor> kSchema = [] {
    std::vector<FieldAccessor> s;
    s.push_back(doubleField("simulation_time",
                            &SimulationConfig::simulation_time));
    s.push_back(FieldAccessor{
        "time_unit",
        [](SimulationConfig& c, const ParamValue& v) {
          const std::string& name = requireString("time_unit", v);
          auto unit = domain::timeUnitFromString(name);
          if (!unit) {
            throw ConfigError("parameter 'time_unit': unknown unit '" + name +
                              "'");
          }
          c.time_unit = *unit;
        },
        [](const SimulationConfig& c) {
          return ParamValue{std::string(domain::toString(c.time_unit))};
        }});
    s.push_back(FieldAccessor{
        "random_seed",
        [](SimulationConfig& c, const ParamValue& v) {
          // 2^53 keeps every accepted seed exactly representable as double.
          c.random_seed = static_cast<std::uint64_t>(
              requireIntegral("random_seed", v, 0, 9007199254740992LL));
        },
        [](const SimulationConfig& c) {
          return ParamValue{static_cast<double>(c.random_seed)};
        }});
    s.push_back(intField("num_storage_locations",
                         &SimulationConfig::num_storage_locations));
    s.push_back(intField("num_workers", &SimulationConfig::num_workers));
    s.push_back(intField("num_forklifts", &SimulationConfig::num_forklifts));
    s.push_back(doubleField("pick_time_mean",
                            &SimulationConfig::pick_time_mean));
    s.push_back(doubleField("pick_time_std", &SimulationConfig::pick_time_std));
    s.push_back(doubleField("pack_time_mean",
                            &SimulationConfig::pack_time_mean));
    s.push_back(doubleField("pack_time_std", &SimulationConfig::pack_time_std));
    s.push_back(doubleField("transport_time_mean",
                            &SimulationConfig::transport_time_mean));
    s.push_back(doubleField("transport_time_std",
                            &SimulationConfig::transport_time_std));
    s.push_back(doubleField("ship_time_mean",
                            &SimulationConfig::ship_time_mean));
    s.push_back(doubleField("ship_time_std", &SimulationConfig::ship_time_std));
    s.push_back(doubleField("order_arrival_rate",
                            &SimulationConfig::order_arrival_rate));
    s.push_back(doubleField("items_per_order_mean",
                            &SimulationConfig::items_per_order_mean));
    s.push_back(doubleField("items_per_order_std",
                            &SimulationConfig::items_per_order_std));
    s.push_back(doubleField("erp_sync_interval",
                            &SimulationConfig::erp_sync_interval));
    s.push_back(intField("event_buffer_size",
                         &SimulationConfig::event_buffer_size));
    s.push_back(doubleField("sync_threshold",
                            &SimulationConfig::sync_threshold));
    s.push_back(intField("calibration_window",
                         &SimulationConfig::calibration_window));
    s.push_back(FieldAccessor{
        "stock_policy",
        [](SimulationConfig& c, const ParamValue& v) {
          const std::string& name = requireString("stock_policy", v);
          auto policy = domain::stockPolicyFromString(name);
          if (!policy) {
            throw ConfigError("parameter 'stock_policy': unknown policy '" +
                              name + "'");
          }
          c.stock_policy = *policy;
        },
        [](const SimulationConfig& c) {
          return ParamValue{std::string(domain::toString(c.stock_policy))};
        }});
    s.push_back(doubleField("replenishment_lead_time",
                            &SimulationConfig::replenishment_lead_time));
    s.push_back(FieldAccessor{
        "trace_resources",
        [](SimulationConfig& c, const ParamValue& v) {
          c.trace_resources = requireIntegral("trace_resources", v, 0, 1) == 1;
        },
        [](const SimulationConfig& c) {
          return ParamValue{c.trace_resources ? 1.0 : 0.0};
        }});
    return s;
  }();
  return kSchema;
}

const FieldAccessor& lookup(const std::string& name) {
  for (const auto& field : schema()) {
    if (name == field.name) {
      return field;
    }
  }
  throw ConfigError("unknown configuration parameter '" + name + "'");
}

}  // namespace

const std::vector<std::string>& parameterNames() {
  static const std::vector<std::string> kNames = [] {
    std::vector<std::string> names;
    for (const auto& field : schema()) {
      names.emplace_back(field.name);
    }
    return names;
  }();
  return kNames;
}

bool isKnownParameter(const std::string& name) {
  for (const auto& field : schema()) {
    if (name == field.name) {
      return true;
    }
  }
  return false;
}

void setParameter(SimulationConfig& config, const std::string& name,
                  const ParamValue& value) {
  lookup(name).set(config, value);
}

ParamValue getParameter(const SimulationConfig& config,
                        const std::string& name) {
  return lookup(name).get(config);
}

SimulationConfig withOverrides(const SimulationConfig& base,
                               const Overrides& overrides) {
  SimulationConfig copy = base;
  for (const auto& [name, value] : overrides) {
    setParameter(copy, name, value);
  }
  domain::validate(copy);
  return copy;
}

SimulationConfig withCalibration(const SimulationConfig& base,
                                 const CalibratedParameters& params) {
  SimulationConfig copy = base;
  for (const auto& [name, value] : params) {
    setParameter(copy, name, ParamValue{value});
  }
  domain::validate(copy);
  return copy;
}

std::string describe(const Overrides& overrides) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& [name, value] : overrides) {
    if (!first) {
      oss << ", ";
    }
    first = false;
    oss << name << "=";
    if (const auto* d = std::get_if<double>(&value)) {
      oss << *d;
    } else {
      oss << std::get<std::string>(value);
    }
  }
  return oss.str();
}

}  // namespace dtwin
