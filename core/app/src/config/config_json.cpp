#include "dtwin/config/config_json.hpp"
#include "dtwin/common/errors.hpp"

#include <fstream>
#include <iostream>

namespace dtwin {

using domain::SimulationConfig;

nlohmann::json configToJson(const SimulationConfig& c) {
  nlohmann::json j;
  j["simulation_time"] = c.simulation_time;
  j["time_unit"] = domain::toString(c.time_unit);
  j["random_seed"] = c.random_seed;
  j["num_storage_locations"] = c.num_storage_locations;
  j["num_workers"] = c.num_workers;
  j["num_forklifts"] = c.num_forklifts;
  j["pick_time_mean"] = c.pick_time_mean;
  j["pick_time_std"] = c.pick_time_std;
  j["pack_time_mean"] = c.pack_time_mean;
  j["pack_time_std"] = c.pack_time_std;
  j["transport_time_mean"] = c.transport_time_mean;
  j["transport_time_std"] = c.transport_time_std;
  j["ship_time_mean"] = c.ship_time_mean;
  j["ship_time_std"] = c.ship_time_std;
  j["order_arrival_rate"] = c.order_arrival_rate;
  j["items_per_order_mean"] = c.items_per_order_mean;
  j["items_per_order_std"] = c.items_per_order_std;
  j["erp_sync_interval"] = c.erp_sync_interval;
  j["event_buffer_size"] = c.event_buffer_size;
  j["sync_threshold"] = c.sync_threshold;
  j["calibration_window"] = c.calibration_window;
  j["stock_policy"] = domain::toString(c.stock_policy);
  j["replenishment_lead_time"] = c.replenishment_lead_time;
  j["trace_resources"] = c.trace_resources;
  return j;
}

Overrides overridesFromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("configuration document must be a JSON object");
  }
  Overrides out;
  for (const auto& [key, value] : doc.items()) {
    if (!isKnownParameter(key)) {
      throw ConfigError("unknown configuration parameter '" + key + "'");
    }
    if (value.is_boolean()) {
      out[key] = value.get<bool>() ? 1.0 : 0.0;
    } else if (value.is_number()) {
      out[key] = value.get<double>();
    } else if (value.is_string()) {
      out[key] = value.get<std::string>();
    } else {
      throw ConfigError("parameter '" + key +
                        "' must be a number, boolean or string");
    }
  }
  return out;
}

nlohmann::json overridesToJson(const Overrides& overrides) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [name, value] : overrides) {
    if (const auto* d = std::get_if<double>(&value)) {
      j[name] = *d;
    } else {
      j[name] = std::get<std::string>(value);
    }
  }
  return j;
}

SimulationConfig configFromJson(const nlohmann::json& doc,
                                const SimulationConfig& base) {
  return withOverrides(base, overridesFromJson(doc));
}

SimulationConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("malformed configuration file '" + path +
                      "': " + e.what());
  }

  SimulationConfig config = configFromJson(doc);
  std::cout << "[Config] Loaded " << doc.size() << " field(s) from " << path
            << "\n";
  return config;
}

void saveConfigFile(const SimulationConfig& config, const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    throw ConfigError("cannot write configuration file '" + path + "'");
  }
  out << configToJson(config).dump(2) << "\n";
}

}  // namespace dtwin
