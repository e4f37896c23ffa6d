#pragma once

#include "dtwin/config/config_schema.hpp"
#include "dtwin/domain/simulation_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace dtwin {

// -----------------------------------------------------------------------------
// Configuration documents
// -----------------------------------------------------------------------------
//
// @brief  JSON encoding of SimulationConfig and of override sets.
//
// @details
// A configuration document is a flat JSON object keyed by schema field name:
//
//   { "num_workers": 7, "time_unit": "minutes", "stock_policy": "block" }
//
// Fields that are absent keep the value of the base configuration. Every key
// goes through the closed schema, so an unknown key is a ConfigError rather
// than a silently ignored typo. Parse failures and type mismatches reported
// by nlohmann::json are rethrown as ConfigError with the file or key named.
// -----------------------------------------------------------------------------

// Full document with every schema field.
nlohmann::json configToJson(const domain::SimulationConfig& config);

// Applies every key of `doc` on top of `base`, then validates.
domain::SimulationConfig configFromJson(
    const nlohmann::json& doc,
    const domain::SimulationConfig& base = domain::SimulationConfig{});

// Reads and applies a JSON file on top of the defaults.
domain::SimulationConfig loadConfigFile(const std::string& path);

void saveConfigFile(const domain::SimulationConfig& config,
                    const std::string& path);

// Converts a JSON object into an override set. Numbers and booleans become
// doubles, strings stay strings. Names are checked against the schema.
Overrides overridesFromJson(const nlohmann::json& doc);

nlohmann::json overridesToJson(const Overrides& overrides);

}  // namespace dtwin
