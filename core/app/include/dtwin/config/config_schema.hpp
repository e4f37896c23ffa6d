#pragma once

#include "dtwin/domain/simulation_config.hpp"

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace dtwin {

// -----------------------------------------------------------------------------
// Parameter values
// -----------------------------------------------------------------------------
// The configuration surface consists of named numeric and string fields.
// Integer and boolean fields accept a double that holds an exact integral
// value (booleans: 0 or 1); enum fields (time_unit, stock_policy) accept
// their lower-case names.
// -----------------------------------------------------------------------------
using ParamValue = std::variant<double, std::string>;

// Field name → new value, as passed to a what-if scenario. std::map keeps
// application order deterministic.
using Overrides = std::map<std::string, ParamValue>;

// Field name → estimate, as produced by the CalibrationEngine.
using CalibratedParameters = std::map<std::string, double>;

// -----------------------------------------------------------------------------
// Closed parameter schema
// -----------------------------------------------------------------------------
//
// @brief  Explicit name → setter/getter table over SimulationConfig.
//
// @details
// This is the only way configuration fields are addressed by name. Unknown
// or misspelled names, values of the wrong kind and non-integral values for
// integer fields all throw ConfigError; nothing is silently ignored.
//
// The setters do not validate cross-field invariants. Callers that build a
// configuration for a run use withOverrides()/withCalibration(), which work
// on a copy and call domain::validate() on the result.
// -----------------------------------------------------------------------------

// Every addressable field name, in declaration order.
const std::vector<std::string>& parameterNames();

bool isKnownParameter(const std::string& name);

void setParameter(domain::SimulationConfig& config, const std::string& name,
                  const ParamValue& value);

ParamValue getParameter(const domain::SimulationConfig& config,
                        const std::string& name);

// Copy of base with every override applied, validated.
domain::SimulationConfig withOverrides(const domain::SimulationConfig& base,
                                       const Overrides& overrides);

// Copy of base with every calibrated estimate applied, validated. Applying a
// calibration is always an explicit caller decision; the CalibrationEngine
// never calls this itself.
domain::SimulationConfig withCalibration(
    const domain::SimulationConfig& base, const CalibratedParameters& params);

// "num_workers=7" style rendering used in log lines.
std::string describe(const Overrides& overrides);

}  // namespace dtwin
