#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace dtwin {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types thrown by the twin engine, grouped so callers can
//         catch by category.
//
// @details
//   ConfigError      Invalid configuration field, unknown parameter name or
//                    malformed configuration document. Always raised before
//                    any simulated activity starts.
//   SamplingError    Malformed distribution request (non-positive mean,
//                    negative spread, non-positive quantity).
//   SimulationError  Internal invariant breach inside a run: illegal status
//                    transition, stage timestamp rewritten, stock driven
//                    below zero.
//   EventLogError    Malformed event record in a JSON event log handed to
//                    calibration.
//   ErpError         The ERP collaborator is unreachable or refused a read.
//
// Statistical degeneracies (few calibration samples, zero variance) and
// resource starvation are not errors and never throw.
// -----------------------------------------------------------------------------
class TwinError : public std::runtime_error {
 public:
  explicit TwinError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

class ConfigError : public TwinError {
 public:
  explicit ConfigError(std::string msg) : TwinError(std::move(msg)) {}
};

class SamplingError : public TwinError {
 public:
  explicit SamplingError(std::string msg) : TwinError(std::move(msg)) {}
};

class SimulationError : public TwinError {
 public:
  explicit SimulationError(std::string msg) : TwinError(std::move(msg)) {}
};

class EventLogError : public TwinError {
 public:
  explicit EventLogError(std::string msg) : TwinError(std::move(msg)) {}
};

class ErpError : public TwinError {
 public:
  explicit ErpError(std::string msg) : TwinError(std::move(msg)) {}
};

}  // namespace dtwin
