#pragma once

#include "dtwin/events/event.hpp"

#include <nlohmann/json.hpp>

#include <istream>
#include <vector>

namespace dtwin {

// -----------------------------------------------------------------------------
// Event JSON codec
// -----------------------------------------------------------------------------
//
// @brief  Converts recorded events to and from the flat JSON record used by
//         telemetry and by event-log files.
//
// @details
// Record layout:
//
//   {
//     "event_type":  "ORDER_STATUS_CHANGED",
//     "sequence_id": 17,
//     "sim_time":    12.5,            // null when absent
//     "timestamp_ms": 1700000000000,
//     "source":      "simulation",
//     "data":        { ... kind-specific fields ... }
//   }
//
// Statuses are written by name ("picked", "completed"). eventFromJson()
// accepts exactly what eventToJson() produces and throws EventLogError on
// anything else, naming the offending field.
// -----------------------------------------------------------------------------

nlohmann::json eventToJson(const Event& event);

Event eventFromJson(const nlohmann::json& record);

// Reads one JSON record per line (JSON Lines). Blank lines are skipped.
std::vector<Event> readEventLog(std::istream& in);

}  // namespace dtwin
