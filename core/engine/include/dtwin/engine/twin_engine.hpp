#pragma once

#include "dtwin/analysis/calibration_engine.hpp"
#include "dtwin/analysis/drift_detector.hpp"
#include "dtwin/config/config_schema.hpp"
#include "dtwin/domain/inventory_item.hpp"
#include "dtwin/domain/order.hpp"
#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/erp/i_erp_adapter.hpp"
#include "dtwin/eventbus/event_bus.hpp"
#include "dtwin/network/telemetry_server.hpp"
#include "dtwin/scenario/scenario_runner.hpp"
#include "dtwin/sim/event_recorder.hpp"
#include "dtwin/sim/simulation.hpp"
#include "dtwin/time/i_time_provider.hpp"

#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dtwin {
namespace engine {

// -----------------------------------------------------------------------------
// TwinEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator of the warehouse digital twin: ERP sync,
//         baseline and what-if runs, sweeps, calibration, drift and the
//         telemetry/command endpoint.
//
// @details
// Provides a small lifecycle API (start/stop) plus one method per twin
// operation so that main() and tests never wire internals by hand.
//
// State held between operations:
//   - the current baseline configuration (replaced only by
//     applyCalibration(); what-if runs never touch it),
//   - the inventory and Received backlog of the last syncFromErp(),
//   - the RunResult of the last baseline run, used by calculateDrift().
//
// Event flow:
//   Simulation runs publish every recorded event on eventBus(). ERP events
//   and drift triggers go to a separate live recorder (liveEvents()), which
//   publishes on the same bus. When telemetry is enabled, a bus subscriber
//   forwards everything to the TelemetryServer queue.
//
// Thread model:
//   Constructed, started and stopped on the caller's thread. Twin operations
//   may be called from the caller's thread and, through executeCommand(),
//   from the telemetry thread; they are serialized by an internal mutex.
//   Each simulation itself is single-threaded.
//
// Ownership:
//   TwinEngine
//    ├── erp_               (IErpAdapter& — non-owning, must outlive engine)
//    ├── clock_             (const ITimeProvider& — non-owning)
//    ├── bus_               (EventBus — value member)
//    ├── live_recorder_     (shared_ptr<EventRecorder> — also held weakly by
//    │                       the ERP subscription)
//    ├── runner_            (unique_ptr<ScenarioRunner> — rebuilt when the
//    │                       baseline or the synced state changes)
//    └── telemetry_         (unique_ptr<TelemetryServer> — optional)
// -----------------------------------------------------------------------------
class TwinEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config        Baseline configuration. Validated here; throws
  //                       ConfigError before anything else happens.
  // @param  erp           ERP collaborator. Must outlive this engine.
  // @param  clock         Wall clock used to timestamp events.
  // @param  cmd_endpoint  ZMQ REP endpoint. Empty disables commands.
  // @param  pub_endpoint  ZMQ PUB endpoint. Empty disables the event stream.
  //
  // No sockets are opened and the ERP is not contacted until start().
  // -------------------------------------------------------------------------
  TwinEngine(domain::SimulationConfig config, erp::IErpAdapter& erp,
             const ITimeProvider& clock, std::string cmd_endpoint = "",
             std::string pub_endpoint = "");

  // Destructor calls stop() for RAII safety.
  ~TwinEngine();

  TwinEngine(const TwinEngine&) = delete;
  TwinEngine& operator=(const TwinEngine&) = delete;
  TwinEngine(TwinEngine&&) = delete;
  TwinEngine& operator=(TwinEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // start() connects the ERP, subscribes to its events and brings up the
  // telemetry server when an endpoint is configured. A failed ERP connect
  // is logged and the engine keeps running on seeded inventory.
  // Both are idempotent.
  // -------------------------------------------------------------------------
  void start();
  void stop();

  // -------------------------------------------------------------------------
  // syncFromErp()
  // -------------------------------------------------------------------------
  //
  // @brief  Pulls inventory and Received orders from the ERP.
  //
  // @return Number of backlog orders pulled.
  //
  // @details
  // Subsequent runs start from the synced inventory and release the
  // backlog at t=0. Throws ErpError if the ERP is unreachable; the
  // previously synced state is kept in that case.
  // -------------------------------------------------------------------------
  std::size_t syncFromErp();

  // Baseline run. The result is remembered for calculateDrift().
  sim::RunResult runSimulation();

  scenario::ScenarioResult runWhatIf(const Overrides& overrides);

  std::vector<scenario::SweepPoint> sweep(const std::string& parameter,
                                          const std::vector<ParamValue>& values);

  // -------------------------------------------------------------------------
  // calibrateFromLogs(events | JSON Lines stream)
  // -------------------------------------------------------------------------
  // Estimates stage timings. Does not change the baseline; pass the report
  // to applyCalibration() to adopt it.
  // -------------------------------------------------------------------------
  analysis::CalibrationReport calibrateFromLogs(
      const std::vector<Event>& events) const;
  analysis::CalibrationReport calibrateFromLogs(std::istream& log) const;

  // Calibrates from the newest `calibration_window` live events, i.e. the
  // status changes the ERP has reported since start(). Durations come from
  // the wall-clock stamps, in minutes.
  analysis::CalibrationReport calibrateFromErpHistory() const;

  // Replaces the baseline with a calibrated, validated copy and returns it.
  domain::SimulationConfig applyCalibration(
      const analysis::CalibrationReport& report);

  // -------------------------------------------------------------------------
  // calculateDrift()
  // -------------------------------------------------------------------------
  // Compares the final inventory of the last baseline run with what the ERP
  // reports now. Empty when no baseline run has happened yet. A ratio above
  // sync_threshold records a CALIBRATION_TRIGGER on the live recorder.
  // -------------------------------------------------------------------------
  std::optional<double> calculateDrift();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one command from the REP socket; returns a JSON reply.
  //
  // @details
  // Supported commands:
  //   "PING"          → {"status":"ok","response":"PONG"}
  //   "STATUS"        → {"status":"ok","config":{...},"erp_connected":bool,
  //                      "backlog":n,"last_run":{...}|null,...}
  //   "RUN"           → {"status":"ok","result":{...}} (baseline run)
  //   "RUN {json}"    → {"status":"ok","scenario":{...},"comparison":{...}}
  //                     (what-if with the given overrides)
  //   "DRIFT"         → {"status":"ok","drift":ratio|null,"threshold":t,
  //                      "exceeded":bool}
  //   other           → {"status":"error","response":"Unknown command: ..."}
  // Failures inside a command (bad override, ERP down) are reported as
  // {"status":"error","response":what()}.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  domain::SimulationConfig config() const;
  std::optional<sim::RunResult> lastRun() const;
  std::size_t backlogSize() const;
  std::vector<Event> liveEvents() const;

  EventBus& eventBus() { return bus_; }

 private:
  sim::RunResult runSimulationLocked();
  scenario::ScenarioResult runWhatIfLocked(const Overrides& overrides);
  std::optional<double> calculateDriftLocked();
  void rebuildRunnerLocked();

  domain::SimulationConfig config_;
  erp::IErpAdapter& erp_;
  const ITimeProvider& clock_;

  // --- Network endpoints (empty = disabled) ----------------------------------
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  EventBus bus_;
  std::shared_ptr<sim::EventRecorder> live_recorder_;
  analysis::CalibrationEngine calibration_;

  mutable std::mutex mutex_;
  std::optional<domain::InventoryMap> synced_inventory_;
  std::vector<domain::Order> backlog_;
  std::optional<sim::RunResult> last_run_;
  std::unique_ptr<scenario::ScenarioRunner> runner_;

  std::unique_ptr<network::TelemetryServer> telemetry_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  bool erp_subscribed_{false};
  bool running_{false};
};

}  // namespace engine
}  // namespace dtwin
