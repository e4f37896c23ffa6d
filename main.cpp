// -----------------------------------------------------------------------------
// dtwin_app — demo entry point for the warehouse digital twin.
//
// Flow:
//   1) Load the baseline configuration (argv[1] if given, e.g.
//      config/default_config.json, else built-in defaults).
//   2) Create a mock ERP, book a small backlog and start the TwinEngine.
//   3) Sync inventory and backlog from the ERP.
//   4) Run the baseline, then a what-if with seven workers, and compare.
//   5) Calibrate stage timings from the baseline's event log and measure
//      drift against the ERP.
//   6) Print everything as one JSON document on stdout.
//
// Telemetry is off unless DTWIN_CMD_ENDPOINT and/or DTWIN_PUB_ENDPOINT are
// set. With a command endpoint the process keeps serving PING / STATUS /
// RUN / DRIFT until Ctrl-C.
// -----------------------------------------------------------------------------

#include "dtwin/common/errors.hpp"
#include "dtwin/config/config_json.hpp"
#include "dtwin/engine/twin_engine.hpp"
#include "dtwin/erp/mock_erp_adapter.hpp"
#include "dtwin/scenario/result_json.hpp"
#include "dtwin/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// The only global: set by the SIGINT handler, polled by main() while the
// command endpoint is being served.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

static std::string env_or_empty(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string();
}

int main(int argc, char** argv) {
  try {
    // -----------------------------------------------------------------------
    // 1) Configuration
    // -----------------------------------------------------------------------
    dtwin::domain::SimulationConfig config =
        argc > 1 ? dtwin::loadConfigFile(argv[1])
                 : dtwin::domain::SimulationConfig{};

    // -----------------------------------------------------------------------
    // 2) ERP + engine
    // -----------------------------------------------------------------------
    dtwin::LiveTimeProvider clock;
    dtwin::erp::MockErpAdapter erp(config, clock);

    const std::string cmd_endpoint = env_or_empty("DTWIN_CMD_ENDPOINT");
    dtwin::engine::TwinEngine engine(config, erp, clock, cmd_endpoint,
                                     env_or_empty("DTWIN_PUB_ENDPOINT"));
    engine.start();

    if (erp.isConnected() && config.num_storage_locations >= 3) {
      erp.createOrder("CUST-0001", {{"SKU-0000", 2}, {"SKU-0001", 1}});
      erp.createOrder("CUST-0002", {{"SKU-0002", 3}});
    }

    // -----------------------------------------------------------------------
    // 3) Sync
    // -----------------------------------------------------------------------
    try {
      engine.syncFromErp();
    } catch (const dtwin::ErpError& e) {
      std::cerr << "[main] WARNING: ERP sync failed: " << e.what() << "\n";
    }

    // -----------------------------------------------------------------------
    // 4) Baseline + what-if. Simulation events are collected for calibration.
    // -----------------------------------------------------------------------
    std::vector<dtwin::Event> baseline_events;
    auto collector = engine.eventBus().subscribe(
        [&baseline_events](const dtwin::Event& event) {
          if (dtwin::headerOf(event).source == dtwin::EventSource::Simulation) {
            baseline_events.push_back(event);
          }
        });
    dtwin::sim::RunResult baseline = engine.runSimulation();
    engine.eventBus().unsubscribe(collector);

    dtwin::scenario::ScenarioResult what_if =
        engine.runWhatIf(dtwin::Overrides{{"num_workers", 7.0}});
    dtwin::scenario::ScenarioComparison comparison =
        dtwin::scenario::ScenarioRunner::compare(baseline, what_if.result);

    // -----------------------------------------------------------------------
    // 5) Calibration + drift
    // -----------------------------------------------------------------------
    dtwin::analysis::CalibrationReport calibration =
        engine.calibrateFromLogs(baseline_events);
    std::optional<double> drift = engine.calculateDrift();

    // -----------------------------------------------------------------------
    // 6) Report
    // -----------------------------------------------------------------------
    nlohmann::json report;
    report["baseline"] = dtwin::runResultToJson(baseline);
    report["what_if"] = dtwin::scenarioResultToJson(what_if);
    report["comparison"] = dtwin::comparisonToJson(comparison);
    report["calibration"] = dtwin::calibrationReportToJson(calibration);
    report["drift"] = drift ? nlohmann::json(*drift) : nlohmann::json(nullptr);
    std::cout << report.dump(2) << "\n";

    if (!cmd_endpoint.empty()) {
      std::signal(SIGINT, sigint_handler);
      std::cout << "[main] Serving commands on " << cmd_endpoint
                << ". Ctrl-C to exit.\n";
      while (!g_stop_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    }

    engine.stop();
  } catch (const dtwin::TwinError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
