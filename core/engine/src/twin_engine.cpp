#include "dtwin/engine/twin_engine.hpp"
#include "dtwin/common/errors.hpp"
#include "dtwin/config/config_json.hpp"
#include "dtwin/events/event_json.hpp"
#include "dtwin/scenario/result_json.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace dtwin {
namespace engine {

namespace {

constexpr const char* kRunPrefix = "RUN ";

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TwinEngine::TwinEngine(domain::SimulationConfig config, erp::IErpAdapter& erp,
                       const ITimeProvider& clock, std::string cmd_endpoint,
                       std::string pub_endpoint)
    : config_(std::move(config)),
      erp_(erp),
      clock_(clock),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {
  domain::validate(config_);
  live_recorder_ = std::make_shared<sim::EventRecorder>(
      static_cast<std::size_t>(config_.event_buffer_size), clock_, &bus_);
  rebuildRunnerLocked();
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TwinEngine::~TwinEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TwinEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) ERP connection + event subscription -------------------------------
  bool connected = erp_.isConnected() || erp_.connect();
  if (!connected) {
    std::cerr << "[TwinEngine] WARNING: ERP connect failed; running on "
                 "seeded inventory.\n";
  }
  if (connected && !erp_subscribed_) {
    // The adapter keeps the callback for its whole lifetime, so it only holds
    // the recorder weakly.
    std::weak_ptr<sim::EventRecorder> weak = live_recorder_;
    erp_subscribed_ = erp_.subscribeToEvents([weak](const Event& event) {
      if (auto recorder = weak.lock()) {
        recorder->record(event, std::nullopt);
      }
    });
  }

  // ---  2) Telemetry server (optional) ---------------------------------------
  if (!cmd_endpoint_.empty() || !pub_endpoint_.empty()) {
    telemetry_ = std::make_unique<network::TelemetryServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        cmd_endpoint_, pub_endpoint_);
    telemetry_->start();
    telemetry_subscription_ = bus_.subscribe(
        [this](const Event& event) { telemetry_->pushEvent(event); });
  }

  running_ = true;

  std::cout << "[TwinEngine] started. ERP="
            << (connected ? "connected" : "offline")
            << " telemetry=" << (telemetry_ ? "on" : "off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TwinEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Detach telemetry before the server goes away ---------------------
  if (telemetry_subscription_) {
    bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }

  // ---  2) Stop TelemetryServer (joins its thread; executeCommand() touches
  //          engine state) ---------------------------------------------------
  telemetry_.reset();

  // ---  3) Release the ERP --------------------------------------------------
  erp_.disconnect();

  running_ = false;

  std::cout << "[TwinEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// syncFromErp()
// -----------------------------------------------------------------------------
std::size_t TwinEngine::syncFromErp() {
  std::lock_guard lock(mutex_);

  // Fetch everything first so a failing ERP leaves the old state intact.
  domain::InventoryMap inventory = erp_.fetchInventory();
  std::vector<domain::Order> backlog =
      erp_.fetchOrders(domain::OrderStatus::Received);

  synced_inventory_ = std::move(inventory);
  backlog_ = std::move(backlog);
  rebuildRunnerLocked();

  std::cout << "[TwinEngine] Synced " << synced_inventory_->size()
            << " SKU(s) and " << backlog_.size()
            << " backlog order(s) from ERP.\n";
  return backlog_.size();
}

// -----------------------------------------------------------------------------
// Runs
// -----------------------------------------------------------------------------
sim::RunResult TwinEngine::runSimulation() {
  std::lock_guard lock(mutex_);
  return runSimulationLocked();
}

sim::RunResult TwinEngine::runSimulationLocked() {
  sim::RunResult result = runner_->runBaseline();
  last_run_ = result;
  return result;
}

scenario::ScenarioResult TwinEngine::runWhatIf(const Overrides& overrides) {
  std::lock_guard lock(mutex_);
  return runWhatIfLocked(overrides);
}

scenario::ScenarioResult TwinEngine::runWhatIfLocked(
    const Overrides& overrides) {
  return runner_->runWhatIf(overrides);
}

std::vector<scenario::SweepPoint> TwinEngine::sweep(
    const std::string& parameter, const std::vector<ParamValue>& values) {
  std::lock_guard lock(mutex_);
  return runner_->sweep(parameter, values);
}

// -----------------------------------------------------------------------------
// Calibration
// -----------------------------------------------------------------------------
analysis::CalibrationReport TwinEngine::calibrateFromLogs(
    const std::vector<Event>& events) const {
  return calibration_.calibrate(events);
}

analysis::CalibrationReport TwinEngine::calibrateFromLogs(
    std::istream& log) const {
  return calibration_.calibrate(readEventLog(log));
}

analysis::CalibrationReport TwinEngine::calibrateFromErpHistory() const {
  std::size_t window = 0;
  {
    std::lock_guard lock(mutex_);
    window = static_cast<std::size_t>(config_.calibration_window);
  }
  return calibration_.calibrate(live_recorder_->recent(window));
}

domain::SimulationConfig TwinEngine::applyCalibration(
    const analysis::CalibrationReport& report) {
  std::lock_guard lock(mutex_);
  config_ = analysis::CalibrationEngine::apply(config_, report.parameters);
  rebuildRunnerLocked();
  last_run_.reset();

  std::cout << "[TwinEngine] Applied " << report.parameters.size()
            << " calibrated parameter(s) to the baseline.\n";
  return config_;
}

// -----------------------------------------------------------------------------
// Drift
// -----------------------------------------------------------------------------
std::optional<double> TwinEngine::calculateDrift() {
  std::lock_guard lock(mutex_);
  return calculateDriftLocked();
}

std::optional<double> TwinEngine::calculateDriftLocked() {
  if (!last_run_) {
    return std::nullopt;
  }

  analysis::QuantityMap reported =
      analysis::quantitiesOf(erp_.fetchInventory());
  analysis::QuantityMap simulated =
      analysis::quantitiesOf(last_run_->final_inventory);

  analysis::DriftDetector detector(config_.sync_threshold);
  double ratio =
      detector.check(simulated, reported, live_recorder_.get(), std::nullopt);

  std::cout << "[TwinEngine] Drift " << ratio << " (threshold "
            << detector.threshold() << ")"
            << (detector.exceeds(ratio) ? " -> calibration advised" : "")
            << "\n";
  return ratio;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle REP socket requests
// -----------------------------------------------------------------------------
std::string TwinEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  try {
    std::lock_guard lock(mutex_);

    if (cmd == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (cmd == "STATUS") {
      response["status"] = "ok";
      response["config"] = configToJson(config_);
      response["erp_connected"] = erp_.isConnected();
      response["synced"] = synced_inventory_.has_value();
      response["backlog"] = backlog_.size();
      response["live_events"] = live_recorder_->totalRecorded();
      response["last_run"] =
          last_run_ ? runResultToJson(*last_run_) : nlohmann::json(nullptr);
    } else if (cmd == "RUN") {
      response["status"] = "ok";
      response["result"] = runResultToJson(runSimulationLocked());
    } else if (cmd.rfind(kRunPrefix, 0) == 0) {
      Overrides overrides = overridesFromJson(
          nlohmann::json::parse(cmd.substr(std::string(kRunPrefix).size())));
      sim::RunResult baseline =
          last_run_ ? *last_run_ : runSimulationLocked();
      scenario::ScenarioResult scenario = runWhatIfLocked(overrides);
      response["status"] = "ok";
      response["comparison"] = comparisonToJson(
          scenario::ScenarioRunner::compare(baseline, scenario.result));
      response["scenario"] = scenarioResultToJson(scenario);
    } else if (cmd == "DRIFT") {
      std::optional<double> ratio = calculateDriftLocked();
      response["status"] = "ok";
      response["drift"] = ratio ? nlohmann::json(*ratio) : nlohmann::json(nullptr);
      response["threshold"] = config_.sync_threshold;
      response["exceeded"] = ratio && *ratio > config_.sync_threshold;
    } else {
      response["status"] = "error";
      response["response"] = "Unknown command: " + cmd;
    }
  } catch (const TwinError& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["response"] = e.what();
  } catch (const nlohmann::json::exception& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["response"] = std::string("bad request: ") + e.what();
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
domain::SimulationConfig TwinEngine::config() const {
  std::lock_guard lock(mutex_);
  return config_;
}

std::optional<sim::RunResult> TwinEngine::lastRun() const {
  std::lock_guard lock(mutex_);
  return last_run_;
}

std::size_t TwinEngine::backlogSize() const {
  std::lock_guard lock(mutex_);
  return backlog_.size();
}

std::vector<Event> TwinEngine::liveEvents() const {
  return live_recorder_->snapshot();
}

// -----------------------------------------------------------------------------
// rebuildRunnerLocked(): the runner's baseline and inputs are immutable, so
// any change to them means a new runner.
// -----------------------------------------------------------------------------
void TwinEngine::rebuildRunnerLocked() {
  scenario::ScenarioRunner::InventorySource source;
  if (synced_inventory_) {
    source = [inventory = *synced_inventory_](const domain::SimulationConfig&) {
      return inventory;
    };
  }
  runner_ = std::make_unique<scenario::ScenarioRunner>(
      config_, std::move(source), clock_, &bus_, backlog_);
}

}  // namespace engine
}  // namespace dtwin
