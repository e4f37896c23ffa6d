// =============================================================================
// twin_engine_test.cpp
// =============================================================================
// Unit tests for dtwin::engine::TwinEngine.
//
// Validates:
//   - Lifecycle: idempotent start()/stop(), RAII destructor, no telemetry
//     with empty endpoints
//   - syncFromErp() pulls the Received backlog into the next runs, and a
//     failing ERP keeps the previous state
//   - What-if runs leave the engine's baseline untouched
//   - Calibration from ERP history and explicit applyCalibration()
//   - Drift against the ERP, with a CALIBRATION_TRIGGER above threshold
//   - executeCommand() replies for every command
//
// Design: each test owns its engine and mock ERP; the clock is manual.
// =============================================================================

#include "dtwin/common/errors.hpp"
#include "dtwin/engine/twin_engine.hpp"
#include "dtwin/erp/mock_erp_adapter.hpp"
#include "dtwin/time/manual_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using dtwin::domain::OrderStatus;
using dtwin::engine::TwinEngine;

class TwinEngineTest : public ::testing::Test {
 protected:
  TwinEngineTest() : erp(quietConfig(), clock) {}

  // Few SKUs and (practically) no random arrivals, so runs are fast and
  // stock only moves when a test says so.
  static dtwin::domain::SimulationConfig quietConfig() {
    dtwin::domain::SimulationConfig c;
    c.simulation_time = 120.0;
    c.num_storage_locations = 5;
    c.order_arrival_rate = 1e-6;
    c.random_seed = 3;
    return c;
  }

  static nlohmann::json reply(TwinEngine& engine, const std::string& cmd) {
    return nlohmann::json::parse(engine.executeCommand(cmd));
  }

  dtwin::ManualTimeProvider clock{1'700'000'000'000};
  dtwin::erp::MockErpAdapter erp;
};

// -----------------------------------------------------------------------------
// 1. Lifecycle.
// -----------------------------------------------------------------------------
TEST_F(TwinEngineTest, StartStopAreIdempotent) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();
  engine.start();
  EXPECT_TRUE(erp.isConnected());
  engine.stop();
  engine.stop();
  EXPECT_FALSE(erp.isConnected());
}

TEST_F(TwinEngineTest, DestructorStops) {
  {
    TwinEngine engine(quietConfig(), erp, clock);
    engine.start();
  }
  EXPECT_FALSE(erp.isConnected());
}

TEST_F(TwinEngineTest, RejectsInvalidBaseline) {
  auto bad = quietConfig();
  bad.num_workers = 0;
  EXPECT_THROW({ TwinEngine rejected(bad, erp, clock); }, dtwin::ConfigError);
}

// -----------------------------------------------------------------------------
// 2. ERP sync feeds the backlog into runs.
// -----------------------------------------------------------------------------
TEST_F(TwinEngineTest, SyncReleasesBacklog) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();
  erp.createOrder("CUST-1", {{"SKU-0000", 1}});
  erp.createOrder("CUST-2", {{"SKU-0001", 1}, {"SKU-0002", 1}});
  auto picked = erp.createOrder("CUST-3", {{"SKU-0003", 1}});
  erp.updateOrderStatus(picked.id, OrderStatus::Picking);

  EXPECT_EQ(engine.syncFromErp(), 2u);
  EXPECT_EQ(engine.backlogSize(), 2u);

  auto result = engine.runSimulation();
  EXPECT_EQ(result.backlog_released, 2);
  EXPECT_EQ(result.metrics.orders_completed, 2);
  ASSERT_TRUE(engine.lastRun().has_value());
}

TEST_F(TwinEngineTest, FailedSyncKeepsPreviousState) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();
  erp.createOrder("CUST-1", {{"SKU-0000", 1}});
  ASSERT_EQ(engine.syncFromErp(), 1u);

  erp.createOrder("CUST-2", {{"SKU-0001", 1}});
  erp.setFailing(true);
  EXPECT_THROW(engine.syncFromErp(), dtwin::ErpError);
  EXPECT_EQ(engine.backlogSize(), 1u);
}

// -----------------------------------------------------------------------------
// 3. What-if through the engine leaves the baseline alone.
// -----------------------------------------------------------------------------
TEST_F(TwinEngineTest, WhatIfKeepsBaseline) {
  TwinEngine engine(quietConfig(), erp, clock);
  auto before = engine.config();

  auto scenario = engine.runWhatIf({{"num_workers", 9.0}});
  EXPECT_EQ(scenario.result.config.num_workers, 9);
  EXPECT_THROW(engine.runWhatIf({{"num_workers", -1.0}}), dtwin::ConfigError);
  EXPECT_TRUE(engine.config() == before);

  auto points = engine.sweep("num_forklifts", {1.0, 3.0});
  ASSERT_EQ(points.size(), 2u);
  EXPECT_EQ(points[1].result.config.num_forklifts, 3);
  EXPECT_TRUE(engine.config() == before);
}

// -----------------------------------------------------------------------------
// 4. Calibration from the ERP's own status history (wall-clock minutes),
//    then an explicit apply.
// -----------------------------------------------------------------------------
TEST_F(TwinEngineTest, CalibratesFromErpHistory) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();

  auto order = erp.createOrder("CUST-1", {{"SKU-0000", 2}});
  clock.advance(4 * 60'000);
  erp.updateOrderStatus(order.id, OrderStatus::Picked);
  clock.advance(5 * 60'000);
  erp.updateOrderStatus(order.id, OrderStatus::Packed);
  clock.advance(2 * 60'000);
  erp.updateOrderStatus(order.id, OrderStatus::Completed);

  EXPECT_EQ(engine.liveEvents().size(), 4u);

  auto report = engine.calibrateFromErpHistory();
  EXPECT_DOUBLE_EQ(report.parameters.at("pick_time_mean"), 4.0);
  EXPECT_DOUBLE_EQ(report.parameters.at("pack_time_mean"), 5.0);
  EXPECT_DOUBLE_EQ(report.parameters.at("ship_time_mean"), 2.0);
  ASSERT_TRUE(report.order_time_mean.has_value());
  EXPECT_DOUBLE_EQ(*report.order_time_mean, 11.0);
  EXPECT_EQ(report.sequence_gaps, 0u);

  // Calibrating alone does not touch the baseline.
  EXPECT_DOUBLE_EQ(engine.config().pick_time_mean, 2.0);

  engine.runSimulation();
  auto applied = engine.applyCalibration(report);
  EXPECT_DOUBLE_EQ(applied.pick_time_mean, 4.0);
  EXPECT_DOUBLE_EQ(applied.pack_time_mean, 5.0);
  EXPECT_DOUBLE_EQ(engine.config().ship_time_mean, 2.0);
  EXPECT_FALSE(engine.lastRun().has_value());
}

TEST_F(TwinEngineTest, CalibratesFromLogStream) {
  TwinEngine engine(quietConfig(), erp, clock);
  std::stringstream log("{ broken\n");
  EXPECT_THROW(engine.calibrateFromLogs(log), dtwin::EventLogError);

  std::stringstream empty;
  auto report = engine.calibrateFromLogs(empty);
  EXPECT_TRUE(report.parameters.empty());
  EXPECT_EQ(report.num_events, 0u);
}

// -----------------------------------------------------------------------------
// 5. Drift against the ERP.
// -----------------------------------------------------------------------------
TEST_F(TwinEngineTest, DriftNeedsABaselineRun) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();
  EXPECT_FALSE(engine.calculateDrift().has_value());
}

TEST_F(TwinEngineTest, DriftAboveThresholdRecordsTrigger) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();
  engine.syncFromErp();
  auto run = engine.runSimulation();

  ASSERT_TRUE(erp.updateInventory("SKU-0000", 1000));
  auto drift = engine.calculateDrift();
  ASSERT_TRUE(drift.has_value());

  double expected = dtwin::analysis::DriftDetector::measure(
      dtwin::analysis::quantitiesOf(run.final_inventory),
      dtwin::analysis::quantitiesOf(erp.fetchInventory()));
  EXPECT_DOUBLE_EQ(*drift, expected);
  EXPECT_GT(*drift, engine.config().sync_threshold);

  bool triggered = false;
  for (const auto& e : engine.liveEvents()) {
    triggered = triggered ||
                dtwin::kindOf(e) == dtwin::EventKind::CalibrationTrigger;
  }
  EXPECT_TRUE(triggered);
}

// -----------------------------------------------------------------------------
// 6. Command interface.
// -----------------------------------------------------------------------------
TEST_F(TwinEngineTest, AnswersPingAndUnknown) {
  TwinEngine engine(quietConfig(), erp, clock);

  auto ping = reply(engine, "PING");
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  auto unknown = reply(engine, "LAUNCH");
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["response"], "Unknown command: LAUNCH");
}

TEST_F(TwinEngineTest, StatusReflectsState) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();

  auto status = reply(engine, "STATUS");
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["erp_connected"], true);
  EXPECT_EQ(status["synced"], false);
  EXPECT_TRUE(status["last_run"].is_null());
  EXPECT_EQ(status["config"]["num_storage_locations"], 5);

  engine.syncFromErp();
  reply(engine, "RUN");
  status = reply(engine, "STATUS");
  EXPECT_EQ(status["synced"], true);
  EXPECT_TRUE(status["last_run"].is_object());
}

TEST_F(TwinEngineTest, RunCommands) {
  TwinEngine engine(quietConfig(), erp, clock);

  auto run = reply(engine, "RUN");
  EXPECT_EQ(run["status"], "ok");
  EXPECT_TRUE(run["result"]["metrics"].is_object());

  auto what_if = reply(engine, R"(RUN {"num_workers": 7})");
  EXPECT_EQ(what_if["status"], "ok");
  EXPECT_EQ(what_if["scenario"]["scenario_params"]["num_workers"], 7.0);
  EXPECT_EQ(what_if["scenario"]["results"]["config"]["num_workers"], 7);
  EXPECT_TRUE(what_if["comparison"].contains("throughput_change_pct"));
  EXPECT_EQ(engine.config().num_workers, quietConfig().num_workers);

  auto bad_json = reply(engine, "RUN {num_workers");
  EXPECT_EQ(bad_json["status"], "error");

  auto bad_name = reply(engine, R"(RUN {"num_wrokers": 7})");
  EXPECT_EQ(bad_name["status"], "error");
}

TEST_F(TwinEngineTest, DriftCommand) {
  TwinEngine engine(quietConfig(), erp, clock);
  engine.start();

  auto before = reply(engine, "DRIFT");
  EXPECT_EQ(before["status"], "ok");
  EXPECT_TRUE(before["drift"].is_null());
  EXPECT_EQ(before["exceeded"], false);

  engine.syncFromErp();
  reply(engine, "RUN");
  auto after = reply(engine, "DRIFT");
  EXPECT_EQ(after["status"], "ok");
  EXPECT_TRUE(after["drift"].is_number());
  EXPECT_DOUBLE_EQ(after["threshold"].get<double>(), 0.05);

  erp.setFailing(true);
  auto failing = reply(engine, "DRIFT");
  EXPECT_EQ(failing["status"], "error");
}
