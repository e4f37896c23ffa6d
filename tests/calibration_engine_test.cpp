// =============================================================================
// calibration_engine_test.cpp
// =============================================================================
// Unit tests for dtwin::analysis::CalibrationEngine.
//
// Validates:
//   - Recovery of known stage distributions from a synthetic log
//   - Fewer than two samples: mean kept, std falls back to 0.5
//   - Stages with no samples produce no parameters
//   - Sequence gaps and orders without a creation event are reported, not
//     fatal
//   - Wall-clock fallback when events carry no simulated time
//   - apply() returns a validated copy and leaves the base untouched
//   - Calibrating a real simulation log recovers its configured pack time
// =============================================================================

#include "dtwin/analysis/calibration_engine.hpp"
#include "dtwin/common/errors.hpp"
#include "dtwin/events/event.hpp"
#include "dtwin/sim/inventory.hpp"
#include "dtwin/sim/simulation.hpp"
#include "dtwin/sim/time_sampler.hpp"
#include "dtwin/time/manual_time_provider.hpp"
#include "dtwin/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using dtwin::analysis::CalibrationEngine;
using dtwin::domain::OrderStatus;

class CalibrationEngineTest : public ::testing::Test {
 protected:
  CalibrationEngine engine;
  std::vector<dtwin::Event> log;
  std::uint64_t next_seq = 1;

  void created(const std::string& id, double t) {
    dtwin::OrderCreatedEvent e;
    e.header.sequence_id = next_seq++;
    e.header.sim_time = t;
    e.order_id = id;
    log.push_back(e);
  }

  void changed(const std::string& id, OrderStatus from, OrderStatus to,
               double t) {
    dtwin::OrderStatusChangedEvent e;
    e.header.sequence_id = next_seq++;
    e.header.sim_time = t;
    e.order_id = id;
    e.old_status = from;
    e.new_status = to;
    log.push_back(e);
  }

  // created → PICKED after `pick`, → PACKED after `pack`, → COMPLETED
  // after `ship`.
  void order(const std::string& id, double start, double pick, double pack,
             double ship) {
    created(id, start);
    changed(id, OrderStatus::Picking, OrderStatus::Picked, start + pick);
    changed(id, OrderStatus::Packing, OrderStatus::Packed, start + pick + pack);
    changed(id, OrderStatus::Shipping, OrderStatus::Completed,
            start + pick + pack + ship);
  }
};

// -----------------------------------------------------------------------------
// 1. 50 orders with pick time ~ N(3, 0.8): estimates land near the truth.
// -----------------------------------------------------------------------------
TEST_F(CalibrationEngineTest, RecoversKnownDistribution) {
  dtwin::sim::TimeSampler rng(2024);
  for (int i = 0; i < 50; ++i) {
    order("ORD-" + std::to_string(i), i * 10.0, rng.sample(3.0, 0.8), 2.0,
          1.0);
  }

  auto report = engine.calibrate(log);

  EXPECT_EQ(report.sample_counts.at("pick"), 50u);
  EXPECT_NEAR(report.parameters.at("pick_time_mean"), 3.0, 0.5);
  EXPECT_NEAR(report.parameters.at("pick_time_std"), 0.8, 0.4);
  EXPECT_NEAR(report.parameters.at("pack_time_mean"), 2.0, 1e-9);
  EXPECT_NEAR(report.parameters.at("pack_time_std"), 0.0, 1e-9);
  EXPECT_NEAR(report.parameters.at("ship_time_mean"), 1.0, 1e-9);
  ASSERT_TRUE(report.order_time_mean.has_value());
  EXPECT_EQ(report.sequence_gaps, 0u);
  EXPECT_TRUE(report.orphaned_orders.empty());
}

// -----------------------------------------------------------------------------
// 2. A single sample keeps its value as the mean and the default std.
// -----------------------------------------------------------------------------
TEST_F(CalibrationEngineTest, SingleSampleUsesDefaultStd) {
  order("ORD-1", 0.0, 4.0, 2.5, 1.5);

  auto report = engine.calibrate(log);

  EXPECT_DOUBLE_EQ(report.parameters.at("pick_time_mean"), 4.0);
  EXPECT_DOUBLE_EQ(report.parameters.at("pick_time_std"),
                   CalibrationEngine::kDefaultStd);
  EXPECT_EQ(report.sample_counts.at("pick"), 1u);
}

// -----------------------------------------------------------------------------
// 3. Incomplete orders only contribute the stages they finished.
// -----------------------------------------------------------------------------
TEST_F(CalibrationEngineTest, StagesWithoutSamplesAreOmitted) {
  created("ORD-1", 0.0);
  changed("ORD-1", OrderStatus::Picking, OrderStatus::Picked, 3.0);

  auto report = engine.calibrate(log);

  EXPECT_EQ(report.parameters.count("pick_time_mean"), 1u);
  EXPECT_EQ(report.parameters.count("pack_time_mean"), 0u);
  EXPECT_EQ(report.parameters.count("ship_time_mean"), 0u);
  EXPECT_EQ(report.sample_counts.at("pack"), 0u);
  EXPECT_FALSE(report.order_time_mean.has_value());
}

TEST_F(CalibrationEngineTest, EmptyLogYieldsEmptyReport) {
  auto report = engine.calibrate({});
  EXPECT_TRUE(report.parameters.empty());
  EXPECT_EQ(report.num_events, 0u);
}

// -----------------------------------------------------------------------------
// 4. Evicted history: a sequence gap and an order whose creation was lost.
//    Both are reported; the remaining samples still calibrate.
// -----------------------------------------------------------------------------
TEST_F(CalibrationEngineTest, ReportsGapsAndOrphans) {
  next_seq = 5;
  changed("ORD-OLD", OrderStatus::Packing, OrderStatus::Packed, 1.0);
  next_seq = 9;
  order("ORD-NEW", 2.0, 2.0, 3.0, 1.0);

  auto report = engine.calibrate(log);

  EXPECT_EQ(report.sequence_gaps, 3u);
  ASSERT_EQ(report.orphaned_orders.size(), 1u);
  EXPECT_EQ(report.orphaned_orders[0], "ORD-OLD");
  EXPECT_DOUBLE_EQ(report.parameters.at("pack_time_mean"), 3.0);
}

// -----------------------------------------------------------------------------
// 5. Without simulated time, durations come from wall-clock minutes.
// -----------------------------------------------------------------------------
TEST_F(CalibrationEngineTest, FallsBackToWallClockMinutes) {
  const std::int64_t t0 = 1'700'000'000'000;
  dtwin::OrderCreatedEvent c;
  c.header.sequence_id = 1;
  c.header.timestamp = dtwin::ms_to_timestamp(t0);
  c.order_id = "ORD-1";
  dtwin::OrderStatusChangedEvent p;
  p.header.sequence_id = 2;
  p.header.timestamp = dtwin::ms_to_timestamp(t0 + 90'000);
  p.order_id = "ORD-1";
  p.old_status = OrderStatus::Picking;
  p.new_status = OrderStatus::Picked;

  auto report = engine.calibrate({c, p});

  EXPECT_DOUBLE_EQ(report.parameters.at("pick_time_mean"), 1.5);
}

// -----------------------------------------------------------------------------
// 6. apply() copies, overrides and validates; the base stays untouched.
// -----------------------------------------------------------------------------
TEST_F(CalibrationEngineTest, ApplyReturnsValidatedCopy) {
  dtwin::domain::SimulationConfig base;
  auto tuned = CalibrationEngine::apply(
      base, {{"pack_time_mean", 4.2}, {"pack_time_std", 0.3}});

  EXPECT_DOUBLE_EQ(tuned.pack_time_mean, 4.2);
  EXPECT_DOUBLE_EQ(tuned.pack_time_std, 0.3);
  EXPECT_DOUBLE_EQ(base.pack_time_mean, 3.0);

  EXPECT_THROW(CalibrationEngine::apply(base, {{"pack_time_mean", 0.0}}),
               dtwin::ConfigError);
  EXPECT_THROW(CalibrationEngine::apply(base, {{"no_such_field", 1.0}}),
               dtwin::ConfigError);
}

// -----------------------------------------------------------------------------
// 7. Calibrating a simulation's own log: PICKED → PACKED covers the wait for
//    a packing worker plus the pack itself, so with ample workers it tracks
//    pack_time_mean * items. Orders are forced down to a single line.
// -----------------------------------------------------------------------------
TEST(CalibrationFromSimulationTest, RecoversPackTimeFromSimulationLog) {
  dtwin::ManualTimeProvider clock;
  dtwin::domain::SimulationConfig config;
  config.simulation_time = 2000.0;
  config.num_workers = 50;
  config.num_forklifts = 50;
  config.order_arrival_rate = 6.0;
  config.items_per_order_mean = 1.0;
  config.items_per_order_std = 0.0;
  config.event_buffer_size = 100000;

  // One unit per line: a single SKU with ample stock and no reorder.
  dtwin::domain::InventoryItem item;
  item.sku = "SKU-0000";
  item.quantity = 100000;
  item.location = "A-00-00";
  dtwin::domain::InventoryMap items;
  items.emplace(item.sku, item);

  dtwin::sim::Simulation simulation(config, items, clock);
  simulation.run();

  auto report = CalibrationEngine().calibrate(simulation.events());
  ASSERT_GT(report.sample_counts.at("pack"), 30u);
  // Quantity per line is 1..3, so the pack centre is 3 * mean(1, 2, 3) = 6.
  EXPECT_NEAR(report.parameters.at("pack_time_mean"), 6.0, 1.0);
  EXPECT_NEAR(report.parameters.at("ship_time_mean"), 1.0, 0.2);
}
