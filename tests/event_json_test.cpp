// =============================================================================
// event_json_test.cpp
// =============================================================================
// Unit tests for the event JSON codec and the JSON Lines event-log reader.
//
// Validates:
//   - Record layout: header fields, statuses by name, null sim_time
//   - Every event kind decodes back to the same alternative and fields
//   - Malformed records throw EventLogError naming the problem
//   - readEventLog() skips blank lines and reports the failing line number
// =============================================================================

#include "dtwin/common/errors.hpp"
#include "dtwin/events/event_json.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using dtwin::Event;
using dtwin::EventLogError;

namespace {

dtwin::OrderStatusChangedEvent completedEvent() {
  dtwin::OrderStatusChangedEvent e;
  e.header.sequence_id = 17;
  e.header.sim_time = 12.5;
  e.header.timestamp = dtwin::ms_to_timestamp(1'700'000'000'000);
  e.order_id = "ORD-000003";
  e.old_status = dtwin::domain::OrderStatus::Shipping;
  e.new_status = dtwin::domain::OrderStatus::Completed;
  e.total_time = 42.0;
  return e;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Record layout.
// -----------------------------------------------------------------------------
TEST(EventJsonTest, WritesFlatRecord) {
  nlohmann::json j = dtwin::eventToJson(completedEvent());

  EXPECT_EQ(j["event_type"], "ORDER_STATUS_CHANGED");
  EXPECT_EQ(j["sequence_id"], 17);
  EXPECT_DOUBLE_EQ(j["sim_time"].get<double>(), 12.5);
  EXPECT_EQ(j["timestamp_ms"], 1'700'000'000'000LL);
  EXPECT_EQ(j["source"], "simulation");
  EXPECT_EQ(j["data"]["old_status"], "shipping");
  EXPECT_EQ(j["data"]["new_status"], "completed");
  EXPECT_DOUBLE_EQ(j["data"]["total_time"].get<double>(), 42.0);
}

TEST(EventJsonTest, ErpEventsHaveNullSimTime) {
  dtwin::InventoryUpdatedEvent e;
  e.header.source = dtwin::EventSource::Erp;
  e.sku = "SKU-0001";
  e.delta = -4;
  e.new_quantity = 20;
  e.reason = "erp_update";

  nlohmann::json j = dtwin::eventToJson(e);
  EXPECT_TRUE(j["sim_time"].is_null());
  EXPECT_EQ(j["source"], "erp");
  EXPECT_FALSE(j["data"].contains("order_id"));
}

// -----------------------------------------------------------------------------
// 2. Decoding restores the alternative and its fields.
// -----------------------------------------------------------------------------
TEST(EventJsonTest, DecodesStatusChange) {
  Event decoded = dtwin::eventFromJson(dtwin::eventToJson(completedEvent()));

  ASSERT_TRUE(std::holds_alternative<dtwin::OrderStatusChangedEvent>(decoded));
  const auto& e = std::get<dtwin::OrderStatusChangedEvent>(decoded);
  EXPECT_EQ(e.header.sequence_id, 17u);
  EXPECT_EQ(e.order_id, "ORD-000003");
  EXPECT_EQ(e.old_status, dtwin::domain::OrderStatus::Shipping);
  EXPECT_EQ(e.new_status, dtwin::domain::OrderStatus::Completed);
  ASSERT_TRUE(e.total_time.has_value());
  EXPECT_DOUBLE_EQ(*e.total_time, 42.0);
  EXPECT_EQ(dtwin::timestamp_to_ms(e.header.timestamp), 1'700'000'000'000);
}

TEST(EventJsonTest, DecodesResourceKinds) {
  dtwin::ResourceEvent e;
  e.resource = dtwin::ResourceType::Forklift;
  e.action = dtwin::ResourceEvent::Action::Released;
  e.order_id = "ORD-000001";
  e.in_use = 1;
  e.capacity = 2;

  nlohmann::json j = dtwin::eventToJson(e);
  EXPECT_EQ(j["event_type"], "RESOURCE_RELEASED");

  Event decoded = dtwin::eventFromJson(j);
  EXPECT_EQ(dtwin::kindOf(decoded), dtwin::EventKind::ResourceReleased);
  const auto& r = std::get<dtwin::ResourceEvent>(decoded);
  EXPECT_EQ(r.resource, dtwin::ResourceType::Forklift);
  EXPECT_EQ(r.in_use, 1);
  EXPECT_EQ(r.capacity, 2);
}

TEST(EventJsonTest, DecodesShortageAndTrigger) {
  dtwin::PickShortageEvent shortage;
  shortage.order_id = "ORD-000009";
  shortage.sku = "SKU-0042";
  shortage.requested = 5;
  shortage.available = 2;
  Event decoded_shortage = dtwin::eventFromJson(dtwin::eventToJson(shortage));
  const auto& s = std::get<dtwin::PickShortageEvent>(decoded_shortage);
  EXPECT_EQ(s.sku, "SKU-0042");
  EXPECT_EQ(s.requested, 5);
  EXPECT_EQ(s.available, 2);

  dtwin::CalibrationTriggerEvent trigger;
  trigger.drift_ratio = 0.2;
  trigger.threshold = 0.05;
  Event decoded_trigger = dtwin::eventFromJson(dtwin::eventToJson(trigger));
  const auto& t = std::get<dtwin::CalibrationTriggerEvent>(decoded_trigger);
  EXPECT_DOUBLE_EQ(t.drift_ratio, 0.2);
  EXPECT_DOUBLE_EQ(t.threshold, 0.05);
}

// -----------------------------------------------------------------------------
// 3. Malformed records.
// -----------------------------------------------------------------------------
TEST(EventJsonTest, RejectsMalformedRecords) {
  nlohmann::json good = dtwin::eventToJson(completedEvent());

  nlohmann::json unknown_type = good;
  unknown_type["event_type"] = "ORDER_TELEPORTED";
  EXPECT_THROW(dtwin::eventFromJson(unknown_type), EventLogError);

  nlohmann::json bad_status = good;
  bad_status["data"]["new_status"] = "lost";
  EXPECT_THROW(dtwin::eventFromJson(bad_status), EventLogError);

  nlohmann::json missing_data = good;
  missing_data.erase("data");
  EXPECT_THROW(dtwin::eventFromJson(missing_data), EventLogError);

  nlohmann::json bad_source = good;
  bad_source["source"] = "carrier";
  EXPECT_THROW(dtwin::eventFromJson(bad_source), EventLogError);
}

// -----------------------------------------------------------------------------
// 4. JSON Lines reader.
// -----------------------------------------------------------------------------
TEST(EventLogReaderTest, SkipsBlankLines) {
  std::stringstream log;
  log << dtwin::eventToJson(completedEvent()).dump() << "\n\n   \n"
      << dtwin::eventToJson(completedEvent()).dump() << "\n";

  auto events = dtwin::readEventLog(log);
  EXPECT_EQ(events.size(), 2u);
}

TEST(EventLogReaderTest, ReportsFailingLineNumber) {
  std::stringstream log;
  log << dtwin::eventToJson(completedEvent()).dump() << "\n"
      << "\n"
      << "{ not json\n";

  try {
    dtwin::readEventLog(log);
    FAIL() << "expected EventLogError";
  } catch (const EventLogError& e) {
    EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos)
        << e.what();
  }
}
