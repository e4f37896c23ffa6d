// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for dtwin::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event struct
//   - Kind subscription separates WORKER_ASSIGNED from RESOURCE_RELEASED
//   - Unsubscribe stops delivery; unknown ids are a no-op
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - Payload integrity through the variant dispatch path
//
// All tests are single-threaded.
// =============================================================================

#include "dtwin/eventbus/event_bus.hpp"
#include "dtwin/events/event.hpp"
#include "dtwin/events/event_types.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  dtwin::EventBus bus;

  static dtwin::OrderCreatedEvent makeCreated(const std::string& id,
                                              int priority) {
    dtwin::OrderCreatedEvent e;
    e.order_id = id;
    e.customer_id = "CUST-0001";
    e.num_lines = 2;
    e.total_items = 4;
    e.priority = priority;
    return e;
  }

  static dtwin::ResourceEvent makeResource(
      dtwin::ResourceType type, dtwin::ResourceEvent::Action action) {
    dtwin::ResourceEvent e;
    e.resource = type;
    e.action = action;
    e.order_id = "SIM-000001";
    e.in_use = 1;
    e.capacity = 2;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const dtwin::Event&) { ++call_count; });

  bus.publish(makeCreated("SIM-000001", 3));
  bus.publish(dtwin::PickShortageEvent{{}, "SIM-000001", "SKU-0001", 3, 1});
  bus.publish(dtwin::CalibrationTriggerEvent{{}, 0.2, 0.05});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered struct.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int created_count = 0;
  bus.subscribe<dtwin::OrderCreatedEvent>(
      [&created_count](const dtwin::OrderCreatedEvent&) { ++created_count; });

  bus.publish(makeCreated("SIM-000001", 1));
  bus.publish(dtwin::CalibrationTriggerEvent{{}, 0.2, 0.05});

  EXPECT_EQ(created_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Kind subscriptions split the shared ResourceEvent struct by flat kind.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, KindSubscriberSeesOnlyItsKind) {
  std::vector<dtwin::EventKind> seen;
  bus.subscribeKind(dtwin::EventKind::WorkerAssigned,
                    [&seen](const dtwin::Event& e) {
                      seen.push_back(dtwin::kindOf(e));
                    });

  using Action = dtwin::ResourceEvent::Action;
  bus.publish(makeResource(dtwin::ResourceType::Worker, Action::Assigned));
  bus.publish(makeResource(dtwin::ResourceType::Worker, Action::Released));
  bus.publish(makeResource(dtwin::ResourceType::Forklift, Action::Assigned));

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], dtwin::EventKind::WorkerAssigned);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<dtwin::OrderCreatedEvent>(
      [&call_count](const dtwin::OrderCreatedEvent&) { ++call_count; });

  bus.publish(makeCreated("SIM-000001", 1));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeCreated("SIM-000002", 1));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unsubscribing an unknown id and publishing to an empty bus are no-ops.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnknownIdAndEmptyBusAreNoOps) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeCreated("SIM-000001", 1)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber may publish from inside its callback.
// Scenario: A receives ORDER_CREATED and publishes a PICK_SHORTAGE that B
//           receives. Holding the lock across callbacks would hang here.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int shortage_received = 0;

  bus.subscribe<dtwin::PickShortageEvent>(
      [&shortage_received](const dtwin::PickShortageEvent&) {
        ++shortage_received;
      });

  bus.subscribe<dtwin::OrderCreatedEvent>(
      [this](const dtwin::OrderCreatedEvent& created) {
        bus.publish(
            dtwin::PickShortageEvent{{}, created.order_id, "SKU-0000", 2, 0});
      });

  bus.publish(makeCreated("SIM-000007", 2));

  EXPECT_EQ(shortage_received, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values survive publish → dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string received_id;
  int received_priority = 0;

  bus.subscribe<dtwin::OrderCreatedEvent>(
      [&received_id, &received_priority](const dtwin::OrderCreatedEvent& e) {
        received_id = e.order_id;
        received_priority = e.priority;
      });

  bus.publish(makeCreated("SIM-000042", 5));

  EXPECT_EQ(received_id, "SIM-000042");
  EXPECT_EQ(received_priority, 5);
}
