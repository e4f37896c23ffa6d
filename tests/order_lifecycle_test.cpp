// =============================================================================
// order_lifecycle_test.cpp
// =============================================================================
// Unit tests for dtwin::sim::OrderLifecycle and the Order helpers.
//
// Validates:
//   - The forward path Received → ... → Completed, one step at a time
//   - Only Received orders may be cancelled
//   - Skipping, reversing or leaving a terminal state throws SimulationError
//   - Each transition stamps its stage time exactly once
//   - Order item totals and the transport requirement
// =============================================================================

#include "dtwin/common/errors.hpp"
#include "dtwin/domain/order.hpp"
#include "dtwin/domain/order_status.hpp"
#include "dtwin/sim/order_lifecycle.hpp"

#include <gtest/gtest.h>

using dtwin::domain::Order;
using dtwin::domain::OrderStatus;
using dtwin::sim::OrderLifecycle;

namespace {

Order makeOrder() {
  Order order;
  order.id = "SIM-000001";
  order.customer_id = "CUST-0001";
  order.lines.push_back({"SKU-0001", 2, 0, "A-00-01", false});
  order.lines.push_back({"SKU-0002", 3, 0, "A-00-02", false});
  return order;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Walking the forward path stamps every stage boundary.
// -----------------------------------------------------------------------------
TEST(OrderLifecycleTest, ForwardPathStampsStageTimes) {
  Order order = makeOrder();

  EXPECT_EQ(OrderLifecycle::advance(order, OrderStatus::Picking, 1.0),
            OrderStatus::Received);
  OrderLifecycle::advance(order, OrderStatus::Picked, 3.0);
  OrderLifecycle::advance(order, OrderStatus::Packing, 3.5);
  OrderLifecycle::advance(order, OrderStatus::Packed, 6.0);
  OrderLifecycle::advance(order, OrderStatus::Shipping, 6.0);
  OrderLifecycle::advance(order, OrderStatus::Completed, 7.0);

  EXPECT_EQ(order.status, OrderStatus::Completed);
  EXPECT_DOUBLE_EQ(*order.pick.start, 1.0);
  EXPECT_DOUBLE_EQ(*order.pick.end, 3.0);
  EXPECT_DOUBLE_EQ(*order.pack.start, 3.5);
  EXPECT_DOUBLE_EQ(*order.pack.end, 6.0);
  EXPECT_DOUBLE_EQ(*order.ship.start, 6.0);
  EXPECT_DOUBLE_EQ(*order.ship.end, 7.0);
  EXPECT_TRUE(OrderLifecycle::isTerminal(order.status));
}

// -----------------------------------------------------------------------------
// 2. Skipping a stage or moving backwards is rejected and leaves the order
//    unchanged.
// -----------------------------------------------------------------------------
TEST(OrderLifecycleTest, IllegalTransitionsThrow) {
  Order order = makeOrder();

  EXPECT_THROW(OrderLifecycle::advance(order, OrderStatus::Packing, 1.0),
               dtwin::SimulationError);
  EXPECT_EQ(order.status, OrderStatus::Received);
  EXPECT_FALSE(order.pack.start.has_value());

  OrderLifecycle::advance(order, OrderStatus::Picking, 1.0);
  EXPECT_THROW(OrderLifecycle::advance(order, OrderStatus::Received, 2.0),
               dtwin::SimulationError);
  EXPECT_THROW(OrderLifecycle::advance(order, OrderStatus::Picking, 2.0),
               dtwin::SimulationError);
}

// -----------------------------------------------------------------------------
// 3. Cancellation is only possible before picking starts, and is terminal.
// -----------------------------------------------------------------------------
TEST(OrderLifecycleTest, OnlyReceivedOrdersCanBeCancelled) {
  EXPECT_TRUE(OrderLifecycle::canTransition(OrderStatus::Received,
                                            OrderStatus::Cancelled));
  EXPECT_FALSE(OrderLifecycle::canTransition(OrderStatus::Picking,
                                             OrderStatus::Cancelled));
  EXPECT_FALSE(OrderLifecycle::canTransition(OrderStatus::Completed,
                                             OrderStatus::Cancelled));

  Order order = makeOrder();
  OrderLifecycle::advance(order, OrderStatus::Cancelled, 0.0);
  EXPECT_TRUE(OrderLifecycle::isTerminal(order.status));
  EXPECT_FALSE(OrderLifecycle::next(order.status).has_value());
}

// -----------------------------------------------------------------------------
// 4. A stage time that is already set is never rewritten.
// -----------------------------------------------------------------------------
TEST(OrderLifecycleTest, RefusesToRewriteStageTime) {
  Order order = makeOrder();
  order.pick.start = 0.5;

  EXPECT_THROW(OrderLifecycle::advance(order, OrderStatus::Picking, 1.0),
               dtwin::SimulationError);
  EXPECT_DOUBLE_EQ(*order.pick.start, 0.5);
}

// -----------------------------------------------------------------------------
// 5. Order helpers.
// -----------------------------------------------------------------------------
TEST(OrderTest, ItemTotals) {
  Order order = makeOrder();
  EXPECT_EQ(order.totalItems(), 5);
  EXPECT_EQ(order.pickedItems(), 0);
  EXPECT_FALSE(order.isFullyPicked());

  order.lines[0].picked_quantity = 2;
  order.lines[1].picked_quantity = 3;
  EXPECT_EQ(order.pickedItems(), 5);
  EXPECT_TRUE(order.isFullyPicked());
}

TEST(OrderTest, TransportNeededOnlyForLocatedLines) {
  Order order = makeOrder();
  EXPECT_TRUE(order.requiresTransport());

  for (auto& line : order.lines) {
    line.location.clear();
  }
  EXPECT_FALSE(order.requiresTransport());
}

// -----------------------------------------------------------------------------
// 6. Status names round-trip through their lower-case spelling.
// -----------------------------------------------------------------------------
TEST(OrderStatusTest, NamesRoundTrip) {
  EXPECT_STREQ(dtwin::domain::toString(OrderStatus::Picked), "picked");
  EXPECT_EQ(dtwin::domain::orderStatusFromString("completed"),
            OrderStatus::Completed);
  EXPECT_FALSE(dtwin::domain::orderStatusFromString("lost").has_value());
}
