#include "dtwin/sim/order_lifecycle.hpp"
#include "dtwin/common/errors.hpp"

#include <sstream>

namespace dtwin {
namespace sim {

using domain::OrderStatus;

namespace {

void stamp(std::optional<double>& slot, double now, const domain::Order& order,
           const char* what) {
  if (slot.has_value()) {
    std::ostringstream oss;
    oss << "order " << order.id << ": " << what << " already set to " << *slot
        << ", refusing to rewrite with " << now;
    throw SimulationError(oss.str());
  }
  slot = now;
}

}  // namespace

std::optional<OrderStatus> OrderLifecycle::next(OrderStatus status) {
  switch (status) {
    case OrderStatus::Received: return OrderStatus::Picking;
    case OrderStatus::Picking:  return OrderStatus::Picked;
    case OrderStatus::Picked:   return OrderStatus::Packing;
    case OrderStatus::Packing:  return OrderStatus::Packed;
    case OrderStatus::Packed:   return OrderStatus::Shipping;
    case OrderStatus::Shipping: return OrderStatus::Completed;
    case OrderStatus::Completed:
    case OrderStatus::Cancelled:
      return std::nullopt;
  }
  return std::nullopt;
}

bool OrderLifecycle::isTerminal(OrderStatus status) {
  return status == OrderStatus::Completed || status == OrderStatus::Cancelled;
}

bool OrderLifecycle::canTransition(OrderStatus from, OrderStatus to) {
  if (to == OrderStatus::Cancelled) {
    return from == OrderStatus::Received;
  }
  auto expected = next(from);
  return expected.has_value() && *expected == to;
}

OrderStatus OrderLifecycle::advance(domain::Order& order, OrderStatus to,
                                    double now) {
  OrderStatus from = order.status;
  if (!canTransition(from, to)) {
    std::ostringstream oss;
    oss << "order " << order.id << ": illegal transition "
        << domain::toString(from) << " -> " << domain::toString(to);
    throw SimulationError(oss.str());
  }

  switch (to) {
    case OrderStatus::Picking:   stamp(order.pick.start, now, order, "pick start"); break;
    case OrderStatus::Picked:    stamp(order.pick.end, now, order, "pick end"); break;
    case OrderStatus::Packing:   stamp(order.pack.start, now, order, "pack start"); break;
    case OrderStatus::Packed:    stamp(order.pack.end, now, order, "pack end"); break;
    case OrderStatus::Shipping:  stamp(order.ship.start, now, order, "ship start"); break;
    case OrderStatus::Completed: stamp(order.ship.end, now, order, "ship end"); break;
    case OrderStatus::Received:
    case OrderStatus::Cancelled:
      break;
  }

  order.status = to;
  return from;
}

}  // namespace sim
}  // namespace dtwin
