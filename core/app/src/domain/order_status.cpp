#include "dtwin/domain/order_status.hpp"

namespace dtwin {
namespace domain {

// -----------------------------------------------------------------------------
// toString(): lower-case wire names shared with ERP payloads
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Received:  return "received";
    case S::Picking:   return "picking";
    case S::Picked:    return "picked";
    case S::Packing:   return "packing";
    case S::Packed:    return "packed";
    case S::Shipping:  return "shipping";
    case S::Completed: return "completed";
    case S::Cancelled: return "cancelled";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// orderStatusFromString()
// -----------------------------------------------------------------------------
std::optional<OrderStatus> orderStatusFromString(const std::string& name) {
  static constexpr OrderStatus kAll[] = {
      OrderStatus::Received, OrderStatus::Picking,   OrderStatus::Picked,
      OrderStatus::Packing,  OrderStatus::Packed,    OrderStatus::Shipping,
      OrderStatus::Completed, OrderStatus::Cancelled,
  };
  for (OrderStatus s : kAll) {
    if (name == toString(s)) {
      return s;
    }
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace dtwin
