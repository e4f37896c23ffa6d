#pragma once

#include <optional>
#include <string>

namespace dtwin {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — fulfillment lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state an order occupies while it moves through the
//         warehouse.
//
// @details
// The lifecycle is a strict line. No stage may be skipped and no order ever
// moves backwards:
//
//   Received ─> Picking ─> Picked ─> Packing ─> Packed ─> Shipping ─> Completed
//
// Completed is the only terminal state reached by the simulation. Cancelled
// exists because external ERP systems report it; the simulation never
// produces it.
//
// OrderLifecycle::canTransition() is the single authority on legal moves.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Received,
  Picking,
  Picked,
  Packing,
  Packed,
  Shipping,
  Completed,
  Cancelled,
};

// Lower-case wire name ("received", "picking", ...). Used in event payloads,
// JSON results and ERP status updates.
const char* toString(OrderStatus status);

// Inverse of toString(). Returns std::nullopt for unknown names.
std::optional<OrderStatus> orderStatusFromString(const std::string& name);

}  // namespace domain
}  // namespace dtwin
