#pragma once

#include "dtwin/domain/order.hpp"
#include "dtwin/domain/order_status.hpp"

#include <optional>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// OrderLifecycle — the only code allowed to move an order's status
// -----------------------------------------------------------------------------
//
// @brief  Validates a status move, applies it and stamps the matching stage
//         boundary with the current simulated time.
//
// @details
// Legal moves are the single forward step along
//   Received → Picking → Picked → Packing → Packed → Shipping → Completed
// plus Received → Cancelled for orders withdrawn by the ERP before work
// started. Anything else is an internal defect and throws SimulationError.
//
// Stage stamping:
//   Picking   → pick.start     Picked    → pick.end
//   Packing   → pack.start     Packed    → pack.end
//   Shipping  → ship.start     Completed → ship.end
// A stamp that is already set is never overwritten; attempting it throws
// SimulationError.
// -----------------------------------------------------------------------------
class OrderLifecycle {
 public:
  static bool canTransition(domain::OrderStatus from, domain::OrderStatus to);

  // Next status on the forward path; nullopt for terminal states.
  static std::optional<domain::OrderStatus> next(domain::OrderStatus status);

  static bool isTerminal(domain::OrderStatus status);

  // Applies from → to at simulated time `now`. Returns the previous status.
  static domain::OrderStatus advance(domain::Order& order,
                                     domain::OrderStatus to, double now);
};

}  // namespace sim
}  // namespace dtwin
