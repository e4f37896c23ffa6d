#pragma once

#include "dtwin/domain/inventory_item.hpp"
#include "dtwin/domain/order.hpp"
#include "dtwin/domain/order_status.hpp"
#include "dtwin/events/event.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dtwin {
namespace erp {

// -----------------------------------------------------------------------------
// IErpAdapter — port to the enterprise resource planning system
// -----------------------------------------------------------------------------
//
// @brief  The only way the twin talks to the system of record: it reads
//         orders and stock, pushes status and stock changes, and listens
//         for events.
//
// @details
// The engine never assumes a particular backing system. Transport,
// authentication and retry belong to the implementation; the engine only
// sees the results below.
//
// Error contract:
//   connect() reports failure by returning false. Reads on a disconnected
//   or failing adapter throw ErpError. Writes return false when the target
//   (order id, SKU) is unknown or the change is refused.
//
// Calling convention:
//   Called synchronously from the TwinEngine's caller thread. Event
//   callbacks run on whatever thread the implementation emits from.
//
// Ownership:
//   TwinEngine holds a non-owning reference. The caller owns the adapter and
//   keeps it alive for the engine's lifetime.
// -----------------------------------------------------------------------------
class IErpAdapter {
 public:
  using EventCallback = std::function<void(const Event&)>;

  virtual ~IErpAdapter() = default;

  virtual bool connect() = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  // Orders in the given status, or all orders when `status` is empty.
  virtual std::vector<domain::Order> fetchOrders(
      std::optional<domain::OrderStatus> status = std::nullopt) = 0;

  virtual domain::InventoryMap fetchInventory() = 0;

  virtual bool updateOrderStatus(const domain::OrderId& order_id,
                                 domain::OrderStatus status) = 0;

  // Adds `delta` (may be negative) to the SKU's on-hand quantity.
  virtual bool updateInventory(const std::string& sku, int delta) = 0;

  virtual bool subscribeToEvents(EventCallback callback) = 0;
};

}  // namespace erp
}  // namespace dtwin
