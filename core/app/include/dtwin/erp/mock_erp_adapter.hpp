#pragma once

#include "dtwin/domain/simulation_config.hpp"
#include "dtwin/erp/i_erp_adapter.hpp"
#include "dtwin/sim/time_sampler.hpp"
#include "dtwin/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace dtwin {
namespace erp {

// -----------------------------------------------------------------------------
// MockErpAdapter — in-memory ERP for tests and the demo binary
// -----------------------------------------------------------------------------
//
// @brief  Holds a seeded inventory and an order book, and emits ERP-sourced
//         events for every change it accepts.
//
// @details
// Inventory: num_storage_locations SKUs built by sim::seedInventory() from
// the configured seed, so a twin seeded the same way starts in sync.
//
// Events carry EventSource::Erp, their own sequence ids starting at 1 and
// the wall clock of the injected provider; subscribers are called
// synchronously from the mutating call.
//
// setFailing(true) makes every read throw ErpError, for exercising error
// paths.
//
// Thread model:
//   A mutex guards the order book and inventory. Callbacks are invoked
//   outside the lock.
// -----------------------------------------------------------------------------
class MockErpAdapter final : public IErpAdapter {
 public:
  MockErpAdapter(const domain::SimulationConfig& config,
                 const ITimeProvider& clock);

  bool connect() override;
  void disconnect() override;
  bool isConnected() const override;

  std::vector<domain::Order> fetchOrders(
      std::optional<domain::OrderStatus> status = std::nullopt) override;
  domain::InventoryMap fetchInventory() override;

  bool updateOrderStatus(const domain::OrderId& order_id,
                         domain::OrderStatus status) override;
  bool updateInventory(const std::string& sku, int delta) override;

  bool subscribeToEvents(EventCallback callback) override;

  // -------------------------------------------------------------------------
  // createOrder(customer_id, items)
  // -------------------------------------------------------------------------
  // Books an order ORD-<n> in status Received with one line per known SKU
  // (unknown SKUs are dropped) and a random priority 1..5. Emits
  // ORDER_CREATED.
  // -------------------------------------------------------------------------
  domain::Order createOrder(const std::string& customer_id,
                            const std::vector<std::pair<std::string, int>>& items);

  void setFailing(bool failing);

  std::size_t orderCount() const;

 private:
  void requireReadable() const;
  void emit(Event event);

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  bool connected_{false};
  bool failing_{false};
  domain::InventoryMap inventory_;
  std::map<domain::OrderId, domain::Order> orders_;
  std::vector<domain::OrderId> order_sequence_;
  sim::TimeSampler rng_;
  std::uint64_t next_event_id_{1};
  std::vector<EventCallback> callbacks_;
};

}  // namespace erp
}  // namespace dtwin
