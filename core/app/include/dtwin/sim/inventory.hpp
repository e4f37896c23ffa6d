#pragma once

#include "dtwin/domain/inventory_item.hpp"
#include "dtwin/domain/order.hpp"
#include "dtwin/sim/event_recorder.hpp"
#include "dtwin/sim/event_scheduler.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// seedInventory
// -----------------------------------------------------------------------------
// Builds a synthetic warehouse of `locations` SKUs (SKU-0000 ...), each with
// 10..100 units in slot A-<aisle>-<bay> (ten bays per aisle), a reorder band
// of 10..100 and a unit cost of 5..50. Deterministic for a given seed. Used
// when no ERP snapshot is available and by the mock ERP adapter.
// -----------------------------------------------------------------------------
domain::InventoryMap seedInventory(int locations, std::uint64_t seed,
                                   Timestamp stamp = Timestamp{});

// -----------------------------------------------------------------------------
// Inventory — stock held by one simulation run
// -----------------------------------------------------------------------------
//
// @brief  Owns the run's copy of on-hand stock and is the only place it
//         changes.
//
// @details
// Every change records exactly one INVENTORY_UPDATED event. Quantity never
// drops below zero: tryTake() refuses a line it cannot serve in full and
// leaves stock untouched.
//
// Automatic reorder: when a pick leaves a SKU below its min_stock, or a line
// asks for more than is on hand, and no reorder is already in flight for it,
// a replenishment is scheduled `lead_time` later. It tops the SKU up to
// max_stock, or to the head stock waiter's quantity if that is larger.
// lead_time == 0 disables reordering.
//
// Stock waits (block policy): takeWhenAvailable() queues a request per SKU
// and serves the queue in FIFO order whenever a replenishment lands. A waiter
// left at the head re-arms the reorder. The continuation runs through the
// scheduler, never inside replenish().
//
// Thread model: single-threaded, owned by Simulation.
// -----------------------------------------------------------------------------
class Inventory {
 public:
  Inventory(domain::InventoryMap items, EventScheduler& scheduler,
            EventRecorder& recorder, double lead_time);

  Inventory(const Inventory&) = delete;
  Inventory& operator=(const Inventory&) = delete;

  bool contains(const std::string& sku) const;

  // On-hand quantity; 0 for an unknown SKU.
  int available(const std::string& sku) const;

  // SKUs with quantity > 0, in key order.
  std::vector<std::string> inStockSkus() const;

  const domain::InventoryItem* find(const std::string& sku) const;

  // Takes `quantity` units if all of them are on hand. A refused line on a
  // known SKU triggers a reorder.
  bool tryTake(const std::string& sku, int quantity,
               const domain::OrderId& order_id);

  // Takes `quantity` units as soon as they are on hand, then schedules
  // `on_taken`. The SKU must exist.
  void takeWhenAvailable(const std::string& sku, int quantity,
                         const domain::OrderId& order_id,
                         std::function<void()> on_taken);

  // Adds `quantity` (> 0) units and serves stock waiters.
  void replenish(const std::string& sku, int quantity,
                 const std::string& reason);

  // Teardown: drops stock waiters and pending reorders stop applying.
  void close();

  const domain::InventoryMap& items() const { return items_; }
  std::map<std::string, int> quantities() const;
  std::size_t waitingRequests() const;
  int replenishments() const { return replenishments_; }

 private:
  struct StockWaiter {
    int quantity;
    domain::OrderId order_id;
    std::function<void()> on_taken;
  };

  domain::InventoryItem& itemOrThrow(const std::string& sku);
  void take(domain::InventoryItem& item, int quantity,
            const domain::OrderId& order_id);
  void maybeReorder(const domain::InventoryItem& item, int demand = 0);
  void serveWaiters(const std::string& sku);

  domain::InventoryMap items_;
  EventScheduler& scheduler_;
  EventRecorder& recorder_;
  double lead_time_;

  std::map<std::string, std::deque<StockWaiter>> waiters_;
  std::set<std::string> reorder_pending_;
  int replenishments_{0};
  bool closed_{false};
};

}  // namespace sim
}  // namespace dtwin
