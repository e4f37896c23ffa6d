#include "dtwin/sim/inventory.hpp"
#include "dtwin/common/errors.hpp"
#include "dtwin/sim/time_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace dtwin {
namespace sim {

domain::InventoryMap seedInventory(int locations, std::uint64_t seed,
                                   Timestamp stamp) {
  TimeSampler rng(seed, TimeSampler::kInventoryStream);
  domain::InventoryMap items;
  for (int i = 0; i < locations; ++i) {
    std::ostringstream sku;
    sku << "SKU-" << std::setw(4) << std::setfill('0') << i;
    std::ostringstream location;
    location << "A-" << std::setw(2) << std::setfill('0') << (i / 10) << "-"
             << std::setw(2) << std::setfill('0') << (i % 10);

    domain::InventoryItem item;
    item.sku = sku.str();
    item.name = "Product " + std::to_string(i);
    item.quantity = rng.uniformInt(10, 100);
    item.location = location.str();
    item.min_stock = 10;
    item.max_stock = 100;
    item.unit_cost = std::round(rng.uniformReal(5.0, 50.0) * 100.0) / 100.0;
    item.last_updated = stamp;
    items.emplace(item.sku, item);
  }
  return items;
}

Inventory::Inventory(domain::InventoryMap items, EventScheduler& scheduler,
                     EventRecorder& recorder, double lead_time)
    : items_(std::move(items)),
      scheduler_(scheduler),
      recorder_(recorder),
      lead_time_(lead_time) {
  for (const auto& [sku, item] : items_) {
    if (item.quantity < 0) {
      throw ConfigError("inventory item '" + sku + "' has negative quantity");
    }
  }
}

bool Inventory::contains(const std::string& sku) const {
  return items_.count(sku) > 0;
}

int Inventory::available(const std::string& sku) const {
  auto it = items_.find(sku);
  return it == items_.end() ? 0 : it->second.quantity;
}

std::vector<std::string> Inventory::inStockSkus() const {
  std::vector<std::string> skus;
  for (const auto& [sku, item] : items_) {
    if (item.quantity > 0) {
      skus.push_back(sku);
    }
  }
  return skus;
}

const domain::InventoryItem* Inventory::find(const std::string& sku) const {
  auto it = items_.find(sku);
  return it == items_.end() ? nullptr : &it->second;
}

domain::InventoryItem& Inventory::itemOrThrow(const std::string& sku) {
  auto it = items_.find(sku);
  if (it == items_.end()) {
    throw SimulationError("unknown SKU '" + sku + "'");
  }
  return it->second;
}

bool Inventory::tryTake(const std::string& sku, int quantity,
                        const domain::OrderId& order_id) {
  auto it = items_.find(sku);
  if (it == items_.end()) {
    return false;
  }
  if (it->second.quantity < quantity) {
    maybeReorder(it->second, quantity);
    return false;
  }
  take(it->second, quantity, order_id);
  return true;
}

void Inventory::takeWhenAvailable(const std::string& sku, int quantity,
                                  const domain::OrderId& order_id,
                                  std::function<void()> on_taken) {
  domain::InventoryItem& item = itemOrThrow(sku);
  auto& queue = waiters_[sku];
  if (queue.empty() && item.quantity >= quantity) {
    take(item, quantity, order_id);
    scheduler_.schedule(0.0, std::move(on_taken));
    return;
  }
  queue.push_back(StockWaiter{quantity, order_id, std::move(on_taken)});
  maybeReorder(item, queue.front().quantity);
}

void Inventory::take(domain::InventoryItem& item, int quantity,
                     const domain::OrderId& order_id) {
  if (quantity <= 0 || item.quantity - quantity < 0) {
    std::ostringstream oss;
    oss << "pick of " << quantity << " x " << item.sku << " would leave "
        << item.quantity - quantity << " on hand";
    throw SimulationError(oss.str());
  }
  item.quantity -= quantity;

  InventoryUpdatedEvent event;
  event.sku = item.sku;
  event.delta = -quantity;
  event.new_quantity = item.quantity;
  event.reason = "pick";
  event.order_id = order_id;
  recorder_.record(event, scheduler_.now());

  maybeReorder(item);
}

void Inventory::maybeReorder(const domain::InventoryItem& item, int demand) {
  if (lead_time_ <= 0.0 || reorder_pending_.count(item.sku) > 0) {
    return;
  }
  if (item.quantity >= item.min_stock && item.quantity >= demand) {
    return;
  }
  reorder_pending_.insert(item.sku);
  std::string sku = item.sku;
  scheduler_.schedule(lead_time_, [this, sku]() {
    reorder_pending_.erase(sku);
    if (closed_) {
      return;
    }
    const domain::InventoryItem& current = itemOrThrow(sku);
    // A waiting line larger than max_stock still gets enough to be served.
    int target = current.max_stock;
    auto waiting = waiters_.find(sku);
    if (waiting != waiters_.end() && !waiting->second.empty()) {
      target = std::max(target, waiting->second.front().quantity);
    }
    int top_up = target - current.quantity;
    if (top_up > 0) {
      replenish(sku, top_up, "replenishment");
    }
  });
}

void Inventory::replenish(const std::string& sku, int quantity,
                          const std::string& reason) {
  if (quantity <= 0) {
    throw SimulationError("replenishment of '" + sku +
                          "' must add at least one unit");
  }
  domain::InventoryItem& item = itemOrThrow(sku);
  item.quantity += quantity;
  ++replenishments_;

  InventoryUpdatedEvent event;
  event.sku = sku;
  event.delta = quantity;
  event.new_quantity = item.quantity;
  event.reason = reason;
  recorder_.record(event, scheduler_.now());

  serveWaiters(sku);
}

void Inventory::serveWaiters(const std::string& sku) {
  auto it = waiters_.find(sku);
  if (it == waiters_.end()) {
    return;
  }
  domain::InventoryItem& item = itemOrThrow(sku);
  auto& queue = it->second;
  while (!queue.empty() && queue.front().quantity <= item.quantity) {
    StockWaiter waiter = std::move(queue.front());
    queue.pop_front();
    take(item, waiter.quantity, waiter.order_id);
    scheduler_.schedule(0.0, std::move(waiter.on_taken));
  }
  if (!queue.empty()) {
    maybeReorder(item, queue.front().quantity);
  }
}

void Inventory::close() {
  closed_ = true;
  std::map<std::string, std::deque<StockWaiter>> doomed;
  doomed.swap(waiters_);
}

std::map<std::string, int> Inventory::quantities() const {
  std::map<std::string, int> out;
  for (const auto& [sku, item] : items_) {
    out.emplace(sku, item.quantity);
  }
  return out;
}

std::size_t Inventory::waitingRequests() const {
  std::size_t total = 0;
  for (const auto& [sku, queue] : waiters_) {
    total += queue.size();
  }
  return total;
}

}  // namespace sim
}  // namespace dtwin
