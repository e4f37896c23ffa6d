#include "dtwin/erp/mock_erp_adapter.hpp"
#include "dtwin/common/errors.hpp"
#include "dtwin/sim/inventory.hpp"
#include "dtwin/time/time_utils.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace dtwin {
namespace erp {

namespace {

// Stream reserved for the mock's own draws (order priorities).
constexpr std::uint64_t kMockErpStream = 100;

}  // namespace

MockErpAdapter::MockErpAdapter(const domain::SimulationConfig& config,
                               const ITimeProvider& clock)
    : clock_(clock),
      inventory_(sim::seedInventory(config.num_storage_locations,
                                    config.random_seed,
                                    ms_to_timestamp(clock.now_ms()))),
      rng_(config.random_seed, kMockErpStream) {}

bool MockErpAdapter::connect() {
  {
    std::lock_guard lock(mutex_);
    connected_ = true;
  }
  std::cout << "[MockErpAdapter] Connected\n";
  return true;
}

void MockErpAdapter::disconnect() {
  {
    std::lock_guard lock(mutex_);
    connected_ = false;
  }
  std::cout << "[MockErpAdapter] Disconnected\n";
}

bool MockErpAdapter::isConnected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

void MockErpAdapter::requireReadable() const {
  if (!connected_) {
    throw ErpError("ERP adapter is not connected");
  }
  if (failing_) {
    throw ErpError("ERP adapter read failed");
  }
}

std::vector<domain::Order> MockErpAdapter::fetchOrders(
    std::optional<domain::OrderStatus> status) {
  std::lock_guard lock(mutex_);
  requireReadable();
  std::vector<domain::Order> out;
  for (const auto& id : order_sequence_) {
    const domain::Order& order = orders_.at(id);
    if (!status || order.status == *status) {
      out.push_back(order);
    }
  }
  return out;
}

domain::InventoryMap MockErpAdapter::fetchInventory() {
  std::lock_guard lock(mutex_);
  requireReadable();
  return inventory_;
}

bool MockErpAdapter::updateOrderStatus(const domain::OrderId& order_id,
                                       domain::OrderStatus status) {
  OrderStatusChangedEvent event;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
      return false;
    }
    event.old_status = it->second.status;
    it->second.status = status;
  }
  event.order_id = order_id;
  event.new_status = status;
  emit(event);
  return true;
}

bool MockErpAdapter::updateInventory(const std::string& sku, int delta) {
  InventoryUpdatedEvent event;
  {
    std::lock_guard lock(mutex_);
    auto it = inventory_.find(sku);
    if (it == inventory_.end() || it->second.quantity + delta < 0) {
      return false;
    }
    it->second.quantity += delta;
    it->second.last_updated = ms_to_timestamp(clock_.now_ms());
    event.new_quantity = it->second.quantity;
  }
  event.sku = sku;
  event.delta = delta;
  event.reason = "erp_update";
  emit(event);
  return true;
}

bool MockErpAdapter::subscribeToEvents(EventCallback callback) {
  std::lock_guard lock(mutex_);
  callbacks_.push_back(std::move(callback));
  return true;
}

domain::Order MockErpAdapter::createOrder(
    const std::string& customer_id,
    const std::vector<std::pair<std::string, int>>& items) {
  domain::Order order;
  {
    std::lock_guard lock(mutex_);
    std::ostringstream id;
    id << "ORD-" << std::setw(6) << std::setfill('0') << orders_.size() + 1;
    order.id = id.str();
    order.customer_id = customer_id;
    order.priority = rng_.uniformInt(1, 5);
    order.created_at = ms_to_timestamp(clock_.now_ms());
    for (const auto& [sku, quantity] : items) {
      auto it = inventory_.find(sku);
      if (it == inventory_.end()) {
        continue;
      }
      domain::OrderLine line;
      line.sku = sku;
      line.quantity = quantity;
      line.location = it->second.location;
      order.lines.push_back(std::move(line));
    }
    orders_.emplace(order.id, order);
    order_sequence_.push_back(order.id);
  }

  OrderCreatedEvent event;
  event.order_id = order.id;
  event.customer_id = order.customer_id;
  event.num_lines = static_cast<int>(order.lines.size());
  event.total_items = order.totalItems();
  event.priority = order.priority;
  emit(event);
  return order;
}

void MockErpAdapter::setFailing(bool failing) {
  std::lock_guard lock(mutex_);
  failing_ = failing;
}

std::size_t MockErpAdapter::orderCount() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

void MockErpAdapter::emit(Event event) {
  std::vector<EventCallback> callbacks;
  {
    std::lock_guard lock(mutex_);
    EventHeader& header = headerOf(event);
    header.sequence_id = next_event_id_++;
    header.timestamp = ms_to_timestamp(clock_.now_ms());
    header.source = EventSource::Erp;
    callbacks = callbacks_;
  }
  for (const auto& callback : callbacks) {
    callback(event);
  }
}

}  // namespace erp
}  // namespace dtwin
