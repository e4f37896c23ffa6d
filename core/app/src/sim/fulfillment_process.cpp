#include "dtwin/sim/fulfillment_process.hpp"
#include "dtwin/sim/order_lifecycle.hpp"

#include <algorithm>
#include <iostream>
#include <memory>

namespace dtwin {
namespace sim {

using domain::OrderStatus;

namespace {

// -----------------------------------------------------------------------------
// OrderActivity — continuation chain of one order
// -----------------------------------------------------------------------------
class OrderActivity : public std::enable_shared_from_this<OrderActivity> {
 public:
  OrderActivity(SimulationContext& ctx, domain::Order order, TimeSampler rng)
      : ctx_(ctx),
        order_(std::move(order)),
        rng_(std::move(rng)),
        arrived_at_(ctx.scheduler.now()) {}

  void start(EventSource source) {
    OrderCreatedEvent created;
    created.header.source = source;
    created.order_id = order_.id;
    created.customer_id = order_.customer_id;
    created.num_lines = static_cast<int>(order_.lines.size());
    created.total_items = order_.totalItems();
    created.priority = order_.priority;
    ctx_.recorder.record(created, arrived_at_);
    ctx_.metrics.orderCreated(order_);

    auto self = shared_from_this();
    ctx_.workers.request(order_.id, [self](Lease lease) {
      self->worker_ = std::move(lease);
      self->transition(OrderStatus::Picking);
      self->processLine(0);
    });
  }

 private:
  const domain::SimulationConfig& config() const { return ctx_.config; }

  void transition(OrderStatus to, std::optional<double> total_time = {}) {
    double now = ctx_.scheduler.now();
    OrderStatus from = OrderLifecycle::advance(order_, to, now);

    OrderStatusChangedEvent changed;
    changed.order_id = order_.id;
    changed.old_status = from;
    changed.new_status = to;
    changed.total_time = total_time;
    ctx_.recorder.record(changed, now);
  }

  // --- Picking ---------------------------------------------------------------

  void processLine(std::size_t index) {
    if (index >= order_.lines.size()) {
      finishPicking();
      return;
    }
    const domain::OrderLine& line = order_.lines[index];
    if (line.location.empty()) {
      pickLine(index);
      return;
    }

    auto self = shared_from_this();
    ctx_.forklifts.request(order_.id, [self, index](Lease lease) {
      self->forklift_ = std::move(lease);
      const auto& cfg = self->config();
      double travel =
          self->rng_.sample(cfg.transport_time_mean, cfg.transport_time_std);
      self->ctx_.scheduler.schedule(travel,
                                    [self, index]() { self->pickLine(index); });
    });
  }

  void pickLine(std::size_t index) {
    const domain::OrderLine& line = order_.lines[index];
    double duration = rng_.sample(config().pick_time_mean,
                                  config().pick_time_std,
                                  static_cast<double>(line.quantity));
    auto self = shared_from_this();
    ctx_.scheduler.schedule(duration, [self, index]() { self->takeStock(index); });
  }

  void takeStock(std::size_t index) {
    domain::OrderLine& line = order_.lines[index];

    bool can_wait = config().stock_policy == domain::StockPolicy::Block &&
                    ctx_.inventory.contains(line.sku);
    if (can_wait) {
      auto self = shared_from_this();
      ctx_.inventory.takeWhenAvailable(line.sku, line.quantity, order_.id,
                                       [self, index]() {
                                         auto& l = self->order_.lines[index];
                                         l.picked_quantity = l.quantity;
                                         self->endLine(index);
                                       });
      return;
    }

    if (ctx_.inventory.tryTake(line.sku, line.quantity, order_.id)) {
      line.picked_quantity = line.quantity;
    } else {
      line.short_picked = true;
      ctx_.metrics.lineShort();

      PickShortageEvent shortage;
      shortage.order_id = order_.id;
      shortage.sku = line.sku;
      shortage.requested = line.quantity;
      shortage.available = ctx_.inventory.available(line.sku);
      ctx_.recorder.record(shortage, ctx_.scheduler.now());
    }
    endLine(index);
  }

  void endLine(std::size_t index) {
    forklift_.release();
    processLine(index + 1);
  }

  void finishPicking() {
    transition(OrderStatus::Picked);
    worker_.release();

    auto self = shared_from_this();
    ctx_.workers.request(order_.id, [self](Lease lease) {
      self->worker_ = std::move(lease);
      self->startPacking();
    });
  }

  // --- Packing and shipping --------------------------------------------------

  void startPacking() {
    transition(OrderStatus::Packing);
    double units = static_cast<double>(std::max(order_.pickedItems(), 1));
    double duration =
        rng_.sample(config().pack_time_mean, config().pack_time_std, units);
    auto self = shared_from_this();
    ctx_.scheduler.schedule(duration, [self]() { self->finishPacking(); });
  }

  void finishPacking() {
    transition(OrderStatus::Packed);
    worker_.release();

    transition(OrderStatus::Shipping);
    double duration =
        rng_.sample(config().ship_time_mean, config().ship_time_std);
    auto self = shared_from_this();
    ctx_.scheduler.schedule(duration, [self]() { self->complete(); });
  }

  void complete() {
    double now = ctx_.scheduler.now();
    order_.completed_at = ms_to_timestamp(ctx_.clock.now_ms());
    transition(OrderStatus::Completed, now - arrived_at_);
    ctx_.metrics.orderCompleted(order_, arrived_at_, now);
  }

  SimulationContext& ctx_;
  domain::Order order_;
  TimeSampler rng_;
  double arrived_at_;

  Lease worker_;
  Lease forklift_;
};

}  // namespace

FulfillmentProcess::FulfillmentProcess(SimulationContext& ctx) : ctx_(ctx) {}

void FulfillmentProcess::launch(domain::Order order, TimeSampler rng,
                                EventSource source) {
  if (order.status != OrderStatus::Received) {
    std::cerr << "[FulfillmentProcess] WARNING: skipping order " << order.id
              << " in status " << domain::toString(order.status) << "\n";
    return;
  }
  ++launched_;
  auto activity =
      std::make_shared<OrderActivity>(ctx_, std::move(order), std::move(rng));
  activity->start(source);
}

}  // namespace sim
}  // namespace dtwin
