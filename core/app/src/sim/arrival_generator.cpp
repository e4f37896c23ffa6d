#include "dtwin/sim/arrival_generator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dtwin {
namespace sim {

namespace {

std::string formatId(const char* prefix, std::uint64_t n, int width) {
  std::ostringstream oss;
  oss << prefix << std::setw(width) << std::setfill('0') << n;
  return oss.str();
}

}  // namespace

ArrivalGenerator::ArrivalGenerator(const domain::SimulationConfig& config,
                                   EventScheduler& scheduler,
                                   const Inventory& inventory,
                                   const ITimeProvider& clock, Sink sink)
    : config_(config),
      scheduler_(scheduler),
      inventory_(inventory),
      clock_(clock),
      sink_(std::move(sink)),
      arrivals_(config.random_seed, TimeSampler::kArrivalStream),
      rate_per_unit_(config.order_arrival_rate /
                     domain::unitsPerHour(config.time_unit)) {}

void ArrivalGenerator::start() { scheduleNext(); }

void ArrivalGenerator::scheduleNext() {
  double gap = arrivals_.exponential(rate_per_unit_);
  if (scheduler_.now() + gap >= config_.simulation_time) {
    return;
  }
  scheduler_.schedule(gap, [this]() { arrive(); });
}

void ArrivalGenerator::arrive() {
  std::uint64_t index = next_index_++;
  TimeSampler rng(config_.random_seed, TimeSampler::kOrderStream, index);

  domain::Order order = makeOrder(rng, index);
  if (order.lines.empty()) {
    ++skipped_;
  } else {
    ++generated_;
    sink_(std::move(order), std::move(rng));
  }
  scheduleNext();
}

domain::Order ArrivalGenerator::makeOrder(TimeSampler& rng,
                                          std::uint64_t index) const {
  domain::Order order;
  order.id = formatId("SIM-", index, 6);
  order.customer_id = formatId("CUST-", static_cast<std::uint64_t>(
                                            rng.uniformInt(1, 100)), 4);
  order.priority = rng.uniformInt(1, 5);
  order.status = domain::OrderStatus::Received;
  order.created_at = ms_to_timestamp(clock_.now_ms());

  std::vector<std::string> skus = inventory_.inStockSkus();
  if (skus.empty()) {
    return order;
  }

  int wanted = static_cast<int>(
      rng.sample(config_.items_per_order_mean, config_.items_per_order_std));
  int count = std::min(std::max(1, wanted), static_cast<int>(skus.size()));

  // Partial Fisher-Yates: the first `count` slots become the selection.
  for (int i = 0; i < count; ++i) {
    int j = rng.uniformInt(i, static_cast<int>(skus.size()) - 1);
    std::swap(skus[static_cast<std::size_t>(i)],
              skus[static_cast<std::size_t>(j)]);

    domain::OrderLine line;
    line.sku = skus[static_cast<std::size_t>(i)];
    line.quantity = rng.uniformInt(1, 3);
    if (const auto* item = inventory_.find(line.sku)) {
      line.location = item->location;
    }
    order.lines.push_back(std::move(line));
  }
  return order;
}

}  // namespace sim
}  // namespace dtwin
