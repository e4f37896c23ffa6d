#include "dtwin/sim/resource_pool.hpp"
#include "dtwin/common/errors.hpp"

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// Lease
// -----------------------------------------------------------------------------
Lease::~Lease() { release(); }

Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), holder_(std::move(other.holder_)) {
  other.pool_ = nullptr;
}

Lease& Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    holder_ = std::move(other.holder_);
    other.pool_ = nullptr;
  }
  return *this;
}

void Lease::release() {
  if (pool_ != nullptr) {
    ResourcePool* pool = pool_;
    pool_ = nullptr;
    pool->release(holder_);
  }
}

// -----------------------------------------------------------------------------
// ResourcePool
// -----------------------------------------------------------------------------
ResourcePool::ResourcePool(std::string name, int capacity,
                           EventScheduler& scheduler)
    : name_(std::move(name)), capacity_(capacity), scheduler_(scheduler) {
  if (capacity_ < 1) {
    throw ConfigError("resource pool '" + name_ + "' needs capacity >= 1");
  }
  last_change_ = scheduler_.now();
}

void ResourcePool::request(std::string holder, GrantCallback on_grant) {
  if (closed_) {
    return;
  }
  Waiter waiter{std::move(holder), std::move(on_grant)};
  if (in_use_ < capacity_ && waiters_.empty()) {
    grant(std::move(waiter));
  } else {
    waiters_.push_back(std::move(waiter));
  }
}

// Reserves the unit now and delivers the lease as a continuation.
void ResourcePool::grant(Waiter waiter) {
  accumulate();
  ++in_use_;
  ++grants_;
  scheduler_.schedule(0.0, [this, w = std::move(waiter)]() {
    if (closed_) {
      return;
    }
    if (trace_) {
      trace_(Change::Granted, w.holder, in_use_);
    }
    w.on_grant(Lease(this, w.holder));
  });
}

void ResourcePool::release(const std::string& holder) {
  accumulate();
  --in_use_;
  if (closed_) {
    return;
  }
  if (trace_) {
    trace_(Change::Released, holder, in_use_);
  }
  if (!waiters_.empty()) {
    Waiter next = std::move(waiters_.front());
    waiters_.pop_front();
    grant(std::move(next));
  }
}

void ResourcePool::close() {
  if (closed_) {
    return;
  }
  accumulate();
  closed_ = true;
  // Destroying a waiter may destroy the activity it captured, which in turn
  // may release other leases back into this pool.
  std::deque<Waiter> doomed;
  doomed.swap(waiters_);
}

void ResourcePool::accumulate() {
  double now = scheduler_.now();
  busy_integral_ += static_cast<double>(in_use_) * (now - last_change_);
  last_change_ = now;
}

double ResourcePool::busyTime() const {
  double now = scheduler_.now();
  return busy_integral_ + static_cast<double>(in_use_) * (now - last_change_);
}

double ResourcePool::utilisation(double elapsed) const {
  if (elapsed <= 0.0) {
    return 0.0;
  }
  return busyTime() / (static_cast<double>(capacity_) * elapsed);
}

}  // namespace sim
}  // namespace dtwin
