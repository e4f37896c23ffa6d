#pragma once

#include "dtwin/sim/event_scheduler.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <utility>

namespace dtwin {
namespace sim {

class ResourcePool;

// -----------------------------------------------------------------------------
// Lease — scoped ownership of one pool unit
// -----------------------------------------------------------------------------
// Move-only. The unit returns to its pool when the lease is released
// explicitly or destroyed, whichever comes first, so an activity that is
// torn down mid-stage never leaks a worker or a forklift.
//
// A lease must not outlive its pool. Simulation guarantees this by closing
// the pools and clearing the scheduler (which owns every activity) before
// the pools are destroyed.
// -----------------------------------------------------------------------------
class Lease {
 public:
  Lease() = default;
  ~Lease();

  Lease(Lease&& other) noexcept;
  Lease& operator=(Lease&& other) noexcept;

  Lease(const Lease&) = delete;
  Lease& operator=(const Lease&) = delete;

  // Returns the unit now. Idempotent.
  void release();

  bool active() const { return pool_ != nullptr; }
  const std::string& holder() const { return holder_; }

 private:
  friend class ResourcePool;
  Lease(ResourcePool* pool, std::string holder)
      : pool_(pool), holder_(std::move(holder)) {}

  ResourcePool* pool_{nullptr};
  std::string holder_;
};

// -----------------------------------------------------------------------------
// ResourcePool — finite-capacity FIFO allocator
// -----------------------------------------------------------------------------
//
// @brief  Hands out at most `capacity` units at a time, strictly in request
//         order.
//
// @details
// request() either reserves a free unit immediately or queues the request.
// In both cases the grant callback runs as a scheduled continuation at the
// current simulated instant, never re-entrantly from inside request() or
// release(). A unit freed by release() goes straight to the head of the
// wait queue, so a later request can never overtake an earlier one. Order
// priority plays no part.
//
// Waiting is not an error: requests still queued when the horizon is
// reached simply stay unserved and are reported as pending.
//
// Tracing: when a trace hook is set, it is invoked on every grant delivery
// and every release with the holder id and the busy count afterwards.
//
// Thread model:
//   Single-threaded, driven by the owning Simulation's EventScheduler.
// -----------------------------------------------------------------------------
class ResourcePool {
 public:
  enum class Change { Granted, Released };

  using GrantCallback = std::function<void(Lease)>;
  using TraceHook =
      std::function<void(Change change, const std::string& holder, int in_use)>;

  ResourcePool(std::string name, int capacity, EventScheduler& scheduler);

  ResourcePool(const ResourcePool&) = delete;
  ResourcePool& operator=(const ResourcePool&) = delete;

  void request(std::string holder, GrantCallback on_grant);

  // Teardown: drops queued requests and stops granting. Units still leased
  // may be released afterwards; they are counted back silently.
  void close();

  void setTraceHook(TraceHook hook) { trace_ = std::move(hook); }

  const std::string& name() const { return name_; }
  int capacity() const { return capacity_; }
  int inUse() const { return in_use_; }
  std::size_t queueLength() const { return waiters_.size(); }
  std::uint64_t grants() const { return grants_; }
  bool closed() const { return closed_; }

  // Integral of busy units over simulated time up to now().
  double busyTime() const;

  // busyTime() / (capacity * elapsed); 0 when no time has elapsed.
  double utilisation(double elapsed) const;

 private:
  friend class Lease;

  struct Waiter {
    std::string holder;
    GrantCallback on_grant;
  };

  void release(const std::string& holder);
  void grant(Waiter waiter);
  void accumulate();

  std::string name_;
  int capacity_;
  EventScheduler& scheduler_;

  int in_use_{0};
  std::deque<Waiter> waiters_;
  std::uint64_t grants_{0};
  bool closed_{false};

  double busy_integral_{0.0};
  double last_change_{0.0};

  TraceHook trace_;
};

}  // namespace sim
}  // namespace dtwin
