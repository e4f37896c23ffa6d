#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace dtwin {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Bounded FIFO hand-off between one simulation thread and the
// telemetry thread. Producers never block: when the queue is at capacity the
// oldest item is dropped and counted. Consumers wait with a timeout so they
// can notice shutdown.
//
// Why bounded: a slow or absent telemetry subscriber must not stall or grow
// a simulation run without limit. Dropping the oldest entry mirrors the
// recorder's own ring-buffer policy.
//
// Thread model: Safe for multiple producers and consumers. close() wakes
// every waiter; after close() push() is a no-op and pop_for() drains what is
// left, then returns std::nullopt.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 4096) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Returns false if the item was rejected because the queue is closed.
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      if (capacity_ > 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // Waits up to `timeout` for an item.
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    condition_.wait_for(lock, timeout,
                        [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  // Items discarded because the queue was full.
  std::size_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  std::size_t capacity_;
  std::size_t dropped_{0};
  bool closed_{false};
};

}  // namespace dtwin
