#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <mutex>
#include <optional>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that multiple threads can push to and pop from
// without data races, with an optional fixed capacity.
//
// Why in architecture: Used at the two thread boundaries of the sync
// service. Callers of enqueueOrder() push order work items that the sync
// worker drains; the simulated venue buffers inbound events that the sync
// worker dispatches when it pumps. No global mutable state: each queue is an
// object owned by the component that drains it.
//
// Capacity: a queue constructed with a capacity never holds more than that
// many items. try_push() fails immediately instead of blocking when full.
// The default-constructed queue is unbounded and push() always succeeds.
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods are thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  explicit ThreadSafeQueue(std::size_t capacity) : capacity_(capacity) {}

  // Non-copyable, non-movable: owns a mutex and a condition variable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item regardless of capacity and wakes one waiter.
  // Use for unbounded queues; bounded producers should call try_push().
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item if the queue is below capacity.
  // Output: true if the item was enqueued, false if the queue was full (the
  // value is dropped; the caller reports "queue full").
  // Thread-safety: Safe from any thread. Never blocks on a full queue.
  // -------------------------------------------------------------------------
  bool try_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one exists.
  // The predicate form of wait() handles spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout): bounded wait
  // -------------------------------------------------------------------------
  // What: Like pop(), but gives up after timeout and returns std::nullopt.
  // Used by the simulated venue's pump() so the sync tick never stalls on
  // an idle event source.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // What: Removes every queued item in one critical section and returns them
  // in FIFO order. Used on teardown so queued orders can be failed
  // explicitly instead of lingering across a reconnect.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::lock_guard lock(mutex_);
    std::vector<T> items;
    items.reserve(queue_.size());
    for (auto& item : queue_) {
      items.push_back(std::move(item));
    }
    queue_.clear();
    return items;
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  mutable std::mutex mutex_;

  // Signalled when an item is added. No "not full" condition: producers on
  // a bounded queue fail fast instead of waiting.
  std::condition_variable condition_;

  std::deque<T> queue_;

  const std::size_t capacity_{std::numeric_limits<std::size_t>::max()};
};

}  // namespace pnlsync
