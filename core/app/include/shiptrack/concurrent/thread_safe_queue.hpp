#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace shiptrack {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that multiple threads can push to and pop from
// without data races. Provides blocking pop() and non-blocking try_pop().
//
// Where it is used: the event transport outbox. Request threads that commit a
// shipment or location mutation push the resulting events; the transport
// worker thread drains them and writes to the socket. The committing thread
// never waits on socket I/O.
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods are thread-safe. The queue is unbounded.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable and non-movable: std::mutex and std::condition_variable are
  // neither. Share the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one thread blocked in pop(), if any. The lock
  // is released before notifying so the woken consumer does not immediately
  // block on the same mutex.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting until one is available. The
  // predicate form of wait() handles spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // Returns the front item if present, std::nullopt otherwise. Used by the
  // transport worker to drain the outbox between socket polls.
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

  // Snapshot only: another thread may push or pop right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace shiptrack
