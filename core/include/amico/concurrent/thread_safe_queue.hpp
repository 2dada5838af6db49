#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace amico {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between producer and consumer threads.
// Event sources push AgentEvents from their own threads; the agent loop pops
// them one at a time. The control server uses one for outbound telemetry.
//
// Thread model: Safe for multiple producers and multiple consumers. pop()
// and pop_for() block the caller; try_pop() never blocks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one blocked consumer.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
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
  // pop_for(timeout): blocking with an upper bound
  // -------------------------------------------------------------------------
  // @brief  Waits at most `timeout` for an item.
  //
  // @return The front item, or std::nullopt if the queue stayed empty for the
  //         whole timeout or wake() was called.
  //
  // @details
  // The agent loop polls with this so it can re-check its shutdown flag
  // between events without busy-waiting.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    const auto seen_wakeups = wakeups_;
    condition_.wait_for(lock, timeout, [this, seen_wakeups] {
      return !queue_.empty() || wakeups_ != seen_wakeups;
    });
    if (queue_.empty()) {
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
  // wake()
  // -------------------------------------------------------------------------
  // Releases every consumer blocked in pop_for() without pushing an item.
  // Used by Agent::shutdown() so the loop notices the request immediately.
  // -------------------------------------------------------------------------
  void wake() {
    {
      std::lock_guard lock(mutex_);
      ++wakeups_;
    }
    condition_.notify_all();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  // Discards every queued item. Returns how many were dropped.
  std::size_t clear() {
    std::lock_guard lock(mutex_);
    const std::size_t dropped = queue_.size();
    queue_.clear();
    return dropped;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
  std::size_t wakeups_{0};  // bumped by wake(); guarded by mutex_
};

}  // namespace amico
