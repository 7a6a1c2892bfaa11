#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tradeledger {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> — unbounded MPMC queue
// -----------------------------------------------------------------------------
//
// @brief  Mutex-guarded queue used to hand telemetry events from the
//         calling threads to the IpcServer thread.
//
// @details
// Producers (any thread that publishes on the EventBus) call push(); the
// IpcServer drains with try_pop() between command polls so it never blocks
// on an empty queue.
//
// FIFO per producer. Non-copyable and non-movable: the mutex is tied to
// this instance.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(value));
  }

  // Non-blocking; std::nullopt when empty.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

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
  std::deque<T> queue_;
};

}  // namespace tradeledger
