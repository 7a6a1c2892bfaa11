#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tradeledger {

// -----------------------------------------------------------------------------
// PeriodicTask — interval-driven background worker with a stop signal
// -----------------------------------------------------------------------------
//
// @brief  Runs a callable every `interval` on a dedicated thread until
//         stop() is called.
//
// @details
// The TradingEngine uses one PeriodicTask to call
// OrderLifecycleManager::reevaluateOpenOrders(): expire stale orders and
// retry resting limit / stop orders against fresh prices. The task is the
// only place that work happens on a timer; place/cancel/apply stay
// synchronous on the caller's thread.
//
// Waiting uses condition_variable::wait_for with a predicate on running_,
// so stop() interrupts a sleep immediately rather than after a full
// interval.
//
// A callable that throws std::exception is logged and the loop continues;
// one failed pass must not end the re-evaluation for the session.
//
// Thread model:
//   start()/stop() from the owning thread. The callable runs on the task
//   thread and must do its own synchronization.
//
// Ownership:
//   RAII. The destructor calls stop(), which joins.
// -----------------------------------------------------------------------------
class PeriodicTask {
 public:
  using Callback = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               Callback callback);

  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;
  PeriodicTask(PeriodicTask&&) = delete;
  PeriodicTask& operator=(PeriodicTask&&) = delete;

  // Idempotent. The first run happens one interval after start().
  void start();

  // Idempotent. Wakes the worker and joins it.
  void stop();

  bool running() const { return running_.load(); }

  // Number of completed runs, successful or not.
  std::uint64_t runCount() const { return run_count_.load(); }

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds interval_;
  Callback callback_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> run_count_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace tradeledger
