#include "tradeledger/concurrent/periodic_task.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace tradeledger {

// -----------------------------------------------------------------------------
// Constructor / Destructor
// -----------------------------------------------------------------------------
PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           Callback callback)
    : name_(std::move(name)),
      interval_(interval),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PeriodicTask::start() {
  if (thread_.joinable()) {
    return;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): clear the flag under the mutex so the waiter cannot miss it
// -----------------------------------------------------------------------------
void PeriodicTask::stop() {
  if (!thread_.joinable()) {
    return;
  }

  {
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();

  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): sleep one interval, invoke, repeat
// -----------------------------------------------------------------------------
void PeriodicTask::run() {
  while (true) {
    {
      std::unique_lock lock(stop_mutex_);
      bool stopped = stop_cv_.wait_for(lock, interval_,
                                       [this] { return !running_.load(); });
      if (stopped) {
        return;
      }
    }

    try {
      callback_();
    } catch (const std::exception& e) {
      std::cerr << "[PeriodicTask:" << name_ << "] run failed: " << e.what()
                << "\n";
    }
    run_count_.fetch_add(1);
  }
}

}  // namespace tradeledger
