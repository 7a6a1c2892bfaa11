// =============================================================================
// periodic_task_test.cpp
// =============================================================================
// Unit tests for tradeledger::PeriodicTask.
//
// Validates:
//   - The callback runs repeatedly at roughly the interval
//   - stop() returns promptly even with a long interval
//   - A throwing callback does not kill the worker
//   - start()/stop() are idempotent; the destructor stops the thread
// =============================================================================

#include "tradeledger/concurrent/periodic_task.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using tradeledger::PeriodicTask;
using namespace std::chrono_literals;

class PeriodicTaskTest : public ::testing::Test {
 protected:
  std::atomic<int> calls{0};

  // Polls until `pred` holds or `timeout` elapses.
  template <typename Pred>
  static bool waitFor(Pred pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (pred()) {
        return true;
      }
      std::this_thread::sleep_for(2ms);
    }
    return pred();
  }
};

// -----------------------------------------------------------------------------
// 1. A 5 ms task runs several times within a second.
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, RunsRepeatedly) {
  PeriodicTask task("test", 5ms, [this] { ++calls; });
  task.start();
  EXPECT_TRUE(task.running());

  EXPECT_TRUE(waitFor([this] { return calls.load() >= 3; }, 1000ms));

  task.stop();
  EXPECT_FALSE(task.running());
  EXPECT_GE(task.runCount(), 3u);
}

// -----------------------------------------------------------------------------
// 2. stop() wakes the worker instead of waiting out the interval.
// Why: Engine shutdown must not hang for a full re-evaluation interval.
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, StopInterruptsLongInterval) {
  PeriodicTask task("slow", 60s, [this] { ++calls; });
  task.start();

  const auto begin = std::chrono::steady_clock::now();
  task.stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, 2s);
  EXPECT_EQ(calls.load(), 0);
}

// -----------------------------------------------------------------------------
// 3. An exception from the callback is logged and the schedule continues.
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, SurvivesThrowingCallback) {
  PeriodicTask task("flaky", 5ms, [this] {
    ++calls;
    throw std::runtime_error("boom");
  });
  task.start();

  EXPECT_TRUE(waitFor([this] { return calls.load() >= 2; }, 1000ms));
  task.stop();
}

// -----------------------------------------------------------------------------
// 4. Double start and double stop are harmless; destruction joins.
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, StartStopAreIdempotent) {
  {
    PeriodicTask task("idem", 5ms, [this] { ++calls; });
    task.start();
    task.start();
    task.stop();
    task.stop();
    EXPECT_FALSE(task.running());

    task.start();
    EXPECT_TRUE(task.running());
  }
  const int after_destroy = calls.load();
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(calls.load(), after_destroy);
}
