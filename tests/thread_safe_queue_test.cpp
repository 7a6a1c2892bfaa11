// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for tradeledger::ThreadSafeQueue<T>, instantiated with the
// telemetry Event variant the IpcServer buffers.
//
// Validates:
//   - FIFO order across event alternatives
//   - try_pop() on empty and non-empty queues
//   - A consumer thread sees events pushed after it started polling
//   - No loss or duplication with several publishing threads
//
// Every spawned thread is joined before the assertions run.
// =============================================================================

#include "tradeledger/concurrent/thread_safe_queue.hpp"
#include "tradeledger/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  tradeledger::ThreadSafeQueue<tradeledger::Event> queue;

  static tradeledger::Event tradeWithSequence(std::uint64_t seq) {
    tradeledger::TradeEvent e;
    e.trade.id = seq;
    e.sequence_id = seq;
    return e;
  }

  static std::uint64_t sequenceOf(const tradeledger::Event& e) {
    return std::visit([](const auto& ev) { return ev.sequence_id; }, e);
  }
};

// -----------------------------------------------------------------------------
// 1. Fresh queue is empty.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Mixed alternatives come out in the order they went in.
// Why: Subscribers rebuild order state from telemetry; an order update seen
//      after its trade would show a stale status.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesFifoOrderAcrossAlternatives) {
  tradeledger::OrderUpdateEvent update;
  update.sequence_id = 1;
  tradeledger::PositionUpdateEvent position;
  position.sequence_id = 3;

  queue.push(update);
  queue.push(tradeWithSequence(2));
  queue.push(position);
  EXPECT_EQ(queue.size(), 3u);

  auto first = *queue.try_pop();
  auto second = *queue.try_pop();
  auto third = *queue.try_pop();

  EXPECT_TRUE(std::holds_alternative<tradeledger::OrderUpdateEvent>(first));
  EXPECT_TRUE(std::holds_alternative<tradeledger::TradeEvent>(second));
  EXPECT_TRUE(std::holds_alternative<tradeledger::PositionUpdateEvent>(third));
  EXPECT_EQ(sequenceOf(first), 1u);
  EXPECT_EQ(sequenceOf(second), 2u);
  EXPECT_EQ(sequenceOf(third), 3u);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() never blocks.
// Why: The IpcServer drains telemetry with try_pop() between command polls.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopReturnsNulloptWhenEmpty) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(tradeWithSequence(5));
  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(sequenceOf(*item), 5u);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. A polling consumer picks up an event pushed after it started.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PollingConsumerSeesLaterPush) {
  std::atomic<std::uint64_t> received{0};

  std::thread consumer([this, &received] {
    for (;;) {
      if (auto item = queue.try_pop()) {
        received.store(sequenceOf(*item));
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), 0u);

  queue.push(tradeWithSequence(77));
  consumer.join();

  EXPECT_EQ(received.load(), 77u);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 5. Several producers, one drainer: every event arrives exactly once.
// Why: Fills from the re-evaluation thread and commands from the IPC thread
//      publish concurrently into the same telemetry queue.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersLoseNothing) {
  constexpr std::uint64_t kProducers = 4;
  constexpr std::uint64_t kPerProducer = 500;
  constexpr std::uint64_t kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (std::uint64_t p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (std::uint64_t i = 0; i < kPerProducer; ++i) {
        queue.push(tradeWithSequence(p * kPerProducer + i + 1));
      }
    });
  }

  std::vector<std::uint64_t> drained;
  drained.reserve(kTotal);
  std::thread drainer([this, &drained] {
    while (drained.size() < kTotal) {
      if (auto item = queue.try_pop()) {
        drained.push_back(sequenceOf(*item));
      } else {
        std::this_thread::yield();
      }
    }
  });

  for (auto& t : producers) t.join();
  drainer.join();

  std::sort(drained.begin(), drained.end());
  ASSERT_EQ(drained.size(), kTotal);
  for (std::uint64_t i = 0; i < kTotal; ++i) {
    EXPECT_EQ(drained[i], i + 1) << "missing or duplicate at index " << i;
  }
}
