#pragma once

#include "tradeledger/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeledger {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is whatever the replayed data
//         last said it was.
//
// @details
// The MarketDataGateway calls advance_time(tick.timestamp_ms) before it
// hands the tick to the engine, so an order placed or filled while that tick
// is processed is stamped with the tick's time. Identical data therefore
// yields identical timestamps, expiries and day boundaries.
//
// Storage is a single std::atomic<int64_t>: one writer (the gateway
// thread), many readers (IPC thread, periodic task, callers), no mutex.
//
// Starts at 0 until the first tick arrives.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Callers are expected to move it forward only, but
  // nothing prevents a replay from restarting at an earlier time.
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradeledger
