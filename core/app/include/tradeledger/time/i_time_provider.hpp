#pragma once

#include <cstdint>

namespace tradeledger {

// -----------------------------------------------------------------------------
// ITimeProvider — the engine's single source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Abstract clock returning epoch milliseconds.
//
// @details
// Every order, trade and lot timestamp comes from an ITimeProvider, never
// from std::chrono::system_clock directly. Two implementations exist:
//
//   LiveTimeProvider        wall clock, for live sessions.
//   SimulationTimeProvider  set by the market-data replay, for backtests
//                           and deterministic tests.
//
// Expiry checks and the daily-loss day boundary therefore follow simulated
// time during a replay.
//
// Thread-safety: implementations must allow concurrent now_ms() calls.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradeledger
