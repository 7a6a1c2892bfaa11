#pragma once

#include <atomic>
#include <cstdint>

namespace tradeledger {

// -----------------------------------------------------------------------------
// IdGenerator — lock-free monotonic id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique, strictly increasing 64-bit ids. The engine owns
//         one for orders and one for trades.
//
// @details
// fetch_add with relaxed ordering: uniqueness only needs atomicity, and the
// id is published to other threads through the mutex that guards whatever
// record carries it.
//
// reset_floor() lets startup hydration move the counter past ids loaded from
// the repository so a restarted engine never reissues one.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Ensures every subsequent id is > last_used.
  void reset_floor(std::uint64_t last_used) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= last_used &&
           !next_id_.compare_exchange_weak(current, last_used + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tradeledger
