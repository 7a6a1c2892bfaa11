#pragma once

#include "tradeledger/events/event_types.hpp"
#include "tradeledger/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace tradeledger {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ SUB feed of price ticks
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks on a SUB socket, optionally advances the
//         simulation clock, and hands each tick to the engine as a
//         MarketDataEvent.
//
// @details
// Expected payload:
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "symbol":       "AAPL",
//     "price":        150.25,
//     "volume":       100.0            // optional, defaults to 0
//   }
//
// Per message, in order:
//   1. advance_time(timestamp_ms), when a SimulationTimeProvider was given,
//      so that orders placed or filled while the tick is processed carry
//      the tick's time.
//   2. sink_(MarketDataEvent).
//
// Malformed payloads are logged to stderr and skipped.
//
// Thread model:
//   run() blocks the calling thread (the process main thread in
//   tradeledger). stop() may be called from any thread, including a signal
//   handler; the loop notices within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq context and socket. The time provider, when given, must
//   outlive the gateway.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using TickSink = std::function<void(const MarketDataEvent&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  sim_clock  Clock to advance per tick, or nullptr when the engine
  //                    runs on the wall clock.
  // @param  sink       Called for every decoded tick, on the run() thread.
  // @param  endpoint   Publisher to connect to.
  // -------------------------------------------------------------------------
  MarketDataGateway(SimulationTimeProvider* sim_clock, TickSink sink,
                    const std::string& endpoint);

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // Blocking receive loop; returns after stop().
  void run();

  void stop();

  // Decodes one payload. Throws nlohmann::json::exception on malformed
  // input. sequence_id is left 0.
  static MarketDataEvent parseTick(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider* sim_clock_;
  TickSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::uint64_t sequence_{0};
};

}  // namespace tradeledger
