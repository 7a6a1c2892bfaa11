#pragma once

#include "tradeledger/concurrent/thread_safe_queue.hpp"
#include "tradeledger/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradeledger {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command (REP) and telemetry (PUB) endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers JSON commands on a REP socket
//         and broadcasts order, trade, position and risk-violation events
//         as JSON on a PUB socket.
//
// @details
// Telemetry:
//   pushTelemetry() enqueues into a ThreadSafeQueue from whichever thread
//   published on the EventBus. The worker drains the queue with try_pop()
//   on every loop iteration, so serialization and socket I/O never run on
//   the thread that placed or filled the order.
//
// Commands:
//   Each request string is passed to command_handler_ (bound to
//   TradingEngine::executeCommand()) and the returned JSON string is the
//   reply. The REP socket has a receive timeout of kPollTimeoutMs so the
//   loop alternates between commands and telemetry and notices stop().
//
// Thread model:
//   start()/stop() from the owning thread. The command handler runs on the
//   worker thread.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the zmq context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  // Calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. Idempotent.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, publishes what is left in the queue and
  // closes the sockets. Idempotent.
  void stop();

  // Safe from any thread.
  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return JSON text with a "type" key (order_update, trade,
  //         position_update, risk_violation) or std::nullopt for event types
  //         that are not broadcast (MarketDataEvent).
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatOrderUpdate(const OrderUpdateEvent& e);
  static std::string formatTrade(const TradeEvent& e);
  static std::string formatPositionUpdate(const PositionUpdateEvent& e);
  static std::string formatRiskViolation(const RiskViolationEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeledger
