#pragma once

#include "tradeledger/account/simulated_account.hpp"
#include "tradeledger/concurrent/id_generator.hpp"
#include "tradeledger/concurrent/periodic_task.hpp"
#include "tradeledger/config/engine_config.hpp"
#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/position.hpp"
#include "tradeledger/domain/risk_decision.hpp"
#include "tradeledger/domain/tax_summary.hpp"
#include "tradeledger/eventbus/event_bus.hpp"
#include "tradeledger/execution/execution_simulator.hpp"
#include "tradeledger/lifecycle/order_lifecycle_manager.hpp"
#include "tradeledger/market/price_cache.hpp"
#include "tradeledger/network/ipc_server.hpp"
#include "tradeledger/persistence/in_memory_repository.hpp"
#include "tradeledger/portfolio/position_book.hpp"
#include "tradeledger/ports/i_repository.hpp"
#include "tradeledger/risk/risk_gate.hpp"
#include "tradeledger/risk/risk_metrics.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the order lifecycle and position-accounting
//         engine. Owns every component and exposes the operations callers
//         use, both as C++ methods and as JSON commands over the IPC socket.
//
// @details
// Component graph (all created in the constructor):
//
//   PriceCache ──> RiskGate ──┐
//        │                    ├──> OrderLifecycleManager ──> IRepository
//        │   ExecutionSimulator┤     │        │
//        │   PositionBook ─────┘     │ settle │ publishes
//        │   SimulatedAccount <──────┘        │
//        └── MarketDataEvent ─────────────────┴──> EventBus ──> IpcServer
//
// The synchronous core (placeOrder, cancelOrder, riskCheck, ...) works as
// soon as the engine is constructed. start() adds the background parts:
//
//   1. Hydration from the repository (first start only): positions and
//      lots into the PositionBook, orders and trades into the lifecycle
//      manager, persisted trades replayed into the account's cash.
//   2. IpcServer (skipped when either endpoint is empty) and the telemetry
//      bridge from the EventBus.
//   3. PeriodicTask running OrderLifecycleManager::reevaluateOpenOrders()
//      every reevaluation_interval.
//
// Market data does not belong to the engine: main runs the
// MarketDataGateway loop on the process main thread and feeds
// onMarketData().
//
// Thread model:
//   start()/stop() from the owning thread. Every other public method is
//   safe from any thread: the IPC worker, the periodic task and the gateway
//   call into the engine concurrently.
//
// Ownership:
//   TradingEngine
//    ├── bus_                 (EventBus, value member, outlives components)
//    ├── order_ids_, trade_ids_
//    ├── owned_repository_    (only when no repository was injected)
//    ├── price_cache_, book_, gate_, simulator_, account_, lifecycle_
//    ├── ipc_server_          (between start() and stop())
//    └── reevaluation_task_   (between start() and stop())
//
//   The clock and an injected repository are non-owning and must outlive
//   the engine.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config      Validated again here; throws ValidationError.
  // @param  clock       Source of every timestamp.
  // @param  repository  Durable store. nullptr means an InMemoryRepository
  //                     owned by the engine.
  // -------------------------------------------------------------------------
  TradingEngine(EngineConfig config, const ITimeProvider& clock,
                IRepository* repository = nullptr);

  // Calls stop().
  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // Idempotent. Throws whatever hydration or socket binding throws; the
  // engine is then left stopped.
  void start();

  // Idempotent. Stops the periodic task, then the IpcServer.
  void stop();

  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // onMarketData(event)
  // -------------------------------------------------------------------------
  // Publishes the tick on the EventBus. The engine's own subscription
  // records it in the PriceCache and marks every position in the symbol to
  // market. Sink of the MarketDataGateway.
  // -------------------------------------------------------------------------
  void onMarketData(const MarketDataEvent& event);

  // --- Operations --------------------------------------------------------------

  domain::OrderId placeOrder(const domain::OrderRequest& request);

  void cancelOrder(domain::OrderId id);

  domain::PositionSnapshot getPosition(const std::string& symbol,
                                       domain::TradingMode mode) const;

  // -------------------------------------------------------------------------
  // riskCheck(request, reference_price)
  // -------------------------------------------------------------------------
  // Dry run of the RiskGate against the current portfolio. Nothing is
  // stored. Without an explicit reference price the market price is used,
  // else the request's limit, else its stop price.
  //
  // @throws ValidationError when no reference price can be found.
  // -------------------------------------------------------------------------
  domain::RiskDecision riskCheck(
      const domain::OrderRequest& request,
      std::optional<double> reference_price = std::nullopt) const;

  // Monetary one-period VaR; empty symbol = whole portfolio.
  double computeVar(const std::string& symbol, VarMethod method,
                    double confidence) const;

  double computeExpectedShortfall(const std::string& symbol,
                                  double confidence) const;

  std::size_t switchTradingMode(domain::TradingMode mode);

  // Lot totals over both modes. Empty symbol = every symbol, with a
  // per-symbol breakdown; unset year = every acquisition year.
  domain::TaxSummary taxSummary(const std::string& symbol,
                                std::optional<int> year) const;

  // taxSummary() for `year` plus the trade counts, realized P&L and taxes
  // of the trades executed in it.
  domain::TaxReport taxReport(int year, const std::string& symbol) const;

  // Newest first, at most `limit`. @throws ValidationError("limit") on 0.
  std::vector<domain::Order> orderHistory(
      const std::string& symbol, std::optional<domain::TradingMode> mode,
      std::size_t limit) const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Handles one request from the IPC command socket.
  //
  // @param  cmd  Either a bare command word ("PING", "STATUS") or a JSON
  //              object {"command": "...", ...arguments}.
  //
  // @return {"status":"ok","response":...} or
  //         {"status":"error","error":{reason_code, message, ...}}.
  //
  // @details
  //   PING          → "PONG"
  //   STATUS        → cash, portfolio value, daily P&L, open orders,
  //                   positions
  //   PLACE_ORDER   {"order": {...}}                → order
  //   CANCEL_ORDER  {"order_id": n}                 → order
  //   GET_POSITION  {"symbol": s, "mode": m?}       → position + lots
  //   RISK_CHECK    {"order": {...}, "price": p?}   → decision
  //   COMPUTE_VAR   {"symbol": s?, "method": m?, "confidence": c?}
  //                 → var, expected_shortfall, var_1w, var_1m
  //   SWITCH_MODE   {"mode": m}                     → orders moved
  //   TAX_SUMMARY   {"symbol": s?, "year": y?}      → lot totals
  //   TAX_REPORT    {"year": y, "symbol": s?}       → summary + trades
  //   ORDER_HISTORY {"symbol": s?, "mode": m?, "limit": n? (50)}
  //                 → orders, newest first
  //
  // Never throws: every failure becomes an error response.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // --- Accessors ---------------------------------------------------------------

  EventBus& eventBus() { return bus_; }
  OrderLifecycleManager& lifecycle() { return *lifecycle_; }
  const PositionBook& positionBook() const { return *book_; }
  const RiskGate& riskGate() const { return *gate_; }
  double cashBalance() const { return account_->cashBalance(); }
  const EngineConfig& config() const { return config_; }

 private:
  void hydrate();

  void applyTick(const MarketDataEvent& event);

  nlohmann::json dispatch(const std::string& command,
                          const nlohmann::json& args);

  nlohmann::json statusJson() const;

  Timestamp now() const;

  const EngineConfig config_;
  const ITimeProvider& clock_;

  EventBus bus_;
  IdGenerator order_ids_;
  IdGenerator trade_ids_;

  std::unique_ptr<InMemoryRepository> owned_repository_;
  IRepository* repository_;

  std::unique_ptr<PriceCache> price_cache_;
  std::unique_ptr<PositionBook> book_;
  std::unique_ptr<RiskGate> gate_;
  std::unique_ptr<ExecutionSimulator> simulator_;
  std::unique_ptr<SimulatedAccount> account_;
  std::unique_ptr<OrderLifecycleManager> lifecycle_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<PeriodicTask> reevaluation_task_;

  EventBus::SubscriptionId market_sub_id_{0};
  EventBus::SubscriptionId telemetry_sub_id_{0};

  bool hydrated_{false};
  std::atomic<bool> running_{false};
};

}  // namespace tradeledger
