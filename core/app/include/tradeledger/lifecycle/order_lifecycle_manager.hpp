#pragma once

#include "tradeledger/concurrent/id_generator.hpp"
#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/order_status.hpp"
#include "tradeledger/domain/risk_decision.hpp"
#include "tradeledger/domain/trade.hpp"
#include "tradeledger/eventbus/event_bus.hpp"
#include "tradeledger/execution/execution_simulator.hpp"
#include "tradeledger/portfolio/position_book.hpp"
#include "tradeledger/ports/i_account.hpp"
#include "tradeledger/ports/i_market_data_source.hpp"
#include "tradeledger/ports/i_repository.hpp"
#include "tradeledger/risk/risk_gate.hpp"
#include "tradeledger/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// OrderLifecycleManager — order state machine and fill orchestration
// -----------------------------------------------------------------------------
//
// @brief  Owns every Order and Trade. Validates new orders, gates them
//         through the RiskGate, executes them against the
//         ExecutionSimulator, applies fills to the PositionBook and persists
//         the result as one unit of work.
//
// @details
// State machine (see canTransition()):
//
//   Pending ──┬─> Submitted ──┬─> PartiallyFilled ──┬─> Filled
//             ├─> Rejected    ├─> Filled            ├─> PartiallyFilled
//             ├─> Cancelled   ├─> Cancelled         ├─> Cancelled
//             └─> Expired     ├─> Rejected          ├─> Rejected
//                             └─> Expired           └─> Expired
//
// placeOrder():
//   validate → RiskGate at a reference price (market, else limit, else
//   stop) → Submitted or Rejected → persisted → OrderUpdateEvent. Simulated
//   and auto-trading orders then get one immediate execution attempt.
//
// attemptExecution():
//   1. Claim the order (per-order mutex + busy flag). Only Submitted or
//      PartiallyFilled orders can be claimed.
//   2. No market price      → PriceUnavailable, order untouched.
//      Expiry passed        → Expired.
//      Simulator says no    → ConditionNotMet, order untouched.
//   3. RiskGate again at the fill price. Deny → Rejected +
//      RiskViolationEvent + RiskLimitExceeded.
//   4. Build exactly one Trade, PositionBook::apply() it. Inside the apply
//      commit hook the trade is completed with its realized P&L and lot tax
//      and IRepository::commit() stores order + trade + position + lots;
//      then IAccount::settle() moves the cash. A PersistenceError there
//      leaves book, cash and order unchanged.
//   5. Publish the new order state, TradeEvent and PositionUpdateEvent.
//
// Cancel vs fill race:
//   Both sides go through the order's mutex. A fill holds the claim for the
//   duration of steps 2-4; a cancel that arrives meanwhile throws
//   ConcurrencyConflict. A fill attempt that finds the order already
//   cancelled (or otherwise terminal) throws ConcurrencyConflict. A trade
//   is never applied twice and a cancelled order never receives a fill.
//
// Thread model:
//   All public methods are safe from any thread. Events are published on
//   the calling thread after every lock has been released.
//
// Ownership:
//   Owned by TradingEngine. Holds references to every collaborator; all of
//   them must outlive the manager.
// -----------------------------------------------------------------------------
class OrderLifecycleManager {
 public:
  enum class ExecutionOutcome {
    Filled,
    PartiallyFilled,
    ConditionNotMet,   // Limit not reached / stop not triggered
    PriceUnavailable,  // No market price; order stays open
    Expired,           // Expiry passed before the attempt
  };

  struct ExecutionResult {
    ExecutionOutcome outcome{ExecutionOutcome::ConditionNotMet};
    domain::OrderStatus status{domain::OrderStatus::Submitted};
    std::optional<domain::Trade> trade;
  };

  OrderLifecycleManager(PositionBook& book,
                        const RiskGate& gate,
                        const ExecutionSimulator& simulator,
                        const IMarketDataSource& market,
                        IRepository& repository,
                        IAccount& account,
                        EventBus& bus,
                        const ITimeProvider& clock,
                        IdGenerator& order_ids,
                        IdGenerator& trade_ids);

  OrderLifecycleManager(const OrderLifecycleManager&) = delete;
  OrderLifecycleManager& operator=(const OrderLifecycleManager&) = delete;
  OrderLifecycleManager(OrderLifecycleManager&&) = delete;
  OrderLifecycleManager& operator=(OrderLifecycleManager&&) = delete;

  // -------------------------------------------------------------------------
  // placeOrder(request)
  // -------------------------------------------------------------------------
  // @return The new order's id. The order is Submitted (or already filled
  //         when the immediate attempt succeeded).
  //
  // @throws ValidationError   malformed request; nothing is stored.
  // @throws RiskLimitExceeded the order was stored as Rejected, at placement
  //                           or by the immediate fill attempt. orderId()
  //                           carries the stored order's id.
  // @throws PersistenceError  the new order could not be stored (nothing
  //                           stored). A persistence failure of the
  //                           immediate fill attempt is logged instead; the
  //                           order stays Submitted and its id is returned.
  // -------------------------------------------------------------------------
  domain::OrderId placeOrder(const domain::OrderRequest& request);

  // Looks up the current price first; PriceUnavailable when there is none.
  ExecutionResult attemptExecution(domain::OrderId id);

  // -------------------------------------------------------------------------
  // attemptExecution(id, market_price)
  // -------------------------------------------------------------------------
  // @throws UnknownOrderError
  // @throws InvalidStateError     order is still Pending.
  // @throws ConcurrencyConflict   order is terminal or another attempt holds
  //                               the claim.
  // @throws RiskLimitExceeded     order moved to Rejected.
  // @throws PersistenceError      fill rolled back, order unchanged.
  // -------------------------------------------------------------------------
  ExecutionResult attemptExecution(domain::OrderId id, double market_price);

  // @throws UnknownOrderError, InvalidStateError (not cancellable),
  //         ConcurrencyConflict (fill in progress), PersistenceError.
  void cancelOrder(domain::OrderId id);

  // Same rules as cancelOrder(), ending in Expired.
  void expireOrder(domain::OrderId id);

  // -------------------------------------------------------------------------
  // reevaluateOpenOrders()
  // -------------------------------------------------------------------------
  // @brief  Body of the periodic re-evaluation task.
  //
  // @details
  // Expires every open order whose expiry has passed, then retries
  // execution of open Simulated or auto-trading orders against the current
  // price. Per-order failures are logged and do not stop the pass.
  //
  // @return Number of fills produced.
  // -------------------------------------------------------------------------
  std::size_t reevaluateOpenOrders();

  // -------------------------------------------------------------------------
  // switchTradingMode(mode)
  // -------------------------------------------------------------------------
  // Moves every Pending / Submitted order that is not mid-execution to
  // `mode`. Auto-trading is switched on for Simulated and off for Live.
  // Partially filled orders keep their mode: their fills already live in
  // the other mode's position.
  //
  // @return Number of orders moved.
  // -------------------------------------------------------------------------
  std::size_t switchTradingMode(domain::TradingMode mode);

  // Loads persisted orders and trades at startup and moves both id
  // generators past the highest loaded id.
  void hydrate(const std::vector<domain::Order>& orders,
               const std::vector<domain::Trade>& trades);

  // @throws UnknownOrderError
  domain::Order order(domain::OrderId id) const;

  std::vector<domain::Order> openOrders() const;
  std::vector<domain::Order> orders() const;

  // -------------------------------------------------------------------------
  // orderHistory(symbol, mode, limit)
  // -------------------------------------------------------------------------
  // Orders in every status, newest first (created_at, then id), at most
  // `limit` of them. An empty symbol or unset mode does not filter.
  //
  // @throws ValidationError("limit") when limit is 0.
  // -------------------------------------------------------------------------
  std::vector<domain::Order> orderHistory(
      const std::string& symbol, std::optional<domain::TradingMode> mode,
      std::size_t limit) const;
  std::vector<domain::Trade> trades() const;

  static bool canTransition(domain::OrderStatus from, domain::OrderStatus to);

 private:
  struct Record {
    mutable std::mutex mutex;
    domain::Order order;
    bool busy{false};  // A fill attempt holds the claim
  };

  // Releases a fill claim on scope exit.
  class ClaimGuard {
   public:
    explicit ClaimGuard(Record& record) : record_(record) {}
    ~ClaimGuard();
    ClaimGuard(const ClaimGuard&) = delete;
    ClaimGuard& operator=(const ClaimGuard&) = delete;

   private:
    Record& record_;
  };

  Record& record(domain::OrderId id) const;

  // Cancel / expire share this path.
  void closeOrder(domain::OrderId id, domain::OrderStatus terminal);

  // Moves a claimed order to a terminal status and persists it. Caller
  // holds the claim, not the mutex.
  domain::Order finishClaimed(Record& rec, domain::OrderStatus terminal);

  void rejectClaimed(Record& rec, const domain::RiskDecision& decision);

  static void validate(const domain::OrderRequest& request, Timestamp now);

  static domain::OrderRequest requestFor(const domain::Order& order,
                                         double quantity);

  domain::PortfolioSnapshot snapshot() const;

  Timestamp now() const;

  void publishOrderUpdate(const domain::Order& order,
                          domain::OrderStatus previous);
  void publishRiskViolation(const domain::Order& order,
                            const domain::RiskDecision& decision);

  PositionBook& book_;
  const RiskGate& gate_;
  const ExecutionSimulator& simulator_;
  const IMarketDataSource& market_;
  IRepository& repository_;
  IAccount& account_;
  EventBus& bus_;
  const ITimeProvider& clock_;
  IdGenerator& order_ids_;
  IdGenerator& trade_ids_;

  std::atomic<std::uint64_t> sequence_{0};

  // Records are never erased; references stay valid.
  mutable std::shared_mutex orders_mutex_;
  std::map<domain::OrderId, std::unique_ptr<Record>> orders_;

  mutable std::mutex trades_mutex_;
  std::vector<domain::Trade> trades_;
};

}  // namespace tradeledger
