#include "tradeledger/lifecycle/order_lifecycle_manager.hpp"
#include "tradeledger/domain/enum_strings.hpp"
#include "tradeledger/domain/errors.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <utility>

namespace tradeledger {

namespace {

constexpr double kQuantityEpsilon = 1e-9;

bool positivePrice(const std::optional<double>& price) {
  return !price.has_value() || (std::isfinite(*price) && *price > 0.0);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderLifecycleManager::OrderLifecycleManager(
    PositionBook& book, const RiskGate& gate,
    const ExecutionSimulator& simulator, const IMarketDataSource& market,
    IRepository& repository, IAccount& account, EventBus& bus,
    const ITimeProvider& clock, IdGenerator& order_ids, IdGenerator& trade_ids)
    : book_(book),
      gate_(gate),
      simulator_(simulator),
      market_(market),
      repository_(repository),
      account_(account),
      bus_(bus),
      clock_(clock),
      order_ids_(order_ids),
      trade_ids_(trade_ids) {}

OrderLifecycleManager::ClaimGuard::~ClaimGuard() {
  std::lock_guard lock(record_.mutex);
  record_.busy = false;
}

// -----------------------------------------------------------------------------
// canTransition: the order state machine
// -----------------------------------------------------------------------------
bool OrderLifecycleManager::canTransition(domain::OrderStatus from,
                                          domain::OrderStatus to) {
  using S = domain::OrderStatus;

  switch (from) {
    case S::Pending:
      return to == S::Submitted ||
             to == S::Rejected ||
             to == S::Cancelled ||
             to == S::Expired;

    case S::Submitted:
    case S::PartiallyFilled:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Rejected ||
             to == S::Expired;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
    case S::Expired:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// validate: reject malformed requests before anything is stored
// -----------------------------------------------------------------------------
void OrderLifecycleManager::validate(const domain::OrderRequest& request,
                                     Timestamp now) {
  using domain::OrderKind;

  if (request.symbol.empty()) {
    throw ValidationError("symbol", "symbol must not be empty");
  }
  if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
    throw ValidationError("quantity", "quantity must be positive");
  }

  const bool needs_limit = request.kind == OrderKind::Limit ||
                           request.kind == OrderKind::StopLimit;
  const bool needs_stop = request.kind == OrderKind::StopLoss ||
                          request.kind == OrderKind::StopLimit;

  if (needs_limit && !request.limit_price.has_value()) {
    throw ValidationError("limit_price", std::string(toString(request.kind)) +
                                             " order requires a limit price");
  }
  if (needs_stop && !request.stop_price.has_value()) {
    throw ValidationError("stop_price", std::string(toString(request.kind)) +
                                            " order requires a stop price");
  }
  if (!positivePrice(request.limit_price)) {
    throw ValidationError("limit_price", "limit price must be positive");
  }
  if (!positivePrice(request.stop_price)) {
    throw ValidationError("stop_price", "stop price must be positive");
  }
  if (request.expires_at.has_value() && *request.expires_at <= now) {
    throw ValidationError("expires_at", "expiry must lie in the future");
  }
}

// -----------------------------------------------------------------------------
// placeOrder
// -----------------------------------------------------------------------------
domain::OrderId OrderLifecycleManager::placeOrder(
    const domain::OrderRequest& request) {
  const Timestamp created = now();
  validate(request, created);

  domain::Order order;
  order.id = order_ids_.next_id();
  order.symbol = request.symbol;
  std::transform(order.symbol.begin(), order.symbol.end(),
                 order.symbol.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  order.kind = request.kind;
  order.side = request.side;
  order.quantity = request.quantity;
  order.limit_price = request.limit_price;
  order.stop_price = request.stop_price;
  order.mode = request.mode;
  order.auto_trading = request.auto_trading;
  order.expires_at = request.expires_at;
  order.notes = request.notes;
  order.status = domain::OrderStatus::Pending;
  order.remaining_quantity = request.quantity;
  order.created_at = created;

  // Reference price: market, else the order's own prices.
  double reference = 0.0;
  if (auto market = market_.currentPrice(order.symbol)) {
    reference = *market;
  } else if (order.limit_price) {
    reference = *order.limit_price;
  } else if (order.stop_price) {
    reference = *order.stop_price;
  }

  domain::RiskDecision decision = domain::RiskDecision::allow();
  if (reference > 0.0) {
    decision = gate_.check(requestFor(order, order.quantity), reference,
                           snapshot());
  } else {
    std::cout << "[OrderLifecycleManager] No reference price for "
              << order.symbol << "; order_id=" << order.id
              << " is gated at execution.\n";
  }

  order.status = decision.allowed ? domain::OrderStatus::Submitted
                                  : domain::OrderStatus::Rejected;
  if (decision.allowed) {
    order.submitted_at = created;
  }

  // Stored before it becomes visible: a PersistenceError leaves no trace.
  repository_.saveOrder(order);
  {
    auto rec = std::make_unique<Record>();
    rec->order = order;
    std::unique_lock lock(orders_mutex_);
    orders_.emplace(order.id, std::move(rec));
  }

  publishOrderUpdate(order, domain::OrderStatus::Pending);

  if (!decision.allowed) {
    std::cerr << "[OrderLifecycleManager] Rejected order_id=" << order.id
              << ": " << decision.reason << "\n";
    publishRiskViolation(order, decision);
    throw RiskLimitExceeded(decision, order.id);
  }

  std::cout << "[OrderLifecycleManager] Submitted order_id=" << order.id
            << " " << toString(order.side) << " " << order.quantity << " "
            << order.symbol << " (" << toString(order.kind) << ", "
            << toString(order.mode) << ")\n";

  if (order.mode == domain::TradingMode::Simulated || order.auto_trading) {
    try {
      attemptExecution(order.id);
    } catch (const ConcurrencyConflict& e) {
      // Cancelled by another caller between submit and the first attempt.
      std::cout << "[OrderLifecycleManager] " << e.what() << "\n";
    } catch (const PersistenceError& e) {
      // The order is stored: the caller gets its id and the fill is retried
      // on the next evaluation.
      std::cerr << "[OrderLifecycleManager] WARNING: fill of order_id="
                << order.id << " not persisted, order stays Submitted: "
                << e.what() << "\n";
    }
  }

  return order.id;
}

// -----------------------------------------------------------------------------
// attemptExecution(id): fetch the market price first
// -----------------------------------------------------------------------------
OrderLifecycleManager::ExecutionResult OrderLifecycleManager::attemptExecution(
    domain::OrderId id) {
  Record& rec = record(id);

  std::string symbol;
  domain::OrderStatus status;
  {
    std::lock_guard lock(rec.mutex);
    symbol = rec.order.symbol;
    status = rec.order.status;
  }

  const auto price = market_.currentPrice(symbol);
  if (!price.has_value() || *price <= 0.0) {
    ExecutionResult result;
    result.outcome = ExecutionOutcome::PriceUnavailable;
    result.status = status;
    return result;
  }
  return attemptExecution(id, *price);
}

// -----------------------------------------------------------------------------
// attemptExecution(id, price): claim → decide → gate → apply + commit
// -----------------------------------------------------------------------------
OrderLifecycleManager::ExecutionResult OrderLifecycleManager::attemptExecution(
    domain::OrderId id, double market_price) {
  Record& rec = record(id);

  domain::Order order;
  {
    std::lock_guard lock(rec.mutex);
    if (rec.order.status == domain::OrderStatus::Pending) {
      throw InvalidStateError(id, rec.order.status,
                              "order_id=" + std::to_string(id) +
                                  " has not been submitted");
    }
    if (!domain::isFillable(rec.order.status)) {
      throw ConcurrencyConflict(
          id, "order_id=" + std::to_string(id) + " is no longer fillable (" +
                  toString(rec.order.status) + ")");
    }
    if (rec.busy) {
      throw ConcurrencyConflict(id, "order_id=" + std::to_string(id) +
                                        " is already being executed");
    }
    rec.busy = true;
    order = rec.order;
  }
  ClaimGuard claim(rec);

  ExecutionResult result;
  result.status = order.status;

  const Timestamp at = now();
  if (order.expires_at.has_value() && at >= *order.expires_at) {
    result.outcome = ExecutionOutcome::Expired;
    result.status = finishClaimed(rec, domain::OrderStatus::Expired).status;
    return result;
  }

  const auto fill = simulator_.decide(order, market_price);
  if (!fill.has_value()) {
    result.outcome = ExecutionOutcome::ConditionNotMet;
    return result;
  }

  const auto decision =
      gate_.check(requestFor(order, fill->quantity), fill->price, snapshot());
  if (!decision.allowed) {
    rejectClaimed(rec, decision);
    throw RiskLimitExceeded(decision, order.id);
  }

  domain::Trade trade;
  trade.id = trade_ids_.next_id();
  trade.order_id = order.id;
  trade.symbol = order.symbol;
  trade.mode = order.mode;
  trade.side = order.side;
  trade.quantity = fill->quantity;
  trade.price = fill->price;
  trade.commission = fill->commission;
  trade.tax = fill->tax;
  trade.executed_at = at;

  domain::Order updated = order;
  const double previous_filled = updated.filled_quantity;
  updated.filled_quantity += fill->quantity;
  updated.average_fill_price =
      (updated.average_fill_price * previous_filled +
       fill->price * fill->quantity) /
      updated.filled_quantity;
  updated.remaining_quantity = updated.quantity - updated.filled_quantity;
  if (updated.remaining_quantity <= kQuantityEpsilon) {
    updated.remaining_quantity = 0.0;
    updated.filled_quantity = updated.quantity;
    updated.status = domain::OrderStatus::Filled;
    updated.filled_at = at;
  } else {
    updated.status = domain::OrderStatus::PartiallyFilled;
  }

  const auto applied = book_.apply(
      trade, [&](const PositionBook::ApplyResult& staged) {
        domain::Trade committed = trade;
        committed.realized_pnl = staged.realized_pnl;
        committed.lot_tax_liability = staged.tax_liability;
        repository_.commit(UnitOfWork{updated, committed, staged.snapshot});
        // Cash moves with the position, under the same book lock.
        account_.settle(committed);
      });
  trade.realized_pnl = applied.realized_pnl;
  trade.lot_tax_liability = applied.tax_liability;

  {
    std::lock_guard lock(rec.mutex);
    rec.order = updated;
  }
  {
    std::lock_guard lock(trades_mutex_);
    trades_.push_back(trade);
  }

  std::cout << "[OrderLifecycleManager] Fill order_id=" << order.id
            << " trade_id=" << trade.id << " " << toString(trade.side) << " "
            << trade.quantity << " " << trade.symbol << " @ " << trade.price
            << " realized=" << trade.realized_pnl << " ("
            << toString(updated.status) << ")\n";

  publishOrderUpdate(updated, order.status);
  bus_.publish(TradeEvent{trade, ++sequence_});
  bus_.publish(PositionUpdateEvent{applied.snapshot.position, at,
                                   ++sequence_});

  result.outcome = updated.status == domain::OrderStatus::Filled
                       ? ExecutionOutcome::Filled
                       : ExecutionOutcome::PartiallyFilled;
  result.status = updated.status;
  result.trade = trade;
  return result;
}

// -----------------------------------------------------------------------------
// cancelOrder / expireOrder
// -----------------------------------------------------------------------------
void OrderLifecycleManager::cancelOrder(domain::OrderId id) {
  closeOrder(id, domain::OrderStatus::Cancelled);
}

void OrderLifecycleManager::expireOrder(domain::OrderId id) {
  closeOrder(id, domain::OrderStatus::Expired);
}

// -----------------------------------------------------------------------------
// closeOrder: the mutex is held across the save so a fill cannot slip in
// -----------------------------------------------------------------------------
void OrderLifecycleManager::closeOrder(domain::OrderId id,
                                       domain::OrderStatus terminal) {
  Record& rec = record(id);

  domain::Order updated;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(rec.mutex);
    previous = rec.order.status;
    if (!domain::isCancellable(previous)) {
      throw InvalidStateError(
          id, previous,
          "order_id=" + std::to_string(id) + " cannot move from " +
              toString(previous) + " to " + toString(terminal));
    }
    if (rec.busy) {
      throw ConcurrencyConflict(id, "order_id=" + std::to_string(id) +
                                        " has a fill in progress");
    }

    updated = rec.order;
    updated.status = terminal;
    if (terminal == domain::OrderStatus::Cancelled) {
      updated.cancelled_at = now();
    }
    repository_.saveOrder(updated);
    rec.order = updated;
  }

  std::cout << "[OrderLifecycleManager] order_id=" << id << " "
            << toString(previous) << " -> " << toString(terminal) << "\n";
  publishOrderUpdate(updated, previous);
}

// -----------------------------------------------------------------------------
// finishClaimed / rejectClaimed
// -----------------------------------------------------------------------------
domain::Order OrderLifecycleManager::finishClaimed(Record& rec,
                                                   domain::OrderStatus terminal) {
  domain::Order updated;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(rec.mutex);
    previous = rec.order.status;
    if (!canTransition(previous, terminal)) {
      throw InvalidStateError(
          rec.order.id, previous,
          "order_id=" + std::to_string(rec.order.id) + " cannot move from " +
              toString(previous) + " to " + toString(terminal));
    }
    updated = rec.order;
    updated.status = terminal;
    repository_.saveOrder(updated);
    rec.order = updated;
  }

  std::cout << "[OrderLifecycleManager] order_id=" << updated.id << " "
            << toString(previous) << " -> " << toString(terminal) << "\n";
  publishOrderUpdate(updated, previous);
  return updated;
}

void OrderLifecycleManager::rejectClaimed(
    Record& rec, const domain::RiskDecision& decision) {
  const auto rejected = finishClaimed(rec, domain::OrderStatus::Rejected);
  std::cerr << "[OrderLifecycleManager] Rejected order_id=" << rejected.id
            << " at execution: " << decision.reason << "\n";
  publishRiskViolation(rejected, decision);
}

// -----------------------------------------------------------------------------
// reevaluateOpenOrders
// -----------------------------------------------------------------------------
std::size_t OrderLifecycleManager::reevaluateOpenOrders() {
  const Timestamp at = now();
  std::size_t fills = 0;

  for (const auto& order : openOrders()) {
    try {
      if (order.expires_at.has_value() && at >= *order.expires_at) {
        expireOrder(order.id);
        continue;
      }
      if (!domain::isFillable(order.status)) {
        continue;
      }
      if (order.mode != domain::TradingMode::Simulated &&
          !order.auto_trading) {
        continue;
      }
      if (attemptExecution(order.id).trade.has_value()) {
        ++fills;
      }
    } catch (const ConcurrencyConflict&) {
      // Another thread is working on this order; it is picked up next pass.
    } catch (const TradingError& e) {
      std::cerr << "[OrderLifecycleManager] Re-evaluation of order_id="
                << order.id << " failed (" << toString(e.code())
                << "): " << e.what() << "\n";
    }
  }

  return fills;
}

// -----------------------------------------------------------------------------
// switchTradingMode
// -----------------------------------------------------------------------------
std::size_t OrderLifecycleManager::switchTradingMode(domain::TradingMode mode) {
  std::vector<Record*> records;
  {
    std::shared_lock lock(orders_mutex_);
    for (auto& [id, rec] : orders_) {
      records.push_back(rec.get());
    }
  }

  const bool auto_trading = (mode == domain::TradingMode::Simulated);
  std::size_t moved = 0;
  for (Record* rec : records) {
    std::lock_guard lock(rec->mutex);
    const auto status = rec->order.status;
    if (rec->busy || (status != domain::OrderStatus::Pending &&
                      status != domain::OrderStatus::Submitted)) {
      continue;
    }
    if (rec->order.mode == mode && rec->order.auto_trading == auto_trading) {
      continue;
    }
    domain::Order updated = rec->order;
    updated.mode = mode;
    updated.auto_trading = auto_trading;
    repository_.saveOrder(updated);
    rec->order = updated;
    ++moved;
  }

  std::cout << "[OrderLifecycleManager] Switched " << moved
            << " open order(s) to " << toString(mode) << "\n";
  return moved;
}

// -----------------------------------------------------------------------------
// hydrate
// -----------------------------------------------------------------------------
void OrderLifecycleManager::hydrate(const std::vector<domain::Order>& orders,
                                    const std::vector<domain::Trade>& trades) {
  domain::OrderId max_order = 0;
  {
    std::unique_lock lock(orders_mutex_);
    for (const auto& o : orders) {
      auto rec = std::make_unique<Record>();
      rec->order = o;
      orders_[o.id] = std::move(rec);
      max_order = std::max(max_order, o.id);
    }
  }

  domain::TradeId max_trade = 0;
  {
    std::lock_guard lock(trades_mutex_);
    for (const auto& t : trades) {
      trades_.push_back(t);
      max_trade = std::max(max_trade, t.id);
    }
  }

  order_ids_.reset_floor(max_order);
  trade_ids_.reset_floor(max_trade);

  std::cout << "[OrderLifecycleManager] Hydrated " << orders.size()
            << " order(s), " << trades.size() << " trade(s)\n";
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
domain::Order OrderLifecycleManager::order(domain::OrderId id) const {
  const Record& rec = record(id);
  std::lock_guard lock(rec.mutex);
  return rec.order;
}

std::vector<domain::Order> OrderLifecycleManager::openOrders() const {
  std::vector<domain::Order> result;
  std::shared_lock lock(orders_mutex_);
  for (const auto& [id, rec] : orders_) {
    std::lock_guard rec_lock(rec->mutex);
    if (!domain::isTerminal(rec->order.status)) {
      result.push_back(rec->order);
    }
  }
  return result;
}

std::vector<domain::Order> OrderLifecycleManager::orders() const {
  std::vector<domain::Order> result;
  std::shared_lock lock(orders_mutex_);
  result.reserve(orders_.size());
  for (const auto& [id, rec] : orders_) {
    std::lock_guard rec_lock(rec->mutex);
    result.push_back(rec->order);
  }
  return result;
}

std::vector<domain::Order> OrderLifecycleManager::orderHistory(
    const std::string& symbol, std::optional<domain::TradingMode> mode,
    std::size_t limit) const {
  if (limit == 0) {
    throw ValidationError("limit", "history limit must be positive");
  }

  std::vector<domain::Order> result;
  for (auto& order : orders()) {
    if (!symbol.empty() && order.symbol != symbol) {
      continue;
    }
    if (mode.has_value() && order.mode != *mode) {
      continue;
    }
    result.push_back(std::move(order));
  }

  std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
              if (a.created_at != b.created_at) {
                return a.created_at > b.created_at;
              }
              return a.id > b.id;
            });
  if (result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

std::vector<domain::Trade> OrderLifecycleManager::trades() const {
  std::lock_guard lock(trades_mutex_);
  return trades_;
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
OrderLifecycleManager::Record& OrderLifecycleManager::record(
    domain::OrderId id) const {
  std::shared_lock lock(orders_mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw UnknownOrderError(id);
  }
  return *it->second;
}

domain::OrderRequest OrderLifecycleManager::requestFor(
    const domain::Order& order, double quantity) {
  domain::OrderRequest req;
  req.symbol = order.symbol;
  req.kind = order.kind;
  req.side = order.side;
  req.quantity = quantity;
  req.limit_price = order.limit_price;
  req.stop_price = order.stop_price;
  req.mode = order.mode;
  req.auto_trading = order.auto_trading;
  req.expires_at = order.expires_at;
  return req;
}

domain::PortfolioSnapshot OrderLifecycleManager::snapshot() const {
  return book_.portfolioSnapshot(account_, now());
}

Timestamp OrderLifecycleManager::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

void OrderLifecycleManager::publishOrderUpdate(const domain::Order& order,
                                               domain::OrderStatus previous) {
  OrderUpdateEvent update;
  update.order = order;
  update.previous_status = previous;
  update.timestamp = now();
  update.sequence_id = ++sequence_;
  bus_.publish(update);
}

void OrderLifecycleManager::publishRiskViolation(
    const domain::Order& order, const domain::RiskDecision& decision) {
  RiskViolationEvent violation;
  violation.order_id = order.id;
  violation.symbol = order.symbol;
  violation.decision = decision;
  violation.timestamp = now();
  violation.sequence_id = ++sequence_;
  bus_.publish(violation);
}

}  // namespace tradeledger
