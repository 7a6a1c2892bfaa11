#include "tradeledger/portfolio/position_book.hpp"
#include "tradeledger/domain/enum_strings.hpp"
#include "tradeledger/domain/errors.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <utility>

namespace tradeledger {

namespace {

// Tolerance for the lots == position check. Quantities are sums of a few
// doubles, so exact comparison would fail on harmless rounding.
constexpr double kInvariantTolerance = 1e-6;

constexpr double kEps = LotLedger::kQuantityEpsilon;

}  // namespace

PositionBook::Entry::Entry(const domain::PositionKey& key, double tax_rate)
    : ledger(key.symbol, key.mode, tax_rate) {
  position.symbol = key.symbol;
  position.mode = key.mode;
}

PositionBook::PositionBook(double tax_rate) : tax_rate_(tax_rate) {}

// -----------------------------------------------------------------------------
// entryFor: shared lookup, exclusive insert
// -----------------------------------------------------------------------------
PositionBook::Entry& PositionBook::entryFor(const domain::PositionKey& key) {
  {
    std::shared_lock lock(book_mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      return *it->second;
    }
  }

  std::unique_lock lock(book_mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    it = entries_.emplace(key, std::make_unique<Entry>(key, tax_rate_)).first;
  }
  return *it->second;
}

// Caller holds book_mutex_ (shared or exclusive).
const PositionBook::Entry* PositionBook::findEntry(
    const domain::PositionKey& key) const {
  auto it = entries_.find(key);
  return (it != entries_.end()) ? it->second.get() : nullptr;
}

// -----------------------------------------------------------------------------
// apply: stage on copies, verify, commit, publish
// -----------------------------------------------------------------------------
PositionBook::ApplyResult PositionBook::apply(const domain::Trade& trade,
                                              const CommitHook& commit) {
  if (trade.quantity <= kEps) {
    throw ValidationError("quantity", "trade quantity must be positive");
  }
  if (trade.price <= 0.0) {
    throw ValidationError("price", "trade price must be positive");
  }

  Entry& entry = entryFor(domain::PositionKey{trade.symbol, trade.mode});

  std::shared_lock book_lock(book_mutex_);
  std::lock_guard entry_lock(entry.mutex);

  domain::Position pos = entry.position;
  LotLedger ledger = entry.ledger;

  ApplyResult result;
  const double q = trade.quantity;
  const double signed_fill = (trade.side == domain::Side::Buy) ? q : -q;
  const double current = pos.quantity;

  const bool flat = std::abs(current) <= kEps;
  const bool same_direction =
      (current > 0.0 && signed_fill > 0.0) ||
      (current < 0.0 && signed_fill < 0.0);

  if (flat || same_direction) {
    // ----- Case 1: open or extend ------------------------------------------
    const auto side = (signed_fill > 0.0) ? domain::PositionSide::Long
                                          : domain::PositionSide::Short;
    ledger.addLot(side, q, trade.price, trade.executed_at);

    const double old_abs = flat ? 0.0 : std::abs(current);
    pos.average_price =
        (pos.average_price * old_abs + trade.price * q) / (old_abs + q);
    pos.quantity = (flat ? 0.0 : current) + signed_fill;
    result.opened_quantity = q;
  } else {
    // ----- Case 2 / 3: close, then possibly open the other way -------------
    const auto close_side = (current > 0.0) ? domain::PositionSide::Long
                                            : domain::PositionSide::Short;
    const double closing = std::min(q, std::abs(current));

    auto consumed = ledger.consume(close_side, closing, trade.price);
    result.realized_pnl = consumed.realized_pnl;
    result.tax_liability = consumed.tax_liability;
    result.closed_quantity = consumed.consumed_quantity;

    pos.quantity = current + ((signed_fill > 0.0) ? closing : -closing);
    if (std::abs(pos.quantity) <= kEps) {
      pos.quantity = 0.0;
      pos.average_price = 0.0;
    }

    const double excess = q - closing;
    if (excess > kEps) {
      // Step b: the remainder opens fresh exposure at the fill price.
      const auto open_side = (signed_fill > 0.0) ? domain::PositionSide::Long
                                                 : domain::PositionSide::Short;
      ledger.addLot(open_side, excess, trade.price, trade.executed_at);
      pos.quantity = (signed_fill > 0.0) ? excess : -excess;
      pos.average_price = trade.price;
      result.opened_quantity = excess;
    }
  }

  pos.realized_pnl += result.realized_pnl;

  const std::int64_t day = day_index(trade.executed_at);
  if (pos.pnl_day != day) {
    pos.pnl_day = day;
    pos.daily_realized_pnl = 0.0;
  }
  pos.daily_realized_pnl += result.realized_pnl;

  // A fill is a price observation.
  pos.current_price = trade.price;
  revalue(pos);

  checkInvariant(pos, ledger);

  result.snapshot.position = pos;
  result.snapshot.lots = ledger.lots();

  if (commit) {
    commit(result);
  }

  entry.position = std::move(pos);
  entry.ledger = std::move(ledger);

  return result;
}

// -----------------------------------------------------------------------------
// markToMarket
// -----------------------------------------------------------------------------
void PositionBook::markToMarket(const std::string& symbol, double price) {
  if (price <= 0.0) {
    return;
  }

  std::shared_lock book_lock(book_mutex_);
  for (auto& [key, entry] : entries_) {
    if (key.symbol != symbol) {
      continue;
    }
    std::lock_guard entry_lock(entry->mutex);
    entry->position.current_price = price;
    revalue(entry->position);
  }
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionBook::position(
    const std::string& symbol, domain::TradingMode mode) const {
  std::shared_lock book_lock(book_mutex_);
  const Entry* entry = findEntry(domain::PositionKey{symbol, mode});
  if (entry == nullptr) {
    return std::nullopt;
  }
  std::lock_guard entry_lock(entry->mutex);
  return entry->position;
}

domain::PositionSnapshot PositionBook::positionSnapshot(
    const std::string& symbol, domain::TradingMode mode) const {
  domain::PositionSnapshot snap;
  snap.position.symbol = symbol;
  snap.position.mode = mode;

  std::shared_lock book_lock(book_mutex_);
  const Entry* entry = findEntry(domain::PositionKey{symbol, mode});
  if (entry == nullptr) {
    return snap;
  }
  std::lock_guard entry_lock(entry->mutex);
  snap.position = entry->position;
  snap.lots = entry->ledger.lots();
  return snap;
}

std::vector<domain::Position> PositionBook::positions() const {
  std::shared_lock book_lock(book_mutex_);
  std::vector<domain::Position> result;
  result.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    std::lock_guard entry_lock(entry->mutex);
    result.push_back(entry->position);
  }
  return result;
}

std::vector<domain::Lot> PositionBook::lots(const std::string& symbol) const {
  std::shared_lock book_lock(book_mutex_);
  std::vector<domain::Lot> result;
  for (const auto& [key, entry] : entries_) {
    if (!symbol.empty() && key.symbol != symbol) {
      continue;
    }
    std::lock_guard entry_lock(entry->mutex);
    const auto& held = entry->ledger.lots();
    result.insert(result.end(), held.begin(), held.end());
  }
  return result;
}

// -----------------------------------------------------------------------------
// portfolioSnapshot: exclusive lock, no apply() can be mid-flight
// -----------------------------------------------------------------------------
domain::PortfolioSnapshot PositionBook::portfolioSnapshot(
    const IAccount& account, Timestamp now) const {
  domain::PortfolioSnapshot snap;
  snap.as_of = now;

  const std::int64_t today = day_index(now);
  double holdings = 0.0;

  std::unique_lock book_lock(book_mutex_);
  snap.cash = account.cashBalance();
  snap.positions.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    const domain::Position& pos = entry->position;
    const double value = pos.marketValue();
    holdings += value;
    snap.gross_exposure += std::abs(value);
    snap.daily_pnl += pos.unrealized_pnl;
    if (pos.pnl_day == today) {
      snap.daily_pnl += pos.daily_realized_pnl;
    }
    snap.positions.push_back(pos);
  }

  snap.portfolio_value = snap.cash + holdings;
  return snap;
}

// -----------------------------------------------------------------------------
// hydrate: startup load with invariant check
// -----------------------------------------------------------------------------
void PositionBook::hydrate(const domain::Position& position,
                           std::vector<domain::Lot> lots) {
  domain::PositionKey key{position.symbol, position.mode};

  LotLedger ledger(key.symbol, key.mode, tax_rate_);
  ledger.restore(std::move(lots));

  domain::Position pos = position;
  revalue(pos);
  checkInvariant(pos, ledger);

  Entry& entry = entryFor(key);
  std::shared_lock book_lock(book_mutex_);
  std::lock_guard entry_lock(entry.mutex);
  entry.position = std::move(pos);
  entry.ledger = std::move(ledger);
}

// -----------------------------------------------------------------------------
// revalue: unrealized = (mark - avg) * signed qty
// -----------------------------------------------------------------------------
void PositionBook::revalue(domain::Position& pos) {
  if (std::abs(pos.quantity) <= kEps || pos.current_price <= 0.0) {
    pos.unrealized_pnl = 0.0;
  } else {
    pos.unrealized_pnl = (pos.current_price - pos.average_price) * pos.quantity;
  }
  pos.total_pnl = pos.realized_pnl + pos.unrealized_pnl;
}

// -----------------------------------------------------------------------------
// checkInvariant
// -----------------------------------------------------------------------------
void PositionBook::checkInvariant(const domain::Position& pos,
                                  const LotLedger& ledger) {
  const double lots = ledger.signedRemaining();
  if (std::abs(lots - pos.quantity) > kInvariantTolerance) {
    std::ostringstream msg;
    msg << "lot/position mismatch for " << pos.symbol << " ("
        << toString(pos.mode) << "): position=" << pos.quantity
        << " lots=" << lots;
    throw InvariantViolation(msg.str());
  }
}

}  // namespace tradeledger
