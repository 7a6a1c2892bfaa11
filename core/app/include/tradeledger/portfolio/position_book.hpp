#pragma once

#include "tradeledger/domain/lot.hpp"
#include "tradeledger/domain/portfolio_snapshot.hpp"
#include "tradeledger/domain/position.hpp"
#include "tradeledger/domain/trade.hpp"
#include "tradeledger/portfolio/lot_ledger.hpp"
#include "tradeledger/ports/i_account.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// PositionBook — per-(symbol, mode) positions and their lot ledgers
// -----------------------------------------------------------------------------
//
// @brief  Applies trades to aggregate positions, keeps each position's
//         LotLedger in step, and produces consistent portfolio snapshots
//         for the RiskGate.
//
// @details
// Fill math (signed quantity, q = trade quantity):
//
//   Case 1 — flat, or trade in the same direction as the position:
//     addLot(direction, q, fill_price)
//     new_avg = (old_avg * |old_qty| + fill_price * q) / (|old_qty| + q)
//
//   Case 2 — opposite direction, q <= |old_qty|:
//     consume(position side, q, fill_price)  → realized P&L, tax
//     average_price unchanged; reset to 0 if the position is now flat.
//
//   Case 3 — opposite direction, q > |old_qty| (sign flip):
//     step a) consume(position side, |old_qty|, fill_price)
//     step b) addLot(opposite side, q - |old_qty|, fill_price)
//     average_price = fill_price
//
// Realized P&L comes from the consumed lots (FIFO), not from the average
// price. The two agree when a position was built at a single price and
// diverge otherwise.
//
// Invariant, checked after every apply() and hydrate():
//   position.quantity == long lot remaining - short lot remaining
//
// Transactional apply():
//   The mutation is staged on copies of the Position and LotLedger. The
//   invariant is verified, then the caller's commit hook runs (the
//   OrderLifecycleManager persists order + trade + position + lots there).
//   Only when the hook returns are the copies swapped in. If the hook
//   throws (PersistenceError) the book is exactly as it was before.
//
// Thread model:
//   - Each key has its own mutex; apply() on one key never interleaves with
//     another apply() on the same key.
//   - book_mutex_ is a shared_mutex. apply(), markToMarket() and the
//     per-key readers take it shared, so different keys proceed in
//     parallel. portfolioSnapshot() takes it exclusively and therefore sees
//     no apply() in flight: no snapshot mixes pre- and post-update figures.
//   - Entries are never erased, so a reference obtained under the lock
//     stays valid for the book's lifetime.
//
// Ownership:
//   Owned by TradingEngine (std::unique_ptr). Exclusively owns every Lot.
// -----------------------------------------------------------------------------
class PositionBook {
 public:
  // Outcome of one apply(). snapshot is the post-trade state (position +
  // every lot) that will be published once the commit hook succeeds.
  struct ApplyResult {
    domain::PositionSnapshot snapshot;
    double realized_pnl{0.0};
    double tax_liability{0.0};
    double closed_quantity{0.0};
    double opened_quantity{0.0};
  };

  // Called with the staged result before it becomes visible. May throw;
  // a throw aborts the apply() with no state change.
  using CommitHook = std::function<void(const ApplyResult&)>;

  explicit PositionBook(double tax_rate);

  PositionBook(const PositionBook&) = delete;
  PositionBook& operator=(const PositionBook&) = delete;
  PositionBook(PositionBook&&) = delete;
  PositionBook& operator=(PositionBook&&) = delete;

  // -------------------------------------------------------------------------
  // apply(trade, commit)
  // -------------------------------------------------------------------------
  // @brief  Applies one fill to the (trade.symbol, trade.mode) position.
  //
  // @param  trade   The fill. Only symbol, mode, side, quantity, price and
  //                 executed_at are read.
  // @param  commit  Optional hook, see CommitHook. Empty means no
  //                 persistence step.
  //
  // @return The realized P&L and lot tax produced, and the new snapshot.
  //
  // @throws InsufficientLotsError, InvariantViolation (book unchanged);
  //         anything the commit hook throws (book unchanged).
  // -------------------------------------------------------------------------
  ApplyResult apply(const domain::Trade& trade, const CommitHook& commit = {});

  // Updates current_price, unrealized and total P&L of every mode's
  // position in `symbol`. Lots are untouched. Unknown symbols are ignored.
  void markToMarket(const std::string& symbol, double price);

  std::optional<domain::Position> position(const std::string& symbol,
                                           domain::TradingMode mode) const;

  // Position plus every lot. A key with no history yields a flat position
  // and no lots.
  domain::PositionSnapshot positionSnapshot(const std::string& symbol,
                                            domain::TradingMode mode) const;

  // Copies of every position, including flat ones.
  std::vector<domain::Position> positions() const;

  // Copies of every lot in both modes, depleted ones included, grouped by
  // (symbol, mode) and in acquisition order within a group. An empty symbol
  // selects all symbols.
  std::vector<domain::Lot> lots(const std::string& symbol = {}) const;

  // -------------------------------------------------------------------------
  // portfolioSnapshot(account, now)
  // -------------------------------------------------------------------------
  // @brief  Consistent view of cash, all positions, portfolio value, gross
  //         exposure and today's P&L.
  //
  // @details
  // Takes book_mutex_ exclusively and reads account.cashBalance() while
  // holding it. Fills settle cash inside their commit hook, under the shared
  // lock, so the snapshot sees either both halves of a fill or neither.
  //
  // daily_pnl counts daily_realized_pnl only for positions whose pnl_day is
  // the day of `now`, plus every position's unrealized P&L.
  // -------------------------------------------------------------------------
  domain::PortfolioSnapshot portfolioSnapshot(const IAccount& account,
                                              Timestamp now) const;

  // -------------------------------------------------------------------------
  // hydrate(position, lots)
  // -------------------------------------------------------------------------
  // @brief  Loads a persisted position and its lots at startup.
  //
  // @throws InvariantViolation if the lots do not sum to the quantity; the
  //         book is left unchanged.
  // -------------------------------------------------------------------------
  void hydrate(const domain::Position& position, std::vector<domain::Lot> lots);

 private:
  struct Entry {
    Entry(const domain::PositionKey& key, double tax_rate);

    mutable std::mutex mutex;
    domain::Position position;
    LotLedger ledger;
  };

  // Finds or creates the entry for key. Creation takes book_mutex_
  // exclusively; lookup only shared.
  Entry& entryFor(const domain::PositionKey& key);

  const Entry* findEntry(const domain::PositionKey& key) const;

  static void revalue(domain::Position& pos);

  static void checkInvariant(const domain::Position& pos,
                             const LotLedger& ledger);

  const double tax_rate_;

  mutable std::shared_mutex book_mutex_;
  std::map<domain::PositionKey, std::unique_ptr<Entry>> entries_;
};

}  // namespace tradeledger
