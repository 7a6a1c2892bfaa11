#pragma once

#include "tradeledger/domain/lot.hpp"
#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/position.hpp"
#include "tradeledger/domain/trade.hpp"

#include <optional>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// UnitOfWork — everything one fill changes, written together
// -----------------------------------------------------------------------------
// The order after the fill, the trade it produced, and the resulting
// position with its full lot list. IRepository::commit() must store all of
// it or none of it.
// -----------------------------------------------------------------------------
struct UnitOfWork {
  domain::Order order;
  std::optional<domain::Trade> trade;
  std::optional<domain::PositionSnapshot> position;
};

// -----------------------------------------------------------------------------
// IRepository — durable storage port
// -----------------------------------------------------------------------------
//
// @brief  Persistence collaborator of the OrderLifecycleManager and the
//         startup hydration in TradingEngine.
//
// @details
// commit() is called from inside PositionBook::apply()'s commit hook while
// the (symbol, mode) key is locked. Throwing PersistenceError there rolls
// back the in-memory position and lot mutation; the order attempt fails.
//
// saveOrder() persists an order status change that does not involve a
// fill (placement, cancel, reject, expire). It may also throw
// PersistenceError.
//
// loadPositions() / loadOrders() are read once at startup.
// -----------------------------------------------------------------------------
class IRepository {
 public:
  virtual ~IRepository() = default;

  virtual void commit(const UnitOfWork& unit) = 0;

  virtual void saveOrder(const domain::Order& order) = 0;

  virtual std::vector<domain::PositionSnapshot> loadPositions() const = 0;

  virtual std::vector<domain::Order> loadOrders() const = 0;

  virtual std::vector<domain::Trade> loadTrades() const = 0;
};

}  // namespace tradeledger
