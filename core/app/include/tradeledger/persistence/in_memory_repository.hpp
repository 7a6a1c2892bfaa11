#pragma once

#include "tradeledger/ports/i_repository.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// InMemoryRepository — process-local IRepository
// -----------------------------------------------------------------------------
//
// @brief  Keeps orders, trades and position snapshots in maps guarded by a
//         single mutex. commit() writes all parts of a UnitOfWork under that
//         mutex, so a reader never sees half of one.
//
// @details
// failNextWrites(n) makes the next n write calls (commit or saveOrder)
// throw PersistenceError without storing anything. The engine never calls
// it; it exists so the rollback paths can be exercised.
//
// Thread-safety: all methods are safe from any thread.
// -----------------------------------------------------------------------------
class InMemoryRepository final : public IRepository {
 public:
  InMemoryRepository() = default;

  InMemoryRepository(const InMemoryRepository&) = delete;
  InMemoryRepository& operator=(const InMemoryRepository&) = delete;

  void commit(const UnitOfWork& unit) override;
  void saveOrder(const domain::Order& order) override;

  std::vector<domain::PositionSnapshot> loadPositions() const override;
  std::vector<domain::Order> loadOrders() const override;
  std::vector<domain::Trade> loadTrades() const override;

  void failNextWrites(std::size_t count);

  std::optional<domain::Order> storedOrder(domain::OrderId id) const;
  std::size_t commitCount() const;

 private:
  // Consumes one injected failure, if any. Caller holds mutex_.
  void throwIfFailing(const char* operation);

  mutable std::mutex mutex_;
  std::map<domain::OrderId, domain::Order> orders_;
  std::vector<domain::Trade> trades_;
  std::map<domain::PositionKey, domain::PositionSnapshot> positions_;
  std::size_t pending_failures_{0};
  std::size_t commits_{0};
};

}  // namespace tradeledger
