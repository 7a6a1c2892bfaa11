#include "tradeledger/persistence/in_memory_repository.hpp"
#include "tradeledger/domain/errors.hpp"

#include <string>

namespace tradeledger {

void InMemoryRepository::throwIfFailing(const char* operation) {
  if (pending_failures_ > 0) {
    --pending_failures_;
    throw PersistenceError(std::string("injected failure in ") + operation);
  }
}

// -----------------------------------------------------------------------------
// commit: all parts of the unit or nothing
// -----------------------------------------------------------------------------
void InMemoryRepository::commit(const UnitOfWork& unit) {
  std::lock_guard lock(mutex_);
  throwIfFailing("commit");

  orders_[unit.order.id] = unit.order;
  if (unit.trade.has_value()) {
    trades_.push_back(*unit.trade);
  }
  if (unit.position.has_value()) {
    positions_[unit.position->position.key()] = *unit.position;
  }
  ++commits_;
}

void InMemoryRepository::saveOrder(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  throwIfFailing("saveOrder");
  orders_[order.id] = order;
}

// -----------------------------------------------------------------------------
// Loaders
// -----------------------------------------------------------------------------
std::vector<domain::PositionSnapshot> InMemoryRepository::loadPositions()
    const {
  std::lock_guard lock(mutex_);
  std::vector<domain::PositionSnapshot> result;
  result.reserve(positions_.size());
  for (const auto& [key, snapshot] : positions_) {
    result.push_back(snapshot);
  }
  return result;
}

std::vector<domain::Order> InMemoryRepository::loadOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  result.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    result.push_back(order);
  }
  return result;
}

std::vector<domain::Trade> InMemoryRepository::loadTrades() const {
  std::lock_guard lock(mutex_);
  return trades_;
}

void InMemoryRepository::failNextWrites(std::size_t count) {
  std::lock_guard lock(mutex_);
  pending_failures_ = count;
}

std::optional<domain::Order> InMemoryRepository::storedOrder(
    domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t InMemoryRepository::commitCount() const {
  std::lock_guard lock(mutex_);
  return commits_;
}

}  // namespace tradeledger
