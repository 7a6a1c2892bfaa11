#include "tradeledger/execution/execution_simulator.hpp"
#include "tradeledger/domain/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace tradeledger {

namespace {

constexpr double kQuantityEpsilon = 1e-9;

double requirePrice(const std::optional<double>& price, const char* field) {
  if (!price.has_value() || *price <= 0.0) {
    throw ValidationError(field, std::string("order is missing ") + field);
  }
  return *price;
}

}  // namespace

ExecutionSimulator::ExecutionSimulator(domain::FeeSchedule fees)
    : fees_(std::move(fees)) {}

// -----------------------------------------------------------------------------
// decide: price rule, quantity cap, fees
// -----------------------------------------------------------------------------
std::optional<Fill> ExecutionSimulator::decide(const domain::Order& order,
                                               double market_price) const {
  if (order.remaining_quantity <= kQuantityEpsilon) {
    return std::nullopt;
  }

  auto price = fillPrice(order, market_price);
  if (!price.has_value()) {
    return std::nullopt;
  }

  double quantity = order.remaining_quantity;
  if (fees_.max_fill_quantity.has_value()) {
    quantity = std::min(quantity, *fees_.max_fill_quantity);
  }

  Fill fill;
  fill.price = *price;
  fill.quantity = quantity;
  fill.commission = fill.notional() * fees_.commission_rate;
  fill.tax = fill.notional() * fees_.tax_rate;
  return fill;
}

// -----------------------------------------------------------------------------
// fillPrice: exhaustive over OrderKind
// -----------------------------------------------------------------------------
std::optional<double> ExecutionSimulator::fillPrice(const domain::Order& order,
                                                    double market_price) {
  if (market_price <= 0.0) {
    throw ValidationError("market_price", "market price must be positive");
  }

  using K = domain::OrderKind;
  switch (order.kind) {
    case K::Market:
      return market_price;

    case K::Limit:
      return limitRule(order.side,
                       requirePrice(order.limit_price, "limit_price"),
                       market_price);

    case K::StopLoss:
      if (!stopTriggered(order.side,
                         requirePrice(order.stop_price, "stop_price"),
                         market_price)) {
        return std::nullopt;
      }
      return market_price;

    case K::StopLimit: {
      const double stop = requirePrice(order.stop_price, "stop_price");
      const double limit = requirePrice(order.limit_price, "limit_price");
      if (!stopTriggered(order.side, stop, market_price)) {
        return std::nullopt;
      }
      return limitRule(order.side, limit, market_price);
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// limitRule: fill at the limit or better
// -----------------------------------------------------------------------------
std::optional<double> ExecutionSimulator::limitRule(domain::Side side,
                                                    double limit,
                                                    double market_price) {
  if (side == domain::Side::Buy) {
    if (market_price <= limit) {
      return std::min(limit, market_price);
    }
    return std::nullopt;
  }
  if (market_price >= limit) {
    return std::max(limit, market_price);
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// stopTriggered: buy stops on breakout, sell stops on breakdown
// -----------------------------------------------------------------------------
bool ExecutionSimulator::stopTriggered(domain::Side side, double stop,
                                       double market_price) {
  return (side == domain::Side::Buy) ? market_price >= stop
                                     : market_price <= stop;
}

}  // namespace tradeledger
