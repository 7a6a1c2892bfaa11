#include "tradeledger/network/json_codec.hpp"
#include "tradeledger/domain/enum_strings.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradeledger {

namespace {

nlohmann::json optionalNumber(const std::optional<double>& v) {
  return v.has_value() ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json optionalTime(const std::optional<Timestamp>& t) {
  return t.has_value() ? nlohmann::json(timestamp_to_ms(*t))
                       : nlohmann::json(nullptr);
}

// Reads an optional key, throwing ValidationError(key) on a type mismatch.
template <typename T>
std::optional<T> readOptional(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception&) {
    throw ValidationError(key, std::string("field '") + key +
                                   "' has the wrong type");
  }
}

template <typename T>
T readRequired(const nlohmann::json& j, const char* key) {
  auto value = readOptional<T>(j, key);
  if (!value.has_value()) {
    throw ValidationError(key, std::string("missing field '") + key + "'");
  }
  return *value;
}

}  // namespace

// -----------------------------------------------------------------------------
// Encoders
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json j;
  j["order_id"] = order.id;
  j["symbol"] = order.symbol;
  j["kind"] = toString(order.kind);
  j["side"] = toString(order.side);
  j["quantity"] = order.quantity;
  j["limit_price"] = optionalNumber(order.limit_price);
  j["stop_price"] = optionalNumber(order.stop_price);
  j["mode"] = toString(order.mode);
  j["auto_trading"] = order.auto_trading;
  j["status"] = toString(order.status);
  j["filled_quantity"] = order.filled_quantity;
  j["remaining_quantity"] = order.remaining_quantity;
  j["average_fill_price"] = order.average_fill_price;
  j["created_at_ms"] = timestamp_to_ms(order.created_at);
  j["submitted_at_ms"] = optionalTime(order.submitted_at);
  j["filled_at_ms"] = optionalTime(order.filled_at);
  j["cancelled_at_ms"] = optionalTime(order.cancelled_at);
  j["expires_at_ms"] = optionalTime(order.expires_at);
  j["notes"] = order.notes;
  return j;
}

nlohmann::json toJson(const domain::Trade& trade) {
  nlohmann::json j;
  j["trade_id"] = trade.id;
  j["order_id"] = trade.order_id;
  j["symbol"] = trade.symbol;
  j["mode"] = toString(trade.mode);
  j["side"] = toString(trade.side);
  j["quantity"] = trade.quantity;
  j["price"] = trade.price;
  j["commission"] = trade.commission;
  j["tax"] = trade.tax;
  j["realized_pnl"] = trade.realized_pnl;
  j["lot_tax_liability"] = trade.lot_tax_liability;
  j["executed_at_ms"] = timestamp_to_ms(trade.executed_at);
  return j;
}

nlohmann::json toJson(const domain::Position& position) {
  nlohmann::json j;
  j["symbol"] = position.symbol;
  j["mode"] = toString(position.mode);
  j["quantity"] = position.quantity;
  j["average_price"] = position.average_price;
  j["current_price"] = position.current_price;
  j["market_value"] = position.marketValue();
  j["realized_pnl"] = position.realized_pnl;
  j["unrealized_pnl"] = position.unrealized_pnl;
  j["total_pnl"] = position.total_pnl;
  j["daily_realized_pnl"] = position.daily_realized_pnl;
  return j;
}

nlohmann::json toJson(const domain::Lot& lot) {
  nlohmann::json j;
  j["lot_id"] = lot.id;
  j["side"] = toString(lot.side);
  j["original_quantity"] = lot.original_quantity;
  j["remaining_quantity"] = lot.remaining_quantity;
  j["unit_cost"] = lot.unit_cost;
  j["acquired_at_ms"] = timestamp_to_ms(lot.acquired_at);
  j["sold_quantity"] = lot.sold_quantity;
  j["realized_gain"] = lot.realized_gain;
  j["tax_liability"] = lot.tax_liability;
  return j;
}

nlohmann::json toJson(const domain::PositionSnapshot& snapshot) {
  nlohmann::json j = toJson(snapshot.position);
  j["lots"] = nlohmann::json::array();
  for (const auto& lot : snapshot.lots) {
    j["lots"].push_back(toJson(lot));
  }
  return j;
}

nlohmann::json toJson(const domain::RiskDecision& decision) {
  nlohmann::json j;
  j["allowed"] = decision.allowed;
  j["check"] = toString(decision.check);
  j["reason"] = decision.reason;
  j["observed"] = decision.observed;
  j["limit"] = decision.limit;
  j["excess"] = decision.excess;
  if (!decision.related_symbol.empty()) {
    j["related_symbol"] = decision.related_symbol;
  }
  return j;
}

// -----------------------------------------------------------------------------
// errorToJson: reason code plus the subclass's numbers
// -----------------------------------------------------------------------------
nlohmann::json errorToJson(const TradingError& error) {
  nlohmann::json j;
  j["reason_code"] = toString(error.code());
  j["message"] = error.what();
  j["retryable"] = error.retryable();

  if (auto* e = dynamic_cast<const ValidationError*>(&error)) {
    j["field"] = e->field();
  } else if (auto* e = dynamic_cast<const UnknownOrderError*>(&error)) {
    j["order_id"] = e->orderId();
  } else if (auto* e = dynamic_cast<const InvalidStateError*>(&error)) {
    j["order_id"] = e->orderId();
    j["order_status"] = toString(e->status());
  } else if (auto* e = dynamic_cast<const ConcurrencyConflict*>(&error)) {
    j["order_id"] = e->orderId();
  } else if (auto* e = dynamic_cast<const InsufficientLotsError*>(&error)) {
    j["requested"] = e->requested();
    j["available"] = e->available();
  } else if (auto* e = dynamic_cast<const RiskLimitExceeded*>(&error)) {
    j["decision"] = toJson(e->decision());
    if (e->orderId()) {
      j["order_id"] = *e->orderId();
    }
  }
  return j;
}

nlohmann::json toJson(const domain::TaxTotals& totals) {
  nlohmann::json j;
  j["lots"] = totals.lots;
  j["quantity"] = totals.quantity;
  j["cost_basis"] = totals.cost_basis;
  j["sold_quantity"] = totals.sold_quantity;
  j["realized_gain"] = totals.realized_gain;
  j["tax_liability"] = totals.tax_liability;
  return j;
}

nlohmann::json toJson(const domain::TaxSummary& summary) {
  nlohmann::json j = toJson(summary.totals);
  j["symbol"] = summary.symbol.empty() ? "ALL" : summary.symbol;
  j["year"] = summary.year.has_value() ? nlohmann::json(*summary.year)
                                       : nlohmann::json(nullptr);
  if (summary.symbol.empty()) {
    j["by_symbol"] = nlohmann::json::object();
    for (const auto& [symbol, totals] : summary.by_symbol) {
      j["by_symbol"][symbol] = toJson(totals);
    }
  }
  return j;
}

nlohmann::json toJson(const domain::TaxReport& report) {
  nlohmann::json j;
  j["summary"] = toJson(report.summary);
  j["total_trades"] = report.total_trades;
  j["buy_trades"] = report.buy_trades;
  j["sell_trades"] = report.sell_trades;
  j["realized_pnl"] = report.realized_pnl;
  j["transaction_tax"] = report.transaction_tax;
  j["trade_tax"] = report.trade_tax;
  return j;
}

// -----------------------------------------------------------------------------
// orderRequestFromJson
// -----------------------------------------------------------------------------
domain::OrderRequest orderRequestFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ValidationError("order", "order must be a JSON object");
  }

  domain::OrderRequest req;
  req.symbol = readRequired<std::string>(j, "symbol");
  req.quantity = readRequired<double>(j, "quantity");

  const auto side_text = readRequired<std::string>(j, "side");
  const auto side = parseSide(side_text);
  if (!side.has_value()) {
    throw ValidationError("side", "unknown side '" + side_text + "'");
  }
  req.side = *side;

  if (auto kind_text = readOptional<std::string>(j, "kind")) {
    const auto kind = parseOrderKind(*kind_text);
    if (!kind.has_value()) {
      throw ValidationError("kind", "unknown order kind '" + *kind_text + "'");
    }
    req.kind = *kind;
  }

  if (auto mode_text = readOptional<std::string>(j, "mode")) {
    const auto mode = parseTradingMode(*mode_text);
    if (!mode.has_value()) {
      throw ValidationError("mode", "unknown trading mode '" + *mode_text + "'");
    }
    req.mode = *mode;
  }

  req.limit_price = readOptional<double>(j, "limit_price");
  req.stop_price = readOptional<double>(j, "stop_price");
  req.auto_trading = readOptional<bool>(j, "auto_trading").value_or(false);
  if (auto expires = readOptional<std::int64_t>(j, "expires_at_ms")) {
    req.expires_at = ms_to_timestamp(*expires);
  }
  req.notes = readOptional<std::string>(j, "notes").value_or("");
  return req;
}

}  // namespace tradeledger
