#pragma once

#include "tradeledger/domain/errors.hpp"
#include "tradeledger/domain/lot.hpp"
#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/position.hpp"
#include "tradeledger/domain/risk_decision.hpp"
#include "tradeledger/domain/tax_summary.hpp"
#include "tradeledger/domain/trade.hpp"

#include <nlohmann/json.hpp>

namespace tradeledger {

// -----------------------------------------------------------------------------
// JSON codec for the command and telemetry sockets
// -----------------------------------------------------------------------------
// Encoders render enums through toString() and timestamps as epoch
// milliseconds. Unset optionals are written as null.
//
// orderRequestFromJson() is the only decoder. It throws ValidationError
// naming the offending key for missing or mistyped fields and unknown enum
// spellings; range checks (quantity > 0 and so on) stay with
// OrderLifecycleManager.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::Trade& trade);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::Lot& lot);
nlohmann::json toJson(const domain::PositionSnapshot& snapshot);
nlohmann::json toJson(const domain::RiskDecision& decision);
nlohmann::json toJson(const domain::TaxTotals& totals);

// symbol "ALL" and year null when unfiltered; by_symbol only for "ALL".
nlohmann::json toJson(const domain::TaxSummary& summary);
nlohmann::json toJson(const domain::TaxReport& report);

// {"reason_code", "message", ...} plus the numeric detail of the concrete
// error type (field, order_id, requested/available, observed/limit/excess).
nlohmann::json errorToJson(const TradingError& error);

// Keys: symbol, side, quantity, kind (default Market), limit_price,
// stop_price, mode (default Simulated), auto_trading, expires_at_ms, notes.
domain::OrderRequest orderRequestFromJson(const nlohmann::json& j);

}  // namespace tradeledger
