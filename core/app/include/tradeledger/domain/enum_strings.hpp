#pragma once

#include "tradeledger/domain/errors.hpp"
#include "tradeledger/domain/lot.hpp"
#include "tradeledger/domain/order.hpp"
#include "tradeledger/domain/order_status.hpp"
#include "tradeledger/domain/risk_decision.hpp"
#include "tradeledger/risk/risk_metrics.hpp"

#include <optional>
#include <string>

namespace tradeledger {

// -----------------------------------------------------------------------------
// Enum <-> string conversions
// -----------------------------------------------------------------------------
// Used for log lines, telemetry payloads and the JSON command interface.
// toString() never fails; the parse functions accept the exact spelling
// toString() produces (case-insensitive) and return std::nullopt otherwise.
// -----------------------------------------------------------------------------

const char* toString(domain::OrderStatus status);
const char* toString(domain::Side side);
const char* toString(domain::OrderKind kind);
const char* toString(domain::TradingMode mode);
const char* toString(domain::PositionSide side);
const char* toString(domain::RiskCheck check);
const char* toString(ReasonCode code);
const char* toString(VarMethod method);

std::optional<domain::Side> parseSide(const std::string& text);
std::optional<domain::OrderKind> parseOrderKind(const std::string& text);
std::optional<domain::TradingMode> parseTradingMode(const std::string& text);
std::optional<VarMethod> parseVarMethod(const std::string& text);

}  // namespace tradeledger
