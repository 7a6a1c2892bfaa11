#include "tradeledger/domain/enum_strings.hpp"

#include <algorithm>
#include <cctype>

namespace tradeledger {

namespace {

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

}  // namespace

// -----------------------------------------------------------------------------
// toString overloads
// -----------------------------------------------------------------------------
const char* toString(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  switch (status) {
    case S::Pending:         return "Pending";
    case S::Submitted:       return "Submitted";
    case S::PartiallyFilled: return "PartiallyFilled";
    case S::Filled:          return "Filled";
    case S::Cancelled:       return "Cancelled";
    case S::Rejected:        return "Rejected";
    case S::Expired:         return "Expired";
  }
  return "Unknown";
}

const char* toString(domain::Side side) {
  switch (side) {
    case domain::Side::Buy:  return "Buy";
    case domain::Side::Sell: return "Sell";
  }
  return "Unknown";
}

const char* toString(domain::OrderKind kind) {
  using K = domain::OrderKind;
  switch (kind) {
    case K::Market:    return "Market";
    case K::Limit:     return "Limit";
    case K::StopLoss:  return "StopLoss";
    case K::StopLimit: return "StopLimit";
  }
  return "Unknown";
}

const char* toString(domain::TradingMode mode) {
  switch (mode) {
    case domain::TradingMode::Simulated: return "Simulated";
    case domain::TradingMode::Live:      return "Live";
  }
  return "Unknown";
}

const char* toString(domain::PositionSide side) {
  switch (side) {
    case domain::PositionSide::Long:  return "Long";
    case domain::PositionSide::Short: return "Short";
  }
  return "Unknown";
}

const char* toString(domain::RiskCheck check) {
  using C = domain::RiskCheck;
  switch (check) {
    case C::None:          return "None";
    case C::PositionSize:  return "PositionSize";
    case C::Concentration: return "Concentration";
    case C::Correlation:   return "Correlation";
    case C::DailyLoss:     return "DailyLoss";
    case C::ValueAtRisk:   return "ValueAtRisk";
  }
  return "Unknown";
}

const char* toString(ReasonCode code) {
  using R = ReasonCode;
  switch (code) {
    case R::Validation:          return "Validation";
    case R::UnknownOrder:        return "UnknownOrder";
    case R::InvalidState:        return "InvalidState";
    case R::ConcurrencyConflict: return "ConcurrencyConflict";
    case R::InsufficientLots:    return "InsufficientLots";
    case R::RiskLimitExceeded:   return "RiskLimitExceeded";
    case R::Persistence:         return "Persistence";
    case R::InvariantViolation:  return "InvariantViolation";
  }
  return "Unknown";
}

const char* toString(VarMethod method) {
  switch (method) {
    case VarMethod::Historical: return "Historical";
    case VarMethod::Parametric: return "Parametric";
    case VarMethod::MonteCarlo: return "MonteCarlo";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// parse helpers
// -----------------------------------------------------------------------------
std::optional<domain::Side> parseSide(const std::string& text) {
  const std::string t = lower(text);
  if (t == "buy") return domain::Side::Buy;
  if (t == "sell") return domain::Side::Sell;
  return std::nullopt;
}

std::optional<domain::OrderKind> parseOrderKind(const std::string& text) {
  const std::string t = lower(text);
  if (t == "market") return domain::OrderKind::Market;
  if (t == "limit") return domain::OrderKind::Limit;
  if (t == "stoploss") return domain::OrderKind::StopLoss;
  if (t == "stoplimit") return domain::OrderKind::StopLimit;
  return std::nullopt;
}

std::optional<domain::TradingMode> parseTradingMode(const std::string& text) {
  const std::string t = lower(text);
  if (t == "simulated") return domain::TradingMode::Simulated;
  if (t == "live") return domain::TradingMode::Live;
  return std::nullopt;
}

std::optional<VarMethod> parseVarMethod(const std::string& text) {
  const std::string t = lower(text);
  if (t == "historical") return VarMethod::Historical;
  if (t == "parametric") return VarMethod::Parametric;
  if (t == "montecarlo" || t == "monte_carlo") return VarMethod::MonteCarlo;
  return std::nullopt;
}

}  // namespace tradeledger
