#include "tradeledger/config/engine_config.hpp"
#include "tradeledger/domain/errors.hpp"
#include "tradeledger/risk/risk_gate.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>

namespace tradeledger {

namespace {

// Copies j[key] into `out` when present. A type mismatch is reported with
// the dotted path of the key.
template <typename T>
void overlay(const nlohmann::json& j, const char* key, const std::string& path,
             T& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception&) {
    throw ValidationError(path + key, "config key '" + path + key +
                                          "' has the wrong type");
  }
}

// Nullable numeric key: null clears the optional.
void overlayOptional(const nlohmann::json& j, const char* key,
                     const std::string& path, std::optional<double>& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (it->is_null()) {
    out.reset();
    return;
  }
  double value = 0.0;
  overlay(j, key, path, value);
  out = value;
}

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  auto it = j.find(key);
  if (it == j.end()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ValidationError(key, std::string("config section '") + key +
                                   "' must be an object");
  }
  return *it;
}

}  // namespace

// -----------------------------------------------------------------------------
// validateEngineConfig
// -----------------------------------------------------------------------------
void validateEngineConfig(const EngineConfig& config) {
  RiskGate::validate(config.limits);

  const auto& fees = config.fees;
  if (!(fees.commission_rate >= 0.0 && fees.commission_rate < 1.0)) {
    throw ValidationError("fees.commission_rate",
                          "commission_rate must lie in [0, 1)");
  }
  if (!(fees.tax_rate >= 0.0 && fees.tax_rate < 1.0)) {
    throw ValidationError("fees.tax_rate", "tax_rate must lie in [0, 1)");
  }
  if (fees.max_fill_quantity.has_value() && !(*fees.max_fill_quantity > 0.0)) {
    throw ValidationError("fees.max_fill_quantity",
                          "max_fill_quantity must be positive");
  }

  if (!std::isfinite(config.starting_cash)) {
    throw ValidationError("account.starting_cash",
                          "starting_cash must be finite");
  }

  const std::size_t needed =
      std::max(config.limits.correlation_window, config.limits.var_lookback) +
      1;
  if (config.price_history_capacity < needed) {
    throw ValidationError(
        "market_data.history_capacity",
        "history_capacity must be at least " + std::to_string(needed) +
            " (longest risk window + 1)");
  }

  if (config.reevaluation_interval.count() <= 0) {
    throw ValidationError("reevaluation_interval_ms",
                          "reevaluation_interval_ms must be positive");
  }
}

// -----------------------------------------------------------------------------
// engineConfigFromJson
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ValidationError("config", "config root must be a JSON object");
  }

  EngineConfig config;

  if (j.contains("clock")) {
    std::string clock;
    overlay(j, "clock", "", clock);
    if (clock == "live") {
      config.clock = ClockMode::Live;
    } else if (clock == "simulation") {
      config.clock = ClockMode::Simulation;
    } else {
      throw ValidationError("clock",
                            "clock must be \"live\" or \"simulation\"");
    }
  }

  std::int64_t interval_ms = config.reevaluation_interval.count();
  overlay(j, "reevaluation_interval_ms", "", interval_ms);
  config.reevaluation_interval = std::chrono::milliseconds(interval_ms);

  const auto& risk = section(j, "risk");
  auto& limits = config.limits;
  overlay(risk, "max_position_fraction", "risk.", limits.max_position_fraction);
  overlay(risk, "max_concentration_fraction", "risk.",
          limits.max_concentration_fraction);
  overlay(risk, "max_daily_loss_fraction", "risk.",
          limits.max_daily_loss_fraction);
  overlay(risk, "max_pairwise_correlation", "risk.",
          limits.max_pairwise_correlation);
  overlay(risk, "var_confidence", "risk.", limits.var_confidence);
  overlay(risk, "correlation_window", "risk.", limits.correlation_window);
  overlay(risk, "var_lookback", "risk.", limits.var_lookback);
  overlayOptional(risk, "max_var_fraction", "risk.", limits.max_var_fraction);
  overlay(risk, "monte_carlo_draws", "risk.", limits.monte_carlo_draws);
  overlay(risk, "monte_carlo_seed", "risk.", limits.monte_carlo_seed);

  const auto& fees = section(j, "fees");
  overlay(fees, "commission_rate", "fees.", config.fees.commission_rate);
  overlay(fees, "tax_rate", "fees.", config.fees.tax_rate);
  overlayOptional(fees, "max_fill_quantity", "fees.",
                  config.fees.max_fill_quantity);

  overlay(section(j, "account"), "starting_cash", "account.",
          config.starting_cash);

  const auto& market = section(j, "market_data");
  overlay(market, "endpoint", "market_data.", config.market_data_endpoint);
  overlay(market, "history_capacity", "market_data.",
          config.price_history_capacity);

  const auto& ipc = section(j, "ipc");
  overlay(ipc, "command_endpoint", "ipc.", config.command_endpoint);
  overlay(ipc, "telemetry_endpoint", "ipc.", config.telemetry_endpoint);

  validateEngineConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("config", "cannot open config file " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("config", "malformed config " + path + ": " +
                                        e.what());
  }
  return engineConfigFromJson(j);
}

}  // namespace tradeledger
