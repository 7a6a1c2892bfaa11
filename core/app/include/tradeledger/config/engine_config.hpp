#pragma once

#include "tradeledger/domain/fee_schedule.hpp"
#include "tradeledger/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace tradeledger {

enum class ClockMode {
  Live,        // Wall clock
  Simulation,  // Advanced by market-data ticks
};

// -----------------------------------------------------------------------------
// EngineConfig — everything TradingEngine needs to start
// -----------------------------------------------------------------------------
//
// @details
// JSON layout (every key optional, defaults below):
//
//   {
//     "clock": "simulation",
//     "reevaluation_interval_ms": 1000,
//     "risk": {
//       "max_position_fraction": 0.10, "max_concentration_fraction": 0.20,
//       "max_daily_loss_fraction": 0.02, "max_pairwise_correlation": 0.80,
//       "var_confidence": 0.95, "correlation_window": 30,
//       "var_lookback": 252, "max_var_fraction": null,
//       "monte_carlo_draws": 10000, "monte_carlo_seed": 42
//     },
//     "fees": { "commission_rate": 0.0015, "tax_rate": 0.001,
//               "max_fill_quantity": null },
//     "account": { "starting_cash": 1000000 },
//     "market_data": { "endpoint": "tcp://127.0.0.1:5555",
//                      "history_capacity": 512 },
//     "ipc": { "command_endpoint": "tcp://127.0.0.1:5556",
//              "telemetry_endpoint": "tcp://127.0.0.1:5557" }
//   }
//
// An empty IPC endpoint leaves the IpcServer off; an empty market-data
// endpoint tells main not to start the gateway.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::RiskLimits limits;
  domain::FeeSchedule fees;

  double starting_cash{1'000'000.0};
  std::size_t price_history_capacity{512};
  std::chrono::milliseconds reevaluation_interval{1000};

  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};

  ClockMode clock{ClockMode::Simulation};
};

// Throws ValidationError naming the first invalid field.
void validateEngineConfig(const EngineConfig& config);

// -----------------------------------------------------------------------------
// engineConfigFromJson(j)
// -----------------------------------------------------------------------------
// Overlays the keys present in `j` on the defaults, then validates.
//
// @throws ValidationError for a mistyped key (field = dotted key path) or
//         an out-of-range value.
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j);

// Reads and parses `path`. A missing file or malformed JSON is a
// ValidationError with field "config".
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace tradeledger
