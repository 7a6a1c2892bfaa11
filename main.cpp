// -----------------------------------------------------------------------------
// tradeledger — single executable entry point.
//
//   1) Load EngineConfig from the optional first argument (defaults
//      otherwise).
//   2) Pick the clock: SimulationTimeProvider driven by ticks, or the wall
//      clock.
//   3) Create and start the TradingEngine (hydration, IPC server, periodic
//      re-evaluation).
//   4) Run the MarketDataGateway loop on the main thread, feeding
//      engine.onMarketData(), until Ctrl-C.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread        → MarketDataGateway::run() (ZMQ SUB loop)
//   ipc thread         → IpcServer (commands + telemetry)
//   reevaluate thread  → OrderLifecycleManager::reevaluateOpenOrders()
// -----------------------------------------------------------------------------

#include "tradeledger/config/engine_config.hpp"
#include "tradeledger/domain/enum_strings.hpp"
#include "tradeledger/domain/errors.hpp"
#include "tradeledger/engine/trading_engine.hpp"
#include "tradeledger/gateway/market_data_gateway.hpp"
#include "tradeledger/time/live_time_provider.hpp"
#include "tradeledger/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Raw pointer to a stack-local gateway so the SIGINT handler can unblock
// the receive loop. Set before the handler is installed.
static tradeledger::MarketDataGateway* g_gateway_ptr = nullptr;

// Used when no market-data endpoint is configured.
static std::atomic<bool> g_shutdown{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown.store(true);
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  tradeledger::EngineConfig config;
  if (argc > 1) {
    try {
      config = tradeledger::loadEngineConfig(argv[1]);
    } catch (const tradeledger::ValidationError& e) {
      std::cerr << "[main] Invalid configuration (" << e.field()
                << "): " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
  }

  // -------------------------------------------------------------------------
  // 2) Clock
  // -------------------------------------------------------------------------
  tradeledger::SimulationTimeProvider sim_clock;
  tradeledger::LiveTimeProvider live_clock;
  const bool simulated = config.clock == tradeledger::ClockMode::Simulation;
  const tradeledger::ITimeProvider& clock =
      simulated ? static_cast<const tradeledger::ITimeProvider&>(sim_clock)
                : static_cast<const tradeledger::ITimeProvider&>(live_clock);

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  tradeledger::TradingEngine engine(config, clock);

  engine.eventBus().subscribe<tradeledger::PositionUpdateEvent>(
      [](const tradeledger::PositionUpdateEvent& e) {
        std::cout << "[PositionUpdate] symbol=" << e.position.symbol
                  << " mode=" << tradeledger::toString(e.position.mode)
                  << " qty=" << e.position.quantity
                  << " avg_price=" << e.position.average_price
                  << " realized_pnl=" << e.position.realized_pnl << "\n";
      });

  engine.eventBus().subscribe<tradeledger::RiskViolationEvent>(
      [](const tradeledger::RiskViolationEvent& e) {
        std::cout << "[RiskViolation] order_id=" << e.order_id
                  << " check=" << tradeledger::toString(e.decision.check)
                  << " observed=" << e.decision.observed
                  << " limit=" << e.decision.limit << "\n";
      });

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] Engine failed to start: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);

  // -------------------------------------------------------------------------
  // 4) Market data on the main thread
  // -------------------------------------------------------------------------
  if (!config.market_data_endpoint.empty()) {
    tradeledger::MarketDataGateway gateway(
        simulated ? &sim_clock : nullptr,
        [&engine](const tradeledger::MarketDataEvent& e) {
          engine.onMarketData(e);
        },
        config.market_data_endpoint);

    g_gateway_ptr = &gateway;

    std::cout << "[main] Press Ctrl-C to shut down.\n";
    if (!g_shutdown.load()) {
      gateway.run();
    }
    g_gateway_ptr = nullptr;
  } else {
    std::cout << "[main] No market-data endpoint; press Ctrl-C to shut "
                 "down.\n";
    while (!g_shutdown.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }

  // -------------------------------------------------------------------------
  // 5) Shutdown
  // -------------------------------------------------------------------------
  std::cout << "[main] Stopping engine...\n";
  engine.stop();

  return 0;
}
