#include "tradeledger/gateway/market_data_gateway.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace tradeledger {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe all, receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(SimulationTimeProvider* sim_clock,
                                     TickSink sink,
                                     const std::string& endpoint)
    : sim_clock_(sim_clock), sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a timeout recv() never returns on a quiet feed and stop() is
  // never observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
  std::cout << "[MarketDataGateway] Connected to " << endpoint << "\n";
}

// -----------------------------------------------------------------------------
// parseTick
// -----------------------------------------------------------------------------
MarketDataEvent MarketDataGateway::parseTick(const std::string& payload) {
  auto json = nlohmann::json::parse(payload);

  MarketDataEvent md;
  md.symbol = json.at("symbol").get<std::string>();
  md.price = json.at("price").get<double>();
  md.quantity = json.value("volume", 0.0);
  md.timestamp = ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());
  return md;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;  // Signal arrived; re-check running_
      }
      throw;
    }

    if (!result.has_value()) {
      continue;  // Timeout
    }

    std::string payload = msg.to_string();

    try {
      MarketDataEvent md = parseTick(payload);
      md.sequence_id = ++sequence_;

      if (sim_clock_ != nullptr) {
        sim_clock_->advance_time(timestamp_to_ms(md.timestamp));
      }

      sink_(md);
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
                << " payload: " << payload << "\n";
    }
  }

  std::cout << "[MarketDataGateway] Stopped after " << sequence_
            << " tick(s)\n";
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace tradeledger
