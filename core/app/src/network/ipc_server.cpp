#include "tradeledger/network/ipc_server.hpp"
#include "tradeledger/domain/enum_strings.hpp"
#include "tradeledger/network/json_codec.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace tradeledger {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request, one reply
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    return formatOrderUpdate(*e);
  }
  if (auto* e = std::get_if<TradeEvent>(&event)) {
    return formatTrade(*e);
  }
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<RiskViolationEvent>(&event)) {
    return formatRiskViolation(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatOrderUpdate(const OrderUpdateEvent& e) {
  nlohmann::json j = toJson(e.order);
  j["type"] = "order_update";
  j["previous_status"] = toString(e.previous_status);
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatTrade(const TradeEvent& e) {
  nlohmann::json j = toJson(e.trade);
  j["type"] = "trade";
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

std::string IpcServer::formatPositionUpdate(const PositionUpdateEvent& e) {
  nlohmann::json j = toJson(e.position);
  j["type"] = "position_update";
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatRiskViolation(const RiskViolationEvent& e) {
  nlohmann::json j = toJson(e.decision);
  j["type"] = "risk_violation";
  j["order_id"] = e.order_id;
  j["symbol"] = e.symbol;
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

}  // namespace tradeledger
