#include "tradeledger/engine/trading_engine.hpp"
#include "tradeledger/domain/enum_strings.hpp"
#include "tradeledger/domain/errors.hpp"
#include "tradeledger/network/json_codec.hpp"
#include "tradeledger/portfolio/tax_reporter.hpp"
#include "tradeledger/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <utility>
#include <variant>

namespace tradeledger {

namespace {

// Trading days per week / month for the square-root-of-time VaR horizons.
constexpr double kDaysPerWeek = 5.0;
constexpr double kDaysPerMonth = 21.0;

constexpr std::int64_t kDefaultHistoryLimit = 50;

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

nlohmann::json okResponse(nlohmann::json payload) {
  nlohmann::json response;
  response["status"] = "ok";
  response["response"] = std::move(payload);
  return response;
}

nlohmann::json errorResponse(nlohmann::json error) {
  nlohmann::json response;
  response["status"] = "error";
  response["error"] = std::move(error);
  return response;
}

const nlohmann::json& requireArg(const nlohmann::json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || it->is_null()) {
    throw ValidationError(key, std::string("missing argument '") + key + "'");
  }
  return *it;
}

domain::TradingMode modeArg(const nlohmann::json& args,
                            domain::TradingMode fallback) {
  auto it = args.find("mode");
  if (it == args.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ValidationError("mode", "mode must be a string");
  }
  const auto mode = parseTradingMode(it->get<std::string>());
  if (!mode.has_value()) {
    throw ValidationError("mode",
                          "unknown trading mode '" + it->get<std::string>() +
                              "'");
  }
  return *mode;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: wire the synchronous core
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config, const ITimeProvider& clock,
                             IRepository* repository)
    : config_(std::move(config)), clock_(clock), repository_(repository) {
  validateEngineConfig(config_);

  if (repository_ == nullptr) {
    owned_repository_ = std::make_unique<InMemoryRepository>();
    repository_ = owned_repository_.get();
  }

  price_cache_ = std::make_unique<PriceCache>(config_.price_history_capacity);
  book_ = std::make_unique<PositionBook>(config_.fees.tax_rate);
  gate_ = std::make_unique<RiskGate>(config_.limits, *price_cache_);
  simulator_ = std::make_unique<ExecutionSimulator>(config_.fees);
  account_ = std::make_unique<SimulatedAccount>(config_.starting_cash);
  lifecycle_ = std::make_unique<OrderLifecycleManager>(
      *book_, *gate_, *simulator_, *price_cache_, *repository_, *account_,
      bus_, clock_, order_ids_, trade_ids_);

  market_sub_id_ = bus_.subscribe<MarketDataEvent>(
      [this](const MarketDataEvent& e) { applyTick(e); });
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradingEngine::~TradingEngine() {
  stop();
  bus_.unsubscribe(market_sub_id_);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Hydrate once ------------------------------------------------------
  if (!hydrated_) {
    hydrate();
    hydrated_ = true;
  }

  // ---  2) IpcServer + telemetry bridge --------------------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    IpcServer* server = ipc_server_.get();
    telemetry_sub_id_ = bus_.subscribe([server](const Event& e) {
      if (!std::holds_alternative<MarketDataEvent>(e)) {
        server->pushTelemetry(e);
      }
    });
  }

  // ---  3) Periodic re-evaluation --------------------------------------------
  reevaluation_task_ = std::make_unique<PeriodicTask>(
      "reevaluate", config_.reevaluation_interval, [this] {
        const auto fills = lifecycle_->reevaluateOpenOrders();
        if (fills > 0) {
          std::cout << "[TradingEngine] Re-evaluation produced " << fills
                    << " fill(s)\n";
        }
      });
  reevaluation_task_->start();

  running_.store(true);

  std::cout << "[TradingEngine] started. Threads: reevaluate"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // Re-evaluation first: it places fills that produce telemetry.
  reevaluation_task_.reset();

  if (ipc_server_) {
    bus_.unsubscribe(telemetry_sub_id_);
    ipc_server_.reset();
  }

  running_.store(false);

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// hydrate(): positions + lots, then orders + trades, then cash
// -----------------------------------------------------------------------------
void TradingEngine::hydrate() {
  const auto positions = repository_->loadPositions();
  for (const auto& snapshot : positions) {
    book_->hydrate(snapshot.position, snapshot.lots);
  }

  const auto orders = repository_->loadOrders();
  const auto trades = repository_->loadTrades();
  lifecycle_->hydrate(orders, trades);

  for (const auto& trade : trades) {
    account_->settle(trade);
  }

  std::cout << "[TradingEngine] Hydration complete: " << positions.size()
            << " position(s), " << orders.size() << " order(s), "
            << trades.size() << " trade(s).\n";
}

// -----------------------------------------------------------------------------
// Market data
// -----------------------------------------------------------------------------
void TradingEngine::onMarketData(const MarketDataEvent& event) {
  bus_.publish(event);
}

void TradingEngine::applyTick(const MarketDataEvent& event) {
  price_cache_->onMarketData(event);
  if (event.price > 0.0) {
    book_->markToMarket(event.symbol, event.price);
  }
}

// -----------------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------------
domain::OrderId TradingEngine::placeOrder(const domain::OrderRequest& request) {
  return lifecycle_->placeOrder(request);
}

void TradingEngine::cancelOrder(domain::OrderId id) {
  lifecycle_->cancelOrder(id);
}

domain::PositionSnapshot TradingEngine::getPosition(
    const std::string& symbol, domain::TradingMode mode) const {
  return book_->positionSnapshot(upper(symbol), mode);
}

domain::RiskDecision TradingEngine::riskCheck(
    const domain::OrderRequest& request,
    std::optional<double> reference_price) const {
  domain::OrderRequest normalized = request;
  normalized.symbol = upper(request.symbol);
  if (!(normalized.quantity > 0.0)) {
    throw ValidationError("quantity", "quantity must be positive");
  }

  if (!reference_price.has_value()) {
    reference_price = price_cache_->currentPrice(normalized.symbol);
  }
  if (!reference_price.has_value()) {
    reference_price = normalized.limit_price ? normalized.limit_price
                                             : normalized.stop_price;
  }
  if (!reference_price.has_value()) {
    throw ValidationError("price", "no reference price for " +
                                       normalized.symbol);
  }

  return gate_->check(normalized, *reference_price,
                      book_->portfolioSnapshot(*account_, now()));
}

double TradingEngine::computeVar(const std::string& symbol, VarMethod method,
                                 double confidence) const {
  return gate_->valueAtRisk(upper(symbol), method, confidence,
                            book_->portfolioSnapshot(*account_, now()));
}

double TradingEngine::computeExpectedShortfall(const std::string& symbol,
                                               double confidence) const {
  return gate_->expectedShortfall(upper(symbol), confidence,
                                  book_->portfolioSnapshot(*account_, now()));
}

std::size_t TradingEngine::switchTradingMode(domain::TradingMode mode) {
  return lifecycle_->switchTradingMode(mode);
}

domain::TaxSummary TradingEngine::taxSummary(const std::string& symbol,
                                             std::optional<int> year) const {
  const std::string sym = upper(symbol);
  return TaxReporter::summarize(book_->lots(sym), sym, year);
}

domain::TaxReport TradingEngine::taxReport(int year,
                                           const std::string& symbol) const {
  const std::string sym = upper(symbol);
  return TaxReporter::report(book_->lots(sym), lifecycle_->trades(), sym,
                             year);
}

std::vector<domain::Order> TradingEngine::orderHistory(
    const std::string& symbol, std::optional<domain::TradingMode> mode,
    std::size_t limit) const {
  return lifecycle_->orderHistory(upper(symbol), mode, limit);
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, serialize errors
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json args = nlohmann::json::object();
  std::string command = cmd;

  const auto first = cmd.find_first_not_of(" \t\r\n");
  if (first != std::string::npos && cmd[first] == '{') {
    try {
      args = nlohmann::json::parse(cmd);
    } catch (const nlohmann::json::parse_error& e) {
      return errorResponse(errorToJson(ValidationError(
                               "command", std::string("malformed JSON: ") +
                                              e.what())))
          .dump();
    }
    auto it = args.find("command");
    if (it == args.end() || !it->is_string()) {
      return errorResponse(errorToJson(ValidationError(
                               "command", "missing 'command' string")))
          .dump();
    }
    command = it->get<std::string>();
  }

  try {
    return okResponse(dispatch(upper(command), args)).dump();
  } catch (const TradingError& e) {
    return errorResponse(errorToJson(e)).dump();
  } catch (const nlohmann::json::exception& e) {
    return errorResponse(errorToJson(ValidationError(
                             "command", std::string("bad argument: ") +
                                            e.what())))
        .dump();
  }
}

nlohmann::json TradingEngine::dispatch(const std::string& command,
                                       const nlohmann::json& args) {
  if (command == "PING") {
    return "PONG";
  }

  if (command == "STATUS") {
    return statusJson();
  }

  if (command == "PLACE_ORDER") {
    const auto request = orderRequestFromJson(requireArg(args, "order"));
    const auto id = placeOrder(request);
    return toJson(lifecycle_->order(id));
  }

  if (command == "CANCEL_ORDER") {
    const auto id = requireArg(args, "order_id").get<domain::OrderId>();
    cancelOrder(id);
    return toJson(lifecycle_->order(id));
  }

  if (command == "GET_POSITION") {
    const auto symbol = requireArg(args, "symbol").get<std::string>();
    return toJson(
        getPosition(symbol, modeArg(args, domain::TradingMode::Simulated)));
  }

  if (command == "RISK_CHECK") {
    const auto request = orderRequestFromJson(requireArg(args, "order"));
    std::optional<double> price;
    if (auto it = args.find("price"); it != args.end() && !it->is_null()) {
      price = it->get<double>();
    }
    return toJson(riskCheck(request, price));
  }

  if (command == "COMPUTE_VAR") {
    const std::string symbol = args.value("symbol", std::string{});
    const double confidence =
        args.value("confidence", gate_->limits()->var_confidence);

    VarMethod method = VarMethod::Historical;
    if (auto it = args.find("method"); it != args.end() && !it->is_null()) {
      const auto parsed = parseVarMethod(it->get<std::string>());
      if (!parsed.has_value()) {
        throw ValidationError("method", "unknown VaR method '" +
                                            it->get<std::string>() + "'");
      }
      method = *parsed;
    }

    const double var = computeVar(symbol, method, confidence);
    nlohmann::json j;
    j["symbol"] = symbol.empty() ? "PORTFOLIO" : upper(symbol);
    j["method"] = toString(method);
    j["confidence"] = confidence;
    j["var"] = var;
    j["expected_shortfall"] = computeExpectedShortfall(symbol, confidence);
    j["var_1w"] = RiskMetrics::scaleToHorizon(var, kDaysPerWeek);
    j["var_1m"] = RiskMetrics::scaleToHorizon(var, kDaysPerMonth);
    return j;
  }

  if (command == "SWITCH_MODE") {
    requireArg(args, "mode");
    const auto mode = modeArg(args, domain::TradingMode::Simulated);
    nlohmann::json j;
    j["mode"] = toString(mode);
    j["orders_moved"] = switchTradingMode(mode);
    return j;
  }

  if (command == "TAX_SUMMARY") {
    std::optional<int> year;
    if (auto it = args.find("year"); it != args.end() && !it->is_null()) {
      year = it->get<int>();
    }
    return toJson(taxSummary(args.value("symbol", std::string{}), year));
  }

  if (command == "TAX_REPORT") {
    const int year = requireArg(args, "year").get<int>();
    return toJson(taxReport(year, args.value("symbol", std::string{})));
  }

  if (command == "ORDER_HISTORY") {
    std::optional<domain::TradingMode> mode;
    if (auto it = args.find("mode"); it != args.end() && !it->is_null()) {
      mode = modeArg(args, domain::TradingMode::Simulated);
    }
    const auto limit = args.value("limit", kDefaultHistoryLimit);
    if (limit < 1) {
      throw ValidationError("limit", "history limit must be positive");
    }

    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order :
         orderHistory(args.value("symbol", std::string{}), mode,
                      static_cast<std::size_t>(limit))) {
      orders.push_back(toJson(order));
    }
    return orders;
  }

  throw ValidationError("command", "Unknown command: " + command);
}

// -----------------------------------------------------------------------------
// statusJson(): portfolio headline figures
// -----------------------------------------------------------------------------
nlohmann::json TradingEngine::statusJson() const {
  const auto snapshot = book_->portfolioSnapshot(*account_, now());

  nlohmann::json j;
  j["running"] = running_.load();
  j["now_ms"] = clock_.now_ms();
  j["cash"] = snapshot.cash;
  j["portfolio_value"] = snapshot.portfolio_value;
  j["gross_exposure"] = snapshot.gross_exposure;
  j["daily_pnl"] = snapshot.daily_pnl;
  j["open_orders"] = lifecycle_->openOrders().size();

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& p : snapshot.positions) {
    positions.push_back(toJson(p));
  }
  j["positions"] = std::move(positions);
  return j;
}

Timestamp TradingEngine::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

}  // namespace tradeledger
