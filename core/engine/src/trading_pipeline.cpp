#include "solseek/engine/trading_pipeline.hpp"
#include "solseek/domain/errors.hpp"
#include "solseek/execution/paper_connector.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace solseek {

namespace {

IExecutionConnector& chooseConnector(
    IExecutionConnector* external,
    std::unique_ptr<IExecutionConnector>& owned) {
  return external != nullptr ? *external : *owned;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradingPipeline::TradingPipeline(const EngineConfig& config,
                                 ILogSource& source,
                                 const ITimeProvider& clock,
                                 FeatureSchema schema,
                                 IExecutionConnector* connector)
    : config_(config),
      source_(source),
      clock_(clock),
      features_(std::move(schema), config.features.history_size),
      posterior_(config.posterior),
      risk_(clock, config.risk),
      strategy_(risk_, config.strategy),
      owned_connector_(connector != nullptr
                           ? nullptr
                           : std::make_unique<PaperConnector>(
                                 oracle_, config.pipeline.paper_fee_rate,
                                 config.pipeline.paper_slippage_bps)),
      connector_(chooseConnector(connector, owned_connector_)),
      executor_(connector_, risk_, clock) {
  if (!config_.posterior.weights_path.empty()) {
    posterior_.load(config_.posterior.weights_path);
    std::cout << "[TradingPipeline] posterior weights loaded from "
              << config_.posterior.weights_path << "\n";
  }

  const std::int64_t width = config_.pipeline.slot_width_ms;
  slot_fn_ = [width](const Event& e) { return eventTimestamp(e) / width; };
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradingPipeline::~TradingPipeline() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingPipeline::start() {
  if (running_.load()) {
    return;
  }
  if (consumer_.joinable()) {
    stop();  // reap a consumer that ended on its own (halt)
  }

  // A halted stream cannot be restarted; each start gets a fresh one.
  stream_ = std::make_unique<LogStream>(source_, config_.stream);
  halted_.store(false);
  stream_->start();

  running_.store(true);
  consumer_ = std::thread([this] { consume(); });

  std::cout << "[TradingPipeline] started on " << source_.describe()
            << " trading " << config_.pipeline.token << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingPipeline::stop() {
  if (!running_.exchange(false) && !consumer_.joinable()) {
    return;
  }

  // ---  1) Close ingestion first: unblocks a consumer parked in next() ------
  if (stream_) {
    stream_->close();
  }

  // ---  2) Join the consumer -------------------------------------------------
  if (consumer_.joinable()) {
    consumer_.join();
  }

  std::cout << "[TradingPipeline] stopped after " << events_processed_.load()
            << " events.\n";
}

void TradingPipeline::setSlotFunction(SlotFunction slot_fn) {
  slot_fn_ = std::move(slot_fn);
}

StreamMetrics TradingPipeline::streamMetrics() const {
  return stream_ ? stream_->metrics() : StreamMetrics{};
}

// -----------------------------------------------------------------------------
// consume(): pipeline thread body
// -----------------------------------------------------------------------------
void TradingPipeline::consume() {
  try {
    while (running_.load()) {
      auto event = stream_->nextEvent();
      if (!event) {
        break;  // stream closed
      }
      process(*event);
    }
  } catch (const StreamHaltedError& e) {
    halted_.store(true);
    std::cerr << "[TradingPipeline] ingestion halted: " << e.what()
              << "; restart required\n";
  }
  running_.store(false);
}

// -----------------------------------------------------------------------------
// process(): one event through features → posterior → sizing → execution
// -----------------------------------------------------------------------------
void TradingPipeline::process(const Event& event) {
  std::lock_guard lock(state_mutex_);
  const std::int64_t slot = slot_fn_(event);

  std::vector<float> snapshot;
  try {
    snapshot = features_.update(event, slot);
  } catch (const SlotRegressionError& e) {
    std::cerr << "[TradingPipeline] skipping " << eventKindName(event)
              << ": " << e.what() << "\n";
    return;
  }
  events_processed_.fetch_add(1);

  try {
    if (const auto* swap = std::get_if<SwapEvent>(&event)) {
      markAndCheckExit(*swap);
    }
    act(snapshot);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[TradingPipeline] skipping " << eventKindName(event)
              << " at ts=" << eventTimestamp(event) << ": " << e.what()
              << "\n";
  }
}

void TradingPipeline::markAndCheckExit(const SwapEvent& swap) {
  const std::string& token = config_.pipeline.token;
  oracle_.observe(token, swap);
  if (!oracle_.has_price(token)) {
    return;
  }
  const double price = oracle_.price(token);
  risk_.update_market_price(token, price);

  if (auto exit = strategy_.check_exit(token, price)) {
    std::cout << "[TradingPipeline] " << exitReasonToString(exit->reason)
              << " on " << token << " @ " << price << "\n";
    placeSafely(exit->quantity, domain::Side::Sell,
                exitReasonToString(exit->reason));
  }
}

void TradingPipeline::act(const std::vector<float>& snapshot) {
  const std::string& token = config_.pipeline.token;
  const Action action = posterior_.decide_action(snapshot);
  const auto held = risk_.position(token);

  if (action == Action::Enter && !held && oracle_.has_price(token)) {
    const PosteriorOutput post = posterior_.predict(snapshot);
    const double equity = config_.pipeline.capital + risk_.realized_pnl();
    const auto signal = strategy_.evaluate(
        post, config_.pipeline.fee_estimate, equity,
        config_.strategy.default_volatility, oracle_.volume(token),
        oracle_.price(token));
    if (signal) {
      placeSafely(signal->quantity, domain::Side::Buy, "enter");
    }
  } else if (action == Action::Exit && held) {
    placeSafely(held->quantity, domain::Side::Sell, "exit");
  }
}

void TradingPipeline::placeSafely(double quantity, domain::Side side,
                                  const char* why) {
  try {
    executor_.place_order(config_.pipeline.token, quantity, side);
  } catch (const SolseekError& e) {
    std::cerr << "[TradingPipeline] " << why << " "
              << domain::sideToString(side) << " " << quantity << " "
              << config_.pipeline.token << " not placed: " << e.what()
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// status(): JSON snapshot of the book
// -----------------------------------------------------------------------------
std::string TradingPipeline::status() const {
  std::lock_guard lock(state_mutex_);
  nlohmann::json response;
  response["status"] = "ok";
  response["halted"] = halted_.load();
  response["events_processed"] = events_processed_.load();

  response["equity"] = risk_.equity();
  response["peak_equity"] = risk_.peak_equity();
  response["drawdown"] = risk_.drawdown();
  response["max_drawdown"] = risk_.max_drawdown();
  response["realized_pnl"] = risk_.realized_pnl();
  response["unrealized_pnl"] = risk_.unrealized_pnl();
  response["var"] = risk_.var();
  response["es"] = risk_.es();
  response["sharpe"] = risk_.sharpe();
  response["exposure"] = risk_.exposure();

  nlohmann::json positions_json = nlohmann::json::array();
  for (const auto& pos : risk_.positions()) {
    nlohmann::json p;
    p["token"] = pos.token;
    p["quantity"] = pos.quantity;
    p["average_cost"] = pos.average_cost;
    p["unrealized_pnl"] = pos.unrealized_pnl;
    positions_json.push_back(std::move(p));
  }
  response["positions"] = std::move(positions_json);
  response["orders"] = executor_.orders().size();

  const StreamMetrics m = streamMetrics();
  response["stream"] = {{"received", m.received},
                        {"dropped", m.dropped},
                        {"skipped", m.skipped},
                        {"reconnects", m.reconnects},
                        {"depth", m.depth},
                        {"capacity", m.capacity}};

  const FeatureLatency lat = features_.latency();
  response["feature_latency_us"] = {{"count", lat.count},
                                    {"last", lat.last_us},
                                    {"max", lat.max_us},
                                    {"mean", lat.mean_us}};
  return response.dump();
}

}  // namespace solseek
