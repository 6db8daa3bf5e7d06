#include "solseek/config/engine_config.hpp"
#include "solseek/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace solseek {

namespace {

using nlohmann::json;

// Assigns j[key] to out if present. A present key of the wrong type throws
// json::type_error, translated to ConfigError by parseEngineConfig().
template <typename T>
void readOptional(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

const json& section(const json& root, const char* name) {
  static const json kEmpty = json::object();
  auto it = root.find(name);
  if (it == root.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("section '") + name + "' must be an object");
  }
  return *it;
}

void require(bool condition, const std::string& what) {
  if (!condition) {
    throw ConfigError(what);
  }
}

void readStream(const json& j, StreamConfig& c) {
  readOptional(j, "endpoint", c.endpoint);
  readOptional(j, "queue_capacity", c.queue_capacity);
  readOptional(j, "backpressure_timeout_ms", c.backpressure_timeout_ms);
  readOptional(j, "backoff_base_ms", c.backoff_base_ms);
  readOptional(j, "backoff_cap_ms", c.backoff_cap_ms);
  readOptional(j, "stable_reset_ms", c.stable_reset_ms);
  readOptional(j, "recv_timeout_ms", c.recv_timeout_ms);

  require(c.queue_capacity > 0, "stream.queue_capacity must be > 0");
  require(c.backpressure_timeout_ms > 0,
          "stream.backpressure_timeout_ms must be > 0");
  require(c.backoff_base_ms > 0 && c.backoff_cap_ms >= c.backoff_base_ms,
          "stream backoff requires 0 < backoff_base_ms <= backoff_cap_ms");
  require(c.recv_timeout_ms > 0, "stream.recv_timeout_ms must be > 0");
}

void readFeatures(const json& j, FeatureConfig& c) {
  readOptional(j, "schema_path", c.schema_path);
  readOptional(j, "history_size", c.history_size);
  readOptional(j, "subscriber_capacity", c.subscriber_capacity);
  require(c.subscriber_capacity > 0,
          "features.subscriber_capacity must be > 0");
}

void readPosterior(const json& j, PosteriorConfig& c) {
  readOptional(j, "n_features", c.n_features);
  readOptional(j, "volume_index", c.volume_index);
  readOptional(j, "fee_index", c.fee_index);
  readOptional(j, "volume_threshold", c.volume_threshold);
  readOptional(j, "fee_threshold", c.fee_threshold);
  readOptional(j, "learning_rate", c.learning_rate);
  readOptional(j, "weights_path", c.weights_path);
  require(c.n_features > 0, "posterior.n_features must be > 0");
}

void readRisk(const json& j, domain::RiskLimits& c) {
  readOptional(j, "equity_history_capacity", c.equity_history_capacity);
  readOptional(j, "price_history_capacity", c.price_history_capacity);
  readOptional(j, "var_confidence", c.var_confidence);
  readOptional(j, "max_exposure", c.max_exposure);
  readOptional(j, "token_drawdown_limit", c.token_drawdown_limit);

  require(c.equity_history_capacity > 0,
          "risk.equity_history_capacity must be > 0");
  require(c.price_history_capacity > 1,
          "risk.price_history_capacity must be > 1");
  require(c.var_confidence > 0.0 && c.var_confidence < 1.0,
          "risk.var_confidence must be in (0, 1)");
  for (const auto& [token, limit] : c.max_exposure) {
    require(limit >= 0.0, "risk.max_exposure[" + token + "] must be >= 0");
  }
  for (const auto& [token, limit] : c.token_drawdown_limit) {
    require(limit >= 0.0 && limit <= 1.0,
            "risk.token_drawdown_limit[" + token + "] must be in [0, 1]");
  }
}

void readStrategy(const json& j, StrategyConfig& c) {
  readOptional(j, "stop_loss", c.stop_loss);
  readOptional(j, "take_profit", c.take_profit);
  readOptional(j, "max_position_size", c.max_position_size);
  readOptional(j, "liquidity_cap", c.liquidity_cap);
  readOptional(j, "zero_equity_tail_fraction", c.zero_equity_tail_fraction);
  readOptional(j, "default_volatility", c.default_volatility);

  require(c.stop_loss >= 0.0 && c.stop_loss < 1.0,
          "strategy.stop_loss must be in [0, 1)");
  require(c.take_profit >= 0.0, "strategy.take_profit must be >= 0");
  require(c.max_position_size >= 0.0,
          "strategy.max_position_size must be >= 0");
  require(c.liquidity_cap >= 0.0, "strategy.liquidity_cap must be >= 0");
  require(c.default_volatility > 0.0,
          "strategy.default_volatility must be > 0");
}

void readPipeline(const json& j, PipelineConfig& c) {
  readOptional(j, "slot_width_ms", c.slot_width_ms);
  readOptional(j, "token", c.token);
  readOptional(j, "capital", c.capital);
  readOptional(j, "fee_estimate", c.fee_estimate);
  readOptional(j, "paper_fee_rate", c.paper_fee_rate);
  readOptional(j, "paper_slippage_bps", c.paper_slippage_bps);

  require(c.slot_width_ms > 0, "pipeline.slot_width_ms must be > 0");
  require(!c.token.empty(), "pipeline.token must not be empty");
  require(c.capital >= 0.0, "pipeline.capital must be >= 0");
  require(c.fee_estimate >= 0.0 && c.paper_fee_rate >= 0.0 &&
              c.paper_slippage_bps >= 0.0,
          "pipeline fees and slippage must be >= 0");
}

}  // namespace

EngineConfig parseEngineConfig(const std::string& json_text) {
  EngineConfig config;
  try {
    auto root = json::parse(json_text);
    if (!root.is_object()) {
      throw ConfigError("top-level value must be an object");
    }
    readStream(section(root, "stream"), config.stream);
    readFeatures(section(root, "features"), config.features);
    readPosterior(section(root, "posterior"), config.posterior);
    readRisk(section(root, "risk"), config.risk);
    readStrategy(section(root, "strategy"), config.strategy);
    readPipeline(section(root, "pipeline"), config.pipeline);
  } catch (const json::exception& e) {
    throw ConfigError(e.what());
  }
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace solseek
