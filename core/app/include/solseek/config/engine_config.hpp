#pragma once

#include "solseek/domain/risk_limits.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace solseek {

// -----------------------------------------------------------------------------
// Component configuration
// -----------------------------------------------------------------------------
//
// @brief  One plain struct per component, filled from config/solseek.json.
//
// @details
// Every field has a working default, so an empty JSON object (or no file at
// all in tests) yields a runnable engine. The JSON layout mirrors the
// structs one-to-one:
//
//   {
//     "stream":    { "endpoint": "tcp://127.0.0.1:5555", "queue_capacity": 10000, ... },
//     "features":  { "schema_path": "config/features.json", "history_size": 1000, ... },
//     "posterior": { "n_features": 256, "volume_index": 67, ... },
//     "risk":      { "var_confidence": 0.95, "max_exposure": { "SOL": 1000.0 }, ... },
//     "strategy":  { "stop_loss": 0.02, "take_profit": 0.04, ... },
//     "pipeline":  { "slot_width_ms": 400, "token": "SOL", "capital": 1000.0 }
//   }
//
// Thread model: value types, read once at startup.
// -----------------------------------------------------------------------------

struct StreamConfig {
  std::string endpoint{"tcp://127.0.0.1:5555"};
  std::size_t queue_capacity{10000};
  std::int64_t backpressure_timeout_ms{1000};
  std::int64_t backoff_base_ms{1000};
  std::int64_t backoff_cap_ms{32000};
  std::int64_t stable_reset_ms{10000};
  int recv_timeout_ms{100};
};

struct FeatureConfig {
  std::string schema_path{"config/features.json"};
  std::size_t history_size{1000};
  std::size_t subscriber_capacity{1};
};

struct PosteriorConfig {
  std::size_t n_features{256};
  std::size_t volume_index{67};
  std::size_t fee_index{68};
  double volume_threshold{0.0};
  double fee_threshold{1.0};
  double learning_rate{0.01};
  std::string weights_path;  // empty → start from zero weights
};

struct StrategyConfig {
  double stop_loss{0.02};
  double take_profit{0.04};
  double max_position_size{std::numeric_limits<double>::infinity()};
  double liquidity_cap{0.1};
  // Fraction of the caller's equity used as the tail-risk budget while the
  // risk manager has not recorded any equity yet.
  double zero_equity_tail_fraction{0.1};
  double default_volatility{0.05};
};

struct PipelineConfig {
  std::int64_t slot_width_ms{400};
  std::string token{"SOL"};      // token the pipeline trades
  double capital{1000.0};        // starting equity handed to the sizer
  double fee_estimate{0.003};    // fee fraction subtracted from the edge
  double paper_fee_rate{0.003};  // PaperConnector fee per unit notional
  double paper_slippage_bps{0.0};
};

struct EngineConfig {
  StreamConfig stream;
  FeatureConfig features;
  PosteriorConfig posterior;
  domain::RiskLimits risk;
  StrategyConfig strategy;
  PipelineConfig pipeline;
};

// -----------------------------------------------------------------------------
// parseEngineConfig(json_text)
// -----------------------------------------------------------------------------
// @brief  Builds an EngineConfig from a JSON document.
//
// @throws ConfigError  on invalid JSON, a value of the wrong type, or a value
//                      outside its valid range (zero capacities, confidence
//                      outside (0,1), negative thresholds where meaningless).
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text);

// -----------------------------------------------------------------------------
// loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads the file and forwards to parseEngineConfig().
//
// @throws ConfigError  if the file cannot be opened, or on any parse error.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace solseek
