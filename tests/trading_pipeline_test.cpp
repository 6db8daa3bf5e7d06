// =============================================================================
// trading_pipeline_test.cpp
// =============================================================================
// Integration tests for the full decision chain:
//   raw log → LogStream → parseLog → FeatureEngine → PosteriorEngine
//     → SizingStrategy → TradeExecutor → RiskManager
//
// Validates:
//   - Swaps mark the book and feed the paper venue's price
//   - A trend-favouring posterior opens a Kelly-sized position from a flat
//     book; take-profit and a revert posterior close it through execution
//   - Risk rejections and slot regressions are absorbed, not thrown
//   - start()/stop() run the consumer thread over a live stream, and
//     status() reports the final book as JSON
//
// Design:
//   Most tests drive process() directly on a stopped pipeline so every step
//   is deterministic. The posterior is trained on a single feature,
//   of_trade_count (index 65), whose z-score stays positive while every
//   slot carries exactly one swap; that makes the regime call predictable.
// =============================================================================

#include "fake_log_source.hpp"

#include "solseek/domain/errors.hpp"
#include "solseek/engine/trading_pipeline.hpp"
#include "solseek/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using solseek::EngineConfig;
using solseek::Regime;
using solseek::SwapEvent;
using solseek::TradingPipeline;
using solseek::domain::Side;
using solseek::testing::ScriptedLogSource;

namespace {

// One swap per slot: amount_in 1000 so the oracle sees ample volume.
SwapEvent swapAt(std::int64_t slot, double price) {
  SwapEvent e;
  e.ts = slot * 400;
  e.amount_in = 1000.0;
  e.amount_out = 1000.0 * price;
  return e;
}

std::string swapJson(std::int64_t slot, double price) {
  return "{\"type\":\"swap\",\"ts\":" + std::to_string(slot * 400) +
         ",\"amount_in\":1000,\"amount_out\":" +
         std::to_string(1000.0 * price) + "}";
}

EngineConfig testConfig() {
  EngineConfig c;
  // Only the regime decides; volume and fee gates are wide open.
  c.posterior.volume_threshold = -1e9;
  c.posterior.fee_threshold = 1e9;
  c.pipeline.capital = 1000.0;
  c.pipeline.fee_estimate = 0.003;
  c.pipeline.paper_fee_rate = 0.0;
  c.pipeline.paper_slippage_bps = 0.0;
  c.stream.backoff_base_ms = 10;
  c.stream.backoff_cap_ms = 20;
  return c;
}

void trainRegime(TradingPipeline& pipeline, Regime regime) {
  std::vector<float> x(solseek::kSnapshotWidth, 0.0f);
  x[solseek::feature_index::kTradeCount] = 1.0f;
  for (int i = 0; i < 200; ++i) {
    pipeline.posterior().update(x, false, regime, 0.5);
  }
}

// Records every order and fills at a fixed price.
class FixedPriceConnector : public solseek::IExecutionConnector {
 public:
  explicit FixedPriceConnector(double price) : price_(price) {}

  solseek::ExecutionResult execute(const std::string&, double quantity,
                                   Side side,
                                   std::optional<double>) override {
    calls.push_back({side, quantity});
    return solseek::ExecutionResult{price_, 0.0, 0.0};
  }

  std::vector<std::pair<Side, double>> calls;

 private:
  double price_;
};

}  // namespace

// =============================================================================
// Test fixture: a stopped pipeline on a simulated clock.
// =============================================================================
class TradingPipelineTest : public ::testing::Test {
 protected:
  solseek::SimulationTimeProvider clock{0};
  ScriptedLogSource source;
};

// -----------------------------------------------------------------------------
// 1. A swap marks the traded token; an untrained posterior stays flat.
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, SwapMarksTheBook) {
  TradingPipeline pipeline(testConfig(), source, clock);
  pipeline.process(swapAt(0, 100.0));

  EXPECT_EQ(pipeline.eventsProcessed(), 1u);
  EXPECT_DOUBLE_EQ(pipeline.oracle().price("SOL"), 100.0);
  EXPECT_DOUBLE_EQ(pipeline.risk().mark("SOL").value(), 100.0);
  EXPECT_TRUE(pipeline.executor().orders().empty());
  EXPECT_EQ(pipeline.features().currentSlot().value(), 0);
}

// -----------------------------------------------------------------------------
// 2. Trend posterior, rising marks: the first call with two returns of
//    history opens a position sized to the whole equity at full Kelly.
//    Take-profit then closes it through the executor.
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, EntersOnTrendAndTakesProfit) {
  TradingPipeline pipeline(testConfig(), source, clock);
  trainRegime(pipeline, Regime::Trend);

  pipeline.process(swapAt(0, 100.0));
  pipeline.process(swapAt(1, 101.0));
  EXPECT_TRUE(pipeline.executor().orders().empty());

  pipeline.process(swapAt(2, 103.0));
  auto orders = pipeline.executor().orders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].side, Side::Buy);
  EXPECT_DOUBLE_EQ(orders[0].price, 103.0);
  // min(1000 / 103, 0.1 · 3000 liquidity, 0.1 · 1000 / (0.05 · 103))
  EXPECT_NEAR(orders[0].quantity, 1000.0 / 103.0, 1e-9);
  const double qty = orders[0].quantity;

  // 110 ≥ 103 · 1.04: take profit, then the still-bullish posterior re-enters.
  pipeline.process(swapAt(3, 110.0));
  orders = pipeline.executor().orders();
  ASSERT_GE(orders.size(), 2u);
  EXPECT_EQ(orders[1].side, Side::Sell);
  EXPECT_DOUBLE_EQ(orders[1].quantity, qty);
  EXPECT_NEAR(pipeline.risk().realized_pnl(), 7.0 * qty, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. A revert posterior exits an open position in full.
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, RevertPosteriorExits) {
  FixedPriceConnector venue(100.0);
  TradingPipeline pipeline(testConfig(), source, clock,
                           solseek::FeatureSchema::builtin(), &venue);
  trainRegime(pipeline, Regime::Revert);
  pipeline.risk().add_position("SOL", 2.0, 100.0);

  pipeline.process(swapAt(0, 100.0));

  ASSERT_EQ(venue.calls.size(), 1u);
  EXPECT_EQ(venue.calls[0].first, Side::Sell);
  EXPECT_DOUBLE_EQ(venue.calls[0].second, 2.0);
  EXPECT_FALSE(pipeline.risk().position("SOL").has_value());
}

TEST_F(TradingPipelineTest, StopLossExits) {
  TradingPipeline pipeline(testConfig(), source, clock);
  pipeline.risk().add_position("SOL", 3.0, 100.0);

  pipeline.process(swapAt(0, 97.0));

  const auto orders = pipeline.executor().orders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].side, Side::Sell);
  EXPECT_DOUBLE_EQ(orders[0].quantity, 3.0);
  EXPECT_NEAR(pipeline.risk().realized_pnl(), -9.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 4. Policy rejections and out-of-order slots never escape process().
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, RiskRejectionIsAbsorbed) {
  EngineConfig config = testConfig();
  config.risk.max_exposure["SOL"] = 1.0;
  TradingPipeline pipeline(config, source, clock);
  trainRegime(pipeline, Regime::Trend);

  for (std::int64_t slot = 0; slot < 4; ++slot) {
    EXPECT_NO_THROW(pipeline.process(swapAt(slot, 100.0 + slot)));
  }
  EXPECT_TRUE(pipeline.executor().orders().empty());
  EXPECT_TRUE(pipeline.risk().positions().empty());
  EXPECT_EQ(pipeline.eventsProcessed(), 4u);
}

TEST_F(TradingPipelineTest, NonFinitePriceSwapDoesNotStopConsumer) {
  TradingPipeline pipeline(testConfig(), source, clock);
  pipeline.risk().add_position("SOL", 1.0, 100.0);
  pipeline.start();

  source.feed(swapJson(0, 100.0));
  source.feed(R"({"type":"swap","ts":400,"amount_in":1e-300,"amount_out":1e300})");
  source.feed(swapJson(2, 101.0));

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (pipeline.eventsProcessed() < 3 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_TRUE(pipeline.running());
  pipeline.stop();

  EXPECT_EQ(pipeline.eventsProcessed(), 3u);
  EXPECT_FALSE(pipeline.halted());
  EXPECT_DOUBLE_EQ(pipeline.oracle().price("SOL"), 101.0);
  EXPECT_DOUBLE_EQ(pipeline.risk().mark("SOL").value(), 101.0);
  EXPECT_DOUBLE_EQ(pipeline.risk().position("SOL")->quantity, 1.0);
}

TEST_F(TradingPipelineTest, SlotRegressionSkipsEvent) {
  TradingPipeline pipeline(testConfig(), source, clock);
  pipeline.setSlotFunction(
      [](const solseek::Event& e) { return solseek::eventTimestamp(e); });

  pipeline.process(swapAt(10, 100.0));
  EXPECT_NO_THROW(pipeline.process(swapAt(5, 90.0)));

  EXPECT_EQ(pipeline.eventsProcessed(), 1u);
  EXPECT_DOUBLE_EQ(pipeline.oracle().price("SOL"), 100.0);
}

// -----------------------------------------------------------------------------
// 5. Running pipeline: records fed to the source are processed on the
//    consumer thread; stop() joins it and status() reports the book.
// -----------------------------------------------------------------------------
TEST_F(TradingPipelineTest, RunsOverLiveStream) {
  TradingPipeline pipeline(testConfig(), source, clock);
  pipeline.start();
  pipeline.start();  // idempotent
  EXPECT_TRUE(pipeline.running());

  source.feed("not json");
  for (std::int64_t slot = 0; slot < 5; ++slot) {
    source.feed(swapJson(slot, 100.0 + slot));
  }

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (pipeline.eventsProcessed() < 5 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  pipeline.stop();
  pipeline.stop();  // idempotent

  EXPECT_FALSE(pipeline.running());
  EXPECT_FALSE(pipeline.halted());
  ASSERT_EQ(pipeline.eventsProcessed(), 5u);

  const auto status = nlohmann::json::parse(pipeline.status());
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_EQ(status.at("events_processed"), 5);
  EXPECT_EQ(status.at("stream").at("received"), 6);
  EXPECT_EQ(status.at("stream").at("skipped"), 1);
  EXPECT_FALSE(status.at("halted").get<bool>());
  EXPECT_TRUE(status.at("positions").is_array());
  EXPECT_EQ(status.at("feature_latency_us").at("count"), 5);
}

TEST_F(TradingPipelineTest, StatusIsReadableWhileRunning) {
  TradingPipeline pipeline(testConfig(), source, clock);
  pipeline.start();

  std::atomic<bool> done{false};
  std::thread reader([&] {
    std::uint64_t last = 0;
    while (!done.load()) {
      const auto status = nlohmann::json::parse(pipeline.status());
      const auto processed = status.at("events_processed").get<std::uint64_t>();
      EXPECT_GE(processed, last);
      EXPECT_EQ(status.at("feature_latency_us").at("count").get<std::uint64_t>(),
                processed);
      last = processed;
    }
  });

  for (std::int64_t slot = 0; slot < 50; ++slot) {
    source.feed(swapJson(slot, 100.0 + slot));
  }
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (pipeline.eventsProcessed() < 50 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  done.store(true);
  reader.join();
  pipeline.stop();

  EXPECT_EQ(pipeline.eventsProcessed(), 50u);
}

TEST_F(TradingPipelineTest, RestartsWithFreshStream) {
  TradingPipeline pipeline(testConfig(), source, clock);
  pipeline.start();
  pipeline.stop();

  pipeline.start();
  source.feed(swapJson(0, 100.0));
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (pipeline.eventsProcessed() < 1 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  pipeline.stop();

  EXPECT_EQ(pipeline.eventsProcessed(), 1u);
  EXPECT_EQ(pipeline.streamMetrics().received, 1u);
}

TEST_F(TradingPipelineTest, MissingWeightsFileFailsConstruction) {
  EngineConfig config = testConfig();
  config.posterior.weights_path = "/nonexistent/weights.json";
  EXPECT_THROW({ TradingPipeline pipeline(config, source, clock); },
               solseek::ConfigError);
}
