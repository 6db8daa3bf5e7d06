// =============================================================================
// trade_executor_test.cpp
// =============================================================================
// Tests for the execution path: PaperConnector fills against a
// SwapPriceOracle, TradeExecutor records them in the RiskManager and keeps
// an order log with monotonically increasing ids.
// =============================================================================

#include "solseek/domain/errors.hpp"
#include "solseek/execution/paper_connector.hpp"
#include "solseek/execution/trade_executor.hpp"
#include "solseek/oracle/swap_price_oracle.hpp"
#include "solseek/risk/risk_manager.hpp"
#include "solseek/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

using solseek::LimitNotReachedError;
using solseek::domain::Side;

// =============================================================================
// Test fixture: SOL quoted at 10 with 20 bps slippage and a 0.1% fee.
// =============================================================================
class TradeExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override { oracle.set("SOL", 10.0, 1000.0); }

  solseek::SimulationTimeProvider clock{5000};
  solseek::SwapPriceOracle oracle;
  solseek::PaperConnector connector{oracle, 0.001, 20.0};
  solseek::RiskManager risk{clock};
  solseek::TradeExecutor executor{connector, risk, clock};
};

// -----------------------------------------------------------------------------
// 1. Oracle quotes follow the last swap with positive amounts.
// -----------------------------------------------------------------------------
TEST(SwapPriceOracleTest, QuotesLastSwap) {
  solseek::SwapPriceOracle oracle;
  EXPECT_FALSE(oracle.has_price("SOL"));
  EXPECT_THROW(oracle.price("SOL"), std::out_of_range);

  solseek::SwapEvent a;
  a.amount_in = 4.0;
  a.amount_out = 10.0;
  oracle.observe("SOL", a);

  solseek::SwapEvent empty;
  empty.amount_in = 3.0;
  oracle.observe("SOL", empty);

  EXPECT_DOUBLE_EQ(oracle.price("SOL"), 2.5);
  EXPECT_DOUBLE_EQ(oracle.volume("SOL"), 7.0);
  EXPECT_DOUBLE_EQ(oracle.volume("BONK"), 0.0);
}

TEST(SwapPriceOracleTest, OverflowingRatioKeepsLastPrice) {
  solseek::SwapPriceOracle oracle;
  solseek::SwapEvent overflow;
  overflow.amount_in = 1e-300;
  overflow.amount_out = 1e300;
  oracle.observe("SOL", overflow);
  EXPECT_FALSE(oracle.has_price("SOL"));

  solseek::SwapEvent good;
  good.amount_in = 2.0;
  good.amount_out = 5.0;
  oracle.observe("SOL", good);
  oracle.observe("SOL", overflow);
  EXPECT_DOUBLE_EQ(oracle.price("SOL"), 2.5);
}

// -----------------------------------------------------------------------------
// 2. A buy fills above the quote, a sell below, fees on fill notional.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, PaperFillsApplySlippageAndFee) {
  const auto buy = executor.place_order("SOL", 2.0, Side::Buy);
  EXPECT_DOUBLE_EQ(buy.price, 10.02);
  EXPECT_NEAR(buy.slippage, 0.02, 1e-12);
  EXPECT_NEAR(buy.fee, 0.001 * 2.0 * 10.02, 1e-12);
  EXPECT_EQ(buy.timestamp_ms, 5000);

  const auto sell = executor.place_order("SOL", 1.0, Side::Sell);
  EXPECT_DOUBLE_EQ(sell.price, 9.98);
  EXPECT_NEAR(sell.slippage, -0.02, 1e-12);

  auto pos = risk.position("SOL");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->quantity, 1.0);
  EXPECT_DOUBLE_EQ(pos->average_cost, 10.02);
  EXPECT_NEAR(risk.realized_pnl(),
              -buy.fee + (9.98 - 10.02) * 1.0 - sell.fee, 1e-12);
}

// -----------------------------------------------------------------------------
// 3. Order ids start at 1 and increase; the log keeps submission order.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, OrderIdsIncrease) {
  const auto a = executor.place_order("SOL", 1.0, Side::Buy);
  const auto b = executor.place_order("SOL", 1.0, Side::Buy);
  const auto c = executor.place_order("SOL", 2.0, Side::Sell);

  EXPECT_EQ(a.id, 1u);
  EXPECT_LT(a.id, b.id);
  EXPECT_LT(b.id, c.id);

  const auto log = executor.orders();
  ASSERT_EQ(log.size(), 3u);
  EXPECT_EQ(log[2].side, Side::Sell);
  EXPECT_FALSE(risk.position("SOL").has_value());
}

// -----------------------------------------------------------------------------
// 4. A limit the fill cannot meet is refused before anything is recorded.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, LimitNotReached) {
  EXPECT_THROW(executor.place_order("SOL", 1.0, Side::Buy, 10.0),
               LimitNotReachedError);
  EXPECT_TRUE(executor.orders().empty());
  EXPECT_FALSE(risk.position("SOL").has_value());

  EXPECT_NO_THROW(executor.place_order("SOL", 1.0, Side::Buy, 10.05));
  EXPECT_THROW(executor.place_order("SOL", 1.0, Side::Sell, 10.0),
               LimitNotReachedError);
  EXPECT_NO_THROW(executor.place_order("SOL", 1.0, Side::Sell, 9.9));
}

// -----------------------------------------------------------------------------
// 5. A risk rejection after the fill propagates and leaves no order behind.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutorTest, RiskRejectionPropagates) {
  risk.set_max_exposure("SOL", 15.0);
  EXPECT_THROW(executor.place_order("SOL", 2.0, Side::Buy),
               solseek::LimitExceededError);
  EXPECT_THROW(executor.place_order("SOL", 1.0, Side::Sell),
               solseek::InsufficientPositionError);
  EXPECT_TRUE(executor.orders().empty());
}

TEST_F(TradeExecutorTest, ConcurrentOrdersGetDistinctIds) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kPerThread; ++i) {
        executor.place_order("SOL", 1.0, Side::Buy);
      }
    });
  }
  for (auto& t : threads) t.join();

  const auto log = executor.orders();
  ASSERT_EQ(log.size(), static_cast<std::size_t>(kThreads * kPerThread));
  for (std::size_t i = 1; i < log.size(); ++i) {
    EXPECT_LT(log[i - 1].id, log[i].id);
  }
  EXPECT_DOUBLE_EQ(risk.position("SOL")->quantity, kThreads * kPerThread);
}
