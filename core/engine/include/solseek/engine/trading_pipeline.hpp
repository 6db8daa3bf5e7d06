#pragma once

#include "solseek/config/engine_config.hpp"
#include "solseek/events/event.hpp"
#include "solseek/execution/i_execution_connector.hpp"
#include "solseek/execution/trade_executor.hpp"
#include "solseek/features/feature_engine.hpp"
#include "solseek/features/feature_schema.hpp"
#include "solseek/ingest/log_source.hpp"
#include "solseek/ingest/log_stream.hpp"
#include "solseek/oracle/swap_price_oracle.hpp"
#include "solseek/posterior/posterior_engine.hpp"
#include "solseek/risk/risk_manager.hpp"
#include "solseek/strategy/sizing_strategy.hpp"
#include "solseek/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace solseek {

// -----------------------------------------------------------------------------
// TradingPipeline — top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns every decision component and runs
//           LogStream → parseLog → FeatureEngine → PosteriorEngine
//             → SizingStrategy → TradeExecutor → RiskManager
//         on one consumer thread.
//
// @details
// Per event (process()):
//   1. slot = slot_fn(event)           default: ts / slot_width_ms
//   2. FeatureEngine::update(event, slot). A slot regression skips the
//      event with a warning.
//   3. Swaps feed the SwapPriceOracle and mark the traded token in the
//      RiskManager, then an open position is checked for stop-loss /
//      take-profit and closed through the TradeExecutor if hit.
//   4. PosteriorEngine::decide_action() on the new snapshot:
//        Enter, flat book → SizingStrategy::evaluate() and place a buy
//        Exit, open book  → sell the whole position
//   Policy rejections (LimitExceededError, InsufficientPositionError,
//   LimitNotReachedError) are logged and the pipeline carries on.
//
// Threads:
//   - LogStream producer (owned by the stream).
//   - Pipeline consumer, spawned by start(). It is the only thread that
//     touches FeatureEngine, PosteriorEngine, RiskManager and
//     SizingStrategy while running.
// A StreamHaltedError ends the consumer: halted() turns true and the owner
// is expected to stop() and rebuild against the upstream.
//
// Lifecycle:
//   start()  builds a fresh LogStream, starts its producer, then spawns
//            the consumer. Idempotent.
//   stop()   closes the stream (unblocking the consumer), joins the
//            consumer. Idempotent; also run by the destructor.
// process() may be called directly (tests, replay) when the pipeline is
// not running. The component accessors hand out unsynchronized references:
// use them only while stopped.
//
// Ownership:
//   Owns the component instances. Borrows the ILogSource, the clock and an
//   optional external connector; without one it trades through a
//   PaperConnector on its own SwapPriceOracle.
// -----------------------------------------------------------------------------
class TradingPipeline {
 public:
  using SlotFunction = std::function<std::int64_t(const Event&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config     Full engine configuration (copied).
  // @param  source     Upstream log source; must outlive the pipeline.
  // @param  clock      Stamps equity samples and orders.
  // @param  schema     Feature schema, validated by FeatureEngine.
  // @param  connector  Execution venue; nullptr → internal PaperConnector.
  //
  // @throws SchemaMismatchError  schema disagrees with the engine.
  // @throws ConfigError          posterior.weights_path set but unreadable.
  // -------------------------------------------------------------------------
  TradingPipeline(const EngineConfig& config, ILogSource& source,
                  const ITimeProvider& clock,
                  FeatureSchema schema = FeatureSchema::builtin(),
                  IExecutionConnector* connector = nullptr);

  ~TradingPipeline();

  TradingPipeline(const TradingPipeline&) = delete;
  TradingPipeline& operator=(const TradingPipeline&) = delete;
  TradingPipeline(TradingPipeline&&) = delete;
  TradingPipeline& operator=(TradingPipeline&&) = delete;

  void start();
  void stop();

  // Runs one event through the decision chain on the calling thread.
  void process(const Event& event);

  void setSlotFunction(SlotFunction slot_fn);

  bool running() const { return running_.load(); }
  bool halted() const { return halted_.load(); }
  std::uint64_t eventsProcessed() const { return events_processed_.load(); }

  // Stream counters; zeros before the first start().
  StreamMetrics streamMetrics() const;

  // -------------------------------------------------------------------------
  // status()
  // -------------------------------------------------------------------------
  // @brief  JSON summary of the book, risk metrics and stream counters.
  //
  // Thread-safety: safe from any thread while the consumer runs; it takes
  //                the state mutex that process() holds for each event, so
  //                the report never sees a half-applied event. Not safe
  //                concurrently with start().
  // -------------------------------------------------------------------------
  std::string status() const;

  FeatureEngine& features() { return features_; }
  PosteriorEngine& posterior() { return posterior_; }
  RiskManager& risk() { return risk_; }
  const SizingStrategy& strategy() const { return strategy_; }
  TradeExecutor& executor() { return executor_; }
  SwapPriceOracle& oracle() { return oracle_; }

 private:
  void consume();
  void markAndCheckExit(const SwapEvent& swap);
  void act(const std::vector<float>& snapshot);
  void placeSafely(double quantity, domain::Side side, const char* why);

  EngineConfig config_;
  ILogSource& source_;
  const ITimeProvider& clock_;

  FeatureEngine features_;
  PosteriorEngine posterior_;
  RiskManager risk_;
  SizingStrategy strategy_;
  SwapPriceOracle oracle_;
  std::unique_ptr<IExecutionConnector> owned_connector_;
  IExecutionConnector& connector_;
  TradeExecutor executor_;

  SlotFunction slot_fn_;

  // Held by process() for a whole event and by status().
  mutable std::mutex state_mutex_;

  std::unique_ptr<LogStream> stream_;
  std::thread consumer_;
  std::atomic<bool> running_{false};
  std::atomic<bool> halted_{false};
  std::atomic<std::uint64_t> events_processed_{0};
};

}  // namespace solseek
