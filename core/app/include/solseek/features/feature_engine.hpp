#pragma once

#include "solseek/concurrent/drop_oldest_ring.hpp"
#include "solseek/events/event.hpp"
#include "solseek/features/decaying_stats.hpp"
#include "solseek/features/feature_schema.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace solseek {

// One (event, feature vector) pair as delivered to subscribers and kept in
// the audit history.
struct FeatureUpdate {
  Event event;
  std::int64_t slot{0};
  std::vector<float> features;  // kSnapshotWidth values
};

using FeatureSubscription = std::shared_ptr<DropOldestRing<FeatureUpdate>>;

// Wall time spent inside update(), in microseconds.
struct FeatureLatency {
  std::uint64_t count{0};
  double last_us{0.0};
  double max_us{0.0};
  double mean_us{0.0};
};

// -----------------------------------------------------------------------------
// FeatureEngine — streaming 256-wide feature vector with a three-slot lag
// -----------------------------------------------------------------------------
//
// @brief  Folds typed events into decayed, normalized per-index statistics
//         and emits [current | one slot back | two slots back] (768 floats)
//         on every update.
//
// @details
// Per event only the indices that event kind feeds are written:
//
//   add/remove liquidity  0 liq_pool_delta, 1 liq_pool_delta_ratio,
//                         2 liq_cum_log
//   swap                  64 of_signed_volume, 65 of_trade_count,
//                         66 of_ia_time_ms (not on the first swap),
//                         67 of_rolling_volume, 68 of_rolling_fee,
//                         192 mic_swap_price (only if amount_in > 0)
//   mint                  128 own_mint_volume, 129 own_mint_count
//
// Order-flow and mint values are slot cumulative; the raw accumulators are
// zeroed when the slot advances. Every other index is a tombstone and reads
// 0 in all three lag positions forever.
//
// Slot advance (slot > last seen slot), before the event is applied:
//   1. prev2 ← prev1, prev1 ← current normalized, current zeroed.
//   2. Every assigned index is decayed by the number of slots since it was
//      last written (DecayingStats::decay), and its current value becomes
//      the decayed z-score of a zero reading.
//
// A slot lower than the last one seen is rejected with SlotRegressionError
// and changes nothing.
//
// Each update also pushes the (event, vector) pair into every subscriber's
// DropOldestRing and into the audit history ring.
//
// Thread model:
//   update(), reset(), snapshot() and the inspection helpers must be
//   called from the pipeline thread. Subscriber rings are the only state
//   shared with other threads.
// -----------------------------------------------------------------------------
class FeatureEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  schema        External schema; must match builtin() exactly.
  // @param  history_size  Capacity of the audit ring (0 disables it).
  //
  // @throws SchemaMismatchError if schema disagrees with the engine.
  // -------------------------------------------------------------------------
  explicit FeatureEngine(FeatureSchema schema = FeatureSchema::builtin(),
                         std::size_t history_size = 1000);

  FeatureEngine(const FeatureEngine&) = delete;
  FeatureEngine& operator=(const FeatureEngine&) = delete;

  // -------------------------------------------------------------------------
  // update(event, slot)
  // -------------------------------------------------------------------------
  // @brief  Applies one event in the given slot and returns the new
  //         768-wide snapshot.
  //
  // @throws SlotRegressionError  slot < last seen slot (no state changed).
  // -------------------------------------------------------------------------
  std::vector<float> update(const Event& event, std::int64_t slot);

  // Copy of the current 768-wide vector. Later updates do not affect it.
  std::vector<float> snapshot() const;

  // Clears statistics, lag stack, accumulators, history and latency.
  // Subscriptions stay registered.
  void reset();

  // -------------------------------------------------------------------------
  // subscribe(capacity) / unsubscribe(handle)
  // -------------------------------------------------------------------------
  // @brief  Registers a drop-oldest ring of the given capacity that receives
  //         every subsequent update. The caller reads from the returned
  //         handle, possibly on another thread.
  // -------------------------------------------------------------------------
  FeatureSubscription subscribe(std::size_t capacity = 1);
  void unsubscribe(const FeatureSubscription& handle);
  std::size_t subscriberCount() const { return subscribers_.size(); }

  // Audit ring contents, oldest first.
  std::vector<FeatureUpdate> history() const;

  // (mean, variance) of a named feature.
  // @throws UnknownFeatureError
  std::pair<double, double> stats(const std::string& key) const;

  // Slot-cumulative raw value at index (0 for tombstones).
  float raw(std::size_t index) const;

  FeatureLatency latency() const { return latency_; }

  // Number of non-finite normalized values replaced by 0.
  std::uint64_t nonFiniteReplacements() const { return non_finite_; }

  std::optional<std::int64_t> currentSlot() const { return slot_; }
  const FeatureSchema& schema() const { return schema_; }

 private:
  using Row = std::array<float, kFeatureWidth>;

  void rotate(std::int64_t new_slot);
  void write(std::size_t index, double raw_value, std::int64_t slot);
  float finiteOrZero(double value);

  void apply(const SwapEvent& e, std::int64_t slot);
  void applyLiquidity(double delta, std::int64_t slot);
  void apply(const MintEvent& e, std::int64_t slot);

  void recordLatency(double micros);

  FeatureSchema schema_;
  std::vector<std::size_t> assigned_;

  DecayingStats stats_;
  std::array<std::int64_t, kFeatureWidth> last_touched_{};

  std::array<double, kFeatureWidth> raw_{};
  Row current_{};
  Row prev1_{};
  Row prev2_{};

  std::optional<std::int64_t> slot_;
  double cumulative_liquidity_{0.0};
  std::optional<std::int64_t> last_swap_ts_;

  std::vector<FeatureSubscription> subscribers_;
  std::unique_ptr<DropOldestRing<FeatureUpdate>> history_;

  FeatureLatency latency_;
  std::uint64_t non_finite_{0};
};

}  // namespace solseek
