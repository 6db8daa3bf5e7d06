#include "solseek/features/feature_engine.hpp"
#include "solseek/domain/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace solseek {

FeatureEngine::FeatureEngine(FeatureSchema schema, std::size_t history_size)
    : schema_(std::move(schema)) {
  schema_.validateAgainst(FeatureSchema::builtin());
  for (const auto& f : schema_.features()) {
    assigned_.push_back(f.index);
  }
  std::sort(assigned_.begin(), assigned_.end());
  if (history_size > 0) {
    history_ = std::make_unique<DropOldestRing<FeatureUpdate>>(history_size);
  }
  std::cout << "[FeatureEngine] schema v" << schema_.version() << ", "
            << assigned_.size() << " assigned indices, history "
            << history_size << "\n";
}

// -----------------------------------------------------------------------------
// update(): slot bookkeeping, event dispatch, fan-out
// -----------------------------------------------------------------------------
std::vector<float> FeatureEngine::update(const Event& event,
                                         std::int64_t slot) {
  const auto started = std::chrono::steady_clock::now();

  if (slot_ && slot < *slot_) {
    throw SlotRegressionError("slot " + std::to_string(slot) +
                              " after slot " + std::to_string(*slot_));
  }
  if (!slot_) {
    last_touched_.fill(slot);
    slot_ = slot;
  } else if (slot > *slot_) {
    rotate(slot);
  }

  std::visit(
      Overloaded{
          [&](const SwapEvent& e) { apply(e, slot); },
          [&](const AddLiquidityEvent& e) {
            applyLiquidity(e.reserve_a + e.reserve_b, slot);
          },
          [&](const RemoveLiquidityEvent& e) {
            applyLiquidity(-(e.reserve_a + e.reserve_b), slot);
          },
          [&](const MintEvent& e) { apply(e, slot); },
      },
      event);

  std::vector<float> out = snapshot();

  FeatureUpdate published{event, slot, out};
  for (const auto& subscriber : subscribers_) {
    subscriber->push(published);
  }
  if (history_) {
    history_->push(std::move(published));
  }

  const auto elapsed = std::chrono::steady_clock::now() - started;
  recordLatency(
      std::chrono::duration<double, std::micro>(elapsed).count());
  return out;
}

std::vector<float> FeatureEngine::snapshot() const {
  std::vector<float> out;
  out.reserve(kSnapshotWidth);
  out.insert(out.end(), current_.begin(), current_.end());
  out.insert(out.end(), prev1_.begin(), prev1_.end());
  out.insert(out.end(), prev2_.begin(), prev2_.end());
  return out;
}

void FeatureEngine::reset() {
  stats_.reset();
  last_touched_.fill(0);
  raw_.fill(0.0);
  current_.fill(0.0f);
  prev1_.fill(0.0f);
  prev2_.fill(0.0f);
  slot_.reset();
  cumulative_liquidity_ = 0.0;
  last_swap_ts_.reset();
  if (history_) {
    history_->clear();
  }
  latency_ = FeatureLatency{};
  non_finite_ = 0;
  std::cout << "[FeatureEngine] reset\n";
}

FeatureSubscription FeatureEngine::subscribe(std::size_t capacity) {
  auto ring = std::make_shared<DropOldestRing<FeatureUpdate>>(capacity);
  subscribers_.push_back(ring);
  return ring;
}

void FeatureEngine::unsubscribe(const FeatureSubscription& handle) {
  subscribers_.erase(
      std::remove(subscribers_.begin(), subscribers_.end(), handle),
      subscribers_.end());
}

std::vector<FeatureUpdate> FeatureEngine::history() const {
  if (!history_) {
    return {};
  }
  return history_->items();
}

std::pair<double, double> FeatureEngine::stats(const std::string& key) const {
  const std::size_t i = schema_.idx(key);
  return {stats_.mean[i], stats_.var[i]};
}

float FeatureEngine::raw(std::size_t index) const {
  return index < kFeatureWidth ? static_cast<float>(raw_[index]) : 0.0f;
}

// -----------------------------------------------------------------------------
// rotate(): lag stack shift plus decay of every assigned index
// -----------------------------------------------------------------------------
void FeatureEngine::rotate(std::int64_t new_slot) {
  prev2_ = prev1_;
  prev1_ = current_;
  current_.fill(0.0f);
  raw_.fill(0.0);
  cumulative_liquidity_ = 0.0;

  for (std::size_t i : assigned_) {
    const std::int64_t elapsed = new_slot - last_touched_[i];
    if (elapsed > 0) {
      current_[i] = finiteOrZero(stats_.decay(i, elapsed));
      last_touched_[i] = new_slot;
    }
  }
  slot_ = new_slot;
}

void FeatureEngine::write(std::size_t index, double raw_value,
                          std::int64_t slot) {
  raw_[index] = raw_value;
  current_[index] = finiteOrZero(stats_.observe(index, raw_value));
  last_touched_[index] = slot;
}

float FeatureEngine::finiteOrZero(double value) {
  if (!std::isfinite(value)) {
    ++non_finite_;
    return 0.0f;
  }
  return static_cast<float>(value);
}

void FeatureEngine::apply(const SwapEvent& e, std::int64_t slot) {
  using namespace feature_index;
  const double signed_volume = e.amount_in - e.amount_out;

  write(kSignedVolume, raw_[kSignedVolume] + signed_volume, slot);
  write(kTradeCount, raw_[kTradeCount] + 1.0, slot);
  if (last_swap_ts_) {
    write(kInterArrivalMs, static_cast<double>(e.ts - *last_swap_ts_), slot);
  }
  last_swap_ts_ = e.ts;
  write(kRollingVolume, raw_[kRollingVolume] + std::abs(signed_volume), slot);
  write(kRollingFee, raw_[kRollingFee] + e.fee, slot);
  if (e.amount_in > 0.0) {
    write(kSwapPrice, e.amount_out / e.amount_in, slot);
  }
}

void FeatureEngine::applyLiquidity(double delta, std::int64_t slot) {
  using namespace feature_index;
  const double before = cumulative_liquidity_;
  const double ratio =
      std::abs(before) > DecayingStats::kEpsilon ? delta / before : 0.0;
  cumulative_liquidity_ += delta;

  write(kLiqPoolDelta, delta, slot);
  write(kLiqPoolDeltaRatio, ratio, slot);
  write(kLiqCumLog,
        std::log(std::abs(cumulative_liquidity_) + DecayingStats::kEpsilon),
        slot);
}

void FeatureEngine::apply(const MintEvent& e, std::int64_t slot) {
  using namespace feature_index;
  write(kMintVolume, raw_[kMintVolume] + e.amount_out, slot);
  write(kMintCount, raw_[kMintCount] + 1.0, slot);
}

void FeatureEngine::recordLatency(double micros) {
  ++latency_.count;
  latency_.last_us = micros;
  latency_.max_us = std::max(latency_.max_us, micros);
  latency_.mean_us +=
      (micros - latency_.mean_us) / static_cast<double>(latency_.count);
}

}  // namespace solseek
