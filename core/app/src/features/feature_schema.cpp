#include "solseek/features/feature_schema.hpp"
#include "solseek/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace solseek {

namespace {

FeatureCategory categoryFromString(const std::string& s) {
  if (s == "liquidity") return FeatureCategory::Liquidity;
  if (s == "order_flow") return FeatureCategory::OrderFlow;
  if (s == "ownership") return FeatureCategory::Ownership;
  if (s == "microstructure") return FeatureCategory::Microstructure;
  throw SchemaMismatchError("unknown category '" + s + "'");
}

}  // namespace

const char* categoryToString(FeatureCategory c) {
  switch (c) {
    case FeatureCategory::Liquidity:      return "liquidity";
    case FeatureCategory::OrderFlow:      return "order_flow";
    case FeatureCategory::Ownership:      return "ownership";
    case FeatureCategory::Microstructure: return "microstructure";
  }
  return "unknown";
}

FeatureCategory categoryOf(std::size_t index) {
  if (index < 64) return FeatureCategory::Liquidity;
  if (index < 128) return FeatureCategory::OrderFlow;
  if (index < 192) return FeatureCategory::Ownership;
  return FeatureCategory::Microstructure;
}

FeatureSchema::FeatureSchema(int version, std::vector<FeatureSpec> features)
    : version_(version), features_(std::move(features)) {
  std::set<std::size_t> seen;
  for (const auto& f : features_) {
    if (f.index >= kFeatureWidth) {
      throw SchemaMismatchError("index " + std::to_string(f.index) +
                                " outside [0, 256)");
    }
    if (!seen.insert(f.index).second) {
      throw SchemaMismatchError("duplicate index " + std::to_string(f.index));
    }
    if (f.category != categoryOf(f.index)) {
      throw SchemaMismatchError("feature '" + f.name + "' at index " +
                                std::to_string(f.index) + " is not in the " +
                                categoryToString(f.category) + " range");
    }
    if (!by_name_.emplace(f.name, f.index).second) {
      throw SchemaMismatchError("duplicate name '" + f.name + "'");
    }
  }
}

FeatureSchema FeatureSchema::builtin() {
  using namespace feature_index;
  using C = FeatureCategory;
  return FeatureSchema(
      kVersion,
      {
          {kLiqPoolDelta, "liq_pool_delta", C::Liquidity, "token", "ewm_zscore"},
          {kLiqPoolDeltaRatio, "liq_pool_delta_ratio", C::Liquidity, "ratio", "ewm_zscore"},
          {kLiqCumLog, "liq_cum_log", C::Liquidity, "log_token", "ewm_zscore"},
          {kSignedVolume, "of_signed_volume", C::OrderFlow, "token", "ewm_zscore"},
          {kTradeCount, "of_trade_count", C::OrderFlow, "count", "ewm_zscore"},
          {kInterArrivalMs, "of_ia_time_ms", C::OrderFlow, "ms", "ewm_zscore"},
          {kRollingVolume, "of_rolling_volume", C::OrderFlow, "token", "ewm_zscore"},
          {kRollingFee, "of_rolling_fee", C::OrderFlow, "token", "ewm_zscore"},
          {kMintVolume, "own_mint_volume", C::Ownership, "token", "ewm_zscore"},
          {kMintCount, "own_mint_count", C::Ownership, "count", "ewm_zscore"},
          {kSwapPrice, "mic_swap_price", C::Microstructure, "price", "ewm_zscore"},
      });
}

FeatureSchema FeatureSchema::fromJson(const std::string& text) {
  try {
    auto root = nlohmann::json::parse(text);
    const int version = root.at("version").get<int>();
    if (version != kVersion) {
      throw SchemaMismatchError("version " + std::to_string(version) +
                                ", engine expects " +
                                std::to_string(kVersion));
    }

    std::vector<FeatureSpec> features;
    for (const auto& item : root.at("features")) {
      FeatureSpec f;
      f.index = item.at("index").get<std::size_t>();
      f.name = item.at("name").get<std::string>();
      f.category = categoryFromString(item.at("category").get<std::string>());
      f.unit = item.value("unit", "");
      f.normalization = item.value("normalization", "");
      features.push_back(std::move(f));
    }

    FeatureSchema schema(version, std::move(features));
    schema.validateAgainst(builtin());
    return schema;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("feature schema: ") + e.what());
  }
}

FeatureSchema FeatureSchema::load(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open feature schema " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return fromJson(buffer.str());
}

std::size_t FeatureSchema::idx(const std::string& key) const {
  auto it = by_name_.find(key);
  if (it == by_name_.end()) {
    throw UnknownFeatureError(key);
  }
  return it->second;
}

bool FeatureSchema::assigned(std::size_t index) const {
  for (const auto& f : features_) {
    if (f.index == index) {
      return true;
    }
  }
  return false;
}

void FeatureSchema::validateAgainst(const FeatureSchema& expected) const {
  if (version_ != expected.version_) {
    throw SchemaMismatchError("version " + std::to_string(version_) +
                              " != " + std::to_string(expected.version_));
  }
  if (features_.size() != expected.features_.size()) {
    throw SchemaMismatchError(
        std::to_string(features_.size()) + " features, engine assigns " +
        std::to_string(expected.features_.size()));
  }
  for (const auto& want : expected.features_) {
    auto it = by_name_.find(want.name);
    if (it == by_name_.end()) {
      throw SchemaMismatchError("missing feature '" + want.name + "'");
    }
    if (it->second != want.index) {
      throw SchemaMismatchError("feature '" + want.name + "' at index " +
                                std::to_string(it->second) +
                                ", engine writes index " +
                                std::to_string(want.index));
    }
  }
}

}  // namespace solseek
