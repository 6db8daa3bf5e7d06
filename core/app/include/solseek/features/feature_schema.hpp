#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace solseek {

// Width of one single-slot feature vector and of the three-slot snapshot.
constexpr std::size_t kFeatureWidth = 256;
constexpr std::size_t kSnapshotWidth = 3 * kFeatureWidth;

enum class FeatureCategory { Liquidity, OrderFlow, Ownership, Microstructure };

const char* categoryToString(FeatureCategory c);

// Fixed category ranges: [0,64) [64,128) [128,192) [192,256).
FeatureCategory categoryOf(std::size_t index);

// Indices the feature engine assigns semantics to. Everything else in
// [0, kFeatureWidth) is a tombstone.
namespace feature_index {
constexpr std::size_t kLiqPoolDelta = 0;
constexpr std::size_t kLiqPoolDeltaRatio = 1;
constexpr std::size_t kLiqCumLog = 2;
constexpr std::size_t kSignedVolume = 64;
constexpr std::size_t kTradeCount = 65;
constexpr std::size_t kInterArrivalMs = 66;
constexpr std::size_t kRollingVolume = 67;
constexpr std::size_t kRollingFee = 68;
constexpr std::size_t kMintVolume = 128;
constexpr std::size_t kMintCount = 129;
constexpr std::size_t kSwapPrice = 192;
}  // namespace feature_index

struct FeatureSpec {
  std::size_t index{0};
  std::string name;
  FeatureCategory category{FeatureCategory::Liquidity};
  std::string unit;
  std::string normalization;
};

// -----------------------------------------------------------------------------
// FeatureSchema — versioned index → metadata mapping
// -----------------------------------------------------------------------------
//
// @brief  Names every assigned feature index and checks that an external
//         schema document agrees with the indices the engine writes.
//
// @details
// The engine's own assignment is FeatureSchema::builtin(). An operator
// supplied document (config/features.json) is accepted only when its
// version equals kVersion and it names exactly the same indices with the
// same names; anything else is a SchemaMismatchError at startup.
//
// Document layout:
//   {
//     "version": 1,
//     "features": [
//       { "index": 0, "name": "liq_pool_delta", "category": "liquidity",
//         "unit": "token", "normalization": "ewm_zscore" },
//       ...
//     ]
//   }
//
// Thread model: immutable after construction; safe to share.
// -----------------------------------------------------------------------------
class FeatureSchema {
 public:
  static constexpr int kVersion = 1;

  // The engine's index assignment.
  static FeatureSchema builtin();

  // -------------------------------------------------------------------------
  // fromJson(text) / load(path)
  // -------------------------------------------------------------------------
  // @brief  Parses a schema document and validates it against builtin().
  //
  // @throws SchemaMismatchError  version differs, an index is out of range
  //                              or duplicated, a category disagrees with
  //                              the index range, or the set of indices and
  //                              names differs from the engine's.
  // @throws ConfigError          the file cannot be read or is not JSON.
  // -------------------------------------------------------------------------
  static FeatureSchema fromJson(const std::string& text);
  static FeatureSchema load(const std::string& path);

  int version() const { return version_; }
  const std::vector<FeatureSpec>& features() const { return features_; }

  // @throws UnknownFeatureError  if key names no feature.
  std::size_t idx(const std::string& key) const;

  bool assigned(std::size_t index) const;

  // @throws SchemaMismatchError on the first disagreement with `expected`.
  void validateAgainst(const FeatureSchema& expected) const;

 private:
  FeatureSchema(int version, std::vector<FeatureSpec> features);

  int version_;
  std::vector<FeatureSpec> features_;
  std::map<std::string, std::size_t> by_name_;
};

}  // namespace solseek
