// =============================================================================
// posterior_engine_test.cpp
// =============================================================================
// Unit tests for solseek::PosteriorEngine: probability invariants, the SGD
// update direction, the decide_action rule and weight persistence.
// =============================================================================

#include "solseek/domain/errors.hpp"
#include "solseek/posterior/posterior_engine.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using solseek::Action;
using solseek::PosteriorConfig;
using solseek::PosteriorEngine;
using solseek::Regime;

namespace {

PosteriorConfig smallConfig() {
  PosteriorConfig c;
  c.n_features = 4;
  c.volume_index = 2;
  c.fee_index = 3;
  c.volume_threshold = 0.0;
  c.fee_threshold = 1.0;
  c.learning_rate = 0.5;
  return c;
}

std::string tempPath(const char* name) {
  return std::string(::testing::TempDir()) + name;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Zero weights: uniform regime, rug probability one half.
// -----------------------------------------------------------------------------
TEST(PosteriorEngineTest, ZeroWeightsAreUninformative) {
  PosteriorEngine engine;
  const auto out = engine.predict(std::vector<float>(768, 1.0f));
  EXPECT_DOUBLE_EQ(out.rug, 0.5);
  EXPECT_NEAR(out.trend, 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(out.revert, 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(out.chop, 1.0 / 3.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. After training the regime probabilities still sum to one and every
//    output stays inside [0, 1], even for extreme inputs.
// -----------------------------------------------------------------------------
TEST(PosteriorEngineTest, ProbabilitiesStayNormalized) {
  PosteriorEngine engine(smallConfig());
  const std::vector<float> x{1.0f, -2.0f, 0.5f, 0.25f};
  for (int i = 0; i < 50; ++i) {
    engine.update(x, i % 2 == 0, static_cast<Regime>(i % 3));
  }

  for (float scale : {1.0f, 1e3f, -1e6f}) {
    std::vector<float> probe{scale, scale, -scale, scale};
    const auto out = engine.predict(probe);
    EXPECT_NEAR(out.trend + out.revert + out.chop, 1.0, 1e-9);
    for (double p : {out.rug, out.trend, out.revert, out.chop}) {
      EXPECT_GE(p, 0.0);
      EXPECT_LE(p, 1.0);
    }
  }
}

// -----------------------------------------------------------------------------
// 3. Repeated updates toward a label move the prediction toward it.
// -----------------------------------------------------------------------------
TEST(PosteriorEngineTest, UpdateMovesTowardLabels) {
  PosteriorEngine engine(smallConfig());
  const std::vector<float> x{1.0f, 0.5f, 0.0f, 0.0f};

  const auto before = engine.predict(x);
  for (int i = 0; i < 20; ++i) {
    engine.update(x, true, Regime::Trend);
  }
  const auto after = engine.predict(x);

  EXPECT_GT(after.rug, before.rug);
  EXPECT_GT(after.trend, before.trend);
  EXPECT_LT(after.revert, before.revert);
}

TEST(PosteriorEngineTest, ShortInputsAreZeroPadded) {
  PosteriorEngine engine(smallConfig());
  engine.update({1.0f, 1.0f, 1.0f, 1.0f}, true, Regime::Chop, 1.0);

  const auto padded = engine.predict({2.0f, 0.0f, 0.0f, 0.0f});
  const auto shorter = engine.predict({2.0f});
  EXPECT_DOUBLE_EQ(padded.rug, shorter.rug);
  EXPECT_DOUBLE_EQ(padded.chop, shorter.chop);
}

// -----------------------------------------------------------------------------
// 4. decide_action(): Enter needs a dominant trend, volume above and fee
//    below threshold; Exit fires on revert dominance or a high fee.
// -----------------------------------------------------------------------------
TEST(PosteriorEngineTest, DecideAction) {
  PosteriorEngine engine(smallConfig());
  const std::vector<float> trend_x{1.0f, 0.0f, 0.0f, 0.0f};
  for (int i = 0; i < 30; ++i) {
    engine.update(trend_x, false, Regime::Trend);
  }

  // Trend dominant, volume 2 > 0, fee 0.5 < 1.
  EXPECT_EQ(engine.decide_action({1.0f, 0.0f, 2.0f, 0.5f}), Action::Enter);
  // Trend dominant but no volume: neither rule fires.
  EXPECT_EQ(engine.decide_action({1.0f, 0.0f, 0.0f, 0.5f}), Action::Flat);
  // Fee above threshold forces an exit.
  EXPECT_EQ(engine.decide_action({1.0f, 0.0f, 2.0f, 3.0f}), Action::Exit);
  // Explicit thresholds override the configured ones.
  EXPECT_EQ(engine.decide_action({1.0f, 0.0f, 2.0f, 0.5f}, 5.0, 1.0),
            Action::Flat);

  PosteriorEngine revert(smallConfig());
  const std::vector<float> revert_x{0.0f, 1.0f, 0.0f, 0.0f};
  for (int i = 0; i < 30; ++i) {
    revert.update(revert_x, false, Regime::Revert);
  }
  EXPECT_EQ(revert.decide_action({0.0f, 1.0f, 2.0f, 0.0f}), Action::Exit);
}

TEST(PosteriorEngineTest, UniformPosteriorIsFlat) {
  PosteriorEngine engine(smallConfig());
  EXPECT_EQ(engine.decide_action({0.0f, 0.0f, 5.0f, 0.0f}), Action::Flat);
  EXPECT_STREQ(solseek::actionToString(Action::Enter), "enter");
}

// -----------------------------------------------------------------------------
// 5. save()/load() restore identical predictions; a bad file changes
//    nothing.
// -----------------------------------------------------------------------------
TEST(PosteriorEngineTest, SaveAndLoadRestoreWeights) {
  const std::string path = tempPath("solseek_posterior_weights.json");
  const std::vector<float> x{0.3f, -1.0f, 2.0f, 0.1f};

  PosteriorEngine trained(smallConfig());
  for (int i = 0; i < 10; ++i) {
    trained.update(x, true, Regime::Revert);
  }
  trained.save(path);

  PosteriorEngine restored(smallConfig());
  restored.load(path);
  const auto a = trained.predict(x);
  const auto b = restored.predict(x);
  EXPECT_DOUBLE_EQ(a.rug, b.rug);
  EXPECT_DOUBLE_EQ(a.revert, b.revert);
  EXPECT_EQ(restored.nFeatures(), 4u);

  std::remove(path.c_str());
}

TEST(PosteriorEngineTest, LoadRejectsBadFiles) {
  PosteriorEngine engine(smallConfig());
  EXPECT_THROW(engine.load("/nonexistent/weights.json"), solseek::ConfigError);

  const std::string path = tempPath("solseek_posterior_bad.json");
  {
    std::ofstream out(path);
    out << R"({"n_features": 3, "w_rug": [0, 0], "w_regime": [[0,0,0],[0,0,0],[0,0,0]]})";
  }
  EXPECT_THROW(engine.load(path), solseek::ConfigError);
  EXPECT_EQ(engine.nFeatures(), 4u);

  {
    std::ofstream out(path);
    out << "not json";
  }
  EXPECT_THROW(engine.load(path), solseek::ConfigError);
  std::remove(path.c_str());
}
