#include <gtest/gtest.h>

#include "risk/confidence.h"

inline IndicatorSet with_rsi(double rsi) {
  IndicatorSet ind;
  ind.rsi = std::vector<double>{55, rsi};
  return ind;
}

inline TrendState trend_of(Trend t) {
  TrendState ts;
  ts.trend = t;
  return ts;
}

inline VolatilityState vol_of(VolatilityLevel level) {
  VolatilityState vs;
  vs.level = level;
  return vs;
}

inline SupportResistance levels(size_t n_support, size_t n_resistance) {
  SupportResistance sr;
  for (size_t i = 0; i < n_support; i++)
    sr.support.push_back({90.0 - i, 2, i});
  for (size_t i = 0; i < n_resistance; i++)
    sr.resistance.push_back({110.0 + i, 2, i});
  return sr;
}

TEST(Confidence, NoSamplesIsZero) {
  Confidence c{with_rsi(50), trend_of(Trend::StrongUptrend),
               vol_of(VolatilityLevel::Low), levels(5, 5), 0};
  EXPECT_EQ(c.score, 0);
  EXPECT_EQ(c.level, ConfidenceLevel::Low);
}

TEST(Confidence, EverythingGoodIsClampedToHundred) {
  // 50 + 10 + 15 + 10 + 10 + 15 = 110
  Confidence c{with_rsi(50), trend_of(Trend::StrongUptrend),
               vol_of(VolatilityLevel::Low), levels(2, 0), 250};
  EXPECT_EQ(c.score, 100);
  EXPECT_EQ(c.level, ConfidenceLevel::High);
}

TEST(Confidence, EverythingMissingIsClampedToZero) {
  // 50 - 10 - 15 - 10 - 10 - 20 = -15
  Confidence c{std::nullopt, std::nullopt, std::nullopt, std::nullopt, 10};
  EXPECT_EQ(c.score, 0);
  EXPECT_EQ(c.level, ConfidenceLevel::Low);
}

TEST(Confidence, AdjustmentsAreIndependent) {
  // 50 + 0 - 15 + 5 - 10 + 5
  Confidence c{with_rsi(80), trend_of(Trend::Neutral),
               vol_of(VolatilityLevel::Medium), levels(1, 1), 120};
  EXPECT_EQ(c.score, 35);
  EXPECT_EQ(c.level, ConfidenceLevel::Low);
}

TEST(Confidence, MediumLevel) {
  // 50 + 10 + 15 + 0 - 10 + 0
  Confidence c{with_rsi(45), trend_of(Trend::Downtrend),
               vol_of(VolatilityLevel::High), SupportResistance{}, 60};
  EXPECT_EQ(c.score, 65);
  EXPECT_EQ(c.level, ConfidenceLevel::Medium);
}

TEST(Confidence, LevelBoundaries) {
  // 50 + 10 - 15 + 10 + 10 + 15
  Confidence high{with_rsi(30), trend_of(Trend::Neutral),
                  vol_of(VolatilityLevel::Low), levels(0, 2), 200};
  EXPECT_EQ(high.score, 80);
  EXPECT_EQ(high.level, ConfidenceLevel::High);

  // 50 + 10 + 15 - 10 - 10 + 5
  Confidence medium{with_rsi(70), trend_of(Trend::Uptrend), std::nullopt,
                    levels(1, 0), 100};
  EXPECT_EQ(medium.score, 60);
  EXPECT_EQ(medium.level, ConfidenceLevel::Medium);
}

TEST(Confidence, RsiOutsideBandIsNeutral) {
  auto score = [](std::optional<IndicatorSet> ind) {
    return Confidence{ind, trend_of(Trend::Uptrend),
                      vol_of(VolatilityLevel::Low), levels(2, 2), 150}
        .score;
  };

  EXPECT_EQ(score(with_rsi(50)) - score(with_rsi(85)), 10);
  EXPECT_EQ(score(with_rsi(85)) - score(std::nullopt), 10);
  // an empty RSI series counts as missing
  IndicatorSet no_rsi;
  no_rsi.rsi = std::vector<double>{};
  EXPECT_EQ(score(no_rsi), score(std::nullopt));
}

TEST(Confidence, SampleSizeTiers) {
  auto score = [](size_t n) {
    return Confidence{std::nullopt, trend_of(Trend::Uptrend),
                      vol_of(VolatilityLevel::Low), levels(2, 2), n}
        .score;
  };

  // 50 - 10 + 15 + 10 + 10 = 75 before the sample bonus
  EXPECT_EQ(score(1), 55);
  EXPECT_EQ(score(49), 55);
  EXPECT_EQ(score(50), 75);
  EXPECT_EQ(score(99), 75);
  EXPECT_EQ(score(100), 80);
  EXPECT_EQ(score(199), 80);
  EXPECT_EQ(score(200), 90);
}

TEST(Confidence, AlwaysWithinBounds) {
  for (size_t n : {0u, 1u, 50u, 500u}) {
    Confidence lo{std::nullopt, std::nullopt, std::nullopt, std::nullopt, n};
    Confidence hi{with_rsi(50), trend_of(Trend::Uptrend),
                  vol_of(VolatilityLevel::Low), levels(5, 5), n};
    for (auto& c : {lo, hi}) {
      EXPECT_GE(c.score, 0);
      EXPECT_LE(c.score, 100);
    }
  }
}
