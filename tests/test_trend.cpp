#include <gtest/gtest.h>

#include "fixtures/candles.h"
#include "ind/trend.h"

#include <cmath>

using namespace fixtures;

inline std::vector<double> concat(std::vector<double> a,
                                  const std::vector<double>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

// =============================================================================
// Trend
// =============================================================================

TEST(Trend, NeutralWithoutMovingAveragesBelowTwoHundred) {
  TrendState ts{from_closes(linear(199, 100, 150))};
  EXPECT_EQ(ts.trend, Trend::Neutral);
  EXPECT_FALSE(ts.moving_averages.has_value());
}

TEST(Trend, StrongUptrend) {
  TrendState ts{from_closes(linear(250, 100, 150))};
  EXPECT_EQ(ts.trend, Trend::StrongUptrend);

  ASSERT_TRUE(ts.moving_averages.has_value());
  auto& ma = *ts.moving_averages;
  EXPECT_GT(ma.short_ma, ma.medium_ma);
  EXPECT_GT(ma.medium_ma, ma.long_ma);
}

TEST(Trend, StrongDowntrend) {
  TrendState ts{from_closes(linear(250, 150, 100))};
  EXPECT_EQ(ts.trend, Trend::StrongDowntrend);
}

TEST(Trend, UptrendWhenLongAverageStillAbove) {
  auto closes = concat(linear(200, 200, 100), linear(50, 100.6, 130));
  TrendState ts{from_closes(closes)};

  EXPECT_EQ(ts.trend, Trend::Uptrend);
  ASSERT_TRUE(ts.moving_averages.has_value());
  EXPECT_LT(ts.moving_averages->medium_ma, ts.moving_averages->long_ma);
}

TEST(Trend, DowntrendWhenLongAverageStillBelow) {
  auto closes = concat(linear(200, 100, 200), linear(50, 199.4, 170));
  TrendState ts{from_closes(closes)};

  EXPECT_EQ(ts.trend, Trend::Downtrend);
}

TEST(Trend, FlatIsNeutral) {
  TrendState ts{flat_candles(220, 50)};
  EXPECT_EQ(ts.trend, Trend::Neutral);
  ASSERT_TRUE(ts.moving_averages.has_value());
  EXPECT_DOUBLE_EQ(ts.moving_averages->long_ma, 50);
}

TEST(Trend, Predicates) {
  EXPECT_TRUE(is_uptrend(Trend::StrongUptrend));
  EXPECT_TRUE(is_uptrend(Trend::Uptrend));
  EXPECT_FALSE(is_uptrend(Trend::Neutral));
  EXPECT_TRUE(is_downtrend(Trend::Downtrend));
  EXPECT_TRUE(is_downtrend(Trend::StrongDowntrend));
  EXPECT_FALSE(is_downtrend(Trend::Uptrend));
}

// =============================================================================
// Volatility
// =============================================================================

TEST(Volatility, FlatSeriesIsZeroAndLow) {
  VolatilityState vs{flat_candles(60, 42)};
  EXPECT_DOUBLE_EQ(vs.std_dev, 0);
  EXPECT_DOUBLE_EQ(vs.annualized, 0);
  EXPECT_EQ(vs.level, VolatilityLevel::Low);
}

TEST(Volatility, ZeroedBelowTwoCandles) {
  for (auto candles : {Candles{}, from_closes({10.0})}) {
    VolatilityState vs{candles};
    EXPECT_DOUBLE_EQ(vs.std_dev, 0);
    EXPECT_DOUBLE_EQ(vs.annualized, 0);
    EXPECT_EQ(vs.level, VolatilityLevel::Low);
  }
}

TEST(Volatility, SingleReturnHasNoSampleDeviation) {
  VolatilityState vs{from_closes({10.0, 12.0})};
  EXPECT_DOUBLE_EQ(vs.std_dev, 0);
}

TEST(Volatility, SmoothAdvanceIsLow) {
  VolatilityState vs{from_closes(linear(250, 100, 150))};
  EXPECT_EQ(vs.level, VolatilityLevel::Low);
  EXPECT_LT(vs.annualized, 0.15);
}

TEST(Volatility, ChoppySeriesIsHigh) {
  VolatilityState vs{from_closes(zigzag(30, 100, 110))};
  EXPECT_EQ(vs.level, VolatilityLevel::High);
  EXPECT_NEAR(vs.annualized, vs.std_dev * std::sqrt(252.0), 1e-12);
}

TEST(Volatility, MildSwingsAreMedium) {
  // log(101.235 / 100) ~ 0.0123 per bar, ~0.20 annualized
  VolatilityState vs{from_closes(zigzag(30, 100, 101.235))};
  EXPECT_EQ(vs.level, VolatilityLevel::Medium);
  EXPECT_NEAR(vs.annualized, 0.20, 0.01);
}

TEST(Volatility, OnlyRecentPeriodCounts) {
  auto closes = concat(zigzag(40, 100, 120), flat(5, 100));
  auto candles = from_closes(closes);

  VolatilityState recent{candles, 5};
  EXPECT_DOUBLE_EQ(recent.std_dev, 0);

  VolatilityState wide{candles, 20};
  EXPECT_GT(wide.std_dev, 0);
}
