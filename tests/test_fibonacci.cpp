#include <gtest/gtest.h>

#include "fixtures/candles.h"
#include "ind/fibonacci.h"

using namespace fixtures;

TEST(Fibonacci, LevelsBetweenHighestAndLowestClose) {
  Fibonacci fib{from_closes(linear(11, 100, 200))};

  // highs reach 202 but only closes count
  EXPECT_DOUBLE_EQ(fib.high, 200);
  EXPECT_DOUBLE_EQ(fib.low, 100);

  ASSERT_EQ(fib.levels.size(), 6u);
  EXPECT_DOUBLE_EQ(fib.levels.at("0%"), 200);
  EXPECT_NEAR(fib.levels.at("23.6%"), 176.4, 1e-9);
  EXPECT_NEAR(fib.levels.at("38.2%"), 161.8, 1e-9);
  EXPECT_NEAR(fib.levels.at("50%"), 150.0, 1e-9);
  EXPECT_NEAR(fib.levels.at("61.8%"), 138.2, 1e-9);
  EXPECT_DOUBLE_EQ(fib.levels.at("100%"), 100);
}

TEST(Fibonacci, MonotoneFromHighToLow) {
  Fibonacci fib{from_closes(sine(90, 40, 12, 29))};

  std::vector<std::string> order{"0%", "23.6%", "38.2%", "50%", "61.8%", "100%"};
  ASSERT_GT(fib.high, fib.low);
  EXPECT_DOUBLE_EQ(*fib.level("0%"), fib.high);
  EXPECT_DOUBLE_EQ(*fib.level("100%"), fib.low);
  for (size_t k = 1; k < order.size(); k++)
    EXPECT_LT(*fib.level(order[k]), *fib.level(order[k - 1])) << order[k];
}

TEST(Fibonacci, DegenerateBelowTwoCandles) {
  for (auto candles : {Candles{}, from_closes({123.0})}) {
    Fibonacci fib{candles};
    EXPECT_DOUBLE_EQ(fib.high, 0);
    EXPECT_DOUBLE_EQ(fib.low, 0);
    ASSERT_EQ(fib.levels.size(), 6u);
    for (auto& [label, price] : fib.levels)
      EXPECT_DOUBLE_EQ(price, 0) << label;
  }
}

TEST(Fibonacci, UnknownLabel) {
  Fibonacci fib{from_closes(linear(5, 1, 5))};
  EXPECT_FALSE(fib.level("42%").has_value());
  EXPECT_TRUE(fib.level("50%").has_value());
}
