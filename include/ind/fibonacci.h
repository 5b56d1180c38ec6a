#pragma once

#include "ind/candle.h"

#include <map>
#include <optional>
#include <string>

// Retracement levels between the highest and lowest close of the window:
// level = high - ratio * (high - low), so "0%" is the high and "100%" the low.
struct Fibonacci {
  double high = 0.0;
  double low = 0.0;
  std::map<std::string, double> levels;

  // All levels zero when there are fewer than two candles.
  Fibonacci(const Candles& candles) noexcept;

  std::optional<double> level(const std::string& label) const;
};
