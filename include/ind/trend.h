#pragma once

#include "ind/candle.h"

#include <optional>

enum class Trend {
  StrongUptrend,
  Uptrend,
  Neutral,
  Downtrend,
  StrongDowntrend,
};

constexpr bool is_uptrend(Trend t) {
  return t == Trend::StrongUptrend || t == Trend::Uptrend;
}

constexpr bool is_downtrend(Trend t) {
  return t == Trend::StrongDowntrend || t == Trend::Downtrend;
}

struct MovingAverages {
  double short_ma = 0.0;
  double medium_ma = 0.0;
  double long_ma = 0.0;
};

struct TrendState {
  Trend trend = Trend::Neutral;
  std::optional<MovingAverages> moving_averages;

  TrendState() noexcept = default;
  TrendState(const Candles& candles) noexcept;
};

enum class VolatilityLevel {
  Low,
  Medium,
  High,
};

// Dispersion of log returns over the most recent `period` closes.
struct VolatilityState {
  double std_dev = 0.0;
  double annualized = 0.0;
  VolatilityLevel level = VolatilityLevel::Low;

  VolatilityState() noexcept = default;
  VolatilityState(const Candles& candles, size_t period) noexcept;
  VolatilityState(const Candles& candles) noexcept;
};
