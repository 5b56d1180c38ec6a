#pragma once

#include "ind/candle.h"

#include <optional>
#include <vector>

// Trailing simple mean; emits size - period + 1 values.
struct SMA {
  std::vector<double> values;

  SMA() noexcept = default;
  SMA(const std::vector<double>& prices, int period) noexcept;
};

// Exponential smoothing seeded with the SMA of the first `period` prices, so
// values[0] lines up with prices[period - 1].
struct EMA {
  std::vector<double> values;

 private:
  int period = 0;

 public:
  EMA() noexcept = default;
  EMA(const std::vector<double>& prices, int period) noexcept;

  // index into the price series that values[0] corresponds to
  size_t offset() const { return period > 0 ? period - 1 : 0; }
};

// Wilder RSI; values[0] lines up with prices[period].
struct RSI {
  std::vector<double> values;

  RSI() noexcept = default;
  RSI(const std::vector<double>& prices, int period = 14) noexcept;
};

struct MacdPoint {
  double macd = 0.0;
  std::optional<double> signal;
  std::optional<double> histogram;
};

// One point per close from index slow - 1 on; signal and histogram stay empty
// until the signal EMA has enough MACD values.
struct MACD {
  std::vector<MacdPoint> values;

  MACD() noexcept = default;
  MACD(const std::vector<double>& prices,
       int fast = 12,
       int slow = 26,
       int signal = 9) noexcept;
};

struct BollingerPoint {
  double upper = 0.0;
  double middle = 0.0;
  double lower = 0.0;
  double percent_b = 0.0;
};

struct Bollinger {
  std::vector<BollingerPoint> values;

  Bollinger() noexcept = default;
  Bollinger(const std::vector<double>& prices,
            int period = 20,
            double width = 2.0) noexcept;
};

// Average directional index. True range, +DM and -DM are smoothed with a
// plain trailing SMA rather than Wilder's running average, and so is DX.
struct ADX {
  std::vector<double> values;

  ADX() noexcept = default;
  ADX(const Candles& candles, int period = 14) noexcept;
};

double true_range(double prev_close, const Candle& c);

struct IndicatorSet {
  std::optional<std::vector<double>> sma_short;
  std::optional<std::vector<double>> sma_medium;
  std::optional<std::vector<double>> sma_long;
  std::optional<std::vector<double>> ema_fast;
  std::optional<std::vector<double>> ema_slow;
  std::optional<std::vector<double>> rsi;
  std::optional<std::vector<MacdPoint>> macd;
  std::optional<std::vector<BollingerPoint>> bollinger;
  std::optional<std::vector<double>> adx;

  std::optional<double> last_rsi() const;
  std::optional<BollingerPoint> last_bollinger() const;
};

// Empty when there are fewer candles than ind_config.min_candles; otherwise
// each field is present only if its own minimum length is met.
std::optional<IndicatorSet> compute_indicators(const Candles& candles);
