#include "ind/trend.h"
#include "ind/indicators.h"
#include "util/config.h"
#include "util/format.h"
#include "util/math.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

inline auto& ind_config = config.ind_config;
inline auto& trend_config = config.trend_config;

inline Trend classify(double px, const MovingAverages& ma) {
  auto& [s, m, l] = ma;

  if (px > s && s > m && m > l)
    return Trend::StrongUptrend;
  if (px > s && s > m)
    return Trend::Uptrend;
  if (px < s && s < m && m < l)
    return Trend::StrongDowntrend;
  if (px < s && s < m)
    return Trend::Downtrend;
  return Trend::Neutral;
}

TrendState::TrendState(const Candles& candles) noexcept {
  auto need = static_cast<size_t>(std::max(
      {ind_config.sma_short, ind_config.sma_medium, ind_config.sma_long}));
  if (candles.size() < need)
    return;

  auto closes = column<PriceField::Close>(candles);
  SMA s{closes, ind_config.sma_short};
  SMA m{closes, ind_config.sma_medium};
  SMA l{closes, ind_config.sma_long};
  if (s.values.empty() || m.values.empty() || l.values.empty())
    return;

  moving_averages =
      MovingAverages{s.values.back(), m.values.back(), l.values.back()};
  trend = classify(closes.back(), *moving_averages);

  spdlog::debug("[trend] {:.2f} vs sma {:.2f}/{:.2f}/{:.2f}: {}",
                closes.back(), moving_averages->short_ma,
                moving_averages->medium_ma, moving_averages->long_ma,
                to_str(trend));
}

VolatilityState::VolatilityState(const Candles& candles) noexcept
    : VolatilityState{candles, trend_config.volatility_period} {}

VolatilityState::VolatilityState(const Candles& candles,
                                 size_t period) noexcept {
  auto n = std::min(period, candles.size());
  if (n < 2)
    return;

  std::vector<double> returns;
  returns.reserve(n - 1);
  for (size_t i = candles.size() - n + 1; i < candles.size(); i++)
    returns.push_back(std::log(candles[i].close / candles[i - 1].close));

  std_dev = stddev(returns.begin(), returns.end(), 1);
  annualized = std_dev * std::sqrt(trend_config.trading_days);

  level = annualized > trend_config.high_volatility     ? VolatilityLevel::High
          : annualized > trend_config.medium_volatility ? VolatilityLevel::Medium
                                                        : VolatilityLevel::Low;
}
