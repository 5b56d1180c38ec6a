#include "ind/indicators.h"
#include "util/config.h"
#include "util/math.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>

inline auto& ind_config = config.ind_config;

SMA::SMA(const std::vector<double>& prices, int period) noexcept {
  if (period <= 0 || prices.size() < size_t(period))
    return;

  values.reserve(prices.size() - period + 1);
  for (size_t i = period - 1; i < prices.size(); i++) {
    auto start = prices.begin() + (i + 1 - period);
    auto end = prices.begin() + (i + 1);
    values.push_back(std::accumulate(start, end, 0.0) / period);
  }
}

EMA::EMA(const std::vector<double>& prices, int period) noexcept
    : period(period) {
  if (period <= 0 || prices.size() < size_t(period))
    return;

  values.reserve(prices.size() - period + 1);
  auto seed = std::accumulate(prices.begin(), prices.begin() + period, 0.0);
  values.push_back(seed / period);

  auto alpha = 2.0 / (period + 1);
  for (size_t i = period; i < prices.size(); i++) {
    auto last = values.back();
    values.push_back((prices[i] - last) * alpha + last);
  }
}

RSI::RSI(const std::vector<double>& prices, int period) noexcept {
  if (period <= 0 || prices.size() < size_t(period + 1))
    return;

  values.reserve(prices.size() - period);

  auto rsi_of = [](double avg_gain, double avg_loss) {
    if (avg_loss == 0.0)
      return 100.0;
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
  };

  // initial averages over the first `period` changes
  double avg_gain = 0.0;
  double avg_loss = 0.0;
  for (int i = 1; i <= period; ++i) {
    double change = prices[i] - prices[i - 1];
    avg_gain += change > 0 ? change : 0.0;
    avg_loss += change < 0 ? -change : 0.0;
  }
  avg_gain /= period;
  avg_loss /= period;
  values.push_back(rsi_of(avg_gain, avg_loss));

  for (size_t i = period + 1; i < prices.size(); ++i) {
    double change = prices[i] - prices[i - 1];
    double gain = change > 0 ? change : 0.0;
    double loss = change < 0 ? -change : 0.0;

    avg_gain = (avg_gain * (period - 1) + gain) / period;
    avg_loss = (avg_loss * (period - 1) + loss) / period;
    values.push_back(rsi_of(avg_gain, avg_loss));
  }
}

MACD::MACD(const std::vector<double>& prices,
           int fast,
           int slow,
           int signal) noexcept {
  EMA fast_ema{prices, fast};
  EMA slow_ema{prices, slow};
  if (fast_ema.values.empty() || slow_ema.values.empty())
    return;

  std::vector<double> macd_line;
  size_t start = std::max(fast_ema.offset(), slow_ema.offset());
  for (size_t i = start; i < prices.size(); ++i)
    macd_line.push_back(fast_ema.values[i - fast_ema.offset()] -
                        slow_ema.values[i - slow_ema.offset()]);

  EMA signal_ema{macd_line, signal};

  values.reserve(macd_line.size());
  for (size_t k = 0; k < macd_line.size(); ++k) {
    MacdPoint pt{.macd = macd_line[k]};
    if (!signal_ema.values.empty() && k >= signal_ema.offset()) {
      pt.signal = signal_ema.values[k - signal_ema.offset()];
      pt.histogram = pt.macd - *pt.signal;
    }
    values.push_back(pt);
  }
}

Bollinger::Bollinger(const std::vector<double>& prices,
                     int period,
                     double width) noexcept {
  if (period <= 0 || prices.size() < size_t(period))
    return;

  values.reserve(prices.size() - period + 1);
  for (size_t i = period - 1; i < prices.size(); i++) {
    auto start = prices.begin() + (i + 1 - period);
    auto end = prices.begin() + (i + 1);

    double middle = mean(start, end);
    double sd = stddev(start, end);

    BollingerPoint pt;
    pt.middle = middle;
    pt.upper = middle + width * sd;
    pt.lower = middle - width * sd;
    pt.percent_b = safe_div(prices[i] - pt.lower, pt.upper - pt.lower);
    values.push_back(pt);
  }
}

double true_range(double prev_close, const Candle& c) {
  double high_low = std::abs(c.high - c.low);
  double high_pc = std::abs(c.high - prev_close);
  double low_pc = std::abs(c.low - prev_close);
  return std::max({high_low, high_pc, low_pc});
}

ADX::ADX(const Candles& candles, int period) noexcept {
  if (period <= 0 || candles.size() < size_t(period))
    return;

  std::vector<double> tr, plus_dm, minus_dm;
  for (size_t i = 1; i < candles.size(); ++i) {
    auto& prev = candles[i - 1];
    auto& cur = candles[i];

    tr.push_back(true_range(prev.close, cur));

    double up_move = cur.high - prev.high;
    double down_move = prev.low - cur.low;

    plus_dm.push_back(up_move > down_move && up_move > 0 ? up_move : 0.0);
    minus_dm.push_back(down_move > up_move && down_move > 0 ? down_move : 0.0);
  }

  auto atr = SMA{tr, period}.values;
  auto plus_sma = SMA{plus_dm, period}.values;
  auto minus_sma = SMA{minus_dm, period}.values;

  std::vector<double> dx;
  dx.reserve(atr.size());
  for (size_t i = 0; i < atr.size(); ++i) {
    double plus_di = safe_div(plus_sma[i] * 100, atr[i]);
    double minus_di = safe_div(minus_sma[i] * 100, atr[i]);
    dx.push_back(safe_div(std::abs(plus_di - minus_di), plus_di + minus_di) *
                 100);
  }

  values = SMA{dx, period}.values;
}

std::optional<double> IndicatorSet::last_rsi() const {
  if (!rsi || rsi->empty())
    return std::nullopt;
  return rsi->back();
}

std::optional<BollingerPoint> IndicatorSet::last_bollinger() const {
  if (!bollinger || bollinger->empty())
    return std::nullopt;
  return bollinger->back();
}

std::optional<IndicatorSet> compute_indicators(const Candles& candles) {
  auto n = candles.size();
  if (n < ind_config.min_candles)
    return std::nullopt;

  auto closes = column<PriceField::Close>(candles);
  auto enough = [n](int period) { return period > 0 && n >= size_t(period); };

  IndicatorSet ind;

  if (enough(ind_config.sma_short))
    ind.sma_short = SMA{closes, ind_config.sma_short}.values;
  if (enough(ind_config.sma_medium))
    ind.sma_medium = SMA{closes, ind_config.sma_medium}.values;
  if (enough(ind_config.sma_long))
    ind.sma_long = SMA{closes, ind_config.sma_long}.values;

  if (enough(ind_config.ema_fast))
    ind.ema_fast = EMA{closes, ind_config.ema_fast}.values;
  if (enough(ind_config.ema_slow))
    ind.ema_slow = EMA{closes, ind_config.ema_slow}.values;

  if (enough(ind_config.rsi_period))
    ind.rsi = RSI{closes, ind_config.rsi_period}.values;

  if (enough(ind_config.ema_slow))
    ind.macd = MACD{closes, ind_config.ema_fast, ind_config.ema_slow,
                    ind_config.macd_signal}
                   .values;

  if (enough(ind_config.bollinger_period))
    ind.bollinger = Bollinger{closes, ind_config.bollinger_period,
                              ind_config.bollinger_width}
                        .values;

  if (enough(ind_config.adx_period))
    ind.adx = ADX{candles, ind_config.adx_period}.values;

  spdlog::debug("[indicators] {} candles, rsi {}, bollinger {}, adx {}", n,
                ind.rsi ? ind.rsi->size() : 0,
                ind.bollinger ? ind.bollinger->size() : 0,
                ind.adx ? ind.adx->size() : 0);

  return ind;
}
