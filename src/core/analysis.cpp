#include "core/analysis.h"
#include "util/config.h"
#include "util/format.h"
#include "util/math.h"

#include <spdlog/spdlog.h>

inline auto& analysis_config = config.analysis_config;

inline Quote snapshot(const Candles& candles, const std::optional<Quote>& q) {
  if (q)
    return *q;

  auto& last = candles.back();
  return {last.close, last.close, last.volume};
}

inline Calculations calculate(const Candles& candles) {
  auto n = candles.size();
  auto& c = analysis_config;

  Calculations calc;
  if (n >= c.levels_min_candles) {
    calc.fibonacci.emplace(candles);
    calc.support_resistance = SupportResistance{candles};
  }
  if (n >= c.trend_min_candles)
    calc.trend = TrendState{candles};
  if (n >= c.volatility_min_candles)
    calc.volatility = VolatilityState{candles};

  return calc;
}

AnalysisRecord analyze(const std::string& symbol,
                       const Candles& candles,
                       const std::optional<Quote>& quote,
                       const std::optional<AnalystConsensus>& analyst) {
  if (candles.empty())
    throw NoDataAvailable{symbol};

  auto n = candles.size();
  if (n < analysis_config.limited_data_warning)
    spdlog::warn("[analysis] {}: only {} candles, results may be less accurate",
                 symbol, n);

  spdlog::debug("[analysis] {}: {} candles, last {}", symbol, n,
                to_str(candles.back()));

  AnalysisRecord rec;
  rec.symbol = symbol;
  rec.analysis_date = today_str();

  auto q = snapshot(candles, quote);
  rec.current_price = q.price;
  rec.price_change = q.price - q.previous_close;
  rec.price_change_pct = safe_div(rec.price_change, q.previous_close) * 100;
  rec.volume = q.volume;

  if (n >= analysis_config.indicators_min_candles)
    rec.indicators = compute_indicators(candles);
  rec.calculations = calculate(candles);

  auto& calc = rec.calculations;
  rec.target = PriceTarget{rec.indicators,     calc.fibonacci,
                           calc.support_resistance, calc.trend,
                           calc.volatility,    candles.back().close};
  rec.confidence = Confidence{rec.indicators, calc.trend, calc.volatility,
                              calc.support_resistance, n};
  rec.recommendation = Recommendation{rec.target.price, rec.current_price,
                                      rec.confidence.score};

  if (analyst)
    rec.analyst = *analyst;

  spdlog::info("[analysis] {}: {} target {:.2f} vs {:.2f}, confidence {} ({})",
               symbol, to_str(rec.recommendation.action), rec.target.price,
               rec.current_price, rec.confidence.score,
               to_str(calc.trend.trend));

  return rec;
}
