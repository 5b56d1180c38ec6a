#include "core/serialization.h"
#include "util/format.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <glaze/glaze.hpp>

template <>
struct glz::meta<LocalTimePoint> {
  using T = LocalTimePoint;

  static constexpr auto write = [](const T& time_point) {
    return date_to_string(time_point);
  };

  static constexpr auto read = [](T& t, const std::string& str) {
    if (str.size() > 10)
      t = datetime_to_local(str);
    else
      t = date_to_local(str);
  };

  static constexpr auto value = custom<read, write>;
};

// enums travel as their labels
template <typename E>
struct label_meta {
  static constexpr auto write = [](const E& e) { return to_str(e); };
  static constexpr auto read = [](E& e, const std::string& str) {
    e = from_str<E>(str);
  };
  static constexpr auto value = glz::custom<read, write>;
};

template <>
struct glz::meta<Trend> : label_meta<Trend> {};
template <>
struct glz::meta<VolatilityLevel> : label_meta<VolatilityLevel> {};
template <>
struct glz::meta<ConfidenceLevel> : label_meta<ConfidenceLevel> {};
template <>
struct glz::meta<TargetMethod> : label_meta<TargetMethod> {};
template <>
struct glz::meta<Action> : label_meta<Action> {};

template <>
struct glz::meta<MacdPoint> {
  using T = MacdPoint;
  static constexpr auto value = object(  //
      "MACD", &T::macd,
      "signal", &T::signal,
      "histogram", &T::histogram  //
  );
};

template <>
struct glz::meta<BollingerPoint> {
  using T = BollingerPoint;
  static constexpr auto value = object(  //
      "upperBand", &T::upper,
      "middleBand", &T::middle,
      "lowerBand", &T::lower,
      "percentB", &T::percent_b  //
  );
};

template <>
struct glz::meta<IndicatorSet> {
  using T = IndicatorSet;
  static constexpr auto value = object(  //
      "sma20", &T::sma_short,
      "sma50", &T::sma_medium,
      "sma200", &T::sma_long,
      "ema12", &T::ema_fast,
      "ema26", &T::ema_slow,
      "rsi", &T::rsi,
      "macd", &T::macd,
      "bollinger", &T::bollinger,
      "adx", &T::adx  //
  );
};

template <>
struct glz::meta<Fibonacci> {
  using T = Fibonacci;
  static constexpr auto value = object(  //
      "high", &T::high,
      "low", &T::low,
      "levels", &T::levels  //
  );
};

template <>
struct glz::meta<Level> {
  using T = Level;
  static constexpr auto value = object(  //
      "price", &T::price,
      "touches", &T::touches,
      "index", &T::index  //
  );
};

template <>
struct glz::meta<SupportResistance> {
  using T = SupportResistance;
  static constexpr auto value = object(  //
      "support", &T::support,
      "resistance", &T::resistance  //
  );
};

template <>
struct glz::meta<MovingAverages> {
  using T = MovingAverages;
  static constexpr auto value = object(  //
      "short", &T::short_ma,
      "medium", &T::medium_ma,
      "long", &T::long_ma  //
  );
};

template <>
struct glz::meta<TrendState> {
  using T = TrendState;
  static constexpr auto value = object(  //
      "trend", &T::trend,
      "movingAverages", &T::moving_averages  //
  );
};

template <>
struct glz::meta<VolatilityState> {
  using T = VolatilityState;
  static constexpr auto value = object(  //
      "standardDeviation", &T::std_dev,
      "annualizedVolatility", &T::annualized,
      "currentLevel", &T::level  //
  );
};

template <>
struct glz::meta<TargetCandidate> {
  using T = TargetCandidate;
  static constexpr auto value = object(  //
      "price", &T::price,
      "weight", &T::weight,
      "source", &T::source  //
  );
};

template <>
struct glz::meta<Recommendation> {
  using T = Recommendation;
  static constexpr auto value = object(  //
      "action", &T::action,
      "reasoning", &T::reasoning,
      "expectedReturn", &T::expected_return  //
  );
};

template <>
struct glz::meta<Calculations> {
  using T = Calculations;
  static constexpr auto value = object(  //
      "fibonacci", &T::fibonacci,
      "supportResistance", &T::support_resistance,
      "trends", &T::trend,
      "volatility", &T::volatility  //
  );
};

struct PriceRange {
  double low;
  double high;
};

template <>
struct glz::meta<AnalysisRecord> {
  using T = AnalysisRecord;

  static constexpr auto range = [](auto& self) {
    return PriceRange{self.target.range_low, self.target.range_high};
  };

  // target, confidence and analyst fields are flattened into the record
  static constexpr auto value = object(
      "symbol", &T::symbol,
      "analysisDate", &T::analysis_date,
      "currentPrice", &T::current_price,
      "priceChange", &T::price_change,
      "priceChangePercent", &T::price_change_pct,
      "volume", &T::volume,
      "targetPrice", [](auto& self) -> auto& { return self.target.price; },
      "analysisMethod", [](auto& self) -> auto& { return self.target.method; },
      "priceRange", range,
      "targetBreakdown",
      [](auto& self) -> auto& { return self.target.breakdown; },
      "confidenceScore",
      [](auto& self) -> auto& { return self.confidence.score; },
      "confidenceLevel",
      [](auto& self) -> auto& { return self.confidence.level; },
      "technicalIndicators", &T::indicators,
      "calculations", &T::calculations,
      "recommendation", &T::recommendation,
      "analystTargetPrice",
      [](auto& self) -> auto& { return self.analyst.target_mean; },
      "analystTargetPriceHigh",
      [](auto& self) -> auto& { return self.analyst.target_high; },
      "analystTargetPriceLow",
      [](auto& self) -> auto& { return self.analyst.target_low; },
      "analystTargetPriceMedian",
      [](auto& self) -> auto& { return self.analyst.target_median; },
      "analystRecommendationKey",
      [](auto& self) -> auto& { return self.analyst.recommendation_key; },
      "analystRecommendationMean",
      [](auto& self) -> auto& { return self.analyst.recommendation_mean; },
      "numberOfAnalystOpinions",
      [](auto& self) -> auto& { return self.analyst.n_opinions; });
};

inline constexpr auto read_opts = glz::opts{
    .error_on_unknown_keys = false,
};

inline constexpr auto write_opts = glz::opts{
    .skip_null_members = false,
    .prettify = true,
};

std::optional<AnalysisRequest> read_request_json(const std::string& str) {
  AnalysisRequest req;
  auto ec = glz::read<read_opts>(req, str);
  if (ec) {
    spdlog::error("[io] request json error: {}", glz::format_error(ec, str));
    return std::nullopt;
  }
  return req;
}

std::optional<AnalysisRequest> read_request_file(const std::string& path) {
  AnalysisRequest req;
  std::string buffer;
  auto ec = glz::read_file_json<read_opts>(req, path, buffer);
  if (ec) {
    spdlog::error("[io] {} error: {}", path, glz::format_error(ec, buffer));
    return std::nullopt;
  }
  return req;
}

std::string write_record_json(const AnalysisRecord& rec) {
  std::string buffer;
  auto ec = glz::write<write_opts>(rec, buffer);
  if (ec) {
    spdlog::error("[io] {} record json error: {}", rec.symbol,
                  glz::format_error(ec));
    return {};
  }
  return buffer;
}

bool write_record_file(const AnalysisRecord& rec, const std::string& path) {
  std::string buffer;
  auto ec = glz::write_file_json<write_opts>(rec, path, buffer);
  if (ec) {
    spdlog::error("[io] error writing {}: {}", path, glz::format_error(ec));
    return false;
  }
  return true;
}
