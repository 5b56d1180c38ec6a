#pragma once

#include "ind/candle.h"
#include "ind/fibonacci.h"
#include "ind/indicators.h"
#include "ind/support_resistance.h"
#include "ind/trend.h"
#include "risk/confidence.h"
#include "risk/target.h"
#include "sig/recommendation.h"

#include <optional>
#include <stdexcept>
#include <string>

struct NoDataAvailable : public std::runtime_error {
  explicit NoDataAvailable(const std::string& symbol)
      : std::runtime_error{"no data available for analysis of " + symbol} {}
};

// Latest quote snapshot; when absent the last candle stands in for it.
struct Quote {
  double price = 0.0;
  double previous_close = 0.0;
  long volume = 0;
};

// Externally sourced analyst consensus. Passed through into the record as is,
// nothing here is validated.
struct AnalystConsensus {
  std::optional<double> target_mean;
  std::optional<double> target_median;
  std::optional<double> target_high;
  std::optional<double> target_low;
  std::optional<std::string> recommendation_key;
  std::optional<double> recommendation_mean;
  std::optional<int> n_opinions;
};

struct Calculations {
  std::optional<Fibonacci> fibonacci;
  SupportResistance support_resistance;
  TrendState trend;
  VolatilityState volatility;
};

struct AnalysisRecord {
  std::string symbol;
  std::string analysis_date;

  double current_price = 0.0;
  double price_change = 0.0;
  double price_change_pct = 0.0;
  long volume = 0;

  PriceTarget target;
  Confidence confidence;

  std::optional<IndicatorSet> indicators;
  Calculations calculations;

  Recommendation recommendation;
  AnalystConsensus analyst;
};

// Runs every stage over `candles` (oldest first). Throws NoDataAvailable when
// `candles` is empty; every other shortfall degrades to absent fields.
AnalysisRecord analyze(const std::string& symbol,
                       const Candles& candles,
                       const std::optional<Quote>& quote = std::nullopt,
                       const std::optional<AnalystConsensus>& analyst =
                           std::nullopt);
