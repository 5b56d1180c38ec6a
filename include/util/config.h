#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct IndicatorsConfig {
  static constexpr const char* name = "ind_config";
  static constexpr bool debug = true;

  int sma_short = 20;
  int sma_medium = 50;
  int sma_long = 200;

  int ema_fast = 12;
  int ema_slow = 26;
  int macd_signal = 9;

  int rsi_period = 14;

  int bollinger_period = 20;
  double bollinger_width = 2.0;

  int adx_period = 14;

  // below this the whole set is absent
  size_t min_candles = 20;
};

struct FibRatio {
  std::string label;
  double ratio;
};

struct LevelsConfig {
  static constexpr const char* name = "levels_config";
  static constexpr bool debug = true;

  double tolerance = 0.02;
  size_t edge = 2;  // points skipped at each end of the series
  size_t min_touches = 2;
  size_t n_levels = 5;
  size_t min_candles = 5;

  std::vector<FibRatio> fib_ratios = {
      {"0%", 0.0},     {"23.6%", 0.236}, {"38.2%", 0.382},
      {"50%", 0.5},    {"61.8%", 0.618}, {"100%", 1.0},
  };
  std::string fib_up_label = "61.8%";
  std::string fib_down_label = "38.2%";
};

struct TrendConfig {
  static constexpr const char* name = "trend_config";
  static constexpr bool debug = true;

  size_t volatility_period = 20;
  double trading_days = 252;

  double medium_volatility = 0.15;
  double high_volatility = 0.25;
};

struct TargetConfig {
  static constexpr const char* name = "target_config";
  static constexpr bool debug = true;

  double bollinger_upper_weight = 0.15;
  double bollinger_middle_weight = 0.10;
  double fibonacci_weight = 0.20;
  double level_weight = 0.15;
  double ma_projection_weight = 0.15;

  double ma_projection_up = 1.05;
  double ma_projection_down = 0.95;

  double range_volatility_factor = 0.5;
  double fallback_range = 0.1;
};

struct ConfidenceConfig {
  static constexpr const char* name = "confidence_config";
  static constexpr bool debug = true;

  int base = 50;

  double rsi_low = 30.0;
  double rsi_high = 70.0;
  int rsi_in_band = 10;
  int rsi_missing = -10;

  int trend_clear = 15;
  int trend_unclear = -15;

  int volatility_low = 10;
  int volatility_medium = 5;
  int volatility_high = 0;
  int volatility_missing = -10;

  size_t min_levels = 2;
  int levels_found = 10;
  int levels_missing = -10;

  size_t large_sample = 200;
  size_t medium_sample = 100;
  size_t small_sample = 50;
  int large_sample_bonus = 15;
  int medium_sample_bonus = 5;
  int tiny_sample_penalty = -20;

  int medium_level = 60;
  int high_level = 80;
};

struct RecommendationConfig {
  static constexpr const char* name = "recommendation_config";
  static constexpr bool debug = true;

  double delta = 10.0;
  double strong_delta = 20.0;
  int min_confidence = 60;
  int strong_min_confidence = 40;
};

struct AnalysisConfig {
  static constexpr const char* name = "analysis_config";
  static constexpr bool debug = true;

  size_t indicators_min_candles = 50;
  size_t levels_min_candles = 50;
  size_t trend_min_candles = 200;
  size_t volatility_min_candles = 20;
  size_t limited_data_warning = 50;
};

struct Config {
  static constexpr const char* CONFIG_DIR_DEFAULT = "config";
  static constexpr size_t MAX_CANDLES_DEFAULT = 200;

  bool debug_en = false;

  std::vector<std::string> inputs;
  std::string config_dir = CONFIG_DIR_DEFAULT;
  std::string output_dir;
  std::string log_file;

  size_t max_candles = MAX_CANDLES_DEFAULT;
  std::string from_date;
  std::string to_date;

  size_t n_concurrency = 1;

  IndicatorsConfig ind_config;
  LevelsConfig levels_config;
  TrendConfig trend_config;
  TargetConfig target_config;
  ConfidenceConfig confidence_config;
  RecommendationConfig recommendation_config;
  AnalysisConfig analysis_config;

  bool read_args(int argc, char* argv[]);
  void update(const std::string& dir);
};

inline Config config;
