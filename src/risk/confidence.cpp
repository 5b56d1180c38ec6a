#include "risk/confidence.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>

inline auto& conf_config = config.confidence_config;

inline int rsi_adjustment(const std::optional<IndicatorSet>& ind) {
  auto rsi = ind ? ind->last_rsi() : std::nullopt;
  if (!rsi)
    return conf_config.rsi_missing;
  if (*rsi >= conf_config.rsi_low && *rsi <= conf_config.rsi_high)
    return conf_config.rsi_in_band;
  return 0;
}

inline int trend_adjustment(const std::optional<TrendState>& trend) {
  if (trend && trend->trend != Trend::Neutral)
    return conf_config.trend_clear;
  return conf_config.trend_unclear;
}

inline int volatility_adjustment(const std::optional<VolatilityState>& vol) {
  if (!vol)
    return conf_config.volatility_missing;

  switch (vol->level) {
    case VolatilityLevel::Low:
      return conf_config.volatility_low;
    case VolatilityLevel::Medium:
      return conf_config.volatility_medium;
    default:
      return conf_config.volatility_high;
  }
}

inline int levels_adjustment(const std::optional<SupportResistance>& sr) {
  auto min = conf_config.min_levels;
  if (sr && (sr->support.size() >= min || sr->resistance.size() >= min))
    return conf_config.levels_found;
  return conf_config.levels_missing;
}

inline int sample_adjustment(size_t n) {
  if (n >= conf_config.large_sample)
    return conf_config.large_sample_bonus;
  if (n >= conf_config.medium_sample)
    return conf_config.medium_sample_bonus;
  if (n >= conf_config.small_sample)
    return 0;
  return conf_config.tiny_sample_penalty;
}

Confidence::Confidence(const std::optional<IndicatorSet>& ind,
                       const std::optional<TrendState>& trend,
                       const std::optional<VolatilityState>& vol,
                       const std::optional<SupportResistance>& sr,
                       size_t n_samples) noexcept {
  if (n_samples == 0) {
    score = 0;
    level = ConfidenceLevel::Low;
    return;
  }

  int raw = conf_config.base;
  raw += rsi_adjustment(ind);
  raw += trend_adjustment(trend);
  raw += volatility_adjustment(vol);
  raw += levels_adjustment(sr);
  raw += sample_adjustment(n_samples);

  score = std::clamp(raw, 0, 100);
  level = score >= conf_config.high_level     ? ConfidenceLevel::High
          : score >= conf_config.medium_level ? ConfidenceLevel::Medium
                                              : ConfidenceLevel::Low;

  spdlog::debug("[confidence] raw {} over {} samples -> {} ({})", raw,
                n_samples, score, to_str(level));
}
