#pragma once

#include "ind/indicators.h"
#include "ind/support_resistance.h"
#include "ind/trend.h"

#include <optional>

enum class ConfidenceLevel {
  Low,
  Medium,
  High,
};

// Heuristic 0-100 score of how much corroborating signal backs a target.
struct Confidence {
  int score = 0;
  ConfidenceLevel level = ConfidenceLevel::Low;

  Confidence() noexcept = default;
  Confidence(const std::optional<IndicatorSet>& ind,
             const std::optional<TrendState>& trend,
             const std::optional<VolatilityState>& vol,
             const std::optional<SupportResistance>& sr,
             size_t n_samples) noexcept;
};
