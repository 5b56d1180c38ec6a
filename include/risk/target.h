#pragma once

#include "ind/fibonacci.h"
#include "ind/indicators.h"
#include "ind/support_resistance.h"
#include "ind/trend.h"

#include <optional>
#include <string>
#include <vector>

enum class TargetMethod {
  WeightedAverage,
  CurrentPrice,
};

struct TargetCandidate {
  double price = 0.0;
  double weight = 0.0;
  std::string source;
};

struct PriceTarget {
  double price = 0.0;
  TargetMethod method = TargetMethod::CurrentPrice;
  double range_low = 0.0;
  double range_high = 0.0;
  std::vector<TargetCandidate> breakdown;

  PriceTarget() noexcept = default;
  PriceTarget(const std::optional<IndicatorSet>& ind,
              const std::optional<Fibonacci>& fib,
              const std::optional<SupportResistance>& sr,
              const std::optional<TrendState>& trend,
              const std::optional<VolatilityState>& vol,
              double current_price) noexcept;

 private:
  static std::vector<TargetCandidate> candidates(
      const std::optional<IndicatorSet>& ind,
      const std::optional<Fibonacci>& fib,
      const std::optional<SupportResistance>& sr,
      const std::optional<TrendState>& trend);

  static double range_adjustment(const std::optional<VolatilityState>& vol,
                                 double price);
};
