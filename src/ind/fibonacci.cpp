#include "ind/fibonacci.h"
#include "util/config.h"

#include <algorithm>

inline auto& levels_config = config.levels_config;

Fibonacci::Fibonacci(const Candles& candles) noexcept {
  if (candles.size() >= 2) {
    auto [lo, hi] = std::minmax_element(
        candles.begin(), candles.end(),
        [](auto& l, auto& r) { return l.close < r.close; });
    high = hi->close;
    low = lo->close;
  }

  // endpoints are pinned so "100%" equals low exactly
  double diff = high - low;
  for (auto& [label, ratio] : levels_config.fib_ratios)
    levels[label] = ratio == 0.0   ? high
                    : ratio == 1.0 ? low
                                   : high - diff * ratio;
}

std::optional<double> Fibonacci::level(const std::string& label) const {
  auto it = levels.find(label);
  if (it == levels.end())
    return std::nullopt;
  return it->second;
}
