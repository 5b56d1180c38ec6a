#pragma once

#include "ind/candle.h"

#include <optional>
#include <vector>

struct Level {
  double price = 0.0;
  size_t touches = 0;
  size_t index = 0;
};

enum class SR {
  Support,
  Resistance,
};

// Local price levels of one series, ranked by touch count (ties keep series
// order). A point is a candidate when it sits no more than `tolerance` above
// either neighbour; its touch count is itself plus every other point within
// `tolerance` of its price.
std::vector<Level> find_levels(const std::vector<double>& data);

// Support levels come from the lows, resistance levels from the highs.
template <SR sr>
std::vector<Level> find_levels(const Candles& candles);

struct SupportResistance {
  std::vector<Level> support;
  std::vector<Level> resistance;

  SupportResistance() noexcept = default;
  SupportResistance(const Candles& candles) noexcept;

  // strongest level, not the closest in price
  std::optional<Level> top_support() const;
  std::optional<Level> top_resistance() const;
};
