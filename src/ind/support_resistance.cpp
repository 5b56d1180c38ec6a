#include "ind/support_resistance.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

inline auto& levels_config = config.levels_config;

std::vector<Level> find_levels(const std::vector<double>& data) {
  std::vector<Level> levels;

  auto n = data.size();
  if (n < levels_config.min_candles)
    return levels;

  auto tol = levels_config.tolerance;
  auto edge = std::max<size_t>(levels_config.edge, 1);

  for (size_t i = edge; i + edge < n; i++) {
    double cur = data[i];

    bool is_level = cur <= data[i - 1] * (1 + tol) &&  //
                    cur <= data[i + 1] * (1 + tol);
    if (!is_level)
      continue;

    size_t touches = 1;
    for (size_t j = 0; j < n; j++)
      if (j != i && std::abs(data[j] - cur) < cur * tol)
        touches++;

    if (touches >= levels_config.min_touches)
      levels.push_back({cur, touches, i});
  }

  std::stable_sort(levels.begin(), levels.end(), [](auto& l, auto& r) {
    return l.touches > r.touches;
  });

  if (levels.size() > levels_config.n_levels)
    levels.resize(levels_config.n_levels);

  return levels;
}

template <SR sr>
std::vector<Level> find_levels(const Candles& candles) {
  constexpr bool is_support = sr == SR::Support;
  if constexpr (is_support)
    return find_levels(column<PriceField::Low>(candles));
  else
    return find_levels(column<PriceField::High>(candles));
}

template std::vector<Level> find_levels<SR::Support>(const Candles&);
template std::vector<Level> find_levels<SR::Resistance>(const Candles&);

SupportResistance::SupportResistance(const Candles& candles) noexcept {
  if (candles.size() < levels_config.min_candles)
    return;

  support = find_levels<SR::Support>(candles);
  resistance = find_levels<SR::Resistance>(candles);

  spdlog::debug("[levels] support [{}], resistance [{}]",
                join(support.begin(), support.end()),
                join(resistance.begin(), resistance.end()));
}

std::optional<Level> SupportResistance::top_support() const {
  if (support.empty())
    return std::nullopt;
  return support.front();
}

std::optional<Level> SupportResistance::top_resistance() const {
  if (resistance.empty())
    return std::nullopt;
  return resistance.front();
}
