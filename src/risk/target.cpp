#include "risk/target.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

inline auto& target_config = config.target_config;
inline auto& levels_config = config.levels_config;

std::vector<TargetCandidate> PriceTarget::candidates(
    const std::optional<IndicatorSet>& ind,
    const std::optional<Fibonacci>& fib,
    const std::optional<SupportResistance>& sr,
    const std::optional<TrendState>& trend) {
  std::vector<TargetCandidate> out;

  // zero prices carry no information and are never candidates
  auto add = [&out](std::optional<double> price, double weight,
                    const char* source) {
    if (price && *price != 0.0)
      out.push_back({*price, weight, source});
  };

  if (ind) {
    if (auto bb = ind->last_bollinger()) {
      add(bb->upper, target_config.bollinger_upper_weight, "bollinger_upper");
      add(bb->middle, target_config.bollinger_middle_weight,
          "bollinger_middle");
    }
  }

  if (!trend)
    return out;

  bool up = is_uptrend(trend->trend);
  bool down = is_downtrend(trend->trend);

  if (fib && up)
    add(fib->level(levels_config.fib_up_label), target_config.fibonacci_weight,
        "fibonacci_up");
  else if (fib && down)
    add(fib->level(levels_config.fib_down_label),
        target_config.fibonacci_weight, "fibonacci_down");

  if (sr && up)
    if (auto res = sr->top_resistance())
      add(res->price, target_config.level_weight, "resistance");

  if (sr && down)
    if (auto sup = sr->top_support())
      add(sup->price, target_config.level_weight, "support");

  if (auto& ma = trend->moving_averages) {
    if (up && ma->medium_ma != 0.0)
      add(ma->medium_ma * target_config.ma_projection_up,
          target_config.ma_projection_weight, "ma_projection_up");
    else if (down && ma->medium_ma != 0.0)
      add(ma->medium_ma * target_config.ma_projection_down,
          target_config.ma_projection_weight, "ma_projection_down");
  }

  return out;
}

double PriceTarget::range_adjustment(const std::optional<VolatilityState>& vol,
                                     double price) {
  if (vol && vol->annualized != 0.0)
    return vol->annualized * price * target_config.range_volatility_factor;
  return price * target_config.fallback_range;
}

PriceTarget::PriceTarget(const std::optional<IndicatorSet>& ind,
                         const std::optional<Fibonacci>& fib,
                         const std::optional<SupportResistance>& sr,
                         const std::optional<TrendState>& trend,
                         const std::optional<VolatilityState>& vol,
                         double current_price) noexcept
    : price{current_price},
      method{TargetMethod::CurrentPrice},
      breakdown{candidates(ind, fib, sr, trend)}  //
{
  double total_weight = 0.0;
  double weighted = 0.0;
  for (auto& c : breakdown) {
    total_weight += c.weight;
    weighted += c.price * c.weight;
  }

  if (!breakdown.empty() && total_weight > 0) {
    price = weighted / total_weight;
    method = TargetMethod::WeightedAverage;
  }

  auto adj = range_adjustment(vol, price);
  range_low = price - adj;
  range_high = price + adj;

  spdlog::debug("[target] {} from {} candidates: {:.2f} ({:.2f} - {:.2f})",
                to_str(method), breakdown.size(), price, range_low,
                range_high);
}
