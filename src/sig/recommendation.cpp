#include "sig/recommendation.h"
#include "util/config.h"
#include "util/math.h"

#include <cmath>
#include <format>

inline auto& rec_config = config.recommendation_config;

Recommendation::Recommendation(double target,
                               double current,
                               int confidence) noexcept
    : expected_return{safe_div(target - current, current) * 100}  //
{
  double delta = expected_return;
  auto& c = rec_config;

  if (delta > c.delta && confidence >= c.min_confidence) {
    action = Action::Buy;
    reasoning =
        std::format("Target price indicates {:.1f}% upside potential", delta);
  } else if (delta > c.strong_delta && confidence >= c.strong_min_confidence) {
    action = Action::StrongBuy;
    reasoning = std::format("Strong upside potential of {:.1f}%", delta);
  } else if (delta < -c.delta && confidence >= c.min_confidence) {
    action = Action::Sell;
    reasoning = std::format("Target price indicates {:.1f}% downside risk",
                            std::abs(delta));
  } else if (delta < -c.strong_delta &&
             confidence >= c.strong_min_confidence) {
    action = Action::StrongSell;
    reasoning =
        std::format("Significant downside risk of {:.1f}%", std::abs(delta));
  } else {
    action = Action::Hold;
    reasoning = "Target price close to current price";
  }
}
