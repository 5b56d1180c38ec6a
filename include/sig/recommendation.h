#pragma once

#include <string>

enum class Action {
  StrongBuy,
  Buy,
  Hold,
  Sell,
  StrongSell,
};

// Maps the target/current delta and confidence to an action. BUY and SELL are
// checked before their STRONG variants, so a large delta at high confidence
// is a BUY (or SELL); STRONG_* only fire between the two confidence bars.
struct Recommendation {
  Action action = Action::Hold;
  std::string reasoning;
  double expected_return = 0.0;  // percent

  Recommendation() noexcept = default;
  Recommendation(double target, double current, int confidence) noexcept;
};
