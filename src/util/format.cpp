#include "util/format.h"
#include "ind/candle.h"
#include "ind/support_resistance.h"
#include "ind/trend.h"
#include "risk/confidence.h"
#include "risk/target.h"
#include "sig/recommendation.h"

#include <string>

template <>
std::string to_str(const Candle& candle) {
  auto& [date, open, high, low, close, volume] = candle;
  return std::format("{} {:.2f} {:.2f} {:.2f} {:.2f} {}",  //
                     date_to_string(date), open, high, low, close, volume);
}

template <>
std::string to_str(const Level& level) {
  return std::format("{:.2f} x{}", level.price, level.touches);
}

template <>
std::string to_str(const Trend& trend) {
  switch (trend) {
    case Trend::StrongUptrend:
      return "strong_uptrend";
    case Trend::Uptrend:
      return "uptrend";
    case Trend::Downtrend:
      return "downtrend";
    case Trend::StrongDowntrend:
      return "strong_downtrend";
    default:
      return "neutral";
  }
}

template <>
std::string to_str(const VolatilityLevel& level) {
  switch (level) {
    case VolatilityLevel::High:
      return "high";
    case VolatilityLevel::Medium:
      return "medium";
    default:
      return "low";
  }
}

template <>
std::string to_str(const ConfidenceLevel& level) {
  switch (level) {
    case ConfidenceLevel::High:
      return "high";
    case ConfidenceLevel::Medium:
      return "medium";
    default:
      return "low";
  }
}

template <>
std::string to_str(const TargetMethod& method) {
  if (method == TargetMethod::WeightedAverage)
    return "weighted_average";
  return "current_price";
}

template <>
std::string to_str(const Action& action) {
  switch (action) {
    case Action::StrongBuy:
      return "STRONG_BUY";
    case Action::Buy:
      return "BUY";
    case Action::Sell:
      return "SELL";
    case Action::StrongSell:
      return "STRONG_SELL";
    default:
      return "HOLD";
  }
}

template <>
Trend from_str(const std::string& str) {
  if (str == "strong_uptrend")
    return Trend::StrongUptrend;
  if (str == "uptrend")
    return Trend::Uptrend;
  if (str == "downtrend")
    return Trend::Downtrend;
  if (str == "strong_downtrend")
    return Trend::StrongDowntrend;
  return Trend::Neutral;
}

template <>
VolatilityLevel from_str(const std::string& str) {
  if (str == "high")
    return VolatilityLevel::High;
  if (str == "medium")
    return VolatilityLevel::Medium;
  return VolatilityLevel::Low;
}

template <>
ConfidenceLevel from_str(const std::string& str) {
  if (str == "high")
    return ConfidenceLevel::High;
  if (str == "medium")
    return ConfidenceLevel::Medium;
  return ConfidenceLevel::Low;
}

template <>
TargetMethod from_str(const std::string& str) {
  if (str == "weighted_average")
    return TargetMethod::WeightedAverage;
  return TargetMethod::CurrentPrice;
}

template <>
Action from_str(const std::string& str) {
  if (str == "STRONG_BUY")
    return Action::StrongBuy;
  if (str == "BUY")
    return Action::Buy;
  if (str == "SELL")
    return Action::Sell;
  if (str == "STRONG_SELL")
    return Action::StrongSell;
  return Action::Hold;
}
