#pragma once

#include "util/times.h"

#include <optional>
#include <string>
#include <vector>

struct Candle {
  LocalTimePoint date;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  long volume = 0;

  std::string day() const { return date_to_string(date); }
  double price() const { return close; }
  LocalTimePoint time() const { return date; }
};

using Candles = std::vector<Candle>;

enum class PriceField { High, Low, Close };

template <PriceField field = PriceField::Close>
std::vector<double> column(const Candles& candles) {
  std::vector<double> out;
  out.reserve(candles.size());
  for (auto& c : candles) {
    if constexpr (field == PriceField::High)
      out.push_back(c.high);
    else if constexpr (field == PriceField::Low)
      out.push_back(c.low);
    else
      out.push_back(c.close);
  }
  return out;
}

// Candles dated within [from, to] (either bound optional), then at most the
// `max_candles` most recent of them; 0 keeps all.
Candles select_window(const Candles& candles,
                      std::optional<LocalTimePoint> from,
                      std::optional<LocalTimePoint> to,
                      size_t max_candles);
