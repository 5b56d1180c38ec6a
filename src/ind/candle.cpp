#include "ind/candle.h"

#include <algorithm>

Candles select_window(const Candles& candles,
                      std::optional<LocalTimePoint> from,
                      std::optional<LocalTimePoint> to,
                      size_t max_candles) {
  Candles out;
  out.reserve(candles.size());
  std::copy_if(candles.begin(), candles.end(), std::back_inserter(out),
               [&](const Candle& c) {
                 return (!from || c.time() >= *from) && (!to || c.time() <= *to);
               });

  if (max_candles != 0 && out.size() > max_candles)
    out.erase(out.begin(), out.end() - max_candles);

  return out;
}
