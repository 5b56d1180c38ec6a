#pragma once

#include <cmath>
#include <cstddef>
#include <iterator>
#include <numeric>
#include <vector>

inline double mean(auto begin, auto end) {
  auto n = std::distance(begin, end);
  if (n <= 0)
    return 0.0;
  return std::accumulate(begin, end, 0.0) / n;
}

// Standard deviation around the mean; ddof = 0 for population, 1 for sample.
inline double stddev(auto begin, auto end, size_t ddof = 0) {
  auto n = static_cast<size_t>(std::distance(begin, end));
  if (n <= ddof)
    return 0.0;

  double mu = mean(begin, end);
  double sq = 0.0;
  for (auto it = begin; it != end; it++)
    sq += (*it - mu) * (*it - mu);
  return std::sqrt(sq / (n - ddof));
}

// Quotient that resolves to 0 instead of inf/NaN on a zero denominator.
constexpr double safe_div(double num, double den) {
  return den == 0.0 ? 0.0 : num / den;
}
