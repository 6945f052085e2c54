#pragma once

#include <cmath>
#include <numeric>
#include <vector>

constexpr auto round(auto x, int n) {
  auto mult = std::pow(10, n);
  return std::round(x * mult) / mult;
}

inline double mean(const std::vector<double>& vals) {
  if (vals.empty())
    return 0.0;
  return std::accumulate(vals.begin(), vals.end(), 0.0) / vals.size();
}

// population standard deviation
inline double pstdev(const std::vector<double>& vals) {
  if (vals.empty())
    return 0.0;
  auto m = mean(vals);
  double var = 0.0;
  for (auto v : vals)
    var += (v - m) * (v - m);
  return std::sqrt(var / vals.size());
}

// |a - b| relative to their midpoint
inline bool is_similar_price(double a, double b, double tolerance) {
  auto avg = (a + b) / 2;
  return std::abs(a - b) / avg <= tolerance;
}
