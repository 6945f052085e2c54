#pragma once

#include <cstddef>
#include <vector>

struct Point {
  double x;
  double y;
};

struct LinearRegression {
  double slope = 0.0;
  double intercept = 0.0;

  LinearRegression() noexcept = default;

  LinearRegression(const std::vector<Point>& vals) noexcept {
    auto n = vals.size();
    if (n < 2)
      return;

    double sum_x = 0, sum_y = 0, sum_x2 = 0, sum_xy = 0;
    for (auto [x, y] : vals) {
      sum_x += x;
      sum_y += y;
      sum_x2 += x * x;
      sum_xy += x * y;
    }

    double denom = n * sum_x2 - sum_x * sum_x;
    if (denom == 0.0)
      return;

    slope = (n * sum_xy - sum_x * sum_y) / denom;
    intercept = (sum_y - slope * sum_x) / n;
  }
};

// Least-squares slope of `ys` against their position (0, 1, 2, ...)
inline double slope(const std::vector<double>& ys) {
  std::vector<Point> pts;
  pts.reserve(ys.size());
  for (size_t i = 0; i < ys.size(); i++)
    pts.push_back({static_cast<double>(i), ys[i]});
  return LinearRegression{pts}.slope;
}

// Slope divided by the mean level, i.e. the fractional change per step
inline double normalized_slope(const std::vector<double>& ys) {
  if (ys.empty())
    return 0.0;
  double sum = 0.0;
  for (auto y : ys)
    sum += y;
  double avg = sum / ys.size();
  return avg == 0.0 ? 0.0 : slope(ys) / avg;
}
