#pragma once

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

struct PriceBar {
  std::string date;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  std::optional<double> volume;

  double range() const { return high - low; }
  double body() const { return std::abs(close - open); }
  double upper_wick() const { return high - std::max(open, close); }
  double lower_wick() const { return std::min(open, close) - low; }
  bool is_up() const { return close >= open; }
};

enum class Order {
  OldestFirst,
  NewestFirst,
};

// Everything past this adapter works on oldest-first series.
inline std::vector<PriceBar> to_oldest_first(std::vector<PriceBar> bars,
                                             Order order) {
  if (order == Order::NewestFirst)
    std::reverse(bars.begin(), bars.end());
  return bars;
}
