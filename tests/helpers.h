#pragma once

#include "core/bar.h"

#include <chrono>
#include <format>
#include <vector>

// Daily bars on consecutive dates from 2024-01-01. Each bar opens halfway
// between the previous close and its own close, and its wicks reach `pad`
// beyond the body, so peaks and troughs follow the closes.
inline std::vector<PriceBar> series(const std::vector<double>& closes,
                                    double pad = 0.01) {
  using namespace std::chrono;

  std::vector<PriceBar> bars;
  auto day = sys_days{year{2024} / January / 1};
  double prev = closes.empty() ? 0.0 : closes.front();

  for (auto c : closes) {
    double open = (prev + c) / 2;
    bars.push_back(PriceBar{
        .date = std::format("{:%F}", day),
        .open = open,
        .high = std::max(open, c) * (1 + pad),
        .low = std::min(open, c) * (1 - pad),
        .close = c,
    });
    prev = c;
    day += days{1};
  }

  return bars;
}

inline PriceBar ohlc(double open, double high, double low, double close) {
  return PriceBar{
      .date = "2024-01-01",
      .open = open,
      .high = high,
      .low = low,
      .close = close,
  };
}

// 1, 2, ..., n
inline std::vector<double> linear(int n) {
  std::vector<double> res;
  for (int i = 1; i <= n; i++)
    res.push_back(i);
  return res;
}
