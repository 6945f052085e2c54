#pragma once

#include "core/bar.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <optional>
#include <vector>

struct MacdValue {
  double macd = 0.0;
  double signal = 0.0;
  double histogram = 0.0;  // always macd - signal

  MacdValue() = default;
  MacdValue(double macd, double signal)
      : macd{macd}, signal{signal}, histogram{macd - signal} {}
};

struct BollingerBands {
  double upper = 0.0;
  double middle = 0.0;
  double lower = 0.0;
};

struct IndicatorSet {
  std::optional<double> rsi;
  std::optional<double> sma;
  std::optional<double> ema;
  std::optional<MacdValue> macd;
  std::optional<BollingerBands> bollinger;
  std::optional<double> deviation_rate;
};

// EMA over a whole close series, seeded with the SMA of the first `period`
// values. values[i] corresponds to prices[i + period - 1].
struct EMA {
  std::vector<double> values;

 private:
  int period = 0;

 public:
  EMA() noexcept = default;
  EMA(const std::vector<double>& prices, int period) noexcept;

  bool empty() const { return values.empty(); }
  size_t offset() const { return period - 1; }
  double at(size_t idx) const { return values[idx - offset()]; }
  double back() const { return values.back(); }
};

std::vector<double> closes(const std::vector<PriceBar>& bars);

// All of the following expect an oldest-first series and return std::nullopt
// when there are too few bars. Results are rounded to 2 decimals.

std::optional<double> rsi(const std::vector<PriceBar>& bars, int period = 14);
std::optional<double> sma(const std::vector<PriceBar>& bars, int period);
std::optional<double> ema(const std::vector<PriceBar>& bars, int period);

std::optional<MacdValue> macd(const std::vector<PriceBar>& bars,
                              int fast = 12,
                              int slow = 26,
                              int signal = 9);

std::optional<BollingerBands> bollinger(const std::vector<PriceBar>& bars,
                                        int period = 20,
                                        double stddev_mult = 2.0);

std::optional<double> deviation_rate(const std::vector<PriceBar>& bars,
                                     int period = 25);

std::optional<double> week_change_rate(const std::vector<PriceBar>& bars,
                                       int lookback = 4);

DeviationZone classify_deviation(
    double rate,
    const IndicatorConfig& cfg = config.ind_config);

IndicatorSet compute_indicators(const std::vector<PriceBar>& bars,
                                const IndicatorConfig& cfg = config.ind_config);
