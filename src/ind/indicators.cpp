#include "ind/indicators.h"
#include "util/math.h"

#include <numeric>

EMA::EMA(const std::vector<double>& prices, int period) noexcept
    : period(period) {
  if (period <= 0 || prices.size() < static_cast<size_t>(period))
    return;

  values.reserve(prices.size() - period + 1);

  double sma = 0;
  for (int i = 0; i < period; i++)
    sma += prices[i];
  values.push_back(sma / period);

  auto alpha = 2.0 / (period + 1);
  for (size_t i = period; i < prices.size(); i++) {
    auto last = values.back();
    values.push_back((prices[i] - last) * alpha + last);
  }
}

std::vector<double> closes(const std::vector<PriceBar>& bars) {
  std::vector<double> res;
  res.reserve(bars.size());
  for (auto& bar : bars)
    res.push_back(bar.close);
  return res;
}

inline std::optional<double> raw_sma(const std::vector<PriceBar>& bars,
                                     int period) {
  if (period <= 0 || bars.size() < static_cast<size_t>(period))
    return std::nullopt;

  double sum = 0.0;
  for (size_t i = bars.size() - period; i < bars.size(); i++)
    sum += bars[i].close;
  return sum / period;
}

std::optional<double> rsi(const std::vector<PriceBar>& bars, int period) {
  if (period <= 0 || bars.size() < static_cast<size_t>(period + 1))
    return std::nullopt;

  double gain = 0.0, loss = 0.0;
  for (size_t i = bars.size() - period; i < bars.size(); i++) {
    double change = bars[i].close - bars[i - 1].close;
    if (change > 0)
      gain += change;
    else
      loss -= change;
  }

  double avg_gain = gain / period;
  double avg_loss = loss / period;

  if (avg_loss == 0.0)
    return 100.0;

  double rs = avg_gain / avg_loss;
  return round(100.0 - 100.0 / (1.0 + rs), 2);
}

std::optional<double> sma(const std::vector<PriceBar>& bars, int period) {
  auto res = raw_sma(bars, period);
  if (!res)
    return std::nullopt;
  return round(*res, 2);
}

std::optional<double> ema(const std::vector<PriceBar>& bars, int period) {
  EMA series{closes(bars), period};
  if (series.empty())
    return std::nullopt;
  return round(series.back(), 2);
}

std::optional<MacdValue> macd(const std::vector<PriceBar>& bars,
                              int fast,
                              int slow,
                              int signal) {
  if (fast <= 0 || slow <= fast || signal <= 0)
    return std::nullopt;
  if (bars.size() < static_cast<size_t>(slow))
    return std::nullopt;

  auto prices = closes(bars);
  EMA fast_ema{prices, fast};
  EMA slow_ema{prices, slow};

  // MACD history from the first bar where both EMAs are seeded
  std::vector<double> macd_line;
  for (size_t i = slow_ema.offset(); i < prices.size(); i++)
    macd_line.push_back(fast_ema.at(i) - slow_ema.at(i));

  double signal_val;
  EMA signal_ema{macd_line, signal};
  if (!signal_ema.empty())
    signal_val = signal_ema.back();
  else
    signal_val = std::accumulate(macd_line.begin(), macd_line.end(), 0.0) /
                 macd_line.size();

  return MacdValue{round(macd_line.back(), 2), round(signal_val, 2)};
}

std::optional<BollingerBands> bollinger(const std::vector<PriceBar>& bars,
                                        int period,
                                        double stddev_mult) {
  auto middle = raw_sma(bars, period);
  if (!middle)
    return std::nullopt;

  std::vector<double> window;
  for (size_t i = bars.size() - period; i < bars.size(); i++)
    window.push_back(bars[i].close);
  double sd = pstdev(window);

  return BollingerBands{
      .upper = round(*middle + stddev_mult * sd, 2),
      .middle = round(*middle, 2),
      .lower = round(*middle - stddev_mult * sd, 2),
  };
}

std::optional<double> deviation_rate(const std::vector<PriceBar>& bars,
                                     int period) {
  auto avg = raw_sma(bars, period);
  if (!avg || *avg == 0.0)
    return std::nullopt;
  return round((bars.back().close - *avg) / *avg * 100, 2);
}

std::optional<double> week_change_rate(const std::vector<PriceBar>& bars,
                                       int lookback) {
  if (lookback <= 0 || bars.size() < static_cast<size_t>(lookback + 1))
    return std::nullopt;

  double base = bars[bars.size() - 1 - lookback].close;
  if (base == 0.0)
    return std::nullopt;
  return round((bars.back().close - base) / base * 100, 2);
}

DeviationZone classify_deviation(double rate, const IndicatorConfig& cfg) {
  if (rate >= cfg.deviation_upper)
    return DeviationZone::Overheated;
  if (rate <= cfg.deviation_lower)
    return DeviationZone::Oversold;
  if (std::abs(rate) <= cfg.deviation_stable)
    return DeviationZone::Stable;
  return DeviationZone::Normal;
}

IndicatorSet compute_indicators(const std::vector<PriceBar>& bars,
                                const IndicatorConfig& cfg) {
  return {
      .rsi = rsi(bars, cfg.rsi_period),
      .sma = sma(bars, cfg.sma_period),
      .ema = ema(bars, cfg.ema_period),
      .macd = macd(bars, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal),
      .bollinger = bollinger(bars, cfg.bb_period, cfg.bb_stddev),
      .deviation_rate = deviation_rate(bars, cfg.deviation_period),
  };
}
