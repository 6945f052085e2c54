#include "sig/analysis.h"

#include <spdlog/spdlog.h>

PatternsReport analyze_candles(const std::vector<PriceBar>& bars,
                               const Config& cfg) {
  if (bars.empty())
    return {std::nullopt, {}, {Signal::Neutral, 0, {"no data"}}};

  auto& ind = cfg.ind_config;

  PatternsReport report;
  report.latest = classify_candle(bars.back(), cfg.candle_config);
  report.signals = scan_candles(bars, cfg.candle_config);

  std::optional<double> hist;
  if (auto m = macd(bars, ind.macd_fast, ind.macd_slow, ind.macd_signal))
    hist = m->histogram;

  report.combined = combine_signals(report.latest, rsi(bars, ind.rsi_period),
                                    hist, cfg.sig_config);
  return report;
}

Analysis analyze(const std::vector<PriceBar>& bars, const Config& cfg) {
  auto& ind = cfg.ind_config;

  Analysis a;
  a.indicators = compute_indicators(bars, ind);
  a.candles = analyze_candles(bars, cfg);
  a.chart_patterns = detect_chart_patterns(bars, cfg.pattern_config);
  a.technical = technical_signal(bars, ind);
  a.week_change_rate = week_change_rate(bars, ind.week_lookback);

  if (a.indicators.deviation_rate)
    a.deviation_zone = classify_deviation(*a.indicators.deviation_rate, ind);

  spdlog::debug("[analysis] {} bars, {} candle signals, {} chart patterns",
                bars.size(), a.candles.signals.size(),
                a.chart_patterns.size());
  return a;
}
