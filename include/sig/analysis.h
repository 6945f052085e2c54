#pragma once

#include "ind/candle_patterns.h"
#include "ind/indicators.h"
#include "sig/chart_patterns.h"
#include "sig/combined_signal.h"

#include <optional>
#include <vector>

struct PatternsReport {
  std::optional<CandlestickPattern> latest;
  std::vector<CandleSignal> signals;  // oldest-first
  CombinedSignal combined;
};

PatternsReport analyze_candles(const std::vector<PriceBar>& bars,
                               const Config& cfg = config);

struct Analysis {
  IndicatorSet indicators;
  PatternsReport candles;
  std::vector<ChartPatternMatch> chart_patterns;
  TechnicalSignal technical;
  std::optional<double> week_change_rate;
  std::optional<DeviationZone> deviation_zone;
};

// Every stage over one oldest-first series
Analysis analyze(const std::vector<PriceBar>& bars, const Config& cfg = config);
