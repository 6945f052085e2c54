#pragma once

#include "core/bar.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <string>
#include <vector>

struct CandlestickPattern {
  CandleType pattern = CandleType::Doji;
  Signal signal = Signal::Neutral;
  int strength = 0;
  std::string description;
  std::string explanation;  // plain-language text for non-expert readers

  CandlestickPattern() = default;
  CandlestickPattern(CandleType type);
};

// One notable bar found while scanning a series
struct CandleSignal {
  std::string date;
  CandleType pattern = CandleType::Doji;
  Signal signal = Signal::Neutral;
  double price = 0.0;
  int strength = 0;
};

CandleType candle_type(const PriceBar& bar,
                       const CandleConfig& cfg = config.candle_config);

CandlestickPattern classify_candle(
    const PriceBar& bar,
    const CandleConfig& cfg = config.candle_config);

// Walks back from the latest bar collecting bars with strength of at least
// cfg.scan_min_strength, up to cfg.scan_max_signals. Returned oldest-first.
std::vector<CandleSignal> scan_candles(
    const std::vector<PriceBar>& bars,
    const CandleConfig& cfg = config.candle_config);
