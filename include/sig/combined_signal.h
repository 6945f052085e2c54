#pragma once

#include "core/bar.h"
#include "ind/candle_patterns.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <optional>
#include <string>
#include <vector>

struct CombinedSignal {
  Signal signal = Signal::Neutral;
  int strength = 0;
  std::vector<std::string> reasons;
};

// Scores the latest candlestick, RSI and MACD histogram into one direction.
// Every input may be absent.
CombinedSignal combine_signals(
    const std::optional<CandlestickPattern>& candle,
    std::optional<double> rsi,
    std::optional<double> histogram,
    const SignalConfig& cfg = config.sig_config);

struct TechnicalSignal {
  double score = 0.0;
  TechnicalLabel label = TechnicalLabel::Neutral;
  std::vector<std::string> reasons;
};

// Coarse RSI / SMA / MACD vote over an oldest-first series
TechnicalSignal technical_signal(
    const std::vector<PriceBar>& bars,
    const IndicatorConfig& cfg = config.ind_config);
