#include "ind/candle_patterns.h"

#include <algorithm>

CandlestickPattern::CandlestickPattern(CandleType type) : pattern{type} {
  auto& meta = meta_of(type);
  signal = meta.signal;
  strength = meta.strength;
  description = meta.desc;
  explanation = meta.expl;
}

CandleType candle_type(const PriceBar& bar, const CandleConfig& cfg) {
  auto range = bar.range();
  if (range < cfg.doji_range)
    return CandleType::Doji;

  auto body_ratio = bar.body() / range;
  bool large_body = body_ratio >= cfg.large_body_ratio;
  bool small_body = body_ratio <= cfg.small_body_ratio;

  bool long_upper = bar.upper_wick() / range >= cfg.long_wick_ratio;
  bool long_lower = bar.lower_wick() / range >= cfg.long_wick_ratio;

  if (bar.is_up()) {
    if (large_body && !long_upper && !long_lower)
      return CandleType::BullishStrong;
    if (long_lower && !long_upper)
      return CandleType::BullishHammer;
    if (long_upper && !long_lower)
      return CandleType::BullishShooting;
    if (small_body)
      return CandleType::BullishSmall;
    return CandleType::BullishNormal;
  }

  if (large_body && !long_upper && !long_lower)
    return CandleType::BearishStrong;
  if (long_upper && !long_lower)
    return CandleType::BearishShooting;
  if (long_lower && !long_upper)
    return CandleType::BearishHammer;
  if (small_body)
    return CandleType::BearishSmall;
  return CandleType::BearishNormal;
}

CandlestickPattern classify_candle(const PriceBar& bar,
                                   const CandleConfig& cfg) {
  return CandlestickPattern{candle_type(bar, cfg)};
}

std::vector<CandleSignal> scan_candles(const std::vector<PriceBar>& bars,
                                       const CandleConfig& cfg) {
  std::vector<CandleSignal> res;

  for (auto it = bars.rbegin(); it != bars.rend(); it++) {
    if (res.size() >= cfg.scan_max_signals)
      break;

    auto type = candle_type(*it, cfg);
    auto& meta = meta_of(type);
    if (meta.strength < cfg.scan_min_strength)
      continue;

    res.push_back({it->date, type, meta.signal, it->close, meta.strength});
  }

  std::reverse(res.begin(), res.end());
  return res;
}
