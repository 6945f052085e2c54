#include "sig/combined_signal.h"
#include "ind/indicators.h"
#include "util/math.h"

#include <algorithm>
#include <format>

struct Scores {
  double buy = 0.0;
  double sell = 0.0;
  std::vector<std::string> reasons;

  void add(Signal sig, double score) {
    if (sig == Signal::Buy)
      buy += score;
    else if (sig == Signal::Sell)
      sell += score;
  }

  double total() const { return buy + sell; }
  double diff() const { return buy - sell; }
};

CombinedSignal combine_signals(const std::optional<CandlestickPattern>& candle,
                               std::optional<double> rsi,
                               std::optional<double> histogram,
                               const SignalConfig& cfg) {
  Scores scores;

  if (candle && candle->signal != Signal::Neutral) {
    scores.add(candle->signal, candle->strength);
    scores.reasons.push_back(candle->description);
  }

  if (rsi) {
    if (*rsi <= cfg.rsi_oversold) {
      scores.add(Signal::Buy, cfg.rsi_extreme_score);
      scores.reasons.push_back("oversold (RSI)");
    } else if (*rsi >= cfg.rsi_overbought) {
      scores.add(Signal::Sell, cfg.rsi_extreme_score);
      scores.reasons.push_back("overbought (RSI)");
    } else if (*rsi <= cfg.rsi_lean_buy) {
      scores.add(Signal::Buy, cfg.rsi_lean_score);
    } else if (*rsi >= cfg.rsi_lean_sell) {
      scores.add(Signal::Sell, cfg.rsi_lean_score);
    }
  }

  if (histogram) {
    if (*histogram > 0) {
      scores.add(Signal::Buy, cfg.macd_score);
      if (*histogram > cfg.macd_reason_threshold)
        scores.reasons.push_back("rising momentum (MACD)");
    } else if (*histogram < 0) {
      scores.add(Signal::Sell, cfg.macd_score);
      if (*histogram < -cfg.macd_reason_threshold)
        scores.reasons.push_back("falling momentum (MACD)");
    }
  }

  auto total = scores.total();
  if (total == 0)
    return {Signal::Neutral, 0, {"insufficient data"}};

  auto pct = [total](double score) {
    return std::min(100, static_cast<int>(std::round(score / total * 100)));
  };

  auto diff = scores.diff();
  if (diff > cfg.decision_margin)
    return {Signal::Buy, pct(scores.buy), std::move(scores.reasons)};
  if (diff < -cfg.decision_margin)
    return {Signal::Sell, pct(scores.sell), std::move(scores.reasons)};

  if (scores.reasons.empty())
    scores.reasons.push_back("wait and see");
  return {Signal::Neutral, cfg.neutral_strength, std::move(scores.reasons)};
}

TechnicalSignal technical_signal(const std::vector<PriceBar>& bars,
                                 const IndicatorConfig& cfg) {
  TechnicalSignal ts;
  if (bars.empty())
    return ts;

  double score = 0.0;
  auto price = bars.back().close;

  if (auto r = rsi(bars, cfg.rsi_period)) {
    if (*r < cfg.rsi_oversold) {
      score += 1;
      ts.reasons.push_back(std::format("RSI {:.1f} oversold", *r));
    } else if (*r > cfg.rsi_overbought) {
      score -= 1;
      ts.reasons.push_back(std::format("RSI {:.1f} overbought", *r));
    }
  }

  if (auto ma = sma(bars, cfg.sma_period)) {
    if (price > *ma) {
      score += 0.5;
      ts.reasons.push_back(
          std::format("above the {}-day moving average", cfg.sma_period));
    } else {
      score -= 0.5;
      ts.reasons.push_back(
          std::format("below the {}-day moving average", cfg.sma_period));
    }
  }

  if (auto m = macd(bars, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal)) {
    if (m->histogram > 0) {
      score += 0.5;
      ts.reasons.push_back("MACD turning up");
    } else {
      score -= 0.5;
      ts.reasons.push_back("MACD turning down");
    }
  }

  ts.score = round(score, 2);
  ts.label = score >= cfg.strong_score    ? TechnicalLabel::StrongBuy
             : score >= cfg.weak_score    ? TechnicalLabel::Buy
             : score <= -cfg.strong_score ? TechnicalLabel::StrongSell
             : score <= -cfg.weak_score   ? TechnicalLabel::Sell
                                          : TechnicalLabel::Neutral;
  return ts;
}
