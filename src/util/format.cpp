#include "util/format.h"
#include "ind/candle_patterns.h"
#include "sig/chart_patterns.h"
#include "sig/combined_signal.h"

#include <string>

template <>
std::string to_str(const std::string& str) {
  return str;
}

template <>
std::string to_str(const Signal& s) {
  switch (s) {
    case Signal::Buy:
      return "buy";
    case Signal::Sell:
      return "sell";
    default:
      return "neutral";
  }
}

template <>
std::string to_str(const Rank& r) {
  switch (r) {
    case Rank::S:
      return "S";
    case Rank::A:
      return "A";
    case Rank::B:
      return "B";
    case Rank::C:
      return "C";
    default:
      return "D";
  }
}

template <>
std::string to_str(const CandleType& type) {
  switch (type) {
    case CandleType::BullishStrong:
      return "bullish_strong";
    case CandleType::BullishHammer:
      return "bullish_hammer";
    case CandleType::BullishShooting:
      return "bullish_shooting";
    case CandleType::BullishSmall:
      return "bullish_small";
    case CandleType::BullishNormal:
      return "bullish_normal";
    case CandleType::BearishStrong:
      return "bearish_strong";
    case CandleType::BearishShooting:
      return "bearish_shooting";
    case CandleType::BearishHammer:
      return "bearish_hammer";
    case CandleType::BearishSmall:
      return "bearish_small";
    case CandleType::BearishNormal:
      return "bearish_normal";
    default:
      return "doji";
  }
}

template <>
std::string to_str(const ChartPatternType& type) {
  switch (type) {
    case ChartPatternType::InverseHeadAndShoulders:
      return "inverse_head_and_shoulders";
    case ChartPatternType::DoubleBottom:
      return "double_bottom";
    case ChartPatternType::TripleBottom:
      return "triple_bottom";
    case ChartPatternType::AscendingTriangle:
      return "ascending_triangle";
    case ChartPatternType::BullFlag:
      return "bull_flag";
    case ChartPatternType::DoubleTop:
      return "double_top";
    case ChartPatternType::HeadAndShoulders:
      return "head_and_shoulders";
    case ChartPatternType::DescendingTriangle:
      return "descending_triangle";
    case ChartPatternType::BearFlag:
      return "bear_flag";
    case ChartPatternType::SymmetricalTriangle:
      return "symmetrical_triangle";
    default:
      return "box_range";
  }
}

template <>
std::string to_str(const Style& style) {
  switch (style) {
    case Style::Conservative:
      return "conservative";
    case Style::Balanced:
      return "balanced";
    case Style::Aggressive:
      return "aggressive";
    default:
      return "default";
  }
}

template <>
std::string to_str(const DeviationZone& zone) {
  if (zone == DeviationZone::Overheated)
    return "overheated";
  if (zone == DeviationZone::Oversold)
    return "oversold";
  if (zone == DeviationZone::Stable)
    return "stable";
  return "normal";
}

template <>
std::string to_str(const TechnicalLabel& label) {
  switch (label) {
    case TechnicalLabel::StrongBuy:
      return "strong_buy";
    case TechnicalLabel::Buy:
      return "buy";
    case TechnicalLabel::Sell:
      return "sell";
    case TechnicalLabel::StrongSell:
      return "strong_sell";
    default:
      return "neutral";
  }
}

template <>
std::string to_str(const CandleSignal& sig) {
  return std::format("{} {} {} {:.2f} ({})", sig.date, to_str(sig.pattern),
                     to_str(sig.signal), sig.price, sig.strength);
}

template <>
std::string to_str(const CombinedSignal& sig) {
  return std::format("{} {} ({})", to_str(sig.signal), sig.strength,
                     join(sig.reasons.begin(), sig.reasons.end(), "; "));
}

template <>
std::string to_str(const ChartPatternMatch& match) {
  auto label = match.signal == Signal::Buy    ? "buy"
               : match.signal == Signal::Sell ? "sell"
                                              : "wait-and-see";

  return std::format(
      "- {}: {} signal (rank {}, reference win rate {}%, strength {}%)\n"
      "  {}",
      match.name(), label, to_str(match.rank), match.win_rate, match.strength,
      match.description);
}

template <>
std::string to_str(const std::vector<ChartPatternMatch>& matches) {
  if (matches.empty())
    return "Chart patterns: none detected";

  return "[Chart pattern analysis] (win rates are reference values from "
         "Bulkowski's research)\n" +
         join(matches.begin(), matches.end(), "\n");
}
