#include "core/serialization.h"

#include <spdlog/spdlog.h>
#include <glaze/glaze.hpp>

template <>
struct glz::meta<Signal> {
  using enum Signal;
  static constexpr auto value = enumerate("buy", Buy,  //
                                          "sell", Sell,
                                          "neutral", Neutral);
};

template <>
struct glz::meta<Rank> {
  using enum Rank;
  static constexpr auto value = enumerate("S", S, "A", A, "B", B, "C", C,  //
                                          "D", D);
};

template <>
struct glz::meta<CandleType> {
  using enum CandleType;
  static constexpr auto value = enumerate(  //
      "doji", Doji,
      "bullish_strong", BullishStrong,
      "bullish_hammer", BullishHammer,
      "bullish_shooting", BullishShooting,
      "bullish_small", BullishSmall,
      "bullish_normal", BullishNormal,
      "bearish_strong", BearishStrong,
      "bearish_shooting", BearishShooting,
      "bearish_hammer", BearishHammer,
      "bearish_small", BearishSmall,
      "bearish_normal", BearishNormal  //
  );
};

template <>
struct glz::meta<ChartPatternType> {
  using enum ChartPatternType;
  static constexpr auto value = enumerate(  //
      "inverse_head_and_shoulders", InverseHeadAndShoulders,
      "double_bottom", DoubleBottom,
      "triple_bottom", TripleBottom,
      "ascending_triangle", AscendingTriangle,
      "bull_flag", BullFlag,
      "double_top", DoubleTop,
      "head_and_shoulders", HeadAndShoulders,
      "descending_triangle", DescendingTriangle,
      "bear_flag", BearFlag,
      "box_range", BoxRange,
      "symmetrical_triangle", SymmetricalTriangle  //
  );
};

template <>
struct glz::meta<Style> {
  using enum Style;
  static constexpr auto value = enumerate("conservative", Conservative,
                                          "balanced", Balanced,
                                          "aggressive", Aggressive,
                                          "default", Default);
};

template <>
struct glz::meta<DeviationZone> {
  using enum DeviationZone;
  static constexpr auto value = enumerate("overheated", Overheated,
                                          "oversold", Oversold,
                                          "stable", Stable,
                                          "normal", Normal);
};

template <>
struct glz::meta<TechnicalLabel> {
  using enum TechnicalLabel;
  static constexpr auto value = enumerate("strong_buy", StrongBuy,
                                          "buy", Buy,
                                          "neutral", Neutral,
                                          "sell", Sell,
                                          "strong_sell", StrongSell);
};

template <>
struct glz::meta<PriceBar> {
  using T = PriceBar;
  static constexpr auto value = object(  //
      "date", &T::date,
      "open", &T::open,
      "high", &T::high,
      "low", &T::low,
      "close", &T::close,
      "volume", &T::volume  //
  );
};

template <>
struct glz::meta<MacdValue> {
  using T = MacdValue;
  static constexpr auto value = object(  //
      "macd", &T::macd,
      "signal", &T::signal,
      "histogram", &T::histogram  //
  );
};

template <>
struct glz::meta<BollingerBands> {
  using T = BollingerBands;
  static constexpr auto value = object(  //
      "upper", &T::upper,
      "middle", &T::middle,
      "lower", &T::lower  //
  );
};

template <>
struct glz::meta<IndicatorSet> {
  using T = IndicatorSet;
  static constexpr auto value = object(  //
      "rsi", &T::rsi,
      "sma", &T::sma,
      "ema", &T::ema,
      "macd", &T::macd,
      "bollinger", &T::bollinger,
      "deviationRate", &T::deviation_rate  //
  );
};

template <>
struct glz::meta<CandlestickPattern> {
  using T = CandlestickPattern;
  static constexpr auto value = object(  //
      "pattern", &T::pattern,
      "signal", &T::signal,
      "strength", &T::strength,
      "description", &T::description,
      "explanation", &T::explanation  //
  );
};

template <>
struct glz::meta<CandleSignal> {
  using T = CandleSignal;
  static constexpr auto value = object(  //
      "date", &T::date,
      "pattern", &T::pattern,
      "signal", &T::signal,
      "price", &T::price,
      "strength", &T::strength  //
  );
};

template <>
struct glz::meta<CombinedSignal> {
  using T = CombinedSignal;
  static constexpr auto value = object(  //
      "signal", &T::signal,
      "strength", &T::strength,
      "reasons", &T::reasons  //
  );
};

template <>
struct glz::meta<PatternsReport> {
  using T = PatternsReport;
  static constexpr auto value = object(  //
      "latest", &T::latest,
      "signals", &T::signals,
      "combined", &T::combined  //
  );
};

template <>
struct glz::meta<ChartPatternMatch> {
  using T = ChartPatternMatch;
  static constexpr auto value = object(  //
      "pattern", &T::pattern,
      "signal", &T::signal,
      "rank", &T::rank,
      "referenceWinRate", &T::win_rate,
      "strength", &T::strength,
      "confidence", &T::confidence,
      "description", &T::description,
      "explanation", &T::explanation,
      "startIndex", &T::start_idx,
      "endIndex", &T::end_idx  //
  );
};

template <>
struct glz::meta<TechnicalSignal> {
  using T = TechnicalSignal;
  static constexpr auto value = object(  //
      "score", &T::score,
      "label", &T::label,
      "reasons", &T::reasons  //
  );
};

template <>
struct glz::meta<Analysis> {
  using T = Analysis;
  static constexpr auto value = object(  //
      "indicators", &T::indicators,
      "candles", &T::candles,
      "chartPatterns", &T::chart_patterns,
      "technical", &T::technical,
      "weekChangeRate", &T::week_change_rate,
      "deviationZone", &T::deviation_zone  //
  );
};

template <>
struct glz::meta<SafetyFlags> {
  using T = SafetyFlags;
  static constexpr auto value = object(  //
      "isSurge", &T::is_surge,
      "isDangerous", &T::is_dangerous,
      "isOverheated", &T::is_overheated,
      "isInDecline", &T::is_in_decline  //
  );
};

template <>
struct glz::meta<Report> {
  using T = Report;
  static constexpr auto value = object(  //
      "analysis", &T::analysis,
      "style", &T::style,
      "safety", &T::safety,
      "fresh", &T::fresh  //
  );
};

std::optional<std::vector<PriceBar>> read_bars_json(const std::string& str) {
  constexpr auto opts = glz::opts{
      .error_on_unknown_keys = false,
  };

  std::vector<PriceBar> bars;
  auto ec = glz::read<opts>(bars, str);
  if (ec) {
    spdlog::error("[bars] json error: {}", glz::format_error(ec, str));
    return std::nullopt;
  }

  return bars;
}

std::optional<std::vector<PriceBar>> read_bars_file(const std::string& path) {
  constexpr auto opts = glz::opts{
      .error_on_unknown_keys = false,
  };

  std::vector<PriceBar> bars;
  auto ec = glz::read_file_json<opts>(bars, path, std::string{});
  if (ec) {
    spdlog::error("[bars] {} error {}", path, glz::format_error(ec));
    return std::nullopt;
  }

  return bars;
}

inline std::string write_json(const auto& value, bool pretty) {
  std::string buffer;
  auto ec = pretty ? glz::write<glz::opts{.prettify = true}>(value, buffer)
                   : glz::write<glz::opts{}>(value, buffer);
  if (ec)
    spdlog::error("[json] write error: {}", glz::format_error(ec));
  return buffer;
}

std::string to_json(const Report& report, bool pretty) {
  return write_json(report, pretty);
}
