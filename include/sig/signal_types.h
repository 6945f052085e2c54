#pragma once

#include <string>

enum class Signal { Buy, Sell, Neutral };

// Literature-derived reliability tier of a chart formation
enum class Rank { S, A, B, C, D };

enum class CandleType {
  Doji,

  BullishStrong,
  BullishHammer,
  BullishShooting,  // pullback after a rise
  BullishSmall,
  BullishNormal,

  BearishStrong,
  BearishShooting,  // rejected rally
  BearishHammer,    // slipped from the high
  BearishSmall,
  BearishNormal,
};

enum class ChartPatternType {
  InverseHeadAndShoulders,
  DoubleBottom,
  TripleBottom,
  AscendingTriangle,
  BullFlag,

  DoubleTop,
  HeadAndShoulders,
  DescendingTriangle,
  BearFlag,

  BoxRange,
  SymmetricalTriangle,
};

enum class Style { Conservative, Balanced, Aggressive, Default };

// Where the latest close sits relative to its moving average
enum class DeviationZone { Overheated, Oversold, Stable, Normal };

enum class TechnicalLabel { StrongBuy, Buy, Neutral, Sell, StrongSell };

struct CandleMeta {
  Signal signal;
  int strength;
  std::string desc;
  std::string expl;
};

// win_rate is a fixed reference figure from Bulkowski's Encyclopedia of
// Chart Patterns, not something measured on the input.
struct PatternMeta {
  Signal signal;
  Rank rank;
  int win_rate;
  std::string name;
};

const CandleMeta& meta_of(CandleType type);
const PatternMeta& meta_of(ChartPatternType type);
