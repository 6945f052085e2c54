#include "sig/signal_types.h"

#include <unordered_map>

inline const std::unordered_map<CandleType, CandleMeta> candle_meta = {
    {
        CandleType::Doji,
        {Signal::Neutral, 30, "Wait and see",
         "The open and close are almost the same, so the market has not "
         "made up its mind. Watch for the next move."}  //
    },

    // Bullish
    {
        CandleType::BullishStrong,
        {Signal::Buy, 80, "Strong rise",
         "The price rose a lot. Buyers are in control and the rise is "
         "likely to continue."}  //
    },
    {
        CandleType::BullishHammer,
        {Signal::Buy, 75, "Bottom reversal",
         "The price dipped but buyers pushed it back up before the close. "
         "This is a sign of a rebound."}  //
    },
    {
        CandleType::BullishShooting,
        {Signal::Buy, 60, "Pullback after rise",
         "The price rose, then gave a little back. This may be a chance "
         "to buy on the dip."}  //
    },
    {
        CandleType::BullishSmall,
        {Signal::Buy, 50, "Gradual rise",
         "The price is creeping up. The uptrend may be continuing."}  //
    },
    {
        CandleType::BullishNormal,
        {Signal::Buy, 55, "Rise",
         "The price went up. Buyers have a slight edge."}  //
    },

    // Bearish
    {
        CandleType::BearishStrong,
        {Signal::Sell, 80, "Strong fall",
         "The price fell a lot. Sellers are in control and the fall may "
         "continue."}  //
    },
    {
        CandleType::BearishShooting,
        {Signal::Sell, 75, "Rejected rally",
         "The price rose at first but sellers pushed it back down. This "
         "is a sign of a decline."}  //
    },
    {
        CandleType::BearishHammer,
        {Signal::Sell, 65, "Slip from the high",
         "Buyers supported the price lower down, but it still closed "
         "lower. This is a weak sign."}  //
    },
    {
        CandleType::BearishSmall,
        {Signal::Sell, 50, "Start of a decline",
         "The price slipped a little. This may be the start of a "
         "downtrend, so be careful."}  //
    },
    {
        CandleType::BearishNormal,
        {Signal::Sell, 55, "Fall",
         "The price went down. Sellers have a slight edge."}  //
    },
};

inline const std::unordered_map<ChartPatternType, PatternMeta> pattern_meta = {
    // Buy
    {
        ChartPatternType::InverseHeadAndShoulders,
        {Signal::Buy, Rank::S, 89, "Inverse head and shoulders"}  //
    },
    {
        ChartPatternType::DoubleBottom,
        {Signal::Buy, Rank::S, 88, "Double bottom"}  //
    },
    {
        ChartPatternType::TripleBottom,
        {Signal::Buy, Rank::A, 87, "Triple bottom"}  //
    },
    {
        ChartPatternType::AscendingTriangle,
        {Signal::Buy, Rank::A, 83, "Ascending triangle"}  //
    },
    {
        ChartPatternType::BullFlag,
        {Signal::Buy, Rank::C, 54, "Bull flag"}  //
    },

    // Sell
    {
        ChartPatternType::DoubleTop,
        {Signal::Sell, Rank::B, 73, "Double top"}  //
    },
    {
        ChartPatternType::HeadAndShoulders,
        {Signal::Sell, Rank::S, 89, "Head and shoulders"}  //
    },
    {
        ChartPatternType::DescendingTriangle,
        {Signal::Sell, Rank::S, 87, "Descending triangle"}  //
    },
    {
        ChartPatternType::BearFlag,
        {Signal::Sell, Rank::C, 54, "Bear flag"}  //
    },

    // Neutral
    {
        ChartPatternType::BoxRange,
        {Signal::Neutral, Rank::D, 55, "Box range"}  //
    },
    {
        ChartPatternType::SymmetricalTriangle,
        {Signal::Neutral, Rank::D, 55, "Symmetrical triangle"}  //
    },
};

const CandleMeta& meta_of(CandleType type) {
  return candle_meta.at(type);
}

const PatternMeta& meta_of(ChartPatternType type) {
  return pattern_meta.at(type);
}
