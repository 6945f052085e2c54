#include "helpers.h"
#include "sig/combined_signal.h"

#include <gtest/gtest.h>
#include <algorithm>

using Reasons = std::vector<std::string>;

TEST(CombinedSignal, NothingToScore) {
  auto res = combine_signals(std::nullopt, std::nullopt, std::nullopt);
  EXPECT_EQ(res.signal, Signal::Neutral);
  EXPECT_EQ(res.strength, 0);
  EXPECT_EQ(res.reasons, Reasons{"insufficient data"});

  // a doji, mid RSI and a flat histogram add nothing either
  auto idle =
      combine_signals(CandlestickPattern{CandleType::Doji}, 50.0, 0.0);
  EXPECT_EQ(idle.strength, 0);
  EXPECT_EQ(idle.reasons, Reasons{"insufficient data"});
}

TEST(CombinedSignal, UnanimousBuy) {
  auto res =
      combine_signals(CandlestickPattern{CandleType::BullishStrong}, 25.0, 2.0);
  EXPECT_EQ(res.signal, Signal::Buy);
  EXPECT_EQ(res.strength, 100);
  EXPECT_EQ(res.reasons, (Reasons{"Strong rise", "oversold (RSI)",
                                  "rising momentum (MACD)"}));
}

TEST(CombinedSignal, BuyWithoutReasonText) {
  // leaning RSI and a small positive histogram carry no reason text
  auto res = combine_signals(std::nullopt, 35.0, 0.5);
  EXPECT_EQ(res.signal, Signal::Buy);
  EXPECT_EQ(res.strength, 100);
  EXPECT_TRUE(res.reasons.empty());
}

TEST(CombinedSignal, SellStrengthIsShareOfTheTotal) {
  // sell 80 + 70, buy 40
  auto res =
      combine_signals(CandlestickPattern{CandleType::BearishStrong}, 75.0, 0.5);
  EXPECT_EQ(res.signal, Signal::Sell);
  EXPECT_EQ(res.strength, 79);
  EXPECT_EQ(res.reasons, (Reasons{"Strong fall", "overbought (RSI)"}));
}

TEST(CombinedSignal, FallingMomentumReason) {
  auto res = combine_signals(std::nullopt, 65.0, -1.5);
  EXPECT_EQ(res.signal, Signal::Sell);
  EXPECT_EQ(res.strength, 100);
  EXPECT_EQ(res.reasons, Reasons{"falling momentum (MACD)"});
}

TEST(CombinedSignal, MarginOfFiftyIsStillNeutral) {
  // buy 50, sell 0
  auto res =
      combine_signals(CandlestickPattern{CandleType::BullishSmall}, 50.0, 0.0);
  EXPECT_EQ(res.signal, Signal::Neutral);
  EXPECT_EQ(res.strength, 50);
  EXPECT_EQ(res.reasons, Reasons{"Gradual rise"});
}

TEST(CombinedSignal, MixedSignalsWaitAndSee) {
  // sell 30, buy 40
  auto res = combine_signals(std::nullopt, 65.0, 0.5);
  EXPECT_EQ(res.signal, Signal::Neutral);
  EXPECT_EQ(res.strength, 50);
  EXPECT_EQ(res.reasons, Reasons{"wait and see"});
}

TEST(CombinedSignal, RsiBands) {
  EXPECT_EQ(combine_signals(std::nullopt, 30.0, std::nullopt).reasons,
            Reasons{"oversold (RSI)"});
  EXPECT_EQ(combine_signals(std::nullopt, 70.0, std::nullopt).reasons,
            Reasons{"overbought (RSI)"});

  // lean bands score 30, below the margin on their own
  auto lean = combine_signals(std::nullopt, 40.0, std::nullopt);
  EXPECT_EQ(lean.signal, Signal::Neutral);
  EXPECT_EQ(lean.reasons, Reasons{"wait and see"});
}

TEST(CombinedSignal, CustomMargin) {
  SignalConfig cfg;
  cfg.decision_margin = 20;
  auto res = combine_signals(std::nullopt, 40.0, std::nullopt, cfg);
  EXPECT_EQ(res.signal, Signal::Buy);
  EXPECT_EQ(res.strength, 100);
}

TEST(TechnicalSignal, EmptySeries) {
  auto ts = technical_signal({});
  EXPECT_EQ(ts.score, 0.0);
  EXPECT_EQ(ts.label, TechnicalLabel::Neutral);
  EXPECT_TRUE(ts.reasons.empty());
}

TEST(TechnicalSignal, OverboughtRiseIsASell) {
  // RSI 100 (-1), above SMA (+0.5), flat MACD histogram (-0.5)
  auto ts = technical_signal(series(linear(40)));
  EXPECT_DOUBLE_EQ(ts.score, -1.0);
  EXPECT_EQ(ts.label, TechnicalLabel::Sell);
  ASSERT_EQ(ts.reasons.size(), 3u);
  EXPECT_EQ(ts.reasons[0], "RSI 100.0 overbought");
}

TEST(TechnicalSignal, OversoldFallIsNeutral) {
  auto falling = linear(40);
  std::reverse(falling.begin(), falling.end());

  // RSI 0 (+1), below SMA (-0.5), flat MACD histogram (-0.5)
  auto ts = technical_signal(series(falling));
  EXPECT_DOUBLE_EQ(ts.score, 0.0);
  EXPECT_EQ(ts.label, TechnicalLabel::Neutral);
  EXPECT_EQ(ts.reasons.front(), "RSI 0.0 oversold");
}

TEST(TechnicalSignal, ShortSeriesOnlyUsesRsi) {
  // 20 bars: RSI only, no SMA(25) or MACD
  auto ts = technical_signal(series(linear(20)));
  EXPECT_DOUBLE_EQ(ts.score, -1.0);
  EXPECT_EQ(ts.label, TechnicalLabel::Sell);
  EXPECT_EQ(ts.reasons.size(), 1u);
}
