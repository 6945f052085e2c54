#include "core/serialization.h"
#include "helpers.h"
#include "sig/analysis.h"

#include <gtest/gtest.h>

inline const std::vector<double> w_bottom = {
    110, 108, 105, 102, 100, 103, 106, 109, 112,
    110, 107, 104, 101, 103, 106, 109, 113, 116,
};

TEST(Adapter, NewestFirstIsReversed) {
  auto bars = series({1, 2, 3});
  std::vector<PriceBar> newest{bars.rbegin(), bars.rend()};

  auto res = to_oldest_first(newest, Order::NewestFirst);
  ASSERT_EQ(res.size(), 3u);
  EXPECT_EQ(res.front().close, 1.0);
  EXPECT_EQ(res.back().close, 3.0);

  EXPECT_EQ(to_oldest_first(bars, Order::OldestFirst).back().close, 3.0);
}

TEST(Analysis, CandlesOfNothing) {
  auto report = analyze_candles({});
  EXPECT_FALSE(report.latest.has_value());
  EXPECT_TRUE(report.signals.empty());
  EXPECT_EQ(report.combined.signal, Signal::Neutral);
  EXPECT_EQ(report.combined.strength, 0);
  EXPECT_EQ(report.combined.reasons, std::vector<std::string>{"no data"});
}

TEST(Analysis, CandlesUseTheLatestBar) {
  auto bars = series(w_bottom);
  auto report = analyze_candles(bars);

  ASSERT_TRUE(report.latest.has_value());
  EXPECT_EQ(report.latest->pattern, candle_type(bars.back()));
  for (size_t i = 1; i < report.signals.size(); i++)
    EXPECT_LT(report.signals[i - 1].date, report.signals[i].date);
}

TEST(Analysis, FullRun) {
  auto bars = series(w_bottom);
  auto a = analyze(bars);

  EXPECT_TRUE(a.indicators.rsi.has_value());
  EXPECT_FALSE(a.indicators.macd.has_value());
  EXPECT_FALSE(a.deviation_zone.has_value());

  ASSERT_EQ(a.chart_patterns.size(), 1u);
  EXPECT_EQ(a.chart_patterns[0].pattern, ChartPatternType::DoubleBottom);

  // 116 against 103 four bars earlier
  ASSERT_TRUE(a.week_change_rate.has_value());
  EXPECT_NEAR(*a.week_change_rate, 12.62, 1e-9);
}

TEST(Analysis, DeviationZoneFollowsTheRate) {
  auto a = analyze(series(linear(40)));
  ASSERT_TRUE(a.indicators.deviation_rate.has_value());
  ASSERT_TRUE(a.deviation_zone.has_value());
  EXPECT_EQ(*a.deviation_zone, DeviationZone::Overheated);
}

TEST(Serialization, ReadBars) {
  auto bars = read_bars_json(R"([
    {"date": "2024-01-02", "open": 10, "high": 11, "low": 9.5, "close": 10.5,
     "volume": 1200, "adjClose": 10.4},
    {"date": "2024-01-03", "open": 10.5, "high": 12, "low": 10, "close": 11.8}
  ])");

  ASSERT_TRUE(bars.has_value());
  ASSERT_EQ(bars->size(), 2u);
  EXPECT_EQ((*bars)[0].date, "2024-01-02");
  EXPECT_EQ((*bars)[0].volume, 1200.0);
  EXPECT_DOUBLE_EQ((*bars)[1].close, 11.8);
  EXPECT_FALSE((*bars)[1].volume.has_value());

  EXPECT_FALSE(read_bars_json("[{\"date\": ").has_value());
}

TEST(Serialization, ReportKeys) {
  Report report;
  report.analysis = analyze(series(w_bottom));
  report.style = Style::Balanced;
  report.safety.is_dangerous = true;

  auto json = to_json(report);
  EXPECT_NE(json.find(R"("chartPatterns":[{"pattern":"double_bottom")"),
            std::string::npos);
  EXPECT_NE(json.find(R"("referenceWinRate":88)"), std::string::npos);
  EXPECT_NE(json.find(R"("startIndex":4)"), std::string::npos);
  EXPECT_NE(json.find(R"("style":"balanced")"), std::string::npos);
  EXPECT_NE(json.find(R"("isDangerous":true)"), std::string::npos);
  EXPECT_EQ(json.find("\"fresh\""), std::string::npos);
}

TEST(Analysis, RepeatedRunsGiveTheSameReport) {
  auto bars = series(w_bottom);

  Report first, second;
  first.analysis = analyze(bars);
  second.analysis = analyze(bars);

  EXPECT_EQ(to_json(first), to_json(second));
  EXPECT_EQ(to_json(first, true), to_json(second, true));
}
