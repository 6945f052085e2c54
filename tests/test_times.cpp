#include "helpers.h"
#include "util/times.h"

#include <gtest/gtest.h>

using namespace std::chrono;

TEST(Times, ParseDate) {
  auto d = parse_date("2024-03-15");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d, sys_days{year{2024} / March / 15});
  EXPECT_EQ(date_to_string(*d), "2024-03-15");

  // time of day is ignored
  EXPECT_EQ(parse_date("2024-03-15 16:00:00"), d);
}

TEST(Times, ParseDateRejectsGarbage) {
  EXPECT_FALSE(parse_date("").has_value());
  EXPECT_FALSE(parse_date("15/03/2024").has_value());
  EXPECT_FALSE(parse_date("2024-02-30").has_value());
  EXPECT_FALSE(parse_date("yesterday!!").has_value());
}

TEST(Times, Freshness) {
  // ten bars, the latest on 2024-01-10
  auto bars = series(linear(10));
  auto as_of = sys_days{year{2024} / January / 15};

  EXPECT_TRUE(is_fresh(bars, as_of, days{5}));
  EXPECT_FALSE(is_fresh(bars, as_of, days{4}));
  EXPECT_TRUE(is_fresh(bars, sys_days{year{2024} / January / 10}, days{0}));

  EXPECT_FALSE(is_fresh({}, as_of, days{5}));

  bars.back().date = "not a date";
  EXPECT_FALSE(is_fresh(bars, as_of, days{5}));
}
