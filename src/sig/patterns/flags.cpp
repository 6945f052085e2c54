#include "ind/trendlines.h"
#include "sig/chart_patterns.h"
#include "util/math.h"

#include <algorithm>
#include <format>

struct FlagFormation {
  size_t pole_start;
  double pole_move;  // signed fraction
  double slope;      // normalized slope of the flag closes
  double range;      // flag height relative to its mean close
};

// Side::Bottom is the bull flag on a rising pole, Side::Top the bear flag on
// a falling one
template <Side side>
inline std::optional<FlagFormation> find_flag(const PatternContext& ctx) {
  constexpr bool is_bull = side == Side::Bottom;
  auto& cfg = ctx.cfg;

  auto n = ctx.size();
  if (n < cfg.min_formation_bars)
    return std::nullopt;

  auto pole_end = n / 2;
  auto pole_start = pole_end > cfg.pole_length ? pole_end - cfg.pole_length : 0;

  double start_price = ctx.close(pole_start);
  if (start_price <= 0)
    return std::nullopt;

  double pole_move = (ctx.close(pole_end) - start_price) / start_price;
  if (is_bull ? pole_move < cfg.pole_min_move : pole_move > -cfg.pole_min_move)
    return std::nullopt;

  if (n - pole_end < cfg.flag_min_bars)
    return std::nullopt;

  std::vector<double> flag_closes;
  double hi = ctx.high(pole_end), lo = ctx.low(pole_end);
  for (size_t i = pole_end; i < n; i++) {
    flag_closes.push_back(ctx.close(i));
    hi = std::max(hi, ctx.high(i));
    lo = std::min(lo, ctx.low(i));
  }

  double slope = normalized_slope(flag_closes);
  if (is_bull ? (slope > cfg.flag_with_slope || slope < -cfg.flag_against_slope)
              : (slope < -cfg.flag_with_slope || slope > cfg.flag_against_slope))
    return std::nullopt;

  double avg = mean(flag_closes);
  if (avg <= 0)
    return std::nullopt;

  double range = (hi - lo) / avg;
  if (range > cfg.flag_max_range)
    return std::nullopt;

  return FlagFormation{pole_start, pole_move, slope, range};
}

std::optional<ChartPatternMatch> bull_flag(const PatternContext& ctx) {
  auto f = find_flag<Side::Bottom>(ctx);
  if (!f)
    return std::nullopt;

  auto expl = std::format(
      "A bull flag is a short sideways or slightly falling pause after a "
      "sharp rise (the pole). Traders take profit, then the rise tends to "
      "resume. Pole: +{:.1f}%, flag range: {:.1f}%",
      f->pole_move * 100, f->range * 100);

  return ChartPatternMatch{ChartPatternType::BullFlag,
                           58,
                           0.50,
                           "A bull flag is forming. The price is resting "
                           "after a sharp rise.",
                           expl,
                           f->pole_start,
                           ctx.size() - 1};
}

std::optional<ChartPatternMatch> bear_flag(const PatternContext& ctx) {
  auto f = find_flag<Side::Top>(ctx);
  if (!f)
    return std::nullopt;

  auto expl = std::format(
      "A bear flag is a short sideways or slightly rising pause after a "
      "sharp fall (the pole). A weak rebound like this often gives way to "
      "another leg down. Pole: {:.1f}%, flag range: {:.1f}%",
      f->pole_move * 100, f->range * 100);

  return ChartPatternMatch{ChartPatternType::BearFlag,
                           58,
                           0.50,
                           "A bear flag is forming. The price is pausing "
                           "after a sharp fall.",
                           expl,
                           f->pole_start,
                           ctx.size() - 1};
}
