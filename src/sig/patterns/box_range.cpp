#include "sig/chart_patterns.h"
#include "util/math.h"

#include <format>

std::optional<ChartPatternMatch> box_range(const PatternContext& ctx) {
  auto& cfg = ctx.cfg;

  if (ctx.size() < cfg.min_formation_bars)
    return std::nullopt;
  if (ctx.peaks().size() < 2 || ctx.troughs().size() < 2)
    return std::nullopt;

  auto highs = ctx.peak_highs();
  auto lows = ctx.trough_lows();

  double ceiling = mean(highs);
  double floor = mean(lows);
  if (ceiling <= 0 || floor <= 0)
    return std::nullopt;

  // both edges flat
  if (pstdev(highs) / ceiling > cfg.box_max_stddev ||
      pstdev(lows) / floor > cfg.box_max_stddev)
    return std::nullopt;

  double width = (ceiling - floor) / floor;
  if (width < cfg.box_min_range || width > cfg.box_max_range)
    return std::nullopt;

  double position = (ctx.last_close() - floor) / (ceiling - floor);

  auto desc = std::format(
      "The price is moving sideways in a box between {:.2f} and {:.2f}.",
      floor, ceiling);

  auto expl = std::format(
      "A box range is when the price keeps bouncing between a fixed floor "
      "and ceiling. A break above the box tends to start an uptrend, a break "
      "below it a downtrend. Range width: {:.1f}%, current position: {:.0f}% "
      "of the range",
      width * 100, position * 100);

  return ChartPatternMatch{ChartPatternType::BoxRange,
                           55,
                           0.55,
                           desc,
                           expl,
                           ctx.first_extremum(),
                           ctx.last_extremum()};
}
