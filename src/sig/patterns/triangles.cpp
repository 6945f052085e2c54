#include "ind/trendlines.h"
#include "sig/chart_patterns.h"
#include "util/math.h"

#include <cmath>
#include <format>

struct TriangleSides {
  std::vector<double> highs;
  std::vector<double> lows;
  double peak_slope;    // normalized by the mean peak
  double trough_slope;  // normalized by the mean trough
};

inline std::optional<TriangleSides> triangle_sides(const PatternContext& ctx) {
  if (ctx.size() < ctx.cfg.min_formation_bars)
    return std::nullopt;
  if (ctx.peaks().size() < 2 || ctx.troughs().size() < 2)
    return std::nullopt;

  auto highs = ctx.peak_highs();
  auto lows = ctx.trough_lows();
  auto peak_slope = normalized_slope(highs);
  auto trough_slope = normalized_slope(lows);
  return TriangleSides{std::move(highs), std::move(lows), peak_slope,
                       trough_slope};
}

// Flat side on `side`, the opposite side closing in on it
template <Side side>
inline std::optional<TriangleSides> find_right_triangle(
    const PatternContext& ctx) {
  constexpr bool is_bottom = side == Side::Bottom;
  auto& cfg = ctx.cfg;

  auto t = triangle_sides(ctx);
  if (!t)
    return std::nullopt;

  auto flat = is_bottom ? t->trough_slope : t->peak_slope;
  auto moving = is_bottom ? t->peak_slope : t->trough_slope;

  if (std::abs(flat) > cfg.triangle_flat_slope)
    return std::nullopt;

  if (is_bottom ? moving >= -cfg.triangle_trend_slope
                : moving <= cfg.triangle_trend_slope)
    return std::nullopt;

  return t;
}

std::optional<ChartPatternMatch> ascending_triangle(const PatternContext& ctx) {
  auto t = find_right_triangle<Side::Top>(ctx);
  if (!t)
    return std::nullopt;

  double resistance = mean(t->highs);
  bool breakout = ctx.last_close() > resistance;

  auto desc = breakout
                  ? "The price broke through the top of an ascending "
                    "triangle. Upward momentum is building."
                  : "An ascending triangle is forming. Lows keep rising and "
                    "an upside break is possible.";

  auto expl = std::format(
      "In an ascending triangle the highs stay level while the lows rise "
      "step by step. The triangle narrows as buying pressure grows. Once "
      "the ceiling (around {:.2f}) is cleared, the price often jumps.",
      resistance);

  return ChartPatternMatch{ChartPatternType::AscendingTriangle,
                           breakout ? 85 : 70,
                           breakout ? 0.75 : 0.55,
                           desc,
                           expl,
                           ctx.first_extremum(),
                           ctx.last_extremum()};
}

std::optional<ChartPatternMatch> descending_triangle(
    const PatternContext& ctx) {
  auto t = find_right_triangle<Side::Bottom>(ctx);
  if (!t)
    return std::nullopt;

  double support = mean(t->lows);
  bool breakout = ctx.last_close() < support;

  auto desc = breakout
                  ? "The price broke below the floor of a descending "
                    "triangle. Downward momentum is building."
                  : "A descending triangle is forming. Highs keep falling "
                    "and a downside break is possible.";

  auto expl = std::format(
      "In a descending triangle the lows stay level while the highs fall "
      "step by step. It is the mirror of the ascending triangle and shows "
      "selling pressure growing. Once the floor (around {:.2f}) gives way, "
      "the price often drops fast.",
      support);

  return ChartPatternMatch{ChartPatternType::DescendingTriangle,
                           breakout ? 90 : 75,
                           breakout ? 0.82 : 0.60,
                           desc,
                           expl,
                           ctx.first_extremum(),
                           ctx.last_extremum()};
}

std::optional<ChartPatternMatch> symmetrical_triangle(
    const PatternContext& ctx) {
  auto& cfg = ctx.cfg;

  auto t = triangle_sides(ctx);
  if (!t)
    return std::nullopt;

  if (t->peak_slope >= -cfg.symmetrical_slope)
    return std::nullopt;
  if (t->trough_slope <= cfg.symmetrical_slope)
    return std::nullopt;

  double initial = t->highs.front() - t->lows.front();
  double latest = t->highs.back() - t->lows.back();
  double convergence = initial > 0 ? 1 - latest / initial : 0.0;

  auto expl = std::format(
      "In a symmetrical triangle the highs fall and the lows rise, squeezing "
      "into a point. Buyers and sellers are evenly matched until one side "
      "wins: a break upward is a buy sign, a break downward a sell sign. "
      "Convergence: {:.0f}%",
      convergence * 100);

  return ChartPatternMatch{ChartPatternType::SymmetricalTriangle,
                           55,
                           0.52,
                           "A symmetrical triangle is forming. The range is "
                           "narrowing and a big move may come soon.",
                           expl,
                           ctx.first_extremum(),
                           ctx.last_extremum()};
}
