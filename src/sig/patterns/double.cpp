#include "sig/chart_patterns.h"
#include "util/math.h"

#include <algorithm>
#include <format>

struct DoubleFormation {
  size_t first;
  size_t second;
  double neckline;
  double extreme;  // lowest bottom / highest top
  bool breakout;
};

template <Side side>
inline std::optional<DoubleFormation> find_double(const PatternContext& ctx) {
  constexpr bool is_bottom = side == Side::Bottom;
  auto& cfg = ctx.cfg;

  if (ctx.size() < cfg.min_bars)
    return std::nullopt;

  auto& anchors = is_bottom ? ctx.troughs() : ctx.peaks();
  auto& others = is_bottom ? ctx.peaks() : ctx.troughs();
  if (anchors.size() < 2 || others.empty())
    return std::nullopt;

  auto val = [&ctx](size_t i) { return is_bottom ? ctx.low(i) : ctx.high(i); };

  for (size_t i = 0; i + 1 < anchors.size(); i++) {
    auto first = anchors[i];
    auto second = anchors[i + 1];

    if (second - first < cfg.double_min_separation)
      continue;
    if (!is_similar_price(val(first), val(second), cfg.double_tolerance))
      continue;

    auto middle = is_bottom ? ctx.peaks_between(first, second)
                            : ctx.troughs_between(first, second);
    if (middle.empty())
      continue;

    double neckline = is_bottom ? ctx.high(middle[0]) : ctx.low(middle[0]);
    for (auto m : middle)
      neckline = is_bottom ? std::max(neckline, ctx.high(m))
                           : std::min(neckline, ctx.low(m));

    double extreme = is_bottom ? std::min(val(first), val(second))
                               : std::max(val(first), val(second));

    bool breakout = is_bottom ? ctx.last_close() > neckline
                              : ctx.last_close() < neckline;

    return DoubleFormation{first, second, neckline, extreme, breakout};
  }

  return std::nullopt;
}

std::optional<ChartPatternMatch> double_bottom(const PatternContext& ctx) {
  auto f = find_double<Side::Bottom>(ctx);
  if (!f)
    return std::nullopt;

  double height = (f->neckline - f->extreme) / f->extreme;

  auto desc =
      f->breakout
          ? "The double bottom is complete. A W-shaped bottom points to a "
            "turn upward."
          : "A double bottom is forming. The price found a floor twice at "
            "the same level and may rebound.";

  auto expl = std::format(
      "A double bottom is when the price bottoms out twice at about the same "
      "level, drawing a W. It shows many buyers step in at that price. Once "
      "the neckline (the high in between, {:.2f}) is cleared, a real rise "
      "often starts. Pattern height: {:.1f}%",
      f->neckline, height * 100);

  return ChartPatternMatch{ChartPatternType::DoubleBottom,
                           f->breakout ? 92 : 78,
                           f->breakout ? 0.82 : 0.62,
                           desc,
                           expl,
                           f->first,
                           f->second};
}

std::optional<ChartPatternMatch> double_top(const PatternContext& ctx) {
  auto f = find_double<Side::Top>(ctx);
  if (!f)
    return std::nullopt;

  double height = (f->extreme - f->neckline) / f->extreme;

  auto desc =
      f->breakout
          ? "The double top is complete. A decline is starting from an "
            "M-shaped top."
          : "A double top is forming. The price was turned back twice at "
            "the same high, so upside looks heavy.";

  auto expl = std::format(
      "A double top is when the price peaks twice at about the same level, "
      "drawing an M. It shows many sellers wait at that price. Once the "
      "neckline (the low in between, {:.2f}) breaks, the fall tends to "
      "speed up. Pattern height: {:.1f}%",
      f->neckline, height * 100);

  return ChartPatternMatch{ChartPatternType::DoubleTop,
                           f->breakout ? 78 : 65,
                           f->breakout ? 0.70 : 0.55,
                           desc,
                           expl,
                           f->first,
                           f->second};
}
