#include "sig/chart_patterns.h"
#include "util/math.h"

#include <algorithm>
#include <format>

std::optional<ChartPatternMatch> triple_bottom(const PatternContext& ctx) {
  auto& cfg = ctx.cfg;
  if (ctx.size() < cfg.min_triple_bars)
    return std::nullopt;

  auto& troughs = ctx.troughs();
  if (troughs.size() < 3 || ctx.peaks().size() < 2)
    return std::nullopt;

  auto tol = cfg.triple_tolerance;

  for (size_t i = 0; i + 2 < troughs.size(); i++) {
    auto t1 = troughs[i], t2 = troughs[i + 1], t3 = troughs[i + 2];
    auto low1 = ctx.low(t1), low2 = ctx.low(t2), low3 = ctx.low(t3);

    if (!is_similar_price(low1, low2, tol) ||
        !is_similar_price(low2, low3, tol) ||
        !is_similar_price(low1, low3, tol))
      continue;

    auto middle = ctx.peaks_between(t1, t3);
    if (middle.size() < 2)
      continue;

    double neckline = ctx.high(middle[0]);
    for (auto m : middle)
      neckline = std::max(neckline, ctx.high(m));

    double bottom = std::min({low1, low2, low3});
    bool breakout = ctx.last_close() > neckline;

    auto desc =
        breakout ? "The triple bottom is complete. The price bounced off the "
                   "same floor three times, a strong turn to buying."
                 : "A triple bottom is forming. Three lows at the same level "
                   "show very strong support.";

    auto expl = std::format(
        "A triple bottom touches the same price zone three times. It is a "
        "stronger version of the double bottom's message that the price "
        "will not go lower. Bottom: around {:.2f}, neckline: {:.2f}",
        bottom, neckline);

    return ChartPatternMatch{ChartPatternType::TripleBottom,
                             breakout ? 88 : 72,
                             breakout ? 0.78 : 0.58,
                             desc,
                             expl,
                             t1,
                             t3};
  }

  return std::nullopt;
}
