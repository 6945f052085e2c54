#include "sig/chart_patterns.h"
#include "util/math.h"

#include <algorithm>
#include <format>

struct HeadShoulders {
  size_t left;
  size_t head;
  size_t right;
  double neckline;
  bool breakout;
};

// Three consecutive extrema on `side` where the middle one goes furthest and
// the outer two are level with each other.
template <Side side>
inline std::optional<HeadShoulders> find_head_shoulders(
    const PatternContext& ctx) {
  constexpr bool is_bottom = side == Side::Bottom;
  auto& cfg = ctx.cfg;

  if (ctx.size() < cfg.min_formation_bars)
    return std::nullopt;

  auto& anchors = is_bottom ? ctx.troughs() : ctx.peaks();
  auto& others = is_bottom ? ctx.peaks() : ctx.troughs();
  if (anchors.size() < 3 || others.size() < 2)
    return std::nullopt;

  auto val = [&ctx](size_t i) { return is_bottom ? ctx.low(i) : ctx.high(i); };
  auto beyond = [](double a, double b) { return is_bottom ? a < b : a > b; };

  for (size_t i = 0; i + 2 < anchors.size(); i++) {
    auto left = anchors[i];
    auto head = anchors[i + 1];
    auto right = anchors[i + 2];

    if (!beyond(val(head), val(left)) || !beyond(val(head), val(right)))
      continue;

    if (!is_similar_price(val(left), val(right), cfg.shoulder_tolerance))
      continue;

    auto middle = is_bottom ? ctx.peaks_between(left, right)
                            : ctx.troughs_between(left, right);
    if (middle.empty())
      continue;

    double neckline = is_bottom ? ctx.high(middle[0]) : ctx.low(middle[0]);
    for (auto m : middle)
      neckline = is_bottom ? std::max(neckline, ctx.high(m))
                           : std::min(neckline, ctx.low(m));

    bool breakout = is_bottom ? ctx.last_close() > neckline
                              : ctx.last_close() < neckline;

    return HeadShoulders{left, head, right, neckline, breakout};
  }

  return std::nullopt;
}

std::optional<ChartPatternMatch> inverse_head_and_shoulders(
    const PatternContext& ctx) {
  auto f = find_head_shoulders<Side::Bottom>(ctx);
  if (!f)
    return std::nullopt;

  double depth = (f->neckline - ctx.low(f->head)) / f->neckline;

  auto desc =
      f->breakout
          ? "The inverse head and shoulders is complete and the price broke "
            "above the neckline. A strong sign of a turn upward."
          : "An inverse head and shoulders is forming. Clearing the neckline "
            "could mark a turn upward.";

  auto expl = std::format(
      "An inverse head and shoulders bottoms out three times, with the "
      "middle low the deepest. It shows the market refusing to go lower and "
      "is one of the most reliable buy signals among chart patterns. "
      "Depth of the head: {:.1f}%",
      depth * 100);

  return ChartPatternMatch{ChartPatternType::InverseHeadAndShoulders,
                           f->breakout ? 95 : 80,
                           f->breakout ? 0.85 : 0.65,
                           desc,
                           expl,
                           f->left,
                           f->right};
}

std::optional<ChartPatternMatch> head_and_shoulders(const PatternContext& ctx) {
  auto f = find_head_shoulders<Side::Top>(ctx);
  if (!f)
    return std::nullopt;

  double height = (ctx.high(f->head) - f->neckline) / ctx.high(f->head);

  auto desc =
      f->breakout
          ? "The head and shoulders is complete and the price broke below "
            "the neckline. A strong sign of a turn downward."
          : "A head and shoulders is forming. Breaking the neckline could "
            "start a real decline.";

  auto expl = std::format(
      "A head and shoulders makes three peaks with the middle one the "
      "highest, like a head between two shoulders. It is the classic top "
      "that shows a rise running out of steam, and one of the most reliable "
      "sell signals. Height of the head: {:.1f}%",
      height * 100);

  return ChartPatternMatch{ChartPatternType::HeadAndShoulders,
                           f->breakout ? 95 : 80,
                           f->breakout ? 0.85 : 0.65,
                           desc,
                           expl,
                           f->left,
                           f->right};
}
