#include "sig/chart_patterns.h"

#include <spdlog/spdlog.h>
#include <algorithm>

inline constexpr pattern_f pattern_funcs[] = {
    // Buy
    inverse_head_and_shoulders,
    double_bottom,
    bull_flag,
    ascending_triangle,
    triple_bottom,
    // Sell
    double_top,
    head_and_shoulders,
    bear_flag,
    descending_triangle,
    // Neutral
    box_range,
    symmetrical_triangle,
};

std::vector<ChartPatternMatch> detect_chart_patterns(
    const std::vector<PriceBar>& bars,
    const PatternConfig& cfg) {
  std::vector<ChartPatternMatch> res;
  if (bars.size() < cfg.min_bars)
    return res;

  PatternContext ctx{bars, cfg};
  spdlog::debug("[pattern] {} bars, {} peaks, {} troughs", bars.size(),
                ctx.peaks().size(), ctx.troughs().size());

  for (auto f : pattern_funcs) {
    auto match = f(ctx);
    if (match)
      res.push_back(std::move(*match));
  }

  std::stable_sort(res.begin(), res.end(), [](auto& l, auto& r) {
    return l.weight() > r.weight();
  });

  spdlog::debug("[pattern] {} matches", res.size());
  return res;
}
