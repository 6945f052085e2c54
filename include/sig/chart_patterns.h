#pragma once

#include "core/bar.h"
#include "sig/signal_types.h"
#include "util/config.h"

#include <optional>
#include <string>
#include <vector>

struct Extrema {
  std::vector<size_t> peaks;    // by high
  std::vector<size_t> troughs;  // by low
};

// Bar i is a peak when its high is strictly above the high of every bar
// within `window` on both sides; troughs likewise on the low.
Extrema find_extrema(const std::vector<PriceBar>& bars, size_t window);

struct ChartPatternMatch {
  ChartPatternType pattern = ChartPatternType::BoxRange;
  Signal signal = Signal::Neutral;
  Rank rank = Rank::D;
  int win_rate = 0;  // reference figure, see PatternMeta
  int strength = 0;
  double confidence = 0.0;
  std::string description;
  std::string explanation;
  size_t start_idx = 0;
  size_t end_idx = 0;

  ChartPatternMatch() = default;
  ChartPatternMatch(ChartPatternType type,
                    int strength,
                    double confidence,
                    std::string desc,
                    std::string expl,
                    size_t start_idx,
                    size_t end_idx);

  const std::string& name() const { return meta_of(pattern).name; }
  double weight() const { return strength * confidence; }
};

// Shared, precomputed view of the window every detector works on
struct PatternContext {
  const std::vector<PriceBar>& bars;
  const PatternConfig& cfg;
  Extrema ext;

  PatternContext(const std::vector<PriceBar>& bars,
                 const PatternConfig& cfg) noexcept
      : bars{bars}, cfg{cfg}, ext{find_extrema(bars, cfg.extrema_window)} {}

  size_t size() const { return bars.size(); }
  double high(size_t idx) const { return bars[idx].high; }
  double low(size_t idx) const { return bars[idx].low; }
  double close(size_t idx) const { return bars[idx].close; }
  double last_close() const { return bars.back().close; }

  auto& peaks() const { return ext.peaks; }
  auto& troughs() const { return ext.troughs; }

  std::vector<double> peak_highs() const;
  std::vector<double> trough_lows() const;

  // extrema strictly inside (l, r)
  std::vector<size_t> peaks_between(size_t l, size_t r) const;
  std::vector<size_t> troughs_between(size_t l, size_t r) const;

  size_t first_extremum() const;
  size_t last_extremum() const;
};

// Mirrored formations are written once against the side they form on
enum class Side {
  Bottom,
  Top,
};

using pattern_f = std::optional<ChartPatternMatch> (*)(const PatternContext&);

// Buy
std::optional<ChartPatternMatch> inverse_head_and_shoulders(
    const PatternContext& ctx);
std::optional<ChartPatternMatch> double_bottom(const PatternContext& ctx);
std::optional<ChartPatternMatch> triple_bottom(const PatternContext& ctx);
std::optional<ChartPatternMatch> ascending_triangle(const PatternContext& ctx);
std::optional<ChartPatternMatch> bull_flag(const PatternContext& ctx);

// Sell
std::optional<ChartPatternMatch> double_top(const PatternContext& ctx);
std::optional<ChartPatternMatch> head_and_shoulders(const PatternContext& ctx);
std::optional<ChartPatternMatch> descending_triangle(
    const PatternContext& ctx);
std::optional<ChartPatternMatch> bear_flag(const PatternContext& ctx);

// Neutral
std::optional<ChartPatternMatch> box_range(const PatternContext& ctx);
std::optional<ChartPatternMatch> symmetrical_triangle(
    const PatternContext& ctx);

// Runs every registered detector over an oldest-first window and returns
// the matches sorted by strength * confidence, strongest first. Fewer than
// cfg.min_bars bars yields an empty list.
std::vector<ChartPatternMatch> detect_chart_patterns(
    const std::vector<PriceBar>& bars,
    const PatternConfig& cfg = config.pattern_config);
