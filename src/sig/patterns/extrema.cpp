#include "sig/chart_patterns.h"

#include <algorithm>

Extrema find_extrema(const std::vector<PriceBar>& bars, size_t window) {
  Extrema ext;
  if (window == 0 || bars.size() < 2 * window + 1)
    return ext;

  for (size_t i = window; i + window < bars.size(); i++) {
    bool is_peak = true, is_trough = true;

    for (size_t j = 1; j <= window; j++) {
      if (bars[i].high <= bars[i - j].high || bars[i].high <= bars[i + j].high)
        is_peak = false;
      if (bars[i].low >= bars[i - j].low || bars[i].low >= bars[i + j].low)
        is_trough = false;
    }

    if (is_peak)
      ext.peaks.push_back(i);
    if (is_trough)
      ext.troughs.push_back(i);
  }

  return ext;
}

ChartPatternMatch::ChartPatternMatch(ChartPatternType type,
                                     int strength,
                                     double confidence,
                                     std::string desc,
                                     std::string expl,
                                     size_t start_idx,
                                     size_t end_idx)
    : pattern{type},
      strength{strength},
      confidence{confidence},
      description{std::move(desc)},
      explanation{std::move(expl)},
      start_idx{start_idx},
      end_idx{end_idx}  //
{
  auto& meta = meta_of(type);
  signal = meta.signal;
  rank = meta.rank;
  win_rate = meta.win_rate;
}

std::vector<double> PatternContext::peak_highs() const {
  std::vector<double> res;
  for (auto i : ext.peaks)
    res.push_back(high(i));
  return res;
}

std::vector<double> PatternContext::trough_lows() const {
  std::vector<double> res;
  for (auto i : ext.troughs)
    res.push_back(low(i));
  return res;
}

inline auto between(const std::vector<size_t>& idxs, size_t l, size_t r) {
  std::vector<size_t> res;
  std::copy_if(idxs.begin(), idxs.end(), std::back_inserter(res),
               [l, r](size_t i) { return i > l && i < r; });
  return res;
}

std::vector<size_t> PatternContext::peaks_between(size_t l, size_t r) const {
  return between(ext.peaks, l, r);
}

std::vector<size_t> PatternContext::troughs_between(size_t l, size_t r) const {
  return between(ext.troughs, l, r);
}

// Both of these expect at least one peak and one trough.
size_t PatternContext::first_extremum() const {
  return std::min(ext.peaks.front(), ext.troughs.front());
}

size_t PatternContext::last_extremum() const {
  return std::max(ext.peaks.back(), ext.troughs.back());
}
