#include "core/serialization.h"
#include "risk/safety.h"
#include "sig/analysis.h"
#include "util/config.h"
#include "util/format.h"
#include "util/times.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

// stdout carries the report, so logs go to stderr
inline void init_logging() {
  auto logger = spdlog::stderr_color_mt("stderr_logger");
  spdlog::set_default_logger(logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline std::string text_report(const Report& r) {
  auto& a = r.analysis;
  auto& c = a.candles.combined;

  std::string out;
  out += std::format("Technical: {} ({:+.2f}) {}\n", to_str(a.technical.label),
                     a.technical.score,
                     join(a.technical.reasons.begin(),
                          a.technical.reasons.end(), "; "));
  out += std::format("Combined: {}\n", to_str(c));
  if (a.candles.latest)
    out += std::format("Latest candle: {}\n", a.candles.latest->description);
  if (a.deviation_zone)
    out += std::format("Deviation: {:.2f}% ({})\n",
                       *a.indicators.deviation_rate, to_str(*a.deviation_zone));
  if (r.safety.any())
    out += std::format("Safety: surge {} dangerous {} overheated {} decline {}\n",
                       r.safety.is_surge, r.safety.is_dangerous,
                       r.safety.is_overheated, r.safety.is_in_decline);
  out += to_str(a.chart_patterns);
  return out;
}

int main(int argc, char* argv[]) {
  if (!config.read_args(argc, argv))
    return 2;
  init_logging();
  config.update(config.config_dir);

  auto bars = read_bars_file(config.input_path);
  if (!bars)
    return 1;

  auto order = config.newest_first ? Order::NewestFirst : Order::OldestFirst;
  auto series = to_oldest_first(std::move(*bars), order);
  spdlog::info("[main] {} bars from {}", series.size(), config.input_path);

  Report report;

  if (!config.as_of.empty()) {
    auto as_of = parse_date(config.as_of);
    if (!as_of)
      return 2;
    report.fresh = is_fresh(series, *as_of, days{config.max_age_days});
  }

  report.analysis = analyze(series);
  report.style = parse_style(config.style);
  report.safety = evaluate_safety(
      SafetyInputs{
          .week_change_rate = report.analysis.week_change_rate,
          .deviation_rate = report.analysis.indicators.deviation_rate,
          .volatility = config.volatility,
          .is_profitable = config.profitable,
      },
      report.style);

  if (config.text)
    std::cout << text_report(report) << std::endl;
  else
    std::cout << to_json(report, config.pretty) << std::endl;

  return 0;
}
