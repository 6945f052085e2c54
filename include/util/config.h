#pragma once

#include <optional>
#include <string>

struct IndicatorConfig {
  static constexpr const char* name = "ind_config";

  // deviation_upper is also the overheat safety threshold
  static constexpr double DEVIATION_UPPER = 20.0;
  static constexpr double DEVIATION_LOWER = -20.0;

  int rsi_period = 14;
  int sma_period = 25;
  int ema_period = 25;

  int macd_fast = 12;
  int macd_slow = 26;
  int macd_signal = 9;

  int bb_period = 20;
  double bb_stddev = 2.0;

  int deviation_period = 25;
  double deviation_upper = DEVIATION_UPPER;
  double deviation_lower = DEVIATION_LOWER;
  double deviation_stable = 5.0;

  int week_lookback = 4;

  // technical_signal() thresholds
  double rsi_oversold = 30.0;
  double rsi_overbought = 70.0;
  double strong_score = 1.5;
  double weak_score = 0.5;
};

struct CandleConfig {
  static constexpr const char* name = "candle_config";

  double doji_range = 0.01;
  double large_body_ratio = 0.6;
  double small_body_ratio = 0.2;
  double long_wick_ratio = 0.3;

  size_t scan_max_signals = 10;
  int scan_min_strength = 60;
};

struct PatternConfig {
  static constexpr const char* name = "pattern_config";

  size_t min_bars = 10;
  size_t min_formation_bars = 15;
  size_t min_triple_bars = 20;
  size_t extrema_window = 2;

  double shoulder_tolerance = 0.05;

  double double_tolerance = 0.04;
  size_t double_min_separation = 5;
  double triple_tolerance = 0.04;

  double triangle_flat_slope = 0.003;
  double triangle_trend_slope = 0.001;
  double symmetrical_slope = 0.0005;

  size_t pole_length = 10;
  double pole_min_move = 0.05;
  size_t flag_min_bars = 5;
  double flag_with_slope = 0.001;     // tolerated slope in the pole direction
  double flag_against_slope = 0.005;  // max slope against the pole
  double flag_max_range = 0.10;

  double box_max_stddev = 0.03;
  double box_min_range = 0.03;
  double box_max_range = 0.15;
};

struct SignalConfig {
  static constexpr const char* name = "sig_config";

  double rsi_oversold = 30.0;
  double rsi_overbought = 70.0;
  double rsi_lean_buy = 40.0;
  double rsi_lean_sell = 60.0;

  double rsi_extreme_score = 70.0;
  double rsi_lean_score = 30.0;
  double macd_score = 40.0;
  double macd_reason_threshold = 1.0;

  double decision_margin = 50.0;
  int neutral_strength = 50;
};

struct StyleThresholds {
  std::optional<double> surge;  // none: never a surge
  double decline = -15.0;
  bool skip_overheat = false;
};

struct SafetyConfig {
  static constexpr const char* name = "safety_config";

  double high_volatility = 50.0;

  StyleThresholds conservative{30.0, -20.0, false};
  StyleThresholds balanced{40.0, -15.0, false};
  StyleThresholds aggressive{std::nullopt, -10.0, true};
  StyleThresholds fallback{30.0, -15.0, false};
};

struct Config {
  bool debug_en = false;
  bool pretty = false;
  bool text = false;
  bool newest_first = false;

  std::string config_dir = "config";
  std::string input_path;

  std::string style;
  std::optional<double> volatility;
  std::optional<bool> profitable;

  std::string as_of;
  int max_age_days = 5;

  IndicatorConfig ind_config;
  CandleConfig candle_config;
  PatternConfig pattern_config;
  SignalConfig sig_config;
  SafetyConfig safety_config;

  bool read_args(int argc, char* argv[]);
  void update(const std::string& dir);
};

inline Config config;
