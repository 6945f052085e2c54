#include "risk/safety.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>

Style parse_style(std::string_view str) {
  std::string s{str};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (s == "conservative" || s == "long")
    return Style::Conservative;
  if (s == "balanced" || s == "medium")
    return Style::Balanced;
  if (s == "aggressive" || s == "short")
    return Style::Aggressive;

  if (!s.empty() && s != "default")
    spdlog::warn("[safety] unknown style '{}', using default", str);
  return Style::Default;
}

const StyleThresholds& thresholds_of(Style style, const SafetyConfig& cfg) {
  switch (style) {
    case Style::Conservative:
      return cfg.conservative;
    case Style::Balanced:
      return cfg.balanced;
    case Style::Aggressive:
      return cfg.aggressive;
    default:
      return cfg.fallback;
  }
}

bool is_surge_stock(double week_change_rate,
                    Style style,
                    const SafetyConfig& cfg) {
  auto& surge = thresholds_of(style, cfg).surge;
  return surge && week_change_rate >= *surge;
}

bool is_dangerous_stock(std::optional<bool> is_profitable,
                        std::optional<double> volatility,
                        const SafetyConfig& cfg) {
  if (!is_profitable || *is_profitable || !volatility)
    return false;
  return *volatility > cfg.high_volatility;
}

bool is_overheated(double deviation_rate,
                   Style style,
                   const SafetyConfig& cfg,
                   const IndicatorConfig& ind_cfg) {
  if (thresholds_of(style, cfg).skip_overheat)
    return false;
  return deviation_rate >= ind_cfg.deviation_upper;
}

bool is_in_decline(double week_change_rate,
                   Style style,
                   const SafetyConfig& cfg) {
  return week_change_rate <= thresholds_of(style, cfg).decline;
}

SafetyFlags evaluate_safety(const SafetyInputs& in,
                            Style style,
                            const SafetyConfig& cfg,
                            const IndicatorConfig& ind_cfg) {
  SafetyFlags flags;

  if (in.week_change_rate) {
    flags.is_surge = is_surge_stock(*in.week_change_rate, style, cfg);
    flags.is_in_decline = is_in_decline(*in.week_change_rate, style, cfg);
  }

  if (in.deviation_rate)
    flags.is_overheated =
        is_overheated(*in.deviation_rate, style, cfg, ind_cfg);

  flags.is_dangerous = is_dangerous_stock(in.is_profitable, in.volatility, cfg);

  if (flags.any())
    spdlog::debug("[safety] {} style: surge {} dangerous {} overheated {} "
                  "decline {}",
                  to_str(style), flags.is_surge, flags.is_dangerous,
                  flags.is_overheated, flags.is_in_decline);
  return flags;
}
