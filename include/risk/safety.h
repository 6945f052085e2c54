#pragma once

#include "sig/signal_types.h"
#include "util/config.h"

#include <optional>
#include <string_view>

struct SafetyFlags {
  bool is_surge = false;
  bool is_dangerous = false;
  bool is_overheated = false;
  bool is_in_decline = false;

  bool any() const {
    return is_surge || is_dangerous || is_overheated || is_in_decline;
  }
};

// Derived metrics handed over by the caller; absent ones never raise a flag
struct SafetyInputs {
  std::optional<double> week_change_rate;
  std::optional<double> deviation_rate;
  std::optional<double> volatility;
  std::optional<bool> is_profitable;
};

// conservative / balanced / aggressive, or the horizon tags long / medium /
// short. Anything else is Style::Default.
Style parse_style(std::string_view str);

const StyleThresholds& thresholds_of(
    Style style,
    const SafetyConfig& cfg = config.safety_config);

bool is_surge_stock(double week_change_rate,
                    Style style = Style::Default,
                    const SafetyConfig& cfg = config.safety_config);

// Loss-making and volatile. An unknown profitability is not a loss.
bool is_dangerous_stock(std::optional<bool> is_profitable,
                        std::optional<double> volatility,
                        const SafetyConfig& cfg = config.safety_config);

// Same upper bound as DeviationZone::Overheated
bool is_overheated(double deviation_rate,
                   Style style = Style::Default,
                   const SafetyConfig& cfg = config.safety_config,
                   const IndicatorConfig& ind_cfg = config.ind_config);

bool is_in_decline(double week_change_rate,
                   Style style = Style::Default,
                   const SafetyConfig& cfg = config.safety_config);

SafetyFlags evaluate_safety(const SafetyInputs& in,
                            Style style = Style::Default,
                            const SafetyConfig& cfg = config.safety_config,
                            const IndicatorConfig& ind_cfg = config.ind_config);
