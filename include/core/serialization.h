#pragma once

#include "core/bar.h"
#include "risk/safety.h"
#include "sig/analysis.h"

#include <optional>
#include <string>
#include <vector>

// What the command line tool prints
struct Report {
  Analysis analysis;
  Style style = Style::Default;
  SafetyFlags safety;
  std::optional<bool> fresh;  // only when an as-of date was given
};

// JSON array of {"date", "open", "high", "low", "close", "volume"?}.
// Returns std::nullopt after logging when the text does not parse.
std::optional<std::vector<PriceBar>> read_bars_json(const std::string& str);
std::optional<std::vector<PriceBar>> read_bars_file(const std::string& path);

std::string to_json(const Report& report, bool pretty = false);
