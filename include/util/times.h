#pragma once

#include "core/bar.h"

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

using days = std::chrono::days;
using SysDays = std::chrono::sys_days;

// "YYYY-MM-DD"; anything after the date (a time part) is ignored
std::optional<SysDays> parse_date(std::string_view date);

std::string date_to_string(SysDays date);

// Whether the latest bar of an oldest-first series is at most `max_age` days
// older than `as_of`. Nothing here reads the clock.
bool is_fresh(const std::vector<PriceBar>& bars, SysDays as_of, days max_age);
