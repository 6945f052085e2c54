#include "util/times.h"

#include <spdlog/spdlog.h>
#include <format>
#include <sstream>

using namespace std::chrono;

std::optional<SysDays> parse_date(std::string_view date) {
  if (date.size() < 10) {
    spdlog::error("[time] bad date string '{}'", date);
    return std::nullopt;
  }

  std::istringstream in{std::string(date.substr(0, 10))};
  year_month_day ymd;
  in >> parse("%F", ymd);

  if (in.fail() || !ymd.ok()) {
    spdlog::error("[time] bad date string '{}'", date);
    return std::nullopt;
  }

  return sys_days{ymd};
}

std::string date_to_string(SysDays date) {
  return std::format("{:%F}", date);
}

bool is_fresh(const std::vector<PriceBar>& bars, SysDays as_of, days max_age) {
  if (bars.empty())
    return false;

  auto latest = parse_date(bars.back().date);
  if (!latest)
    return false;

  auto age = as_of - *latest;
  if (age > max_age) {
    spdlog::warn("[time] latest bar {} is {} days older than {}",
                 bars.back().date, age.count(), date_to_string(as_of));
    return false;
  }
  return true;
}
