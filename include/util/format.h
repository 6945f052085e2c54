#pragma once

#include "sig/signal_types.h"

#include <format>
#include <string>
#include <vector>

struct ChartPatternMatch;
struct CandleSignal;
struct CombinedSignal;

template <typename T>
std::string to_str(const T& t);

template <>
std::string to_str(const std::string& str);

template <>
std::string to_str(const Signal& s);
template <>
std::string to_str(const Rank& r);
template <>
std::string to_str(const CandleType& type);
template <>
std::string to_str(const ChartPatternType& type);
template <>
std::string to_str(const Style& style);
template <>
std::string to_str(const DeviationZone& zone);
template <>
std::string to_str(const TechnicalLabel& label);

template <>
std::string to_str(const CandleSignal& sig);
template <>
std::string to_str(const CombinedSignal& sig);
template <>
std::string to_str(const ChartPatternMatch& match);
template <>
std::string to_str(const std::vector<ChartPatternMatch>& matches);

inline std::string join(auto start, auto end, std::string sep = ", ") {
  std::string result;

  for (auto it = start; it != end; it++) {
    result += to_str(*it);

    auto _end = end;
    if (it != --_end)
      result += sep;
  }

  return result;
}
