#include "ck/indicators/Indicator.hpp"

namespace ck {

namespace {

struct IndicatorName {
  IndicatorType type;
  const char* name;
};

const IndicatorName kIndicatorNames[] = {
  {IndicatorType::MA, "MA"},
  {IndicatorType::EMA, "EMA"},
  {IndicatorType::RSI, "RSI"},
  {IndicatorType::BB, "BB"},
  {IndicatorType::MACD, "MACD"},
  {IndicatorType::Stochastic, "Stochastic"},
  {IndicatorType::SuperTrend, "SuperTrend"},
  {IndicatorType::VWAP, "VWAP"},
  {IndicatorType::MARibbon, "MA Ribbon"},
  {IndicatorType::CCI, "CCI"},
  {IndicatorType::Volume, "Volume"},
  {IndicatorType::MFI, "MFI"},
  {IndicatorType::OBV, "OBV"}
};

} // namespace

const char* indicatorTypeName(IndicatorType type) {
  for (const auto& e : kIndicatorNames) {
    if (e.type == type) return e.name;
  }
  return "Unknown";
}

bool parseIndicatorType(const std::string& name, IndicatorType& out) {
  for (const auto& e : kIndicatorNames) {
    if (name == e.name) {
      out = e.type;
      return true;
    }
  }
  return false;
}

IndicatorSettings defaultIndicatorSettings(IndicatorType type) {
  switch (type) {
    case IndicatorType::MA:
    case IndicatorType::EMA:        return {{"period", 14}};
    case IndicatorType::RSI:        return {{"period", 14}};
    case IndicatorType::BB:         return {{"period", 20}, {"stdDev", 2}};
    case IndicatorType::MACD:       return {{"fastPeriod", 12}, {"slowPeriod", 26}, {"signalPeriod", 9}};
    case IndicatorType::Stochastic: return {{"kPeriod", 14}, {"kSlowing", 3}, {"dPeriod", 3}};
    case IndicatorType::SuperTrend: return {{"atrPeriod", 10}, {"factor", 3}};
    case IndicatorType::MARibbon:   return {{"period", 10}, {"step", 10}, {"count", 6}};
    case IndicatorType::CCI:        return {{"period", 20}};
    case IndicatorType::MFI:        return {{"period", 14}};
    case IndicatorType::VWAP:
    case IndicatorType::Volume:
    case IndicatorType::OBV:
    default:                        return {};
  }
}

} // namespace ck
