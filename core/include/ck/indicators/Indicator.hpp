#pragma once
#include "ck/ids/Id.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ck {

enum class IndicatorType : std::uint8_t {
  MA = 1, EMA, RSI, BB, MACD, Stochastic, SuperTrend, VWAP, MARibbon, CCI, Volume, MFI, OBV
};

// "MA", "EMA", ..., "MA Ribbon".
const char* indicatorTypeName(IndicatorType type);
bool parseIndicatorType(const std::string& name, IndicatorType& out);

using IndicatorSettings = std::map<std::string, double>;

// Persisted indicator instance. Computed output is not part of it.
struct IndicatorConfig {
  Id id{kInvalidId};
  IndicatorType type{IndicatorType::MA};
  IndicatorSettings settings;
  bool isVisible{true};

  bool operator==(const IndicatorConfig& o) const {
    return id == o.id && type == o.type && settings == o.settings && isVisible == o.isVisible;
  }
  bool operator!=(const IndicatorConfig& o) const { return !(*this == o); }
};

// Named output series aligned with the candle array. NaN marks a gap.
using IndicatorOutput = std::map<std::string, std::vector<double>>;

// Defaults used when an indicator is added without settings.
IndicatorSettings defaultIndicatorSettings(IndicatorType type);

} // namespace ck
