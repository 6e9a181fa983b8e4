#pragma once
#include "ck/data/Candle.hpp"
#include "ck/indicators/Indicator.hpp"

#include <functional>
#include <map>
#include <string>

namespace ck {

using IndicatorFunction =
    std::function<IndicatorOutput(const CandleSeries& candles, const IndicatorSettings& settings)>;

// Maps indicator types to pure compute functions. The host may replace any
// entry; registerBuiltins() covers MA, EMA, RSI and Stochastic.
class IndicatorRegistry {
public:
  void registerFunction(IndicatorType type, IndicatorFunction fn);
  bool hasFunction(IndicatorType type) const;

  // Computes `config` over `candles`. False (out untouched) when no
  // function is registered for the type.
  bool compute(const IndicatorConfig& config, const CandleSeries& candles,
               IndicatorOutput& out) const;

  void registerBuiltins();

private:
  std::map<IndicatorType, IndicatorFunction> functions_;
};

// Setting lookup with fallback.
double settingOr(const IndicatorSettings& settings, const std::string& name, double fallback);

// Last finite value of output[series]. False when the series is missing or
// holds no finite value.
bool latestValue(const IndicatorOutput& output, const std::string& series, double& out);

} // namespace ck
