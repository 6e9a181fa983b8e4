#include "ck/indicators/IndicatorRegistry.hpp"
#include "ck/math/Indicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ck {

namespace {

std::vector<double> closes(const CandleSeries& candles) {
  std::vector<double> v;
  v.reserve(candles.size());
  for (const auto& c : candles) v.push_back(c.close);
  return v;
}

// Longer than any candle series the chart holds.
constexpr double kMaxPeriod = 1000000;

int period(const IndicatorSettings& s, const char* name, int fallback) {
  double v = settingOr(s, name, fallback);
  if (v < 1) return fallback;
  return static_cast<int>(std::min(v, kMaxPeriod));
}

} // namespace

double settingOr(const IndicatorSettings& settings, const std::string& name, double fallback) {
  auto it = settings.find(name);
  if (it == settings.end() || !std::isfinite(it->second)) return fallback;
  return it->second;
}

void IndicatorRegistry::registerFunction(IndicatorType type, IndicatorFunction fn) {
  if (!fn) {
    functions_.erase(type);
    return;
  }
  functions_[type] = std::move(fn);
}

bool IndicatorRegistry::hasFunction(IndicatorType type) const {
  return functions_.count(type) != 0;
}

bool IndicatorRegistry::compute(const IndicatorConfig& config, const CandleSeries& candles,
                                IndicatorOutput& out) const {
  auto it = functions_.find(config.type);
  if (it == functions_.end()) {
    std::fprintf(stderr, "IndicatorRegistry: no function for %s\n",
                 indicatorTypeName(config.type));
    return false;
  }
  out = it->second(candles, config.settings);
  return true;
}

void IndicatorRegistry::registerBuiltins() {
  registerFunction(IndicatorType::MA, [](const CandleSeries& c, const IndicatorSettings& s) {
    return IndicatorOutput{{"main", computeSma(closes(c), period(s, "period", 14))}};
  });
  registerFunction(IndicatorType::EMA, [](const CandleSeries& c, const IndicatorSettings& s) {
    return IndicatorOutput{{"main", computeEma(closes(c), period(s, "period", 14))}};
  });
  registerFunction(IndicatorType::RSI, [](const CandleSeries& c, const IndicatorSettings& s) {
    return IndicatorOutput{{"rsi", computeRSI(closes(c), period(s, "period", 14))}};
  });
  registerFunction(IndicatorType::Stochastic, [](const CandleSeries& c, const IndicatorSettings& s) {
    std::vector<double> highs, lows;
    highs.reserve(c.size());
    lows.reserve(c.size());
    for (const auto& k : c) {
      highs.push_back(k.high);
      lows.push_back(k.low);
    }
    StochasticResult r = computeStochastic(highs, lows, closes(c),
                                           period(s, "kPeriod", 14),
                                           period(s, "kSlowing", 3),
                                           period(s, "dPeriod", 3));
    return IndicatorOutput{{"k", std::move(r.percentK)}, {"d", std::move(r.percentD)}};
  });
}

bool latestValue(const IndicatorOutput& output, const std::string& series, double& out) {
  auto it = output.find(series);
  if (it == output.end()) return false;
  const auto& v = it->second;
  for (auto r = v.rbegin(); r != v.rend(); ++r) {
    if (std::isfinite(*r)) {
      out = *r;
      return true;
    }
  }
  return false;
}

} // namespace ck
