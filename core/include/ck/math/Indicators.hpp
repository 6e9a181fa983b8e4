#pragma once
#include <vector>

namespace ck {

// Simple moving average. Values before `period - 1` are NaN.
std::vector<double> computeSma(const std::vector<double>& input, int period);

// Exponential moving average seeded with the SMA of the first `period`
// values. Values before the seed are NaN.
std::vector<double> computeEma(const std::vector<double>& input, int period);

// Wilder RSI (0-100). First `period` values are NaN.
std::vector<double> computeRSI(const std::vector<double>& closes, int period = 14);

struct StochasticResult {
  std::vector<double> percentK;
  std::vector<double> percentD;
};

// %K over kPeriod, smoothed by kSlowing, %D = SMA(dPeriod) of %K.
StochasticResult computeStochastic(const std::vector<double>& highs,
                                   const std::vector<double>& lows,
                                   const std::vector<double>& closes,
                                   int kPeriod = 14, int kSlowing = 3, int dPeriod = 3);

} // namespace ck
