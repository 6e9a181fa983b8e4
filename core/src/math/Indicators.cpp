#include "ck/math/Indicators.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace ck {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// SMA that skips leading NaNs of its input.
std::vector<double> smaOfValid(const std::vector<double>& input, int period) {
  std::vector<double> out(input.size(), kNaN);
  if (period < 1) return out;
  std::size_t first = 0;
  while (first < input.size() && std::isnan(input[first])) ++first;

  double sum = 0.0;
  int n = 0;
  for (std::size_t i = first; i < input.size(); i++) {
    sum += input[i];
    n++;
    if (n > period) sum -= input[i - static_cast<std::size_t>(period)];
    if (n >= period) out[i] = sum / period;
  }
  return out;
}

} // namespace

std::vector<double> computeSma(const std::vector<double>& input, int period) {
  return smaOfValid(input, period);
}

std::vector<double> computeEma(const std::vector<double>& input, int period) {
  std::vector<double> out(input.size(), kNaN);
  int count = static_cast<int>(input.size());
  if (period < 1 || count < period) return out;

  double sum = 0.0;
  for (int i = 0; i < period; i++) sum += input[static_cast<std::size_t>(i)];
  out[static_cast<std::size_t>(period - 1)] = sum / period;

  double k = 2.0 / (period + 1.0);
  for (int i = period; i < count; i++) {
    auto u = static_cast<std::size_t>(i);
    out[u] = input[u] * k + out[u - 1] * (1.0 - k);
  }
  return out;
}

std::vector<double> computeRSI(const std::vector<double>& closes, int period) {
  int count = static_cast<int>(closes.size());
  std::vector<double> rsi(closes.size(), kNaN);
  if (period < 1 || count < period + 1) return rsi;

  double avgGain = 0.0, avgLoss = 0.0;
  for (int i = 1; i <= period; i++) {
    double change = closes[static_cast<std::size_t>(i)] - closes[static_cast<std::size_t>(i - 1)];
    if (change > 0) avgGain += change;
    else avgLoss -= change;
  }
  avgGain /= period;
  avgLoss /= period;

  auto value = [](double gain, double loss) {
    if (loss == 0.0) return 100.0;
    return 100.0 - 100.0 / (1.0 + gain / loss);
  };
  rsi[static_cast<std::size_t>(period)] = value(avgGain, avgLoss);

  // Wilder smoothing
  for (int i = period + 1; i < count; i++) {
    double change = closes[static_cast<std::size_t>(i)] - closes[static_cast<std::size_t>(i - 1)];
    double gain = change > 0 ? change : 0.0;
    double loss = change < 0 ? -change : 0.0;
    avgGain = (avgGain * (period - 1) + gain) / period;
    avgLoss = (avgLoss * (period - 1) + loss) / period;
    rsi[static_cast<std::size_t>(i)] = value(avgGain, avgLoss);
  }
  return rsi;
}

StochasticResult computeStochastic(const std::vector<double>& highs,
                                   const std::vector<double>& lows,
                                   const std::vector<double>& closes,
                                   int kPeriod, int kSlowing, int dPeriod) {
  StochasticResult result;
  std::size_t count = closes.size();
  if (highs.size() < count || lows.size() < count) count = std::min(highs.size(), lows.size());
  result.percentK.assign(closes.size(), kNaN);
  result.percentD.assign(closes.size(), kNaN);
  if (kPeriod < 1 || count < static_cast<std::size_t>(kPeriod)) return result;

  std::vector<double> rawK(closes.size(), kNaN);
  for (std::size_t i = static_cast<std::size_t>(kPeriod - 1); i < count; i++) {
    double hh = highs[i], ll = lows[i];
    for (std::size_t j = i + 1 - static_cast<std::size_t>(kPeriod); j <= i; j++) {
      if (highs[j] > hh) hh = highs[j];
      if (lows[j] < ll) ll = lows[j];
    }
    double range = hh - ll;
    rawK[i] = range > 0.0 ? (closes[i] - ll) / range * 100.0 : 50.0;
  }

  result.percentK = kSlowing > 1 ? smaOfValid(rawK, kSlowing) : rawK;
  if (dPeriod >= 1) result.percentD = smaOfValid(result.percentK, dPeriod);
  return result;
}

} // namespace ck
