#include "ck/viewport/AutoScale.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ck {

bool AutoScale::computePriceRange(const ChartViewport& vp, PriceRange& out) const {
  std::size_t n = vp.candleCount();
  if (n == 0) return false;

  const ViewState& v = vp.view();
  double first = std::max(0.0, std::floor(v.startIndex));
  double last = std::min(static_cast<double>(n), std::ceil(v.startIndex + v.visibleCandles));
  if (first >= last) return false;

  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();
  for (auto i = static_cast<std::size_t>(first); i < static_cast<std::size_t>(last); ++i) {
    const Candle* c = vp.candleAt(i);
    lo = std::min(lo, c->low);
    hi = std::max(hi, c->high);
  }

  if (lo == hi) {
    lo *= 0.999;
    hi *= 1.001;
    if (lo == hi) {
      lo -= 0.001;
      hi += 0.001;
    }
  }
  // Negative prices invert the x0.999 widening.
  if (lo > hi) std::swap(lo, hi);

  double buffer = (hi - lo) * config_.marginFraction;
  out = {lo - buffer, hi + buffer};
  return true;
}

} // namespace ck
