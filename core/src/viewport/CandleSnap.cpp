#include "ck/viewport/CandleSnap.hpp"
#include <cmath>

namespace ck {

SnapResult CandleSnap::snap(const ChartViewport& vp, double x, double y) const {
  SnapResult result;
  result.point = vp.toPoint(x, y);

  double step = vp.xStep();
  auto n = static_cast<long long>(vp.candleCount());
  if (!config_.enabled || step <= 0 || n == 0) return result;

  double start = vp.view().startIndex;
  auto closest = static_cast<long long>(std::llround(start + x / step - 0.5));
  double thresholdSq = config_.thresholdPx * config_.thresholdPx;
  double bestSq = thresholdSq;

  for (long long i = closest - config_.searchRadius; i <= closest + config_.searchRadius; ++i) {
    if (i < 0 || i >= n) continue;
    const Candle* c = vp.candleAt(static_cast<std::size_t>(i));
    double cx = vp.indexToX(static_cast<double>(i) - start);
    const double prices[4] = {c->open, c->high, c->low, c->close};
    for (double price : prices) {
      double py = vp.yScale(price);
      double dSq = (x - cx) * (x - cx) + (y - py) * (y - py);
      if (dSq < bestSq) {
        bestSq = dSq;
        result.point = {c->time, price};
        result.indicator = {cx, py};
        result.snapped = true;
      }
    }
  }
  return result;
}

} // namespace ck
