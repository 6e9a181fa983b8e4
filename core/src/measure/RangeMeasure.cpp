#include "ck/measure/RangeMeasure.hpp"
#include <cmath>
#include <type_traits>

namespace ck {

RangeMeasure measureRange(const Point& start, const Point& end, double candleInterval) {
  RangeMeasure r;
  r.priceDelta = end.price - start.price;
  r.up = r.priceDelta >= 0;
  r.percentChange = (start.price != 0.0) ? (std::fabs(r.priceDelta) / start.price * 100.0) : 0.0;
  r.timeDelta = std::fabs(end.time - start.time);
  r.bars = (candleInterval > 0) ? std::round(r.timeDelta / candleInterval) : 0.0;
  r.days = r.timeDelta / 86400.0;
  r.valid = true;
  return r;
}

RangeMeasure measureDrawing(const Drawing& d, double candleInterval) {
  return std::visit([&](const auto& g) -> RangeMeasure {
    using G = std::decay_t<decltype(g)>;
    if constexpr (IsSegmentGeom<G>::value) {
      if constexpr (G::kType == DrawingType::PriceRange ||
                    G::kType == DrawingType::DateRange ||
                    G::kType == DrawingType::DatePriceRange ||
                    G::kType == DrawingType::TrendLine) {
        return measureRange(g.start, g.end, candleInterval);
      }
    }
    return {};
  }, d.geom);
}

PositionStats positionStats(const Point& entry, const Point& profit, const Point& stop) {
  PositionStats s;
  s.profitDiff = std::fabs(profit.price - entry.price);
  s.stopDiff = std::fabs(entry.price - stop.price);
  if (s.stopDiff > 0) {
    s.riskReward = s.profitDiff / s.stopDiff;
    s.hasRiskReward = true;
  }
  if (entry.price != 0.0) {
    s.targetPercent = s.profitDiff / entry.price * 100.0;
    s.stopPercent = s.stopDiff / entry.price * 100.0;
  }
  s.valid = true;
  return s;
}

double segmentAngleDeg(const PixelPoint& start, const PixelPoint& end) {
  const double kPi = 3.14159265358979323846;
  return std::atan2(-(end.y - start.y), end.x - start.x) * (180.0 / kPi);
}

} // namespace ck
