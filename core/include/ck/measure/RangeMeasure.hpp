#pragma once
#include "ck/data/Point.hpp"
#include "ck/drawing/Drawing.hpp"

namespace ck {

// Read-outs shown next to ranges and trend lines while they are drawn.
struct RangeMeasure {
  double priceDelta{0};      // end - start
  double percentChange{0};   // |delta| / start * 100
  double timeDelta{0};       // |end - start| seconds
  double bars{0};            // timeDelta / interval, rounded
  double days{0};            // timeDelta / 86400
  bool up{true};
  bool valid{false};
};

struct PositionStats {
  double profitDiff{0};
  double stopDiff{0};
  double riskReward{0};      // profitDiff / stopDiff
  bool hasRiskReward{false}; // false when the stop sits on the entry
  double targetPercent{0};
  double stopPercent{0};
  bool valid{false};
};

RangeMeasure measureRange(const Point& start, const Point& end, double candleInterval);

// Range read-out of a Price / Date / Date & Price Range or Trend Line.
// Returns an invalid measure for other kinds.
RangeMeasure measureDrawing(const Drawing& d, double candleInterval);

PositionStats positionStats(const Point& entry, const Point& profit, const Point& stop);

// Screen angle of a segment in degrees, counter-clockwise from +x.
double segmentAngleDeg(const PixelPoint& start, const PixelPoint& end);

} // namespace ck
