#pragma once
#include "ck/data/Point.hpp"
#include "ck/viewport/ChartViewport.hpp"

namespace ck {

struct SnapConfig {
  double thresholdPx{15.0};
  int searchRadius{2};      // candles either side of the cursor's index
  bool enabled{true};
};

struct SnapResult {
  Point point;              // snapped or raw domain point
  bool snapped{false};
  PixelPoint indicator;     // pixel position of the snapped OHLC value
};

class CandleSnap {
public:
  void setConfig(const SnapConfig& cfg) { config_ = cfg; }
  const SnapConfig& config() const { return config_; }

  // Substitute the nearest OHLC value within the threshold, otherwise the
  // unsnapped (xToTime, yToPrice) point.
  SnapResult snap(const ChartViewport& vp, double x, double y) const;

private:
  SnapConfig config_;
};

} // namespace ck
