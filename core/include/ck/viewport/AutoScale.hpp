#pragma once
#include "ck/viewport/ChartViewport.hpp"

namespace ck {

struct AutoScaleConfig {
  double marginFraction{0.1};   // buffer added on each side, as a fraction of span
};

class AutoScale {
public:
  void setConfig(const AutoScaleConfig& cfg) { config_ = cfg; }

  // Fit the price range to the lows/highs of the candles inside the view.
  // Returns false if no candle is visible.
  bool computePriceRange(const ChartViewport& vp, PriceRange& out) const;

private:
  AutoScaleConfig config_;
};

} // namespace ck
