#pragma once
#include "ck/viewport/ChartViewport.hpp"

namespace ck {

// Exponential zoom for wheel, axis-drag and pinch gestures.
// Every zoom factor is exp(delta * sensitivity).
struct ZoomControllerConfig {
  double wheelSensitivity{0.0006};
  double wheelMaxFactor{1.5};        // wheel pre-clamp: max(len * factor, cap)
  double wheelMaxCap{300};
  double priceDragSensitivity{0.003};
  double timeDragSensitivity{0.005};
  double minPriceSpan{1e-9};
  double maxPriceSpan{1e9};
  double minPinchDistance{5.0};
};

// Snapshot taken when the second pointer goes down.
struct PinchAnchor {
  double initialDistance{0};
  ViewState initialView;
  PriceRange initialPriceRange;
  double initialCenterIndex{0};
  double initialCenterPrice{0};
};

class ZoomController {
public:
  void setConfig(const ZoomControllerConfig& cfg) { config_ = cfg; }
  const ZoomControllerConfig& config() const { return config_; }

  // Wheel over the price axis. Returns false when the new span is rejected.
  bool wheelPrice(const PriceRange& current, double deltaY, PriceRange& out) const;

  // Wheel over the chart. Anchors the last candle when it is on screen,
  // otherwise the right edge.
  ViewState wheelTime(const ChartViewport& vp, double deltaY) const;

  // Price-axis drag, relative to the gesture start.
  bool dragPrice(const PriceRange& initial, double dyPixels, PriceRange& out) const;

  // Time-axis drag, anchored at the initial right edge.
  ViewState dragTime(const ChartViewport& vp, const ViewState& initial, double dxPixels) const;

  PinchAnchor beginPinch(const ChartViewport& vp, double distance,
                         double centerX, double centerY) const;

  // Returns false when the pointers are too close to give a stable ratio.
  bool pinch(const ChartViewport& vp, const PinchAnchor& anchor,
             double distance, double centerX, ViewState& out) const;

private:
  ZoomControllerConfig config_;
};

} // namespace ck
