#include "ck/viewport/ZoomController.hpp"
#include <algorithm>
#include <cmath>

namespace ck {

namespace {

PriceRange rescaleAboutCenter(const PriceRange& r, double newSpan) {
  double c = r.center();
  return {c - newSpan / 2.0, c + newSpan / 2.0};
}

} // namespace

bool ZoomController::wheelPrice(const PriceRange& current, double deltaY,
                                PriceRange& out) const {
  double span = current.span();
  if (span <= 0) return false;

  double newSpan = span * std::exp(deltaY * config_.wheelSensitivity);
  if (newSpan < config_.minPriceSpan || newSpan > config_.maxPriceSpan) return false;

  out = rescaleAboutCenter(current, newSpan);
  return true;
}

ViewState ZoomController::wheelTime(const ChartViewport& vp, double deltaY) const {
  const ViewState& v = vp.view();
  double factor = std::exp(deltaY * config_.wheelSensitivity);
  double n = static_cast<double>(vp.candleCount());

  double maxVisible = std::max(n * config_.wheelMaxFactor, config_.wheelMaxCap);
  double newVisible = std::max(vp.config().minCandles,
                               std::min(maxVisible, v.visibleCandles * factor));

  double last = n - 1.0;
  double newStart;
  if (n > 0 && vp.isIndexVisible(last) && v.visibleCandles > 0) {
    double ratio = (last - v.startIndex) / v.visibleCandles;
    newStart = last - ratio * newVisible;
  } else {
    newStart = v.startIndex + v.visibleCandles - newVisible;
  }
  return vp.clampedViewState(newStart, newVisible);
}

bool ZoomController::dragPrice(const PriceRange& initial, double dyPixels,
                               PriceRange& out) const {
  double span = initial.span();
  if (span <= 0) return false;

  double newSpan = span * std::exp(dyPixels * config_.priceDragSensitivity);
  if (newSpan < config_.minPriceSpan || newSpan > config_.maxPriceSpan) return false;

  out = rescaleAboutCenter(initial, newSpan);
  return true;
}

ViewState ZoomController::dragTime(const ChartViewport& vp, const ViewState& initial,
                                   double dxPixels) const {
  double newVisible = initial.visibleCandles * std::exp(dxPixels * config_.timeDragSensitivity);
  double rightEdge = initial.startIndex + initial.visibleCandles;
  return vp.clampedViewState(rightEdge - newVisible, newVisible);
}

PinchAnchor ZoomController::beginPinch(const ChartViewport& vp, double distance,
                                       double centerX, double centerY) const {
  PinchAnchor a;
  a.initialDistance = distance;
  a.initialView = vp.view();
  a.initialPriceRange = vp.priceRange();
  double w = vp.width();
  a.initialCenterIndex = vp.view().startIndex +
      (w > 0 ? centerX * vp.view().visibleCandles / w : 0.0);
  a.initialCenterPrice = vp.yToPrice(centerY);
  return a;
}

bool ZoomController::pinch(const ChartViewport& vp, const PinchAnchor& anchor,
                           double distance, double centerX, ViewState& out) const {
  if (distance < config_.minPinchDistance) return false;
  if (anchor.initialDistance <= 0 || vp.width() <= 0) return false;

  double newVisible = anchor.initialView.visibleCandles * (anchor.initialDistance / distance);
  double newStart = anchor.initialCenterIndex - centerX * (newVisible / vp.width());
  out = vp.clampedViewState(newStart, newVisible);
  return true;
}

} // namespace ck
