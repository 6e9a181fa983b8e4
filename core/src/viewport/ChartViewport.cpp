#include "ck/viewport/ChartViewport.hpp"
#include "ck/data/Timeframe.hpp"

#include <algorithm>
#include <cmath>

namespace ck {

const Candle* ChartViewport::candleAt(std::size_t index) const {
  if (!candles_ || index >= candles_->size()) return nullptr;
  return &(*candles_)[index];
}

void ChartViewport::setSize(double width, double height) {
  width_ = std::max(0.0, width);
  height_ = std::max(0.0, height);
}

double ChartViewport::xStep() const {
  if (view_.visibleCandles <= 0) return 0;
  return width_ / view_.visibleCandles;
}

double ChartViewport::indexToX(double index) const {
  return (index + 0.5) * xStep();
}

double ChartViewport::xToIndex(double x) const {
  double step = xStep();
  if (step <= 0) return 0;
  return std::floor(x / step);
}

double ChartViewport::yScale(double price) const {
  double span = range_.span();
  if (span == 0) return height_ / 2.0;
  return height_ - ((price - range_.min) / span) * height_;
}

double ChartViewport::yToPrice(double y) const {
  double span = range_.span();
  if (span == 0) return range_.min;
  if (height_ <= 0) return 0;
  return range_.max - (y / height_) * span;
}

double ChartViewport::candleInterval() const {
  std::size_t n = candleCount();
  if (n >= 2) return (*candles_)[1].time - (*candles_)[0].time;
  return timeframeSeconds(timeframe_);
}

double ChartViewport::timeToIndex(double time) const {
  if (candleCount() == 0) return 0;
  double interval = candleInterval();
  if (interval == 0) return 0;
  return (time - (*candles_)[0].time) / interval;
}

double ChartViewport::timeToX(double time) const {
  if (candleCount() == 0) return -100.0;
  return indexToX(timeToIndex(time) - view_.startIndex);
}

double ChartViewport::xToTime(double x) const {
  std::size_t n = candleCount();
  if (n == 0) return 0;
  double step = xStep();
  if (step <= 0) return (*candles_)[0].time;

  double raw = view_.startIndex + x / step - 0.5;
  double interval = candleInterval();
  const auto& data = *candles_;

  double nearest = std::floor(raw + 0.5);
  if (nearest < 0) return data.front().time + raw * interval;
  if (nearest < static_cast<double>(n)) return data[static_cast<std::size_t>(nearest)].time;
  return data.back().time + (raw - static_cast<double>(n - 1)) * interval;
}

PixelPoint ChartViewport::toPixel(const Point& p) const {
  return {timeToX(p.time), yScale(p.price)};
}

Point ChartViewport::toPoint(double x, double y) const {
  return {xToTime(x), yToPrice(y)};
}

double ChartViewport::maxVisibleCandles() const {
  return std::max(static_cast<double>(candleCount()) * config_.maxCandlesFactor,
                  config_.maxCandlesCap);
}

double ChartViewport::rightPadding(double visibleCandles) const {
  return std::max(config_.rightPaddingCandles, visibleCandles / 5.0);
}

ViewState ChartViewport::clampedViewState(double startIndex, double visibleCandles) const {
  std::size_t n = candleCount();
  if (n == 0) {
    return {0, std::max(config_.minCandles, visibleCandles)};
  }
  if (!std::isfinite(visibleCandles)) visibleCandles = view_.visibleCandles;
  if (!std::isfinite(startIndex)) startIndex = view_.startIndex;

  ViewState out;
  out.visibleCandles = std::max(config_.minCandles,
                                std::min(maxVisibleCandles(), visibleCandles));
  double pad = rightPadding(out.visibleCandles);
  double maxStart = static_cast<double>(n) - 1.0;
  out.startIndex = std::max(-pad, std::min(maxStart, startIndex));
  return out;
}

ViewState ChartViewport::defaultViewState() const {
  double visible = config_.defaultVisibleCandles;
  double start = std::max(0.0, static_cast<double>(candleCount()) - visible +
                                   config_.rightPaddingCandles);
  return {start, visible};
}

bool ChartViewport::isIndexVisible(double index) const {
  return index >= view_.startIndex &&
         index <= view_.startIndex + view_.visibleCandles;
}

} // namespace ck
