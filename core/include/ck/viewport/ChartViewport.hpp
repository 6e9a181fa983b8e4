#pragma once
#include "ck/data/Candle.hpp"
#include "ck/data/Point.hpp"
#include <cstddef>
#include <string>

namespace ck {

// Visible window into the candle series. startIndex may be negative
// (future padding) or fractional (smooth zoom).
struct ViewState {
  double startIndex{0};
  double visibleCandles{60};

  bool operator==(const ViewState& o) const {
    return startIndex == o.startIndex && visibleCandles == o.visibleCandles;
  }
  bool operator!=(const ViewState& o) const { return !(*this == o); }
};

struct PriceRange {
  double min{0};
  double max{100};

  double span() const { return max - min; }
  double center() const { return (max + min) / 2.0; }

  bool operator==(const PriceRange& o) const { return min == o.min && max == o.max; }
  bool operator!=(const PriceRange& o) const { return !(*this == o); }
};

struct ViewportConfig {
  double minCandles{2};
  double maxCandlesFactor{3.0};     // max visible = max(len * factor, cap)
  double maxCandlesCap{500};
  double rightPaddingCandles{20};   // padding = max(this, visible / 5)
  double defaultVisibleCandles{60};
};

// Bidirectional mapping between data index / time / price and chart pixels.
// The candle array is not owned; the caller keeps it alive.
class ChartViewport {
public:
  void setConfig(const ViewportConfig& cfg) { config_ = cfg; }
  const ViewportConfig& config() const { return config_; }

  void setCandles(const CandleSeries* candles) { candles_ = candles; }
  const CandleSeries* candles() const { return candles_; }
  std::size_t candleCount() const { return candles_ ? candles_->size() : 0; }
  const Candle* candleAt(std::size_t index) const;

  void setTimeframe(const std::string& timeframe) { timeframe_ = timeframe; }
  const std::string& timeframe() const { return timeframe_; }

  void setSize(double width, double height);
  double width() const { return width_; }
  double height() const { return height_; }

  // Raw setters: no clamping. Navigation goes through clampedViewState().
  void setView(const ViewState& v) { view_ = v; }
  const ViewState& view() const { return view_; }
  void setPriceRange(const PriceRange& r) { range_ = r; }
  const PriceRange& priceRange() const { return range_; }

  // Horizontal mapping, relative to the first visible slot.
  double xStep() const;
  double indexToX(double index) const;
  double xToIndex(double x) const;

  // Vertical mapping over [min, max] -> [height, 0].
  double yScale(double price) const;
  double yToPrice(double y) const;

  // Seconds between candles.
  double candleInterval() const;

  // Fractional data index of an absolute time (extrapolated past the data).
  double timeToIndex(double time) const;
  double timeToX(double time) const;
  double xToTime(double x) const;

  PixelPoint toPixel(const Point& p) const;
  Point toPoint(double x, double y) const;

  double maxVisibleCandles() const;
  double rightPadding(double visibleCandles) const;
  ViewState clampedViewState(double startIndex, double visibleCandles) const;
  ViewState defaultViewState() const;

  // True when data index lies in [startIndex, startIndex + visibleCandles].
  bool isIndexVisible(double index) const;

private:
  ViewportConfig config_;
  const CandleSeries* candles_{nullptr};
  std::string timeframe_{"1H"};
  double width_{800};
  double height_{600};
  ViewState view_;
  PriceRange range_;
};

} // namespace ck
