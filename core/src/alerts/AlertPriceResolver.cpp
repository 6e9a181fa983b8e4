#include "ck/alerts/AlertPriceResolver.hpp"
#include "ck/drawing/DrawingGeometry.hpp"
#include "ck/indicators/IndicatorRegistry.hpp"

namespace ck {

namespace {

ResolvedPrice single(double price) {
  ResolvedPrice r;
  r.valid = true;
  r.price = price;
  return r;
}

} // namespace

double AlertPriceResolver::fibPrice(const FibRetracementGeom& g, double level) {
  return g.start.price + (g.end.price - g.start.price) * level;
}

ResolvedPrice AlertPriceResolver::resolveDrawing(const Drawing& d, std::optional<double> fibLevel,
                                                 double fallbackTime) {
  double t = fallbackTime;
  if (!DrawingGeometry::referenceTime(d, t)) t = fallbackTime;
  return resolveDrawingAt(d, t, fibLevel);
}

ResolvedPrice AlertPriceResolver::resolveDrawingAt(const Drawing& d, double time,
                                                   std::optional<double> fibLevel) {
  if (const auto* fib = d.as<FibRetracementGeom>()) {
    if (!fibLevel) return {};
    return single(fibPrice(*fib, *fibLevel));
  }

  double price = 0;
  if (DrawingGeometry::priceAtTime(d, time, price)) return single(price);

  ResolvedPrice band;
  if (DrawingGeometry::priceBandAtTime(d, time, band.lower, band.upper)) {
    band.valid = true;
    band.isBand = true;
    band.price = (band.lower + band.upper) / 2.0;
    return band;
  }
  return {};
}

ResolvedPrice AlertPriceResolver::resolveIndicator(const IndicatorOutput& output,
                                                   const std::string& series) {
  double v = 0;
  if (!latestValue(output, series, v)) return {};
  return single(v);
}

ResolvedPrice AlertPriceResolver::resolve(const PriceAlert& a, const Drawing* drawing,
                                          const IndicatorOutput* indicator,
                                          double lastCandleTime) {
  if (a.hasDrawing()) {
    if (!drawing) return {};
    return resolveDrawing(*drawing, a.fibLevel, lastCandleTime);
  }
  if (a.hasIndicator()) {
    if (!indicator) return {};
    return resolveIndicator(*indicator, a.series);
  }
  if (a.value) return single(*a.value);
  return {};
}

bool evaluateCondition(AlertCondition condition, double prev, double current,
                       const ResolvedPrice& target) {
  if (!target.valid) return false;

  if (isChannelCondition(condition)) {
    if (!target.isBand) return false;
    bool wasInside = prev >= target.lower && prev <= target.upper;
    bool isInside = current >= target.lower && current <= target.upper;
    if (condition == AlertCondition::EnteringChannel) return !wasInside && isInside;
    return wasInside && !isInside;
  }

  if (target.isBand) return false;
  double t = target.price;
  switch (condition) {
    case AlertCondition::Crossing:
      return (prev < t && current >= t) || (prev > t && current <= t);
    case AlertCondition::CrossingUp:   return prev < t && current >= t;
    case AlertCondition::CrossingDown: return prev > t && current <= t;
    case AlertCondition::GreaterThan:  return current > t;
    case AlertCondition::LessThan:     return current < t;
    default:                           return false;
  }
}

} // namespace ck
