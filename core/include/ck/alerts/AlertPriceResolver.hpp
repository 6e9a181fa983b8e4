#pragma once
#include "ck/alerts/Alert.hpp"
#include "ck/drawing/Drawing.hpp"
#include "ck/indicators/Indicator.hpp"

#include <optional>
#include <string>

namespace ck {

// Live target of an alert: a single price for line-like sources, a
// [lower, upper] band for area-like drawings.
struct ResolvedPrice {
  bool valid{false};
  bool isBand{false};
  double price{0};
  double lower{0};
  double upper{0};
};

class AlertPriceResolver {
public:
  // Target of a drawing-linked alert. The drawing is evaluated at its own
  // reference time, or at fallbackTime (last candle) when it has none.
  static ResolvedPrice resolveDrawing(const Drawing& d, std::optional<double> fibLevel,
                                      double fallbackTime);

  // Target of a drawing evaluated at an explicit time.
  static ResolvedPrice resolveDrawingAt(const Drawing& d, double time,
                                        std::optional<double> fibLevel);

  // start + (end - start) * level.
  static double fibPrice(const FibRetracementGeom& g, double level);

  // Last finite value of the named indicator series.
  static ResolvedPrice resolveIndicator(const IndicatorOutput& output, const std::string& series);

  // Dispatch on the alert's link. `drawing` / `indicator` are the linked
  // sources (null when unlinked or unknown); unlinked alerts use `value`.
  static ResolvedPrice resolve(const PriceAlert& a, const Drawing* drawing,
                               const IndicatorOutput* indicator, double lastCandleTime);
};

// True when moving from prev to current satisfies the condition against
// the resolved target. Channel conditions need a band, the rest a price.
bool evaluateCondition(AlertCondition condition, double prev, double current,
                       const ResolvedPrice& target);

} // namespace ck
