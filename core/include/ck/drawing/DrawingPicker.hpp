#pragma once
#include "ck/drawing/DrawingGeometry.hpp"
#include "ck/ids/Id.hpp"
#include <vector>

namespace ck {

struct PickConfig {
  double hitboxWidthPx{12.0};   // line / edge proximity
  double handleRadiusPx{8.0};   // circular handle hit radius
};

struct DrawingHit {
  bool hit{false};
  Id drawingId{kInvalidId};
  Handle handle;                // kind None = body hit (move)

  bool onHandle() const { return handle.kind != HandleKind::None; }
};

// Hit-tests drawings back-to-front so the most recently added match wins.
// Handles are tested before bodies. All comparisons use squared distances.
class DrawingPicker {
public:
  void setConfig(const PickConfig& cfg) { config_ = cfg; }
  const PickConfig& config() const { return config_; }

  DrawingHit pick(double x, double y, const std::vector<Drawing>& drawings,
                  const ChartViewport& vp) const;

  // Test a single drawing.
  DrawingHit test(double x, double y, const Drawing& d, const ChartViewport& vp) const;

private:
  PickConfig config_;
};

} // namespace ck
