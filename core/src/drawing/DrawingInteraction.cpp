#include "ck/drawing/DrawingInteraction.hpp"
#include "ck/math/Geometry2D.hpp"
#include "ck/math/Simplify.hpp"

#include <cmath>

namespace ck {

namespace {

DrawingStyle defaultStyle() {
  DrawingStyle s;
  s.fillColor = kDefaultFillColor;
  return s;
}

bool dragged(const Point& a, const Point& b) {
  return a.time != b.time || a.price != b.price;
}

} // namespace

void DrawingInteraction::setTool(DrawingType type) {
  tool_ = type;
  hasTool_ = true;
}

void DrawingInteraction::cancel() {
  hasTool_ = false;
  hasCurrent_ = false;
  current_ = CurrentDrawing{};
}

CreationResult DrawingInteraction::complete(bool editText, bool select) {
  CreationResult r;
  r.event = CreationEvent::Completed;
  r.drawing = std::move(current_.drawing);
  r.editText = editText;
  r.select = select;
  cancel();
  return r;
}

CreationResult DrawingInteraction::onClick(const Point& p, double candleInterval) {
  if (hasCurrent_) return continueCurrent(p);
  if (hasTool_) return startNew(p, candleInterval);
  return {};
}

CreationResult DrawingInteraction::startNew(const Point& p, double candleInterval) {
  current_ = CurrentDrawing{};
  current_.drawing.style = defaultStyle();
  current_.step = 1;
  hasCurrent_ = true;

  switch (tool_) {
    case DrawingType::HorizontalLine:
    case DrawingType::VerticalLine:
      current_.drawing.geom = makeGeometry(tool_, p);
      return complete();

    case DrawingType::TextNote:
      current_.drawing.geom = makeGeometry(tool_, p);
      current_.drawing.style.fontSize = kDefaultFontSize;
      return complete(true);

    case DrawingType::LongPosition:
    case DrawingType::ShortPosition: {
      double offset = p.price * config_.positionOffsetFraction;
      double interval = candleInterval != 0 ? candleInterval : 3600.0;
      double future = p.time + interval * config_.positionBars;
      Point above{future, p.price + offset};
      Point below{future, p.price - offset};
      if (tool_ == DrawingType::LongPosition) {
        current_.drawing.geom = LongPositionGeom{p, above, below};
      } else {
        current_.drawing.geom = ShortPositionGeom{p, below, above};
      }
      return complete(false, true);
    }

    case DrawingType::ParallelChannel:
      current_.drawing.geom = makeGeometry(tool_, p);
      current_.drawing.style.fillColor = kChannelFillColor;
      break;

    case DrawingType::Callout:
      current_.drawing.geom = CalloutGeom{p, p, "Note..."};
      break;

    default:
      current_.drawing.geom = makeGeometry(tool_, p);
      break;
  }

  CreationResult r;
  r.event = CreationEvent::Started;
  return r;
}

CreationResult DrawingInteraction::continueCurrent(const Point& p) {
  Drawing& d = current_.drawing;
  CreationResult r;
  r.event = CreationEvent::Updated;

  if (auto* path = d.as<PathGeom>()) {
    // Pin the ghost vertex and start a new ghost.
    if (path->points.empty()) path->points.push_back(p);
    path->points.back() = p;
    path->points.push_back(p);
    return r;
  }

  if (auto* ch = d.as<ParallelChannelGeom>()) {
    if (current_.step == 1) {
      ch->end = p;
      ch->p2 = p;
      current_.step = 2;
      return r;
    }
    ch->p2 = p;
    return complete();
  }

  if (auto* c = d.as<CalloutGeom>()) {
    c->label = p;
    return complete(true);
  }

  if (isTwoPointType(d.type())) {
    std::visit([&](auto& g) {
      using G = std::decay_t<decltype(g)>;
      if constexpr (IsSegmentGeom<G>::value) g.end = p;
    }, d.geom);
    return complete();
  }

  // Brush accretes through onMove only.
  return {};
}

CreationResult DrawingInteraction::onMove(const Point& p, const ChartViewport& vp) {
  if (!hasCurrent_) return {};
  Drawing& d = current_.drawing;
  CreationResult r;
  r.event = CreationEvent::Updated;

  if (auto* path = d.as<PathGeom>()) {
    if (!path->points.empty()) path->points.back() = p;
    return r;
  }
  if (auto* brush = d.as<BrushGeom>()) {
    if (brush->points.empty()) {
      brush->points.push_back(p);
      return r;
    }
    double stepSq = config_.brushMinStepPx * config_.brushMinStepPx;
    if (distSq(vp.toPixel(brush->points.back()), vp.toPixel(p)) > stepSq) {
      brush->points.push_back(p);
      return r;
    }
    return {};
  }
  if (auto* ch = d.as<ParallelChannelGeom>()) {
    if (current_.step == 1) {
      ch->end = p;
      ch->p2 = p;
    } else {
      ch->p2 = p;
    }
    return r;
  }
  if (auto* c = d.as<CalloutGeom>()) {
    c->label = p;
    return r;
  }

  std::visit([&](auto& g) {
    using G = std::decay_t<decltype(g)>;
    if constexpr (IsSegmentGeom<G>::value) g.end = p;
  }, d.geom);
  return r;
}

CreationResult DrawingInteraction::onRelease(const ChartViewport& vp) {
  if (!hasCurrent_) return {};
  Drawing& d = current_.drawing;

  if (auto* brush = d.as<BrushGeom>()) {
    std::vector<PixelPoint> px;
    px.reserve(brush->points.size());
    for (const auto& p : brush->points) px.push_back(vp.toPixel(p));

    std::vector<PixelPoint> simplified = simplifyPolyline(px, config_.brushEpsilonPx);
    std::vector<Point> pts;
    pts.reserve(simplified.size());
    for (const auto& s : simplified) pts.push_back(vp.toPoint(s.x, s.y));
    brush->points = std::move(pts);
    return complete();
  }

  if (auto* c = d.as<CalloutGeom>()) {
    if (dragged(c->anchor, c->label)) return complete(true);
    return {};
  }

  if (auto* ch = d.as<ParallelChannelGeom>()) {
    // Baseline may be drag-drawn; p2 always needs its own click.
    if (current_.step == 1 && dragged(ch->start, ch->end)) {
      current_.step = 2;
      CreationResult r;
      r.event = CreationEvent::Updated;
      return r;
    }
    return {};
  }

  if (isTwoPointType(d.type())) {
    bool moved = std::visit([&](const auto& g) -> bool {
      using G = std::decay_t<decltype(g)>;
      if constexpr (IsSegmentGeom<G>::value) return dragged(g.start, g.end);
      else return false;
    }, d.geom);
    if (moved) return complete();
    if (current_.step == 1) {
      current_.step = 2;
      CreationResult r;
      r.event = CreationEvent::Updated;
      return r;
    }
  }
  return {};
}

CreationResult DrawingInteraction::onDoubleClick() {
  if (!hasCurrent_) return {};
  auto* path = current_.drawing.as<PathGeom>();
  if (!path) return {};

  auto& pts = path->points;
  if (!pts.empty()) pts.pop_back();
  // The double-click's own clicks pin the same vertex twice.
  while (pts.size() >= 2 && pts[pts.size() - 1] == pts[pts.size() - 2]) pts.pop_back();

  if (pts.size() < 2) {
    cancel();
    return {};
  }
  return complete();
}

} // namespace ck
