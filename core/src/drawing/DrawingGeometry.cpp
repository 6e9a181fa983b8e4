#include "ck/drawing/DrawingGeometry.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace ck {

namespace {

void shiftPoint(Point& p, double dTime, double dPrice) {
  p.time += dTime;
  p.price += dPrice;
}

bool linePriceAt(const Point& a, const Point& b, double time, double& out) {
  double dt = b.time - a.time;
  if (dt == 0) return false;
  double slope = (b.price - a.price) / dt;
  out = a.price + slope * (time - a.time);
  return true;
}

std::vector<PixelPoint> boxOutline(const PixelPoint& a, const PixelPoint& b) {
  return {{a.x, a.y}, {b.x, a.y}, {b.x, b.y}, {a.x, b.y}, {a.x, a.y}};
}

PixelRect rectOf(const PixelPoint& a, const PixelPoint& b) {
  return {std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x), std::max(a.y, b.y)};
}

} // namespace

std::string handleName(const Handle& h) {
  switch (h.kind) {
    case HandleKind::Start:  return "start";
    case HandleKind::End:    return "end";
    case HandleKind::P2:     return "p2";
    case HandleKind::P2End:  return "p2_end";
    case HandleKind::Vertex: return "p" + std::to_string(h.index);
    case HandleKind::Anchor: return "anchor";
    case HandleKind::Label:  return "label";
    case HandleKind::Entry:  return "entry";
    case HandleKind::Profit: return "profit";
    case HandleKind::Stop:   return "stop";
    case HandleKind::None:
    default:                 return "";
  }
}

void DrawingGeometry::translate(Drawing& d, double dTime, double dPrice) {
  std::visit([&](auto& g) {
    using G = std::decay_t<decltype(g)>;
    if constexpr (std::is_same_v<G, HorizontalLineGeom>) {
      g.price += dPrice;
    } else if constexpr (std::is_same_v<G, VerticalLineGeom>) {
      g.time += dTime;
    } else if constexpr (IsSegmentGeom<G>::value) {
      shiftPoint(g.start, dTime, dPrice);
      shiftPoint(g.end, dTime, dPrice);
    } else if constexpr (std::is_same_v<G, ParallelChannelGeom>) {
      shiftPoint(g.start, dTime, dPrice);
      shiftPoint(g.end, dTime, dPrice);
      shiftPoint(g.p2, dTime, dPrice);
    } else if constexpr (std::is_same_v<G, TextNoteGeom>) {
      shiftPoint(g.point, dTime, dPrice);
    } else if constexpr (std::is_same_v<G, CalloutGeom>) {
      shiftPoint(g.anchor, dTime, dPrice);
      shiftPoint(g.label, dTime, dPrice);
    } else if constexpr (IsPositionGeom<G>::value) {
      shiftPoint(g.entry, dTime, dPrice);
      shiftPoint(g.profit, dTime, dPrice);
      shiftPoint(g.stop, dTime, dPrice);
    } else if constexpr (IsPolylineGeom<G>::value) {
      for (auto& p : g.points) shiftPoint(p, dTime, dPrice);
    } else {
      static_assert(kUnhandledGeom<G>, "unhandled drawing geometry");
    }
  }, d.geom);
}

void DrawingGeometry::shiftTime(Drawing& d, double seconds) {
  translate(d, seconds, 0.0);
}

bool DrawingGeometry::moveHandle(Drawing& d, const Handle& h, const Point& p) {
  return std::visit([&](auto& g) -> bool {
    using G = std::decay_t<decltype(g)>;
    if constexpr (IsSegmentGeom<G>::value) {
      if (h.kind == HandleKind::Start) { g.start = p; return true; }
      if (h.kind == HandleKind::End) { g.end = p; return true; }
      return false;
    } else if constexpr (std::is_same_v<G, ParallelChannelGeom>) {
      switch (h.kind) {
        case HandleKind::Start: g.start = p; return true;
        case HandleKind::End:   g.end = p; return true;
        case HandleKind::P2:    g.p2 = p; return true;
        case HandleKind::P2End:
          // Keep the parallel line's extent equal to the baseline's.
          g.p2 = {p.time - (g.end.time - g.start.time), p.price - (g.end.price - g.start.price)};
          return true;
        default:
          return false;
      }
    } else if constexpr (std::is_same_v<G, CalloutGeom>) {
      if (h.kind == HandleKind::Anchor) { g.anchor = p; return true; }
      if (h.kind == HandleKind::Label) { g.label = p; return true; }
      return false;
    } else if constexpr (IsPositionGeom<G>::value) {
      if (h.kind == HandleKind::Entry) { g.entry = p; return true; }
      if (h.kind == HandleKind::Profit) { g.profit = p; return true; }
      if (h.kind == HandleKind::Stop) { g.stop = p; return true; }
      return false;
    } else if constexpr (std::is_same_v<G, PathGeom>) {
      if (h.kind != HandleKind::Vertex || h.index >= g.points.size()) return false;
      g.points[h.index] = p;
      return true;
    } else if constexpr (std::is_same_v<G, HorizontalLineGeom> ||
                         std::is_same_v<G, VerticalLineGeom> ||
                         std::is_same_v<G, TextNoteGeom> ||
                         std::is_same_v<G, BrushGeom>) {
      return false;
    } else {
      static_assert(kUnhandledGeom<G>, "unhandled drawing geometry");
    }
  }, d.geom);
}

bool DrawingGeometry::referenceTime(const Drawing& d, double& out) {
  return std::visit([&](const auto& g) -> bool {
    using G = std::decay_t<decltype(g)>;
    if constexpr (std::is_same_v<G, HorizontalLineGeom>) {
      return false;
    } else if constexpr (std::is_same_v<G, VerticalLineGeom>) {
      out = g.time;
      return true;
    } else if constexpr (IsSegmentGeom<G>::value || std::is_same_v<G, ParallelChannelGeom>) {
      out = g.start.time;
      return true;
    } else if constexpr (std::is_same_v<G, TextNoteGeom>) {
      out = g.point.time;
      return true;
    } else if constexpr (std::is_same_v<G, CalloutGeom>) {
      out = g.anchor.time;
      return true;
    } else if constexpr (IsPositionGeom<G>::value) {
      out = g.entry.time;
      return true;
    } else if constexpr (IsPolylineGeom<G>::value) {
      if (g.points.empty()) return false;
      out = g.points.front().time;
      return true;
    } else {
      static_assert(kUnhandledGeom<G>, "unhandled drawing geometry");
    }
  }, d.geom);
}

bool DrawingGeometry::priceAtTime(const Drawing& d, double time, double& out) {
  if (const auto* g = d.as<HorizontalLineGeom>()) {
    out = g->price;
    return true;
  }
  if (const auto* g = d.as<HorizontalRayGeom>()) {
    if (time < g->start.time) return false;
    out = g->start.price;
    return true;
  }
  if (const auto* g = d.as<RayGeom>()) {
    if (time < g->start.time) return false;
    return linePriceAt(g->start, g->end, time, out);
  }

  const Point* a = nullptr;
  const Point* b = nullptr;
  if (const auto* g = d.as<TrendLineGeom>()) { a = &g->start; b = &g->end; }
  else if (const auto* g = d.as<ArrowGeom>()) { a = &g->start; b = &g->end; }
  if (!a) return false;

  if (time < std::min(a->time, b->time) || time > std::max(a->time, b->time)) return false;
  return linePriceAt(*a, *b, time, out);
}

bool DrawingGeometry::priceBandAtTime(const Drawing& d, double time,
                                      double& lower, double& upper) {
  if (const auto* g = d.as<ParallelChannelGeom>()) {
    if (time < std::min(g->start.time, g->end.time) ||
        time > std::max(g->start.time, g->end.time)) return false;
    double p1 = 0;
    if (!linePriceAt(g->start, g->end, time, p1)) return false;
    double slope = (g->end.price - g->start.price) / (g->end.time - g->start.time);
    double p2 = g->p2.price + slope * (time - g->p2.time);
    lower = std::min(p1, p2);
    upper = std::max(p1, p2);
    return true;
  }

  return std::visit([&](const auto& g) -> bool {
    using G = std::decay_t<decltype(g)>;
    if constexpr (IsSegmentGeom<G>::value) {
      if (!isBoxType(G::kType) || G::kType == DrawingType::DateRange) return false;
      if (time < std::min(g.start.time, g.end.time) ||
          time > std::max(g.start.time, g.end.time)) return false;
      lower = std::min(g.start.price, g.end.price);
      upper = std::max(g.start.price, g.end.price);
      return true;
    } else if constexpr (IsPositionGeom<G>::value) {
      lower = std::min(g.profit.price, g.stop.price);
      upper = std::max(g.profit.price, g.stop.price);
      return true;
    } else {
      return false;
    }
  }, d.geom);
}

PixelRect DrawingGeometry::textNoteBox(const Drawing& d, const TextNoteGeom& g,
                                       const ChartViewport& vp) {
  const double padding = 8;
  double fontSize = d.style.fontSize > 0 ? d.style.fontSize : kDefaultFontSize;
  double w = static_cast<double>(g.text.size()) * (fontSize * 0.6) + padding * 2;
  double h = fontSize + padding * 2;
  PixelPoint p = vp.toPixel(g.point);
  return {p.x, p.y - h + padding, p.x + w, p.y + padding};
}

PixelRect DrawingGeometry::calloutBox(const CalloutGeom& g, const ChartViewport& vp) {
  const double fontSize = 12;
  const double padding = 8;
  double w = static_cast<double>(g.text.size()) * (fontSize * 0.6) + padding * 3;
  double h = fontSize + padding * 2 + 10;
  PixelPoint c = vp.toPixel(g.label);
  return {c.x - w / 2, c.y - h / 2, c.x + w / 2, c.y + h / 2};
}

void DrawingGeometry::channelParallel(const ParallelChannelGeom& g, const ChartViewport& vp,
                                      PixelPoint& l2Start, PixelPoint& l2End) {
  PixelPoint s = vp.toPixel(g.start);
  PixelPoint e = vp.toPixel(g.end);
  PixelPoint p2 = vp.toPixel(g.p2);
  double dx = e.x - s.x;
  double dy = e.y - s.y;
  double len = std::sqrt(dx * dx + dy * dy);
  if (len == 0) {
    l2Start = p2;
    l2End = p2;
    return;
  }
  double nx = -dy / len;
  double ny = dx / len;
  double width = (p2.x - s.x) * nx + (p2.y - s.y) * ny;
  l2Start = {s.x + nx * width, s.y + ny * width};
  l2End = {e.x + nx * width, e.y + ny * width};
}

PixelPoint DrawingGeometry::rayFarEnd(const PixelPoint& start, const PixelPoint& through,
                                      const ChartViewport& vp) {
  double dx = through.x - start.x;
  double dy = through.y - start.y;
  double len = std::sqrt(dx * dx + dy * dy);
  if (len == 0) return through;
  double reach = (vp.width() + vp.height() + std::fabs(start.x) + std::fabs(start.y)) * 2.0;
  double k = reach / len;
  return {start.x + dx * k, start.y + dy * k};
}

DrawingProjection DrawingGeometry::project(const Drawing& d, const ChartViewport& vp) {
  DrawingProjection out;
  out.id = d.id;
  out.type = d.type();

  auto handle = [&](HandleKind kind, const Point& p, std::size_t index = 0) {
    out.handles.push_back({{kind, index}, vp.toPixel(p)});
  };

  std::visit([&](const auto& g) {
    using G = std::decay_t<decltype(g)>;
    if constexpr (std::is_same_v<G, HorizontalLineGeom>) {
      double y = vp.yScale(g.price);
      out.polylines.push_back({{0, y}, {vp.width(), y}});
    } else if constexpr (std::is_same_v<G, VerticalLineGeom>) {
      double x = vp.timeToX(g.time);
      out.polylines.push_back({{x, 0}, {x, vp.height()}});
    } else if constexpr (IsSegmentGeom<G>::value) {
      PixelPoint s = vp.toPixel(g.start);
      PixelPoint e = vp.toPixel(g.end);
      handle(HandleKind::Start, g.start);
      if (G::kType != DrawingType::HorizontalRay) handle(HandleKind::End, g.end);

      if constexpr (G::kType == DrawingType::Ray) {
        out.polylines.push_back({s, rayFarEnd(s, e, vp)});
      } else if constexpr (G::kType == DrawingType::HorizontalRay) {
        out.polylines.push_back({s, {std::max(s.x, vp.width()), s.y}});
      } else if constexpr (G::kType == DrawingType::FibRetracement) {
        out.polylines.push_back({s, e});
        double x0 = std::min(s.x, e.x);
        double x1 = std::max(s.x, e.x);
        double diff = g.end.price - g.start.price;
        for (double level : effectiveLevels(d)) {
          double price = g.start.price + diff * level;
          out.levels.push_back({level, price, vp.yScale(price), x0, x1});
        }
      } else if constexpr (G::kType == DrawingType::GannBox) {
        out.polylines.push_back(boxOutline(s, e));
        out.polylines.push_back({s, e});
        out.boxes.push_back(rectOf(s, e));
        double diff = g.end.price - g.start.price;
        for (double level : effectiveLevels(d)) {
          double price = g.start.price + diff * level;
          out.levels.push_back({level, price, vp.yScale(price),
                                std::min(s.x, e.x), std::max(s.x, e.x)});
        }
      } else if constexpr (isBoxType(G::kType)) {
        out.polylines.push_back(boxOutline(s, e));
        out.boxes.push_back(rectOf(s, e));
      } else {
        out.polylines.push_back({s, e});
      }
    } else if constexpr (std::is_same_v<G, ParallelChannelGeom>) {
      PixelPoint s = vp.toPixel(g.start);
      PixelPoint e = vp.toPixel(g.end);
      PixelPoint l2s, l2e;
      channelParallel(g, vp, l2s, l2e);
      out.polylines.push_back({s, e});
      out.polylines.push_back({l2s, l2e});
      handle(HandleKind::Start, g.start);
      handle(HandleKind::End, g.end);
      handle(HandleKind::P2, g.p2);
      out.handles.push_back({{HandleKind::P2End, 0}, l2e});
    } else if constexpr (std::is_same_v<G, TextNoteGeom>) {
      out.boxes.push_back(textNoteBox(d, g, vp));
    } else if constexpr (std::is_same_v<G, CalloutGeom>) {
      out.polylines.push_back({vp.toPixel(g.anchor), vp.toPixel(g.label)});
      out.boxes.push_back(calloutBox(g, vp));
      handle(HandleKind::Anchor, g.anchor);
      handle(HandleKind::Label, g.label);
    } else if constexpr (IsPositionGeom<G>::value) {
      PixelPoint en = vp.toPixel(g.entry);
      PixelPoint pr = vp.toPixel(g.profit);
      PixelPoint st = vp.toPixel(g.stop);
      double x0 = std::min(en.x, pr.x);
      double x1 = std::max(en.x, pr.x);
      out.boxes.push_back({x0, std::min(en.y, pr.y), x1, std::max(en.y, pr.y)});   // profit zone
      out.boxes.push_back({x0, std::min(en.y, st.y), x1, std::max(en.y, st.y)});   // stop zone
      out.polylines.push_back({{x0, en.y}, {x1, en.y}});
      handle(HandleKind::Entry, g.entry);
      handle(HandleKind::Profit, g.profit);
      handle(HandleKind::Stop, g.stop);
    } else if constexpr (IsPolylineGeom<G>::value) {
      std::vector<PixelPoint> line;
      line.reserve(g.points.size());
      for (std::size_t i = 0; i < g.points.size(); ++i) {
        line.push_back(vp.toPixel(g.points[i]));
        if constexpr (G::kType == DrawingType::Path) handle(HandleKind::Vertex, g.points[i], i);
      }
      if (line.size() >= 2) out.polylines.push_back(std::move(line));
    } else {
      static_assert(kUnhandledGeom<G>, "unhandled drawing geometry");
    }
  }, d.geom);

  return out;
}

} // namespace ck
