#include "ck/drawing/DrawingPicker.hpp"
#include "ck/math/Geometry2D.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace ck {

DrawingHit DrawingPicker::pick(double x, double y, const std::vector<Drawing>& drawings,
                               const ChartViewport& vp) const {
  for (auto it = drawings.rbegin(); it != drawings.rend(); ++it) {
    if (!it->isVisible) continue;
    DrawingHit h = test(x, y, *it, vp);
    if (h.hit) return h;
  }
  return {};
}

DrawingHit DrawingPicker::test(double x, double y, const Drawing& d,
                               const ChartViewport& vp) const {
  const PixelPoint p{x, y};
  const double hitbox = config_.hitboxWidthPx;
  const double hitboxSq = hitbox * hitbox;
  const double handleSq = config_.handleRadiusPx * config_.handleRadiusPx;

  DrawingHit result;
  auto body = [&]() {
    result.hit = true;
    result.drawingId = d.id;
    return result;
  };
  auto grab = [&](HandleKind kind, std::size_t index = 0) {
    result.hit = true;
    result.drawingId = d.id;
    result.handle = {kind, index};
    return result;
  };
  auto nearHandle = [&](const PixelPoint& h) { return distSq(p, h) < handleSq; };

  return std::visit([&](const auto& g) -> DrawingHit {
    using G = std::decay_t<decltype(g)>;

    if constexpr (std::is_same_v<G, HorizontalLineGeom>) {
      if (std::fabs(y - vp.yScale(g.price)) < hitbox) return body();
    } else if constexpr (std::is_same_v<G, VerticalLineGeom>) {
      if (std::fabs(x - vp.timeToX(g.time)) < hitbox) return body();
    } else if constexpr (G::kType == DrawingType::HorizontalRay) {
      PixelPoint s = vp.toPixel(g.start);
      if (nearHandle(s)) return grab(HandleKind::Start);
      if (std::fabs(y - s.y) < hitbox && x >= s.x) return body();
    } else if constexpr (std::is_same_v<G, TextNoteGeom>) {
      if (DrawingGeometry::textNoteBox(d, g, vp).contains(x, y)) return body();
    } else if constexpr (std::is_same_v<G, CalloutGeom>) {
      if (nearHandle(vp.toPixel(g.anchor))) return grab(HandleKind::Anchor);
      if (nearHandle(vp.toPixel(g.label))) return grab(HandleKind::Label);
      if (DrawingGeometry::calloutBox(g, vp).contains(x, y)) return body();
    } else if constexpr (IsPositionGeom<G>::value) {
      PixelPoint en = vp.toPixel(g.entry);
      PixelPoint pr = vp.toPixel(g.profit);
      PixelPoint st = vp.toPixel(g.stop);
      if (nearHandle(en)) return grab(HandleKind::Entry);
      if (nearHandle(pr)) return grab(HandleKind::Profit);
      if (nearHandle(st)) return grab(HandleKind::Stop);

      double minX = std::min(en.x, pr.x);
      double maxX = std::max(en.x, pr.x);
      if (x >= minX && x <= maxX) {
        if (y >= std::min(en.y, pr.y) && y <= std::max(en.y, pr.y)) return body();
        if (y >= std::min(en.y, st.y) && y <= std::max(en.y, st.y)) return body();
      }
    } else if constexpr (std::is_same_v<G, ParallelChannelGeom>) {
      PixelPoint s = vp.toPixel(g.start);
      PixelPoint e = vp.toPixel(g.end);
      if (nearHandle(s)) return grab(HandleKind::Start);
      if (nearHandle(e)) return grab(HandleKind::End);
      if (nearHandle(vp.toPixel(g.p2))) return grab(HandleKind::P2);
      if (distToSegmentSq(p, s, e) < hitboxSq) return body();

      double dx = e.x - s.x;
      double dy = e.y - s.y;
      double len = std::sqrt(dx * dx + dy * dy);
      if (len > 0) {
        PixelPoint l2s, l2e;
        DrawingGeometry::channelParallel(g, vp, l2s, l2e);
        if (nearHandle(l2e)) return grab(HandleKind::P2End);
        if (distToSegmentSq(p, l2s, l2e) < hitboxSq) return body();

        // Interior: between the lines along the normal, within the baseline span.
        double nx = -dy / len;
        double ny = dx / len;
        double width = (l2s.x - s.x) * nx + (l2s.y - s.y) * ny;
        double along = (x - s.x) * nx + (y - s.y) * ny;
        if (along * width >= 0 && std::fabs(along) <= std::fabs(width)) {
          double t = projectOnSegment(p, s, e);
          if (t >= 0 && t <= 1) return body();
        }
      }
    } else if constexpr (G::kType == DrawingType::FibRetracement) {
      PixelPoint s = vp.toPixel(g.start);
      PixelPoint e = vp.toPixel(g.end);
      if (nearHandle(s)) return grab(HandleKind::Start);
      if (nearHandle(e)) return grab(HandleKind::End);
      if (distToSegmentSq(p, s, e) < hitboxSq) return body();

      double diff = g.end.price - g.start.price;
      double minX = std::min(s.x, e.x);
      double maxX = std::max(s.x, e.x);
      for (double level : effectiveLevels(d)) {
        double ly = vp.yScale(g.start.price + diff * level);
        if (std::fabs(y - ly) < hitbox && x >= minX && x <= maxX) return body();
      }
    } else if constexpr (IsPolylineGeom<G>::value) {
      if (g.points.size() < 2) return result;
      std::vector<PixelPoint> px;
      px.reserve(g.points.size());
      for (const auto& pt : g.points) px.push_back(vp.toPixel(pt));

      if constexpr (G::kType == DrawingType::Path) {
        for (std::size_t i = 0; i < px.size(); ++i) {
          if (nearHandle(px[i])) return grab(HandleKind::Vertex, i);
        }
      }
      for (std::size_t i = 0; i + 1 < px.size(); ++i) {
        if (distToSegmentSq(p, px[i], px[i + 1]) < hitboxSq) return body();
      }
    } else if constexpr (IsSegmentGeom<G>::value) {
      PixelPoint s = vp.toPixel(g.start);
      PixelPoint e = vp.toPixel(g.end);
      if (nearHandle(s)) return grab(HandleKind::Start);
      if (nearHandle(e)) return grab(HandleKind::End);

      if constexpr (isBoxType(G::kType)) {
        double minX = std::min(s.x, e.x);
        double maxX = std::max(s.x, e.x);
        double minY = std::min(s.y, e.y);
        double maxY = std::max(s.y, e.y);
        // Left edge resizes whichever corner sits on it.
        if (std::fabs(x - minX) < hitbox && y > minY && y < maxY) {
          return grab(s.x <= e.x ? HandleKind::Start : HandleKind::End);
        }
        if (x > minX && x < maxX && y > minY && y < maxY) return body();
      } else if constexpr (G::kType == DrawingType::Ray) {
        if (distToSegmentSq(p, s, DrawingGeometry::rayFarEnd(s, e, vp)) < hitboxSq) return body();
      } else {
        if (distToSegmentSq(p, s, e) < hitboxSq) return body();
      }
    } else {
      static_assert(kUnhandledGeom<G>, "unhandled drawing geometry");
    }
    return result;
  }, d.geom);
}

} // namespace ck
