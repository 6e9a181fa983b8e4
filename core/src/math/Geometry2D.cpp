#include "ck/math/Geometry2D.hpp"
#include <algorithm>

namespace ck {

double distSq(const PixelPoint& a, const PixelPoint& b) {
  double dx = a.x - b.x;
  double dy = a.y - b.y;
  return dx * dx + dy * dy;
}

double projectOnSegment(const PixelPoint& p, const PixelPoint& v, const PixelPoint& w) {
  double l2 = distSq(v, w);
  if (l2 == 0) return 0;
  return ((p.x - v.x) * (w.x - v.x) + (p.y - v.y) * (w.y - v.y)) / l2;
}

double distToSegmentSq(const PixelPoint& p, const PixelPoint& v, const PixelPoint& w) {
  if (distSq(v, w) == 0) return distSq(p, v);
  double t = std::max(0.0, std::min(1.0, projectOnSegment(p, v, w)));
  PixelPoint c{v.x + t * (w.x - v.x), v.y + t * (w.y - v.y)};
  return distSq(p, c);
}

} // namespace ck
