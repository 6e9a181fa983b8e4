#include "ck/math/Simplify.hpp"
#include "ck/math/Geometry2D.hpp"

#include <cstddef>

namespace ck {

namespace {

void simplifyRange(const std::vector<PixelPoint>& pts, std::size_t first, std::size_t last,
                   double epsilonSq, std::vector<PixelPoint>& out) {
  double dmax = 0;
  std::size_t index = first;
  for (std::size_t i = first + 1; i < last; ++i) {
    double d = distToSegmentSq(pts[i], pts[first], pts[last]);
    if (d > dmax) {
      index = i;
      dmax = d;
    }
  }

  if (dmax > epsilonSq) {
    simplifyRange(pts, first, index, epsilonSq, out);
    out.pop_back();   // shared vertex
    simplifyRange(pts, index, last, epsilonSq, out);
  } else {
    out.push_back(pts[first]);
    out.push_back(pts[last]);
  }
}

} // namespace

std::vector<PixelPoint> simplifyPolyline(const std::vector<PixelPoint>& pts, double epsilon) {
  if (pts.size() < 3) return pts;

  std::vector<PixelPoint> out;
  out.reserve(pts.size());
  simplifyRange(pts, 0, pts.size() - 1, epsilon * epsilon, out);
  return out;
}

} // namespace ck
