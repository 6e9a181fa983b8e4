#pragma once
#include "ck/data/Point.hpp"

namespace ck {

// Pixel-space distance helpers. All return squared distances.

double distSq(const PixelPoint& a, const PixelPoint& b);

// Distance to the closest point of segment [v, w].
double distToSegmentSq(const PixelPoint& p, const PixelPoint& v, const PixelPoint& w);

// Projection parameter of p onto [v, w], unclamped. 0 when v == w.
double projectOnSegment(const PixelPoint& p, const PixelPoint& v, const PixelPoint& w);

} // namespace ck
