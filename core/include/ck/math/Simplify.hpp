#pragma once
#include "ck/data/Point.hpp"
#include <vector>

namespace ck {

// Ramer-Douglas-Peucker polyline simplification in pixel space.
// A point survives when its distance to the current chord exceeds epsilon.
// Inputs with fewer than 3 points are returned unchanged.
std::vector<PixelPoint> simplifyPolyline(const std::vector<PixelPoint>& pts, double epsilon);

} // namespace ck
