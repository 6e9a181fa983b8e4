#pragma once

namespace ck {

// Domain-space coordinate.
struct Point {
  double time{0};
  double price{0};

  bool operator==(const Point& o) const { return time == o.time && price == o.price; }
  bool operator!=(const Point& o) const { return !(*this == o); }
};

// Screen-space coordinate, 0 = left/top of the chart area.
struct PixelPoint {
  double x{0};
  double y{0};
};

} // namespace ck
