#pragma once
#include "ck/drawing/Drawing.hpp"
#include "ck/viewport/ChartViewport.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ck {

// Draggable control points. Vertex carries an index into a Path.
enum class HandleKind : std::uint8_t {
  None = 0,
  Start,
  End,
  P2,
  P2End,     // end of the channel's parallel line
  Vertex,
  Anchor,
  Label,
  Entry,
  Profit,
  Stop
};

struct Handle {
  HandleKind kind{HandleKind::None};
  std::size_t index{0};

  bool operator==(const Handle& o) const { return kind == o.kind && index == o.index; }
  bool operator!=(const Handle& o) const { return !(*this == o); }
};

// "start", "p2_end", "p3", ...
std::string handleName(const Handle& h);

struct PixelRect {
  double x0{0}, y0{0}, x1{0}, y1{0};

  bool contains(double x, double y) const { return x >= x0 && x <= x1 && y >= y0 && y <= y1; }
};

// Screen-space output for the rendering layer.
struct LevelLine {
  double ratio{0};
  double price{0};
  double y{0};
  double x0{0}, x1{0};
};

struct HandleMarker {
  Handle handle;
  PixelPoint pos;
};

struct DrawingProjection {
  Id id{kInvalidId};
  DrawingType type{DrawingType::TrendLine};
  std::vector<std::vector<PixelPoint>> polylines;
  std::vector<PixelRect> boxes;
  std::vector<LevelLine> levels;
  std::vector<HandleMarker> handles;
};

class DrawingGeometry {
public:
  // Add (dTime, dPrice) to every anchor. Horizontal Line moves in price
  // only, Vertical Line in time only.
  static void translate(Drawing& d, double dTime, double dPrice);

  // Shift every time coordinate.
  static void shiftTime(Drawing& d, double seconds);

  // Move one handle to p. Returns false if the kind has no such handle.
  static bool moveHandle(Drawing& d, const Handle& h, const Point& p);

  // Time the drawing is anchored at (start / point / entry / anchor).
  // Returns false for Horizontal Line, which has no time axis.
  static bool referenceTime(const Drawing& d, double& out);

  // Price of a line-like drawing at a time. Trend Line is bounded to its
  // time span, Ray and Horizontal Ray to t >= start. Returns false where the
  // line is undefined (outside bounds, vertical segment, non-line kinds).
  static bool priceAtTime(const Drawing& d, double time, double& out);

  // Price band of an area-like drawing at a time.
  static bool priceBandAtTime(const Drawing& d, double time, double& lower, double& upper);

  // Text boxes shared by picking and rendering.
  static PixelRect textNoteBox(const Drawing& d, const TextNoteGeom& g, const ChartViewport& vp);
  static PixelRect calloutBox(const CalloutGeom& g, const ChartViewport& vp);

  // Parallel line of a channel in pixel space.
  static void channelParallel(const ParallelChannelGeom& g, const ChartViewport& vp,
                              PixelPoint& l2Start, PixelPoint& l2End);

  // Far end of a ray, extended past the chart bounds.
  static PixelPoint rayFarEnd(const PixelPoint& start, const PixelPoint& through,
                              const ChartViewport& vp);

  static DrawingProjection project(const Drawing& d, const ChartViewport& vp);
};

} // namespace ck
