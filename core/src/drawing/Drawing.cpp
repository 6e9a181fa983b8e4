#include "ck/drawing/Drawing.hpp"

namespace ck {

namespace {

struct TypeName {
  DrawingType type;
  const char* name;
};

const TypeName kTypeNames[] = {
  {DrawingType::HorizontalLine, "Horizontal Line"},
  {DrawingType::VerticalLine, "Vertical Line"},
  {DrawingType::TrendLine, "Trend Line"},
  {DrawingType::Ray, "Ray"},
  {DrawingType::HorizontalRay, "Horizontal Ray"},
  {DrawingType::Rectangle, "Rectangle"},
  {DrawingType::ParallelChannel, "Parallel Channel"},
  {DrawingType::TextNote, "Text Note"},
  {DrawingType::LongPosition, "Long Position"},
  {DrawingType::ShortPosition, "Short Position"},
  {DrawingType::Path, "Path"},
  {DrawingType::Brush, "Brush"},
  {DrawingType::Arrow, "Arrow"},
  {DrawingType::Callout, "Callout"},
  {DrawingType::PriceRange, "Price Range"},
  {DrawingType::DateRange, "Date Range"},
  {DrawingType::DatePriceRange, "Date & Price Range"},
  {DrawingType::GannBox, "Gann Box"},
  {DrawingType::FibRetracement, "Fibonacci Retracement"}
};

} // namespace

const char* drawingTypeName(DrawingType type) {
  for (const auto& e : kTypeNames) {
    if (e.type == type) return e.name;
  }
  return "Unknown";
}

bool parseDrawingType(const std::string& name, DrawingType& out) {
  for (const auto& e : kTypeNames) {
    if (name == e.name) {
      out = e.type;
      return true;
    }
  }
  return false;
}

const char* lineStyleName(LineStyle style) {
  switch (style) {
    case LineStyle::Dashed: return "dashed";
    case LineStyle::Dotted: return "dotted";
    case LineStyle::Solid:
    default:                return "solid";
  }
}

LineStyle parseLineStyle(const std::string& name) {
  if (name == "dashed") return LineStyle::Dashed;
  if (name == "dotted") return LineStyle::Dotted;
  return LineStyle::Solid;
}

DrawingType Drawing::type() const {
  return std::visit([](const auto& g) { return std::decay_t<decltype(g)>::kType; }, geom);
}

DrawingGeom makeGeometry(DrawingType type, const Point& p) {
  switch (type) {
    case DrawingType::HorizontalLine:  return HorizontalLineGeom{p.price};
    case DrawingType::VerticalLine:    return VerticalLineGeom{p.time};
    case DrawingType::TrendLine:       return TrendLineGeom{p, p};
    case DrawingType::Ray:             return RayGeom{p, p};
    case DrawingType::HorizontalRay:   return HorizontalRayGeom{p, p};
    case DrawingType::Rectangle:       return RectangleGeom{p, p};
    case DrawingType::ParallelChannel: return ParallelChannelGeom{p, p, p};
    case DrawingType::TextNote:        return TextNoteGeom{p, "Note..."};
    case DrawingType::LongPosition:    return LongPositionGeom{p, p, p};
    case DrawingType::ShortPosition:   return ShortPositionGeom{p, p, p};
    case DrawingType::Path:            return PathGeom{{p, p}};
    case DrawingType::Brush:           return BrushGeom{{p}};
    case DrawingType::Arrow:           return ArrowGeom{p, p};
    case DrawingType::Callout:         return CalloutGeom{p, p, ""};
    case DrawingType::PriceRange:      return PriceRangeGeom{p, p};
    case DrawingType::DateRange:       return DateRangeGeom{p, p};
    case DrawingType::DatePriceRange:  return DatePriceRangeGeom{p, p};
    case DrawingType::GannBox:         return GannBoxGeom{p, p};
    case DrawingType::FibRetracement:  return FibRetracementGeom{p, p};
  }
  return TrendLineGeom{p, p};
}

std::vector<double> effectiveLevels(const Drawing& d) {
  DrawingType t = d.type();
  if (t != DrawingType::FibRetracement && t != DrawingType::GannBox) return {};
  if (!d.style.levels.empty()) return d.style.levels;
  if (t == DrawingType::FibRetracement) return {kFibLevels.begin(), kFibLevels.end()};
  return {kGannLevels.begin(), kGannLevels.end()};
}

} // namespace ck
