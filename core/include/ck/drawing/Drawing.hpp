#pragma once
#include "ck/data/Point.hpp"
#include "ck/ids/Id.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace ck {

// User-created annotations in domain space (time, price).
enum class DrawingType : std::uint8_t {
  HorizontalLine = 1,
  VerticalLine,
  TrendLine,
  Ray,
  HorizontalRay,
  Rectangle,
  ParallelChannel,
  TextNote,
  LongPosition,
  ShortPosition,
  Path,
  Brush,
  Arrow,
  Callout,
  PriceRange,
  DateRange,
  DatePriceRange,
  GannBox,
  FibRetracement
};

// Display name, also used as the persisted "type" string ("Trend Line", ...).
const char* drawingTypeName(DrawingType type);
bool parseDrawingType(const std::string& name, DrawingType& out);

enum class LineStyle : std::uint8_t { Solid = 0, Dashed, Dotted };

const char* lineStyleName(LineStyle style);
LineStyle parseLineStyle(const std::string& name);

inline constexpr std::array<double, 7> kFibLevels{0, 0.236, 0.382, 0.5, 0.618, 0.786, 1};
inline constexpr std::array<double, 7> kGannLevels{0, 0.25, 0.382, 0.5, 0.618, 0.75, 1};

inline constexpr const char* kDefaultDrawingColor = "#3B82F6";
inline constexpr const char* kDefaultFillColor = "rgba(59, 130, 246, 0.2)";
inline constexpr const char* kChannelFillColor = "rgba(59, 130, 246, 0.1)";
inline constexpr double kDefaultFontSize = 14;

struct DrawingStyle {
  std::string color{kDefaultDrawingColor};
  double width{2};
  LineStyle lineStyle{LineStyle::Solid};
  std::string fillColor;         // empty = no fill
  double fontSize{0};            // 0 = kind default
  std::vector<double> levels;    // empty = kind default (Fibonacci / Gann)

  bool operator==(const DrawingStyle& o) const {
    return color == o.color && width == o.width && lineStyle == o.lineStyle &&
           fillColor == o.fillColor && fontSize == o.fontSize && levels == o.levels;
  }
  bool operator!=(const DrawingStyle& o) const { return !(*this == o); }
};

// ---- per-kind geometry ----

struct HorizontalLineGeom {
  static constexpr DrawingType kType = DrawingType::HorizontalLine;
  double price{0};
  bool operator==(const HorizontalLineGeom& o) const { return price == o.price; }
};

struct VerticalLineGeom {
  static constexpr DrawingType kType = DrawingType::VerticalLine;
  double time{0};
  bool operator==(const VerticalLineGeom& o) const { return time == o.time; }
};

// Every kind defined by a start and an end point.
template <DrawingType T>
struct SegmentGeom {
  static constexpr DrawingType kType = T;
  Point start, end;
  bool operator==(const SegmentGeom& o) const { return start == o.start && end == o.end; }
};

using TrendLineGeom      = SegmentGeom<DrawingType::TrendLine>;
using RayGeom            = SegmentGeom<DrawingType::Ray>;
using HorizontalRayGeom  = SegmentGeom<DrawingType::HorizontalRay>;
using RectangleGeom      = SegmentGeom<DrawingType::Rectangle>;
using ArrowGeom          = SegmentGeom<DrawingType::Arrow>;
using PriceRangeGeom     = SegmentGeom<DrawingType::PriceRange>;
using DateRangeGeom      = SegmentGeom<DrawingType::DateRange>;
using DatePriceRangeGeom = SegmentGeom<DrawingType::DatePriceRange>;
using GannBoxGeom        = SegmentGeom<DrawingType::GannBox>;
using FibRetracementGeom = SegmentGeom<DrawingType::FibRetracement>;

// Baseline start->end plus a parallel line starting at p2 with the same extent.
struct ParallelChannelGeom {
  static constexpr DrawingType kType = DrawingType::ParallelChannel;
  Point start, end, p2;
  bool operator==(const ParallelChannelGeom& o) const {
    return start == o.start && end == o.end && p2 == o.p2;
  }
};

struct TextNoteGeom {
  static constexpr DrawingType kType = DrawingType::TextNote;
  Point point;
  std::string text;
  bool operator==(const TextNoteGeom& o) const { return point == o.point && text == o.text; }
};

struct CalloutGeom {
  static constexpr DrawingType kType = DrawingType::Callout;
  Point anchor, label;
  std::string text;
  bool operator==(const CalloutGeom& o) const {
    return anchor == o.anchor && label == o.label && text == o.text;
  }
};

template <DrawingType T>
struct PositionGeom {
  static constexpr DrawingType kType = T;
  Point entry, profit, stop;
  bool operator==(const PositionGeom& o) const {
    return entry == o.entry && profit == o.profit && stop == o.stop;
  }
};

using LongPositionGeom  = PositionGeom<DrawingType::LongPosition>;
using ShortPositionGeom = PositionGeom<DrawingType::ShortPosition>;

template <DrawingType T>
struct PolylineGeom {
  static constexpr DrawingType kType = T;
  std::vector<Point> points;
  bool operator==(const PolylineGeom& o) const { return points == o.points; }
};

using PathGeom  = PolylineGeom<DrawingType::Path>;
using BrushGeom = PolylineGeom<DrawingType::Brush>;

using DrawingGeom = std::variant<
  HorizontalLineGeom, VerticalLineGeom, TrendLineGeom, RayGeom, HorizontalRayGeom,
  RectangleGeom, ParallelChannelGeom, TextNoteGeom, LongPositionGeom, ShortPositionGeom,
  PathGeom, BrushGeom, ArrowGeom, CalloutGeom, PriceRangeGeom, DateRangeGeom,
  DatePriceRangeGeom, GannBoxGeom, FibRetracementGeom>;

template <class G> struct IsSegmentGeom : std::false_type {};
template <DrawingType T> struct IsSegmentGeom<SegmentGeom<T>> : std::true_type {};
template <class G> struct IsPositionGeom : std::false_type {};
template <DrawingType T> struct IsPositionGeom<PositionGeom<T>> : std::true_type {};
template <class G> struct IsPolylineGeom : std::false_type {};
template <DrawingType T> struct IsPolylineGeom<PolylineGeom<T>> : std::true_type {};

// Forces a compile error in visitors that forget an alternative.
template <class> inline constexpr bool kUnhandledGeom = false;

struct Drawing {
  Id id{kInvalidId};
  DrawingStyle style;
  bool isVisible{true};
  DrawingGeom geom;

  DrawingType type() const;

  template <class G> G* as() { return std::get_if<G>(&geom); }
  template <class G> const G* as() const { return std::get_if<G>(&geom); }

  bool operator==(const Drawing& o) const {
    return id == o.id && style == o.style && isVisible == o.isVisible && geom == o.geom;
  }
  bool operator!=(const Drawing& o) const { return !(*this == o); }
};

// Fresh geometry for a kind, every anchor at p.
DrawingGeom makeGeometry(DrawingType type, const Point& p);

// Kinds finalized by one click.
constexpr bool isInstantType(DrawingType type) {
  return type == DrawingType::HorizontalLine ||
         type == DrawingType::VerticalLine ||
         type == DrawingType::TextNote;
}

// Kinds that take a start and an end point (Callout excluded).
constexpr bool isTwoPointType(DrawingType type) {
  switch (type) {
    case DrawingType::TrendLine:
    case DrawingType::Ray:
    case DrawingType::HorizontalRay:
    case DrawingType::Rectangle:
    case DrawingType::Arrow:
    case DrawingType::PriceRange:
    case DrawingType::DateRange:
    case DrawingType::DatePriceRange:
    case DrawingType::FibRetracement:
    case DrawingType::GannBox:
      return true;
    default:
      return false;
  }
}

// Kinds drawn as a start/end box: Rectangle, the ranges and Gann Box.
constexpr bool isBoxType(DrawingType type) {
  switch (type) {
    case DrawingType::Rectangle:
    case DrawingType::PriceRange:
    case DrawingType::DateRange:
    case DrawingType::DatePriceRange:
    case DrawingType::GannBox:
      return true;
    default:
      return false;
  }
}

// Level ratios in effect: style override or the kind default. Empty for
// kinds without levels.
std::vector<double> effectiveLevels(const Drawing& d);

} // namespace ck
