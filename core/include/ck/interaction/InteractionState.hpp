#pragma once
#include "ck/drawing/Drawing.hpp"
#include "ck/drawing/DrawingGeometry.hpp"
#include "ck/history/HistoryManager.hpp"
#include "ck/interaction/InputEvents.hpp"
#include "ck/viewport/ChartViewport.hpp"
#include "ck/viewport/ZoomController.hpp"

#include <cstdint>
#include <variant>

namespace ck {

// Gesture states. Each carries the snapshot taken when the gesture began.

struct IdleState {};

struct PanningState {
  double startX{0}, startY{0};
  bool chartArea{true};            // false: time-axis pan, price untouched
  ViewState initialView;
  PriceRange initialPriceRange;
  bool initialAutoScale{true};
};

struct ScalingState {
  HitArea area{HitArea::PriceAxis};
  double startX{0}, startY{0};
  ViewState initialView;
  PriceRange initialPriceRange;
  bool initialAutoScale{true};
};

struct PinchingState {
  PinchAnchor anchor;
};

struct DrawingState {
  DrawingType tool{DrawingType::TrendLine};
};

// Touch with a tool armed: the click happens when the finger lifts.
struct AimingState {
  int pointerId{0};
};

struct MovingState {
  Id drawingId{kInvalidId};
  Drawing initialDrawing;
  Point startPoint;
  HistoryEntry before;             // pushed on release if the drawing changed
};

struct ResizingState {
  Id drawingId{kInvalidId};
  Handle handle;
  Drawing initialDrawing;
  Point startPoint;
  HistoryEntry before;
};

struct CrosshairState {};

struct DraggingLineState {
  Id lineId{kInvalidId};
  double initialPrice{0};
};

using InteractionState = std::variant<
  IdleState, PanningState, ScalingState, PinchingState, DrawingState, AimingState,
  MovingState, ResizingState, CrosshairState, DraggingLineState>;

enum class InteractionKind : std::uint8_t {
  None = 0, Panning, Scaling, Pinching, Drawing, Aiming, Moving, Resizing, Crosshair, DraggingLine
};

inline InteractionKind interactionKind(const InteractionState& s) {
  return static_cast<InteractionKind>(s.index());
}

// "none", "panning", ..., "draggingLine".
const char* interactionKindName(InteractionKind kind);

} // namespace ck
