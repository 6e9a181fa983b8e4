#include "ck/interaction/ChartInteraction.hpp"

#include <cmath>
#include <cstdio>
#include <iterator>
#include <utility>

namespace ck {

ChartInteraction::ChartInteraction(ChartSession& session)
  : session_(session) {
  setConfig(InteractionConfig{});
}

void ChartInteraction::setConfig(const InteractionConfig& cfg) {
  config_ = cfg;
  zoom_.setConfig(cfg.zoom);
  snap_.setConfig(cfg.snap);
  picker_.setConfig(cfg.pick);
  creator_.setConfig(cfg.drawing);
}

// ---- tools ----

void ChartInteraction::setTool(DrawingType type) {
  creator_.cancel();
  creator_.setTool(type);
  if (kind() == InteractionKind::Drawing) state_ = IdleState{};
}

void ChartInteraction::clearTool() {
  creator_.cancel();
  if (kind() == InteractionKind::Drawing || kind() == InteractionKind::Aiming) {
    state_ = IdleState{};
  }
}

void ChartInteraction::commitTextEdit(const std::string& text) {
  if (editingTextId_ == kInvalidId) return;
  OpResult r = session_.setDrawingText(editingTextId_, text);
  if (!r.ok) {
    std::fprintf(stderr, "ChartInteraction: text edit dropped: %s\n", r.err.message.c_str());
  }
  editingTextId_ = kInvalidId;
}

// ---- helpers ----

double ChartInteraction::drawingY(const PointerEvent& e) const {
  return e.kind == PointerKind::Touch ? e.y - config_.touchYOffsetPx : e.y;
}

SnapResult ChartInteraction::snapAt(double x, double y) const {
  return snap_.snap(session_.viewport(), x, y);
}

void ChartInteraction::updateCrosshair(double x, double y) {
  const ChartViewport& vp = session_.viewport();
  crosshair_.visible = true;
  crosshair_.x = x;
  crosshair_.y = y;
  crosshair_.hasCandle = false;

  double step = vp.xStep();
  if (step > 0) {
    double raw = vp.view().startIndex + x / step - 0.5;
    long long idx = std::llround(raw);
    if (idx >= 0 && static_cast<std::size_t>(idx) < vp.candleCount()) {
      crosshair_.hasCandle = true;
      crosshair_.candleIndex = static_cast<std::size_t>(idx);
      crosshair_.x = vp.indexToX(static_cast<double>(idx) - vp.view().startIndex);
    }
  }

  SnapResult s = snapAt(x, y);
  crosshair_.point = s.point;
  crosshair_.snapped = s.snapped;
  crosshair_.snapIndicator = s.indicator;
}

PriceLine* ChartInteraction::findPriceLine(Id id) {
  for (auto& l : priceLines_) {
    if (l.id == id) return &l;
  }
  return nullptr;
}

bool ChartInteraction::brushActive() const {
  if (const CurrentDrawing* cur = creator_.current()) {
    return cur->drawing.type() == DrawingType::Brush;
  }
  return creator_.hasTool() && creator_.tool() == DrawingType::Brush;
}

void ChartInteraction::dropStaleSelection() {
  if (selectedId_ != kInvalidId && !session_.drawings().get(selectedId_)) {
    selectedId_ = kInvalidId;
  }
  if (editingTextId_ != kInvalidId && !session_.drawings().get(editingTextId_)) {
    editingTextId_ = kInvalidId;
  }
}

// ---- drawing ----

void ChartInteraction::finishCreation(CreationResult r) {
  if (!r.completed()) {
    if (!creator_.isDrawing() && kind() == InteractionKind::Drawing) state_ = IdleState{};
    return;
  }
  Id id = session_.addDrawing(std::move(r.drawing));
  if (r.select) selectedId_ = id;
  if (r.editText) editingTextId_ = id;
  state_ = IdleState{};
}

bool ChartInteraction::handleDrawingClick(double x, double y, const Point& snapped) {
  double interval = session_.viewport().candleInterval();

  // Continue the drawing in progress.
  if (creator_.isDrawing()) {
    finishCreation(creator_.onClick(snapped, interval));
    return true;
  }

  // Start a new drawing.
  if (creator_.hasTool()) {
    state_ = DrawingState{creator_.tool()};
    finishCreation(creator_.onClick(snapped, interval));
    return true;
  }

  const ChartViewport& vp = session_.viewport();

  for (auto it = priceLines_.rbegin(); it != priceLines_.rend(); ++it) {
    if (std::fabs(y - vp.yScale(it->price)) < config_.pick.hitboxWidthPx) {
      state_ = DraggingLineState{it->id, it->price};
      return true;
    }
  }

  DrawingHit hit = picker_.pick(x, y, session_.drawings().drawings(), vp);
  if (!hit.hit) {
    selectedId_ = kInvalidId;
    return false;
  }

  const Drawing* d = session_.drawings().get(hit.drawingId);
  if (!d) return false;
  selectedId_ = hit.drawingId;

  if (hit.onHandle()) {
    ResizingState s;
    s.drawingId = hit.drawingId;
    s.handle = hit.handle;
    s.initialDrawing = *d;
    s.startPoint = snapped;
    s.before = session_.snapshot();
    s.before.label = "Resize drawing";
    state_ = std::move(s);
  } else {
    MovingState s;
    s.drawingId = hit.drawingId;
    s.initialDrawing = *d;
    s.startPoint = snapped;
    s.before = session_.snapshot();
    s.before.label = "Move drawing";
    state_ = std::move(s);
  }
  return true;
}

// ---- navigation ----

void ChartInteraction::beginPinch() {
  if (pointers_.size() != 2) return;
  auto a = pointers_.begin();
  auto b = std::next(a);
  double dist = std::hypot(a->second.x - b->second.x, a->second.y - b->second.y);
  double cx = (a->second.x + b->second.x) / 2.0;
  double cy = (a->second.y + b->second.y) / 2.0;

  longPress_.armed = false;
  PinchingState s;
  s.anchor = zoom_.beginPinch(session_.viewport(), dist, cx, cy);
  state_ = s;
  session_.setAutoScale(false);
}

void ChartInteraction::beginNavigation(const PointerEvent& e) {
  const ChartViewport& vp = session_.viewport();

  if (e.area == HitArea::PriceAxis) {
    if (e.button != PointerButton::Left) return;
    ScalingState s;
    s.area = HitArea::PriceAxis;
    s.startX = e.x;
    s.startY = e.y;
    s.initialView = vp.view();
    s.initialPriceRange = vp.priceRange();
    s.initialAutoScale = session_.autoScale();
    state_ = s;
    session_.setAutoScale(false);
    return;
  }

  if (e.area == HitArea::TimeAxis) {
    if (e.button != PointerButton::Left && e.button != PointerButton::Right) return;
    ScalingState s;
    s.area = HitArea::TimeAxis;
    s.startX = e.x;
    s.startY = e.y;
    s.initialView = vp.view();
    s.initialPriceRange = vp.priceRange();
    s.initialAutoScale = session_.autoScale();
    state_ = s;
    return;
  }

  if (e.button != PointerButton::Left) return;
  if (creator_.isActive()) return;

  if (config_.mobile && e.kind == PointerKind::Touch && tap_.wasVisible) {
    state_ = CrosshairState{};
    return;
  }

  PanningState s;
  s.startX = e.x;
  s.startY = e.y;
  s.chartArea = true;
  s.initialView = vp.view();
  s.initialPriceRange = vp.priceRange();
  s.initialAutoScale = session_.autoScale();
  state_ = s;
  session_.setAutoScale(false);
}

void ChartInteraction::recordViewChange(const ViewState& initialView,
                                        const PriceRange& initialRange,
                                        bool initialAutoScale) {
  const ViewState& v = session_.viewport().view();
  bool changed = std::fabs(v.startIndex - initialView.startIndex) > config_.viewChangeThreshold ||
                 std::fabs(v.visibleCandles - initialView.visibleCandles) > config_.viewChangeThreshold;
  if (!changed) return;

  HistoryEntry before = session_.snapshot();
  before.view = initialView;
  before.priceRange = initialRange;
  before.autoScale = initialAutoScale;
  before.label = "Navigate";
  session_.pushHistory(std::move(before));
}

void ChartInteraction::endGesture(bool commit) {
  if (const auto* p = std::get_if<PanningState>(&state_)) {
    recordViewChange(p->initialView, p->initialPriceRange, p->initialAutoScale);
    state_ = IdleState{};
    return;
  }
  if (const auto* s = std::get_if<ScalingState>(&state_)) {
    if (s->area == HitArea::TimeAxis) {
      recordViewChange(s->initialView, s->initialPriceRange, s->initialAutoScale);
    }
    state_ = IdleState{};
    return;
  }
  if (auto* m = std::get_if<MovingState>(&state_)) {
    const Drawing* now = session_.drawings().get(m->drawingId);
    if (now && *now != m->initialDrawing) {
      session_.pushHistory(std::move(m->before));
      session_.publishDrawings();
    }
    state_ = IdleState{};
    return;
  }
  if (auto* r = std::get_if<ResizingState>(&state_)) {
    const Drawing* now = session_.drawings().get(r->drawingId);
    if (now && *now != r->initialDrawing) {
      session_.pushHistory(std::move(r->before));
      session_.publishDrawings();
    }
    state_ = IdleState{};
    return;
  }
  if (const auto* l = std::get_if<DraggingLineState>(&state_)) {
    PriceLine* line = findPriceLine(l->lineId);
    if (line) {
      if (!commit) {
        line->price = l->initialPrice;
      } else if (priceLineCallback_ && line->price != l->initialPrice) {
        priceLineCallback_(line->id, line->price);
      }
    }
    state_ = IdleState{};
    return;
  }
  if (std::holds_alternative<CrosshairState>(state_)) {
    state_ = IdleState{};
  }
}

// ---- pointer input ----

void ChartInteraction::pointerDown(const PointerEvent& e) {
  ActivePointer& ap = pointers_[e.pointerId];
  ap.x = e.x;
  ap.y = e.y;
  if (!ap.capture.active()) ap.capture = ScopedPointerCapture(captureHost_, e.pointerId);

  tap_.active = true;
  tap_.x = e.x;
  tap_.y = e.y;
  tap_.timeMs = e.timeMs;
  tap_.wasVisible = crosshair_.visible;

  double y = drawingY(e);
  updateCrosshair(e.x, y);

  if (pointers_.size() == 2) {
    InteractionKind k = kind();
    if (k == InteractionKind::None || k == InteractionKind::Panning) beginPinch();
    return;
  }
  if (pointers_.size() > 2) return;

  InteractionKind k = kind();
  if (k != InteractionKind::None && k != InteractionKind::Drawing) return;

  if (e.button == PointerButton::Right && e.area != HitArea::TimeAxis) return;

  if (e.button == PointerButton::Left && e.area == HitArea::Chart) {
    // Brush strokes follow the finger; every other tool places on lift.
    if (e.kind == PointerKind::Touch && creator_.isActive() && !brushActive()) {
      state_ = AimingState{e.pointerId};
      return;
    }

    longPress_.armed = false;
    if (e.kind == PointerKind::Touch && !creator_.isActive()) {
      longPress_.armed = true;
      longPress_.startX = e.x;
      longPress_.startY = e.y;
      longPress_.deadlineMs = e.timeMs + config_.longPressMs;
    }

    SnapResult s = snapAt(e.x, y);
    bool handled = handleDrawingClick(e.x, y, s.point);
    if (handled || kind() != InteractionKind::None || creator_.isActive()) return;
  }

  if (creator_.isDrawing()) return;
  beginNavigation(e);
}

void ChartInteraction::pointerMove(const PointerEvent& e) {
  auto pit = pointers_.find(e.pointerId);
  if (pit != pointers_.end()) {
    pit->second.x = e.x;
    pit->second.y = e.y;
  }

  ChartViewport& vp = session_.viewport();

  if (auto* p = std::get_if<PinchingState>(&state_)) {
    if (pointers_.size() != 2) return;
    auto a = pointers_.begin();
    auto b = std::next(a);
    double dist = std::hypot(a->second.x - b->second.x, a->second.y - b->second.y);
    double cx = (a->second.x + b->second.x) / 2.0;
    ViewState v;
    if (zoom_.pinch(vp, p->anchor, dist, cx, v)) session_.setView(v.startIndex, v.visibleCandles);
    return;
  }

  double y = drawingY(e);
  updateCrosshair(e.x, y);
  const Point& snapped = crosshair_.point;

  if (longPress_.armed &&
      std::hypot(e.x - longPress_.startX, e.y - longPress_.startY) > config_.longPressCancelPx) {
    longPress_.armed = false;
  }

  if (std::holds_alternative<AimingState>(state_)) {
    if (creator_.isDrawing()) creator_.onMove(snapped, vp);
    return;
  }

  if (const auto* p = std::get_if<PanningState>(&state_)) {
    double step = vp.xStep();
    if (step > 0) {
      double dx = e.x - p->startX;
      session_.setView(p->initialView.startIndex - dx / step, vp.view().visibleCandles);
    }
    if (p->chartArea) {
      double span = p->initialPriceRange.span();
      if (span > 0 && vp.height() > 0) {
        double shift = (e.y - p->startY) / vp.height() * span;
        session_.setPriceRange({p->initialPriceRange.min + shift, p->initialPriceRange.max + shift});
      }
    }
    return;
  }

  if (std::holds_alternative<DrawingState>(state_)) {
    creator_.onMove(snapped, vp);
    return;
  }

  if (const auto* m = std::get_if<MovingState>(&state_)) {
    Drawing d = m->initialDrawing;
    DrawingGeometry::translate(d, snapped.time - m->startPoint.time,
                               snapped.price - m->startPoint.price);
    session_.previewDrawing(d);
    return;
  }

  if (const auto* r = std::get_if<ResizingState>(&state_)) {
    Drawing d = r->initialDrawing;
    if (DrawingGeometry::moveHandle(d, r->handle, snapped)) session_.previewDrawing(d);
    return;
  }

  if (const auto* s = std::get_if<ScalingState>(&state_)) {
    if (s->area == HitArea::PriceAxis) {
      PriceRange out;
      if (zoom_.dragPrice(s->initialPriceRange, e.y - s->startY, out)) session_.setPriceRange(out);
    } else {
      ViewState v = zoom_.dragTime(vp, s->initialView, e.x - s->startX);
      session_.setView(v.startIndex, v.visibleCandles);
    }
    return;
  }

  if (const auto* l = std::get_if<DraggingLineState>(&state_)) {
    if (PriceLine* line = findPriceLine(l->lineId)) line->price = snapped.price;
  }
}

void ChartInteraction::pointerUp(const PointerEvent& e) {
  InteractionKind before = kind();
  pointers_.erase(e.pointerId);
  longPress_.armed = false;

  if (before == InteractionKind::Pinching) {
    if (pointers_.size() < 2) state_ = IdleState{};
    tap_.active = false;
    return;
  }

  if (before == InteractionKind::Aiming) {
    state_ = creator_.isDrawing() ? InteractionState{DrawingState{creator_.tool()}}
                                  : InteractionState{IdleState{}};
    double y = drawingY(e);
    SnapResult s = snapAt(e.x, y);
    handleDrawingClick(e.x, y, s.point);
    if (brushActive() && creator_.isDrawing()) {
      finishCreation(creator_.onRelease(session_.viewport()));
    } else if (creator_.isDrawing()) {
      state_ = DrawingState{creator_.tool()};
    }
    tap_.active = false;
    return;
  }

  if (before == InteractionKind::Drawing && creator_.isDrawing()) {
    finishCreation(creator_.onRelease(session_.viewport()));
  }

  if (config_.mobile && tap_.active &&
      (before == InteractionKind::Panning || before == InteractionKind::Crosshair)) {
    double dist = std::hypot(e.x - tap_.x, e.y - tap_.y);
    std::int64_t elapsed = e.timeMs - tap_.timeMs;
    if (dist < config_.tapMaxDistancePx && elapsed < config_.tapMaxMs && tap_.wasVisible) {
      crosshair_.visible = false;
    }
  }
  tap_.active = false;

  endGesture(true);
}

void ChartInteraction::pointerLeave(const PointerEvent& e) {
  pointers_.erase(e.pointerId);
  longPress_.armed = false;
  tap_.active = false;

  if (!config_.mobile) {
    crosshair_.visible = false;
    crosshair_.snapped = false;
  }

  InteractionKind k = kind();
  if (k == InteractionKind::Pinching) {
    if (pointers_.size() < 2) state_ = IdleState{};
    return;
  }
  if (k == InteractionKind::Aiming) {
    state_ = creator_.isDrawing() ? InteractionState{DrawingState{creator_.tool()}}
                                  : InteractionState{IdleState{}};
    return;
  }
  if (k == InteractionKind::None || k == InteractionKind::Drawing) return;

  endGesture(k != InteractionKind::DraggingLine);
}

void ChartInteraction::tick(std::int64_t nowMs) {
  if (!longPress_.armed || nowMs < longPress_.deadlineMs) return;
  longPress_.armed = false;
  InteractionKind k = kind();
  if (k == InteractionKind::None || k == InteractionKind::Panning) {
    if (k == InteractionKind::Panning) endGesture(true);
    state_ = CrosshairState{};
    crosshair_.visible = true;
  }
}

// ---- wheel / keyboard / double-click ----

void ChartInteraction::wheel(const WheelEvent& e) {
  InteractionKind k = kind();
  if (k != InteractionKind::None && k != InteractionKind::Panning) return;

  ChartViewport& vp = session_.viewport();
  if (e.area == HitArea::PriceAxis) {
    PriceRange out;
    if (!zoom_.wheelPrice(vp.priceRange(), e.deltaY, out)) return;
    session_.setAutoScale(false);
    session_.setPriceRange(out);
    return;
  }

  ViewState v = zoom_.wheelTime(vp, e.deltaY);
  session_.setView(v.startIndex, v.visibleCandles);
}

bool ChartInteraction::keyDown(const KeyEvent& e) {
  if (modalOpen_ || editingTextId_ != kInvalidId) return false;

  if ((e.key == KeyCode::Delete || e.key == KeyCode::Backspace) && selectedId_ != kInvalidId) {
    OpResult r = session_.removeDrawing(selectedId_);
    if (!r.ok) std::fprintf(stderr, "ChartInteraction: delete failed: %s\n", r.err.code.c_str());
    selectedId_ = kInvalidId;
    return true;
  }

  if (e.modifiers.alt && e.key == KeyCode::R) {
    session_.resetView();
    return true;
  }

  if (e.modifiers.command()) {
    if (e.key == KeyCode::Z) {
      session_.undo();
      dropStaleSelection();
      return true;
    }
    if (e.key == KeyCode::Y) {
      session_.redo();
      dropStaleSelection();
      return true;
    }
  }

  if (e.key == KeyCode::Escape) {
    bool consumed = creator_.isActive() || selectedId_ != kInvalidId;
    creator_.cancel();
    if (kind() == InteractionKind::Drawing || kind() == InteractionKind::Aiming) {
      state_ = IdleState{};
    }
    selectedId_ = kInvalidId;
    return consumed;
  }
  return false;
}

void ChartInteraction::doubleClick(const PointerEvent& e) {
  if (e.area == HitArea::PriceAxis) {
    session_.setAutoScale(true);
    return;
  }

  double y = drawingY(e);
  DrawingHit hit = picker_.pick(e.x, y, session_.drawings().drawings(), session_.viewport());
  if (hit.hit) {
    const Drawing* d = session_.drawings().get(hit.drawingId);
    if (d && (d->type() == DrawingType::TextNote || d->type() == DrawingType::Callout)) {
      selectedId_ = hit.drawingId;
      editingTextId_ = hit.drawingId;
      return;
    }
  }

  const CurrentDrawing* cur = creator_.current();
  if (cur && cur->drawing.type() == DrawingType::Path) {
    CreationResult r = creator_.onDoubleClick();
    if (r.completed()) {
      finishCreation(std::move(r));
    } else if (!creator_.isDrawing()) {
      state_ = IdleState{};
    }
  }
}

} // namespace ck
