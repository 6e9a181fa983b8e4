#pragma once
#include "ck/drawing/DrawingInteraction.hpp"
#include "ck/drawing/DrawingPicker.hpp"
#include "ck/interaction/InputEvents.hpp"
#include "ck/interaction/InteractionState.hpp"
#include "ck/interaction/PointerCapture.hpp"
#include "ck/session/ChartSession.hpp"
#include "ck/viewport/CandleSnap.hpp"
#include "ck/viewport/ZoomController.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ck {

struct InteractionConfig {
  std::int64_t longPressMs{500};     // touch hold that enters crosshair mode
  double longPressCancelPx{20};      // movement that cancels the hold
  double tapMaxDistancePx{10};
  std::int64_t tapMaxMs{300};
  double touchYOffsetPx{70};         // touch points are lifted above the finger
  double viewChangeThreshold{0.001}; // pan / time-scale smaller than this is not recorded
  bool mobile{false};                // tap hides the tooltip, touch on a visible tooltip inspects

  DrawingInteractionConfig drawing;  // brush step 3 px, RDP epsilon 2 px
  ZoomControllerConfig zoom;
  SnapConfig snap;
  PickConfig pick;
};

// Crosshair / tooltip output for the rendering layer.
struct CrosshairInfo {
  bool visible{false};
  double x{0}, y{0};                 // x is centred on the hovered candle when there is one
  bool hasCandle{false};
  std::size_t candleIndex{0};
  bool snapped{false};
  PixelPoint snapIndicator;
  Point point;                       // snapped domain position
};

// Externally owned horizontal level (order take-profit / stop-loss, ...).
struct PriceLine {
  Id id{kInvalidId};
  double price{0};
  std::string label;
};

using PriceLineCallback = std::function<void(Id lineId, double price)>;

// Pointer / wheel / key state machine over a ChartSession. Exactly one
// InteractionState is active; new gestures are ignored while another runs,
// except that a second touch upgrades none / panning to pinching.
class ChartInteraction {
public:
  explicit ChartInteraction(ChartSession& session);

  void setConfig(const InteractionConfig& cfg);
  const InteractionConfig& config() const { return config_; }

  // Not owned. Null disables capture.
  void setPointerCaptureHost(PointerCaptureHost* host) { captureHost_ = host; }

  // Final price of a dragged price line.
  void setPriceLineCallback(PriceLineCallback cb) { priceLineCallback_ = std::move(cb); }
  void setPriceLines(std::vector<PriceLine> lines) { priceLines_ = std::move(lines); }
  const std::vector<PriceLine>& priceLines() const { return priceLines_; }

  // ---- tools ----
  void setTool(DrawingType type);
  void clearTool();
  bool hasTool() const { return creator_.hasTool(); }
  const CurrentDrawing* currentDrawing() const { return creator_.current(); }

  // Keyboard is ignored while a modal is open or text is being edited.
  void setModalOpen(bool open) { modalOpen_ = open; }
  void commitTextEdit(const std::string& text);
  void cancelTextEdit() { editingTextId_ = kInvalidId; }

  // ---- input ----
  void pointerDown(const PointerEvent& e);
  void pointerMove(const PointerEvent& e);
  void pointerUp(const PointerEvent& e);
  void pointerLeave(const PointerEvent& e);
  void pointerCancel(const PointerEvent& e) { pointerLeave(e); }
  void wheel(const WheelEvent& e);
  void doubleClick(const PointerEvent& e);
  // Returns true if the key was consumed.
  bool keyDown(const KeyEvent& e);

  // Advances the long-press deadline.
  void tick(std::int64_t nowMs);

  // ---- output ----
  const InteractionState& state() const { return state_; }
  InteractionKind kind() const { return interactionKind(state_); }
  const CrosshairInfo& crosshair() const { return crosshair_; }
  Id selectedId() const { return selectedId_; }
  void select(Id id) { selectedId_ = id; }
  Id editingTextId() const { return editingTextId_; }
  std::size_t activePointerCount() const { return pointers_.size(); }

private:
  struct ActivePointer {
    double x{0}, y{0};
    ScopedPointerCapture capture;
  };

  struct LongPress {
    bool armed{false};
    double startX{0}, startY{0};
    std::int64_t deadlineMs{0};
  };

  struct Tap {
    bool active{false};
    double x{0}, y{0};
    std::int64_t timeMs{0};
    bool wasVisible{false};
  };

  double drawingY(const PointerEvent& e) const;
  SnapResult snapAt(double x, double y) const;
  void updateCrosshair(double x, double y);

  bool handleDrawingClick(double x, double y, const Point& snapped);
  void finishCreation(CreationResult r);
  void beginPinch();
  void beginNavigation(const PointerEvent& e);

  // Ends panning / scaling / moving / resizing / line drags. `commit` is
  // false when the gesture is abandoned (pointer leave on a price line).
  void endGesture(bool commit);
  void recordViewChange(const ViewState& initialView, const PriceRange& initialRange,
                        bool initialAutoScale);
  PriceLine* findPriceLine(Id id);
  bool brushActive() const;
  void dropStaleSelection();

  ChartSession& session_;
  InteractionConfig config_;
  ZoomController zoom_;
  CandleSnap snap_;
  DrawingPicker picker_;
  DrawingInteraction creator_;

  InteractionState state_{IdleState{}};
  CrosshairInfo crosshair_;
  Id selectedId_{kInvalidId};
  Id editingTextId_{kInvalidId};
  bool modalOpen_{false};

  std::map<int, ActivePointer> pointers_;
  LongPress longPress_;
  Tap tap_;

  PointerCaptureHost* captureHost_{nullptr};
  std::vector<PriceLine> priceLines_;
  PriceLineCallback priceLineCallback_;
};

} // namespace ck
