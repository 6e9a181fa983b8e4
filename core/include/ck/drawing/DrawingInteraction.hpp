#pragma once
#include "ck/drawing/Drawing.hpp"
#include "ck/viewport/ChartViewport.hpp"

#include <cstdint>

namespace ck {

struct DrawingInteractionConfig {
  double brushMinStepPx{3.0};          // brush accretes points past this distance
  double brushEpsilonPx{2.0};          // RDP tolerance applied on release
  double positionOffsetFraction{0.01}; // profit / stop distance from entry
  double positionBars{20};             // profit / stop placed this many intervals ahead
};

// A drawing being created. step counts the clicks still expected by
// multi-click tools and is never persisted.
struct CurrentDrawing {
  Drawing drawing;
  int step{1};
};

enum class CreationEvent : std::uint8_t {
  None = 0,
  Started,     // a CurrentDrawing now exists
  Updated,     // the CurrentDrawing changed
  Completed    // `drawing` is ready to be committed to the store
};

struct CreationResult {
  CreationEvent event{CreationEvent::None};
  Drawing drawing;          // completed drawing (id unassigned)
  bool editText{false};     // open inline text editing after commit
  bool select{false};       // select the drawing after commit

  bool completed() const { return event == CreationEvent::Completed; }
};

// Multi-step creation protocol per drawing kind:
//   instant    - Horizontal/Vertical Line, Text Note, Long/Short Position
//   two-point  - drag-release finishes, otherwise click, click
//   channel    - baseline (drag or click), then p2 on a further click
//   path       - click per vertex, double-click finishes
//   brush      - press, move, release
//   callout    - anchor, then label
class DrawingInteraction {
public:
  void setConfig(const DrawingInteractionConfig& cfg) { config_ = cfg; }
  const DrawingInteractionConfig& config() const { return config_; }

  void setTool(DrawingType type);
  void clearTool() { hasTool_ = false; }
  bool hasTool() const { return hasTool_; }
  DrawingType tool() const { return tool_; }

  // Drop the tool and any CurrentDrawing.
  void cancel();

  bool isDrawing() const { return hasCurrent_; }
  bool isActive() const { return hasTool_ || hasCurrent_; }
  const CurrentDrawing* current() const { return hasCurrent_ ? &current_ : nullptr; }

  // Pointer-down (or deferred touch lift) at snapped point p.
  CreationResult onClick(const Point& p, double candleInterval);

  // Pointer move while a CurrentDrawing exists.
  CreationResult onMove(const Point& p, const ChartViewport& vp);

  // Pointer-up. Finishes drag-drawn shapes and brushes.
  CreationResult onRelease(const ChartViewport& vp);

  // Finishes a Path, dropping the trailing ghost point.
  CreationResult onDoubleClick();

private:
  CreationResult complete(bool editText = false, bool select = false);
  CreationResult startNew(const Point& p, double candleInterval);
  CreationResult continueCurrent(const Point& p);

  DrawingInteractionConfig config_;
  bool hasTool_{false};
  DrawingType tool_{DrawingType::TrendLine};
  bool hasCurrent_{false};
  CurrentDrawing current_;
};

} // namespace ck
