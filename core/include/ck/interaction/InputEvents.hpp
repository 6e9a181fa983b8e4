#pragma once
#include <cstdint>

namespace ck {

// Platform-neutral input. Coordinates are pixels relative to the plot
// area's top-left corner, also for events over the axis strips.

enum class PointerKind : std::uint8_t { Mouse = 0, Pen, Touch };

enum class PointerButton : std::uint8_t { Left = 0, Middle = 1, Right = 2 };

// Region of the chart the pointer is over.
enum class HitArea : std::uint8_t { Chart = 0, PriceAxis, TimeAxis };

struct Modifiers {
  bool ctrl{false};
  bool meta{false};
  bool alt{false};
  bool shift{false};

  // Ctrl on most platforms, Cmd on macOS.
  bool command() const { return ctrl || meta; }
};

struct PointerEvent {
  int pointerId{0};
  double x{0}, y{0};
  PointerButton button{PointerButton::Left};
  PointerKind kind{PointerKind::Mouse};
  HitArea area{HitArea::Chart};
  Modifiers modifiers;
  std::int64_t timeMs{0};
};

struct WheelEvent {
  double x{0}, y{0};
  double deltaY{0};   // positive = zoom out
  HitArea area{HitArea::Chart};
};

enum class KeyCode : std::uint8_t {
  None = 0, Delete, Backspace, Escape, Z, Y, R, Other
};

struct KeyEvent {
  KeyCode key{KeyCode::None};
  Modifiers modifiers;
};

} // namespace ck
