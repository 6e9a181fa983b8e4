#pragma once

namespace ck {

// Host windowing layer. Captured pointers keep delivering move / up events
// when they leave the chart.
class PointerCaptureHost {
public:
  virtual ~PointerCaptureHost() = default;
  virtual void capturePointer(int pointerId) = 0;
  virtual void releasePointer(int pointerId) = 0;
};

// Holds one pointer capture for its lifetime. Move-only.
class ScopedPointerCapture {
public:
  ScopedPointerCapture() = default;
  ScopedPointerCapture(PointerCaptureHost* host, int pointerId);
  ~ScopedPointerCapture();

  ScopedPointerCapture(const ScopedPointerCapture&) = delete;
  ScopedPointerCapture& operator=(const ScopedPointerCapture&) = delete;
  ScopedPointerCapture(ScopedPointerCapture&& o) noexcept;
  ScopedPointerCapture& operator=(ScopedPointerCapture&& o) noexcept;

  void release();
  bool active() const { return host_ != nullptr; }
  int pointerId() const { return pointerId_; }

private:
  PointerCaptureHost* host_{nullptr};
  int pointerId_{0};
};

} // namespace ck
