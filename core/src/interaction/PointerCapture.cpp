#include "ck/interaction/PointerCapture.hpp"

namespace ck {

ScopedPointerCapture::ScopedPointerCapture(PointerCaptureHost* host, int pointerId)
  : host_(host), pointerId_(pointerId) {
  if (host_) host_->capturePointer(pointerId_);
}

ScopedPointerCapture::~ScopedPointerCapture() {
  release();
}

ScopedPointerCapture::ScopedPointerCapture(ScopedPointerCapture&& o) noexcept
  : host_(o.host_), pointerId_(o.pointerId_) {
  o.host_ = nullptr;
}

ScopedPointerCapture& ScopedPointerCapture::operator=(ScopedPointerCapture&& o) noexcept {
  if (this != &o) {
    release();
    host_ = o.host_;
    pointerId_ = o.pointerId_;
    o.host_ = nullptr;
  }
  return *this;
}

void ScopedPointerCapture::release() {
  if (!host_) return;
  host_->releasePointer(pointerId_);
  host_ = nullptr;
}

} // namespace ck
