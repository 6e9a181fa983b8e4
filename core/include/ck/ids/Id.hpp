#pragma once
#include <cstdint>
#include <limits>
#include <string>

namespace ck {

// Drawing / alert / indicator identifier. 0 is never assigned.
using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Decimal string form of an id, as some stored drawings carry it.
// Rejects empty input, non-digits and overflow.
inline bool parseId(const std::string& s, Id& out) {
  if (s.empty()) return false;
  Id v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    Id digit = static_cast<Id>(c - '0');
    if (v > (std::numeric_limits<Id>::max() - digit) / 10) return false;
    v = v * 10 + digit;
  }
  out = v;
  return true;
}

} // namespace ck
