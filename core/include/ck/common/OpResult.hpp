#pragma once
#include "ck/ids/Id.hpp"
#include <string>

namespace ck {

struct OpError {
  std::string code;     // e.g. "ALERT_DUPLICATE_DRAWING"
  std::string message;  // human text
  std::string details;  // small JSON object string
};

// Outcome of a user-level operation that can be rejected.
struct OpResult {
  bool ok{true};
  OpError err{};
  Id createdId{kInvalidId};

  static OpResult success(Id created = kInvalidId) {
    OpResult r;
    r.createdId = created;
    return r;
  }

  static OpResult fail(const std::string& code, const std::string& message,
                       const std::string& detailsJson = {}) {
    OpResult r;
    r.ok = false;
    r.err.code = code;
    r.err.message = message;
    r.err.details = detailsJson.empty() ? "{}" : detailsJson;
    return r;
  }
};

} // namespace ck
