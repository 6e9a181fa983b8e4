#include "ck/alerts/AlertLog.hpp"

#include <cmath>
#include <cstdio>

namespace ck {

namespace {

const char* const kLogTypeNames[] = {
  "CREATED", "ACTIVATED", "CLOSED_TP", "CLOSED_SL", "CLOSED_MANUAL", "CLOSED_OTHER"
};

std::string fmt(const char* f, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), f, v);
  return buf;
}

} // namespace

const char* alertLogTypeName(AlertLogType type) {
  auto i = static_cast<std::size_t>(type);
  return i < 6 ? kLogTypeNames[i] : "CLOSED_OTHER";
}

bool parseAlertLogType(const std::string& name, AlertLogType& out) {
  for (std::size_t i = 0; i < 6; ++i) {
    if (name == kLogTypeNames[i]) {
      out = static_cast<AlertLogType>(i);
      return true;
    }
  }
  return false;
}

std::string formatAlertMessage(AlertLogType type, const std::string& symbol,
                               const SignalInfo& info) {
  switch (type) {
    case AlertLogType::Created:
      return "New Signal: " + symbol + " (" + info.direction + ") at " + fmt("%g", info.entryPrice);
    case AlertLogType::Activated:
      return "Signal Activated: " + symbol + " price reached entry";
    case AlertLogType::ClosedTp:
      return "Take Profit Hit: " + symbol + " secured " + fmt("%.2f", info.pnlPercent) + "% profit";
    case AlertLogType::ClosedSl:
      return "Stop Loss Hit: " + symbol + " loss " + fmt("%.2f", std::fabs(info.pnlPercent)) + "%";
    case AlertLogType::ClosedManual:
      return "Signal Closed Manually: " + symbol;
    case AlertLogType::ClosedOther:
    default:
      return "Signal Update: " + symbol;
  }
}

bool AlertLog::record(const std::string& signalId, AlertLogType type,
                      const std::string& symbol, const SignalInfo& info) {
  if (type == AlertLogType::Created || type == AlertLogType::Activated) {
    bool found = false;
    if (!store_.exists(signalId, type, found)) {
      std::fprintf(stderr, "AlertLog: duplicate lookup failed for %s/%s, inserting anyway\n",
                   signalId.c_str(), alertLogTypeName(type));
    } else if (found) {
      return false;
    }
  }

  AlertLogRecord rec;
  rec.signalId = signalId;
  rec.type = type;
  rec.message = formatAlertMessage(type, symbol, info);
  if (!store_.insert(rec)) {
    std::fprintf(stderr, "AlertLog: insert failed for %s/%s\n",
                 signalId.c_str(), alertLogTypeName(type));
    return false;
  }
  std::fprintf(stderr, "AlertLog: %s\n", rec.message.c_str());
  return true;
}

} // namespace ck
