#include "ck/data/Timeframe.hpp"

namespace ck {

namespace {

struct TimeframeEntry {
  const char* label;
  double seconds;
};

const TimeframeEntry kTimeframes[] = {
  {"1m", 60},       {"3m", 180},      {"5m", 300},
  {"15m", 900},     {"30m", 1800},    {"45m", 2700},
  {"1H", 3600},     {"2H", 7200},     {"3H", 10800},
  {"4H", 14400},    {"1D", 86400},    {"1W", 604800},
  {"1M", 2592000}
};

} // namespace

double timeframeSeconds(const std::string& label) {
  for (const auto& e : kTimeframes) {
    if (label == e.label) return e.seconds;
  }
  return 3600.0;
}

} // namespace ck
