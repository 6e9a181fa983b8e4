#include "ck/alerts/Alert.hpp"

#include <cstdio>

namespace ck {

namespace {

const char* const kConditionNames[] = {
  "Crossing", "Crossing Up", "Crossing Down", "Greater Than",
  "Less Than", "Entering Channel", "Exiting Channel"
};

const char* const kFrequencyNames[] = {
  "Only Once", "Once Per Bar", "Once Per Bar Close", "Once Per Minute"
};

std::string formatNumber(const char* fmt, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

} // namespace

const char* alertConditionName(AlertCondition c) {
  auto i = static_cast<std::size_t>(c);
  return i < 7 ? kConditionNames[i] : "Crossing";
}

bool parseAlertCondition(const std::string& name, AlertCondition& out) {
  for (std::size_t i = 0; i < 7; ++i) {
    if (name == kConditionNames[i]) {
      out = static_cast<AlertCondition>(i);
      return true;
    }
  }
  return false;
}

const char* triggerFrequencyName(TriggerFrequency f) {
  auto i = static_cast<std::size_t>(f);
  return i < 4 ? kFrequencyNames[i] : "Only Once";
}

bool parseTriggerFrequency(const std::string& name, TriggerFrequency& out) {
  for (std::size_t i = 0; i < 4; ++i) {
    if (name == kFrequencyNames[i]) {
      out = static_cast<TriggerFrequency>(i);
      return true;
    }
  }
  return false;
}

std::string defaultAlertMessage(const std::string& symbol, const Drawing* drawing,
                                AlertCondition condition, double value,
                                std::optional<double> fibLevel) {
  std::string price = formatNumber("%.5f", value);
  std::string cond = alertConditionName(condition);
  if (drawing) {
    DrawingType t = drawing->type();
    if (t == DrawingType::Rectangle || t == DrawingType::ParallelChannel) {
      return symbol + " " + cond + " " + drawingTypeName(t);
    }
    if (t == DrawingType::FibRetracement) {
      std::string level = fibLevel ? formatNumber("%g", *fibLevel) : std::string("?");
      return symbol + " " + cond + " Fib " + level + " (" + price + ")";
    }
  }
  return symbol + " Price " + cond + " " + price;
}

} // namespace ck
