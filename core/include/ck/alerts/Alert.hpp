#pragma once
#include "ck/drawing/Drawing.hpp"
#include "ck/ids/Id.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace ck {

enum class AlertCondition : std::uint8_t {
  Crossing = 0,
  CrossingUp,
  CrossingDown,
  GreaterThan,
  LessThan,
  EnteringChannel,
  ExitingChannel
};

const char* alertConditionName(AlertCondition c);
bool parseAlertCondition(const std::string& name, AlertCondition& out);

// Channel conditions compare against a [lower, upper] band.
constexpr bool isChannelCondition(AlertCondition c) {
  return c == AlertCondition::EnteringChannel || c == AlertCondition::ExitingChannel;
}

enum class TriggerFrequency : std::uint8_t {
  OnlyOnce = 0,
  OncePerBar,
  OncePerBarClose,
  OncePerMinute
};

const char* triggerFrequencyName(TriggerFrequency f);
bool parseTriggerFrequency(const std::string& name, TriggerFrequency& out);

// A price alert. It is linked to at most one drawing or one indicator
// instance; with neither it compares against `value`.
struct PriceAlert {
  Id id{kInvalidId};
  std::string symbol;
  Id drawingId{kInvalidId};
  Id indicatorId{kInvalidId};
  std::string alertConditionId;
  std::map<std::string, double> conditionParameters;
  std::string series{"main"};          // indicator output series
  AlertCondition condition{AlertCondition::Crossing};
  std::optional<double> value;
  std::optional<double> fibLevel;
  std::string message;
  bool triggered{false};
  TriggerFrequency triggerFrequency{TriggerFrequency::OnlyOnce};
  std::int64_t createdAt{0};           // epoch milliseconds
  std::optional<std::int64_t> lastTriggeredAt;
  bool notifyApp{true};
  bool playSound{true};

  bool hasDrawing() const { return drawingId != kInvalidId; }
  bool hasIndicator() const { return indicatorId != kInvalidId; }
};

// Message shown when the user does not supply one, e.g.
// "EURUSD Price Crossing 1.08500" or "EURUSD Crossing Fib 0.618 (1.08500)".
std::string defaultAlertMessage(const std::string& symbol, const Drawing* drawing,
                                AlertCondition condition, double value,
                                std::optional<double> fibLevel = std::nullopt);

} // namespace ck
