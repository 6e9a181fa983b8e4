#pragma once
#include <cstdint>
#include <string>

namespace ck {

enum class AlertLogType : std::uint8_t {
  Created = 0,
  Activated,
  ClosedTp,
  ClosedSl,
  ClosedManual,
  ClosedOther
};

// "CREATED", "ACTIVATED", "CLOSED_TP", ...
const char* alertLogTypeName(AlertLogType type);
bool parseAlertLogType(const std::string& name, AlertLogType& out);

// Signal fields referenced by the log messages.
struct SignalInfo {
  std::string direction;   // "BUY" / "SELL"
  double entryPrice{0};
  double pnlPercent{0};
};

std::string formatAlertMessage(AlertLogType type, const std::string& symbol,
                               const SignalInfo& info = {});

struct AlertLogRecord {
  std::string signalId;
  AlertLogType type{AlertLogType::Created};
  std::string message;
};

// Storage collaborator for the signal alert log.
class AlertLogStore {
public:
  virtual ~AlertLogStore() = default;

  // Sets found. Returns false when the lookup itself failed.
  virtual bool exists(const std::string& signalId, AlertLogType type, bool& found) = 0;

  // Returns false when the write failed.
  virtual bool insert(const AlertLogRecord& record) = 0;
};

// Writes signal lifecycle entries. CREATED and ACTIVATED are written once per
// signal; CLOSED_* entries are always written.
class AlertLog {
public:
  explicit AlertLog(AlertLogStore& store) : store_(store) {}

  // Returns true if a record was inserted. A failing duplicate lookup does
  // not block the insert.
  bool record(const std::string& signalId, AlertLogType type,
              const std::string& symbol, const SignalInfo& info = {});

private:
  AlertLogStore& store_;
};

} // namespace ck
