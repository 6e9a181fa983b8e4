#pragma once
#include "ck/alerts/Alert.hpp"
#include "ck/drawing/Drawing.hpp"
#include "ck/indicators/Indicator.hpp"

#include <string>
#include <vector>

namespace ck {

// Storage collaborator. Each call returns false on failure; the session
// logs failures and keeps its in-memory state.
class ChartPersistence {
public:
  virtual ~ChartPersistence() = default;

  virtual bool saveDrawings(const std::string& symbol, const std::vector<Drawing>& drawings) = 0;
  virtual bool saveIndicators(const std::string& symbol,
                              const std::vector<IndicatorConfig>& indicators) = 0;
  virtual bool saveAlert(const PriceAlert& alert) = 0;
  virtual bool updateAlert(const PriceAlert& alert) = 0;
  virtual bool deleteAlert(Id alertId) = 0;
};

} // namespace ck
