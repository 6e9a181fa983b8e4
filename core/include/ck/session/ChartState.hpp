#pragma once
#include "ck/data/ChartType.hpp"
#include "ck/drawing/Drawing.hpp"
#include "ck/indicators/Indicator.hpp"
#include "ck/viewport/ChartViewport.hpp"

#include <string>
#include <vector>

namespace ck {

// Serializable chart configuration.
struct ChartState {
  std::string version{"1.0"};
  std::string symbol;        // e.g. "BTCUSD"
  std::string timeframe{"1H"};
  ChartType chartType{ChartType::Candle};

  // Cleared on load when the stored view / range is missing or invalid.
  bool hasView{false};
  ViewState view;
  bool hasPriceRange{false};
  PriceRange priceRange;
  bool autoScale{true};

  std::vector<Drawing> drawings;
  std::vector<IndicatorConfig> indicators;
};

std::string serializeChartState(const ChartState& state);

// Returns false (out untouched) when the text is not a JSON object.
// Malformed drawings / indicators are skipped. An invalid price range turns
// auto-scale back on.
bool deserializeChartState(const std::string& json, ChartState& out);

} // namespace ck
