#include "ck/data/ChartType.hpp"

namespace ck {

const char* chartTypeName(ChartType type) {
  switch (type) {
    case ChartType::Bar:        return "Bar";
    case ChartType::Line:       return "Line";
    case ChartType::Area:       return "Area";
    case ChartType::HeikinAshi: return "Heikin Ashi";
    case ChartType::Candle:
    default:                    return "Candle";
  }
}

bool parseChartType(const std::string& name, ChartType& out) {
  if (name == "Candle")      { out = ChartType::Candle; return true; }
  if (name == "Bar")         { out = ChartType::Bar; return true; }
  if (name == "Line")        { out = ChartType::Line; return true; }
  if (name == "Area")        { out = ChartType::Area; return true; }
  if (name == "Heikin Ashi") { out = ChartType::HeikinAshi; return true; }
  return false;
}

} // namespace ck
