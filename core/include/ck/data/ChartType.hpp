#pragma once
#include <cstdint>
#include <string>

namespace ck {

enum class ChartType : std::uint8_t { Candle = 0, Bar, Line, Area, HeikinAshi };

// "Candle", "Bar", "Line", "Area", "Heikin Ashi".
const char* chartTypeName(ChartType type);
bool parseChartType(const std::string& name, ChartType& out);

} // namespace ck
