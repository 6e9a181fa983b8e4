#pragma once
#include <string>

namespace ck {

// Nominal bar length in seconds for a timeframe label ("1m", "4H", "1D", ...).
// Unknown labels map to one hour.
double timeframeSeconds(const std::string& label);

} // namespace ck
