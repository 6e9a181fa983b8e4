#pragma once
#include <vector>

namespace ck {

// One OHLCV bar. time is epoch seconds.
struct Candle {
  double time{0};
  double open{0}, high{0}, low{0}, close{0};
  double volume{0};
};

using CandleSeries = std::vector<Candle>;

} // namespace ck
