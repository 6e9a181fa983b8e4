// Indicators: math, registry and defaults

#include "ck/indicators/IndicatorRegistry.hpp"
#include "ck/math/Indicators.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static ck::CandleSeries rising(int n) {
  ck::CandleSeries out;
  for (int i = 0; i < n; ++i) {
    ck::Candle c;
    c.time = i * 60.0;
    c.open = 10.0 + i;
    c.close = 10.0 + i + 0.5;
    c.high = c.close + 0.5;
    c.low = c.open - 0.5;
    out.push_back(c);
  }
  return out;
}

int main() {
  // ---- Test 1: SMA ----
  {
    std::vector<double> v{1, 2, 3, 4, 5};
    auto sma = ck::computeSma(v, 3);
    requireTrue(std::isnan(sma[0]) && std::isnan(sma[1]), "warm-up is NaN");
    requireTrue(near(sma[2], 2) && near(sma[3], 3) && near(sma[4], 4), "3-period average");
    std::printf("  Test 1 (SMA): PASS\n");
  }

  // ---- Test 2: EMA ----
  {
    std::vector<double> v{2, 4, 6, 8};
    auto ema = ck::computeEma(v, 3);
    requireTrue(std::isnan(ema[1]), "before the seed is NaN");
    requireTrue(near(ema[2], 4), "seeded with the SMA");
    requireTrue(near(ema[3], 8 * 0.5 + 4 * 0.5), "k = 2 / (period + 1)");

    auto shortEma = ck::computeEma(v, 10);
    requireTrue(std::isnan(shortEma[3]), "too short for the period");
    std::printf("  Test 2 (EMA): PASS\n");
  }

  // ---- Test 3: RSI ----
  {
    std::vector<double> up;
    for (int i = 0; i < 20; ++i) up.push_back(100.0 + i);
    auto rsi = ck::computeRSI(up, 14);
    requireTrue(std::isnan(rsi[13]), "first period values NaN");
    requireTrue(near(rsi[14], 100), "only gains -> 100");

    std::vector<double> alt{10, 11, 10, 11, 10, 11, 10};
    rsi = ck::computeRSI(alt, 2);
    requireTrue(rsi[2] > 0 && rsi[2] < 100, "mixed moves in (0, 100)");
    std::printf("  Test 3 (RSI): PASS\n");
  }

  // ---- Test 4: Stochastic ----
  {
    std::vector<double> h{10, 10, 10, 10, 10};
    std::vector<double> l{0, 0, 0, 0, 0};
    std::vector<double> c{5, 10, 0, 10, 5};
    ck::StochasticResult r = ck::computeStochastic(h, l, c, 2, 1, 2);
    requireTrue(std::isnan(r.percentK[0]), "warm-up");
    requireTrue(near(r.percentK[1], 100) && near(r.percentK[2], 0), "raw %K");
    requireTrue(near(r.percentD[2], 50), "%D averages %K");
    std::printf("  Test 4 (Stochastic): PASS\n");
  }

  // ---- Test 5: registry builtins ----
  {
    ck::IndicatorRegistry reg;
    ck::CandleSeries candles = rising(30);
    ck::IndicatorConfig cfg;
    cfg.type = ck::IndicatorType::MA;
    cfg.settings = ck::defaultIndicatorSettings(ck::IndicatorType::MA);

    ck::IndicatorOutput out;
    requireTrue(!reg.compute(cfg, candles, out), "empty registry computes nothing");

    reg.registerBuiltins();
    requireTrue(reg.compute(cfg, candles, out), "MA registered");
    requireTrue(out.count("main") && out["main"].size() == 30, "aligned with candles");

    double last = 0;
    requireTrue(ck::latestValue(out, "main", last), "latest value");
    // Closes 10.5 .. 39.5; the last 14 average 33.
    requireTrue(near(last, 33.0), "14-period SMA of the last closes");

    cfg.type = ck::IndicatorType::Stochastic;
    cfg.settings = ck::defaultIndicatorSettings(ck::IndicatorType::Stochastic);
    requireTrue(reg.compute(cfg, candles, out), "Stochastic registered");
    requireTrue(out.count("k") && out.count("d"), "k and d series");

    cfg.type = ck::IndicatorType::MA;
    cfg.settings = {{"period", 1e12}};
    requireTrue(reg.compute(cfg, candles, out), "huge period still computes");
    requireTrue(out["main"].size() == 30 && std::isnan(out["main"][29]),
                "period longer than the data gives no values");
    cfg.settings = {{"period", 3}};
    requireTrue(reg.compute(cfg, candles, out) && near(out["main"][29], 38.5),
                "ordinary period unaffected");

    cfg.type = ck::IndicatorType::CCI;
    requireTrue(!reg.compute(cfg, candles, out), "no builtin for CCI");
    std::printf("  Test 5 (registry builtins): PASS\n");
  }

  // ---- Test 6: host functions ----
  {
    ck::IndicatorRegistry reg;
    reg.registerFunction(ck::IndicatorType::Volume,
      [](const ck::CandleSeries& c, const ck::IndicatorSettings& s) {
        double scale = ck::settingOr(s, "scale", 1.0);
        std::vector<double> v;
        for (const auto& k : c) v.push_back(k.volume * scale);
        return ck::IndicatorOutput{{"volume", v}};
      });
    requireTrue(reg.hasFunction(ck::IndicatorType::Volume), "registered");

    ck::CandleSeries candles = rising(3);
    for (auto& c : candles) c.volume = 2;
    ck::IndicatorConfig cfg;
    cfg.type = ck::IndicatorType::Volume;
    cfg.settings = {{"scale", 3}};
    ck::IndicatorOutput out;
    requireTrue(reg.compute(cfg, candles, out) && out["volume"][2] == 6, "settings passed");

    reg.registerFunction(ck::IndicatorType::Volume, nullptr);
    requireTrue(!reg.hasFunction(ck::IndicatorType::Volume), "null function unregisters");
    std::printf("  Test 6 (host functions): PASS\n");
  }

  // ---- Test 7: latest value and names ----
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ck::IndicatorOutput out{{"main", {1, 2, nan}}, {"empty", {nan, nan}}};
    double v = 0;
    requireTrue(ck::latestValue(out, "main", v) && v == 2, "trailing NaN skipped");
    requireTrue(!ck::latestValue(out, "empty", v), "all NaN");
    requireTrue(!ck::latestValue(out, "missing", v), "missing series");

    ck::IndicatorType t;
    requireTrue(ck::parseIndicatorType("MA Ribbon", t) && t == ck::IndicatorType::MARibbon,
                "display name parses");
    requireTrue(!ck::parseIndicatorType("Nope", t), "unknown name");
    requireTrue(ck::defaultIndicatorSettings(ck::IndicatorType::BB).at("period") == 20,
                "BB default period");
    std::printf("  Test 7 (latest value and names): PASS\n");
  }

  std::printf("indicators: ALL PASS\n");
  return 0;
}
