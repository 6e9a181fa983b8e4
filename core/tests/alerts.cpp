// Alerts: store rules, price resolution, conditions and the signal log

#include "ck/alerts/AlertLog.hpp"
#include "ck/alerts/AlertPriceResolver.hpp"
#include "ck/alerts/AlertStore.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static ck::PriceAlert drawingAlert(ck::Id drawingId) {
  ck::PriceAlert a;
  a.symbol = "EURUSD";
  a.drawingId = drawingId;
  a.condition = ck::AlertCondition::CrossingUp;
  return a;
}

// In-memory log store with switchable failures.
class MemoryLogStore : public ck::AlertLogStore {
public:
  bool exists(const std::string& signalId, ck::AlertLogType type, bool& found) override {
    if (failLookup) return false;
    found = false;
    for (const auto& r : records) {
      if (r.signalId == signalId && r.type == type) found = true;
    }
    return true;
  }

  bool insert(const ck::AlertLogRecord& record) override {
    if (failInsert) return false;
    records.push_back(record);
    return true;
  }

  std::vector<ck::AlertLogRecord> records;
  bool failLookup{false};
  bool failInsert{false};
};

int main() {
  // ---- Test 1: one alert per drawing ----
  {
    ck::AlertStore store;
    ck::OpResult r = store.add(drawingAlert(5));
    requireTrue(r.ok && r.createdId != ck::kInvalidId, "first alert accepted");

    r = store.add(drawingAlert(5));
    requireTrue(!r.ok && r.err.code == "ALERT_DUPLICATE_DRAWING", "second alert rejected");
    requireTrue(r.err.details == "{\"drawingId\":5}", "details name the drawing");
    requireTrue(store.count() == 1, "store unchanged");

    requireTrue(store.add(drawingAlert(6)).ok, "other drawing accepted");

    ck::PriceAlert moved = *store.forDrawing(6);
    moved.drawingId = 5;
    r = store.update(moved);
    requireTrue(!r.ok && r.err.code == "ALERT_DUPLICATE_DRAWING", "update onto a taken drawing");

    ck::PriceAlert ghost;
    ghost.id = 99;
    requireTrue(store.update(ghost).err.code == "ALERT_NOT_FOUND", "update unknown");
    requireTrue(store.remove(99).err.code == "ALERT_NOT_FOUND", "remove unknown");
    std::printf("  Test 1 (one alert per drawing): PASS\n");
  }

  // ---- Test 2: cascades ----
  {
    ck::AlertStore store;
    ck::Id a = store.add(drawingAlert(5)).createdId;
    ck::PriceAlert ind;
    ind.indicatorId = 3;
    ck::Id b = store.add(ind).createdId;
    ck::Id c = store.add(ind).createdId;

    requireTrue(store.removeForDrawing(5) == a, "drawing cascade returns the alert id");
    requireTrue(store.removeForDrawing(5) == ck::kInvalidId, "nothing left");

    std::vector<ck::Id> removed = store.removeForIndicator(3);
    requireTrue(removed.size() == 2 && removed[0] == b && removed[1] == c, "indicator cascade");
    requireTrue(store.count() == 0, "empty");
    std::printf("  Test 2 (cascades): PASS\n");
  }

  // ---- Test 3: drawing targets ----
  {
    ck::Drawing fib;
    fib.geom = ck::FibRetracementGeom{{0, 100}, {10, 200}};
    ck::ResolvedPrice p = ck::AlertPriceResolver::resolveDrawing(fib, 0.5, 0);
    requireTrue(p.valid && near(p.price, 150), "Fib 0.5 of 100..200 is 150");
    requireTrue(!ck::AlertPriceResolver::resolveDrawing(fib, std::nullopt, 0).valid,
                "Fib without a level");

    ck::Drawing h;
    h.geom = ck::HorizontalLineGeom{1.085};
    p = ck::AlertPriceResolver::resolveDrawing(h, std::nullopt, 5000);
    requireTrue(p.valid && !p.isBand && p.price == 1.085, "horizontal line price");

    ck::Drawing trend;
    trend.geom = ck::TrendLineGeom{{0, 100}, {100, 200}};
    p = ck::AlertPriceResolver::resolveDrawingAt(trend, 25, std::nullopt);
    requireTrue(p.valid && near(p.price, 125), "trend line at a time");

    ck::Drawing rect;
    rect.geom = ck::RectangleGeom{{0, 90}, {100, 110}};
    p = ck::AlertPriceResolver::resolveDrawing(rect, std::nullopt, 0);
    requireTrue(p.valid && p.isBand && p.lower == 90 && p.upper == 110, "rectangle band");

    ck::Drawing note;
    note.geom = ck::TextNoteGeom{{0, 1}, "x"};
    requireTrue(!ck::AlertPriceResolver::resolveDrawing(note, std::nullopt, 0).valid,
                "text has no price");
    std::printf("  Test 3 (drawing targets): PASS\n");
  }

  // ---- Test 4: indicator and value targets ----
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ck::IndicatorOutput out{{"main", {1, 2, 3, nan}}, {"d", {4, 5}}};

    ck::PriceAlert a;
    a.indicatorId = 1;
    ck::ResolvedPrice p = ck::AlertPriceResolver::resolve(a, nullptr, &out, 0);
    requireTrue(p.valid && p.price == 3, "last finite main value");

    a.series = "d";
    p = ck::AlertPriceResolver::resolve(a, nullptr, &out, 0);
    requireTrue(p.valid && p.price == 5, "named series");

    requireTrue(!ck::AlertPriceResolver::resolve(a, nullptr, nullptr, 0).valid,
                "missing indicator output");

    ck::PriceAlert v;
    v.value = 42.5;
    p = ck::AlertPriceResolver::resolve(v, nullptr, nullptr, 0);
    requireTrue(p.valid && p.price == 42.5, "unlinked alert uses its value");

    ck::PriceAlert dangling = drawingAlert(8);
    requireTrue(!ck::AlertPriceResolver::resolve(dangling, nullptr, nullptr, 0).valid,
                "unknown drawing");
    std::printf("  Test 4 (indicator and value targets): PASS\n");
  }

  // ---- Test 5: conditions ----
  {
    ck::ResolvedPrice line;
    line.valid = true;
    line.price = 100;

    using C = ck::AlertCondition;
    requireTrue(ck::evaluateCondition(C::Crossing, 99, 100, line), "crossing up counts");
    requireTrue(ck::evaluateCondition(C::Crossing, 101, 100, line), "crossing down counts");
    requireTrue(ck::evaluateCondition(C::CrossingUp, 99, 101, line), "crossing up");
    requireTrue(!ck::evaluateCondition(C::CrossingUp, 101, 99, line), "not crossing up");
    requireTrue(ck::evaluateCondition(C::CrossingDown, 101, 99, line), "crossing down");
    requireTrue(ck::evaluateCondition(C::GreaterThan, 0, 101, line), "greater than");
    requireTrue(!ck::evaluateCondition(C::LessThan, 0, 101, line), "not less than");
    requireTrue(!ck::evaluateCondition(C::EnteringChannel, 0, 100, line), "channel needs a band");

    ck::ResolvedPrice band;
    band.valid = true;
    band.isBand = true;
    band.lower = 90;
    band.upper = 110;
    requireTrue(ck::evaluateCondition(C::EnteringChannel, 80, 95, band), "entering");
    requireTrue(!ck::evaluateCondition(C::EnteringChannel, 95, 96, band), "already inside");
    requireTrue(ck::evaluateCondition(C::ExitingChannel, 95, 120, band), "exiting");
    requireTrue(!ck::evaluateCondition(C::Crossing, 80, 95, band), "band with a line condition");

    ck::ResolvedPrice invalid;
    requireTrue(!ck::evaluateCondition(C::GreaterThan, 0, 1e9, invalid), "invalid target");
    std::printf("  Test 5 (conditions): PASS\n");
  }

  // ---- Test 6: default messages and names ----
  {
    requireTrue(ck::defaultAlertMessage("EURUSD", nullptr, ck::AlertCondition::Crossing, 1.085) ==
                "EURUSD Price Crossing 1.08500", "plain price message");

    ck::Drawing fib;
    fib.geom = ck::FibRetracementGeom{{0, 1}, {1, 2}};
    requireTrue(ck::defaultAlertMessage("BTC", &fib, ck::AlertCondition::CrossingUp, 1.5, 0.5) ==
                "BTC Crossing Up Fib 0.5 (1.50000)", "fib message");

    ck::Drawing rect;
    rect.geom = ck::RectangleGeom{{0, 1}, {1, 2}};
    requireTrue(ck::defaultAlertMessage("BTC", &rect, ck::AlertCondition::EnteringChannel, 0) ==
                "BTC Entering Channel Rectangle", "area message");

    ck::AlertCondition c;
    requireTrue(ck::parseAlertCondition("Exiting Channel", c) &&
                c == ck::AlertCondition::ExitingChannel, "condition name");
    ck::TriggerFrequency f;
    requireTrue(ck::parseTriggerFrequency("Once Per Bar Close", f) &&
                f == ck::TriggerFrequency::OncePerBarClose, "frequency name");
    std::printf("  Test 6 (messages and names): PASS\n");
  }

  // ---- Test 7: signal log ----
  {
    MemoryLogStore store;
    ck::AlertLog log(store);
    ck::SignalInfo info;
    info.direction = "BUY";
    info.entryPrice = 1.2345;
    info.pnlPercent = 2.5;

    requireTrue(log.record("s1", ck::AlertLogType::Created, "EURUSD", info), "created");
    requireTrue(store.records[0].message == "New Signal: EURUSD (BUY) at 1.2345", "created text");
    requireTrue(!log.record("s1", ck::AlertLogType::Created, "EURUSD", info), "created once");

    requireTrue(log.record("s1", ck::AlertLogType::ClosedTp, "EURUSD", info), "closed tp");
    requireTrue(log.record("s1", ck::AlertLogType::ClosedTp, "EURUSD", info), "closed repeats");
    requireTrue(store.records[1].message == "Take Profit Hit: EURUSD secured 2.50% profit",
                "take profit text");

    info.pnlPercent = -1.25;
    log.record("s1", ck::AlertLogType::ClosedSl, "EURUSD", info);
    requireTrue(store.records.back().message == "Stop Loss Hit: EURUSD loss 1.25%", "stop text");

    store.failLookup = true;
    requireTrue(log.record("s1", ck::AlertLogType::Created, "EURUSD", info),
                "failed lookup still inserts");

    store.failLookup = false;
    store.failInsert = true;
    requireTrue(!log.record("s2", ck::AlertLogType::Activated, "EURUSD"), "insert failure");

    requireTrue(ck::formatAlertMessage(ck::AlertLogType::ClosedOther, "X") == "Signal Update: X",
                "other close text");
    std::printf("  Test 7 (signal log): PASS\n");
  }

  std::printf("alerts: ALL PASS\n");
  return 0;
}
