// Drawing geometry: hit-testing, handle edits, line prices, RDP and measures

#include "ck/drawing/DrawingGeometry.hpp"
#include "ck/drawing/DrawingPicker.hpp"
#include "ck/math/Simplify.hpp"
#include "ck/measure/RangeMeasure.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static ck::CandleSeries makeCandles(int n) {
  ck::CandleSeries out;
  for (int i = 0; i < n; ++i) {
    ck::Candle c;
    c.time = 1000.0 + i * 60.0;
    c.open = c.close = 100;
    c.high = 101;
    c.low = 99;
    out.push_back(c);
  }
  return out;
}

static ck::Drawing hline(ck::Id id, double price) {
  ck::Drawing d;
  d.id = id;
  d.geom = ck::HorizontalLineGeom{price};
  return d;
}

// Candle i sits at x = 10 i + 5 in the test viewport.
static ck::Point at(int index, double price) {
  return {1000.0 + index * 60.0, price};
}

template <class G>
static ck::Drawing make(ck::Id id, G geom) {
  ck::Drawing d;
  d.id = id;
  d.geom = std::move(geom);
  return d;
}

static bool body(const ck::DrawingHit& h) { return h.hit && !h.onHandle(); }

static bool grabbed(const ck::DrawingHit& h, ck::HandleKind kind) {
  return h.hit && h.handle.kind == kind;
}

int main() {
  ck::CandleSeries candles = makeCandles(100);
  ck::ChartViewport vp;
  vp.setCandles(&candles);
  vp.setSize(1000, 500);
  vp.setView({0, 100});
  vp.setPriceRange({0, 500});   // 1 px per price unit

  ck::DrawingPicker picker;

  // ---- Test 1: horizontal line hitbox ----
  {
    std::vector<ck::Drawing> ds{hline(1, 250)};
    double y = vp.yScale(250);
    requireTrue(picker.pick(300, y + 11, ds, vp).hit, "11px from the line hits");
    requireTrue(!picker.pick(300, y + 13, ds, vp).hit, "13px from the line misses");
    requireTrue(!picker.pick(300, y - 13, ds, vp).hit, "13px above misses");

    ds[0].isVisible = false;
    requireTrue(!picker.pick(300, y, ds, vp).hit, "hidden drawings are not picked");
    std::printf("  Test 1 (horizontal line hitbox): PASS\n");
  }

  // ---- Test 2: topmost drawing wins ----
  {
    std::vector<ck::Drawing> ds{hline(1, 250), hline(2, 252)};
    ck::DrawingHit h = picker.pick(300, vp.yScale(251), ds, vp);
    requireTrue(h.hit && h.drawingId == 2, "most recently added drawing wins");
    std::printf("  Test 2 (topmost wins): PASS\n");
  }

  // ---- Test 3: trend line handles and body ----
  {
    ck::Drawing d;
    d.id = 7;
    d.geom = ck::TrendLineGeom{{candles[10].time, 100}, {candles[50].time, 300}};
    std::vector<ck::Drawing> ds{d};

    ck::PixelPoint s = vp.toPixel({candles[10].time, 100});
    ck::PixelPoint e = vp.toPixel({candles[50].time, 300});

    ck::DrawingHit h = picker.pick(s.x + 3, s.y, ds, vp);
    requireTrue(h.hit && h.handle.kind == ck::HandleKind::Start, "start handle within 8px");

    h = picker.pick(e.x, e.y - 5, ds, vp);
    requireTrue(h.hit && h.handle.kind == ck::HandleKind::End, "end handle within 8px");

    double mx = (s.x + e.x) / 2;
    double my = (s.y + e.y) / 2;
    h = picker.pick(mx, my, ds, vp);
    requireTrue(h.hit && !h.onHandle(), "midpoint is a body hit");

    // Beyond the end: a segment, not a ray.
    requireTrue(!picker.pick(e.x + 60, e.y - 60, ds, vp).hit, "past the end misses");
    std::printf("  Test 3 (trend line pick): PASS\n");
  }

  // ---- Test 4: ray extends past its second point ----
  {
    ck::Drawing d;
    d.id = 3;
    d.geom = ck::RayGeom{{candles[10].time, 100}, {candles[20].time, 100}};
    std::vector<ck::Drawing> ds{d};
    requireTrue(picker.pick(vp.timeToX(candles[80].time), vp.yScale(100), ds, vp).hit,
                "ray hit far beyond the second point");
    requireTrue(!picker.pick(vp.timeToX(candles[2].time), vp.yScale(100), ds, vp).hit,
                "ray does not extend backwards");
    std::printf("  Test 4 (ray pick): PASS\n");
  }

  // ---- Test 5: rectangle body and edge resize ----
  {
    ck::Drawing d;
    d.id = 4;
    d.geom = ck::RectangleGeom{{candles[60].time, 400}, {candles[20].time, 200}};
    std::vector<ck::Drawing> ds{d};

    double left = vp.timeToX(candles[20].time);
    double right = vp.timeToX(candles[60].time);
    double midY = vp.yScale(300);

    ck::DrawingHit h = picker.pick((left + right) / 2, midY, ds, vp);
    requireTrue(h.hit && !h.onHandle(), "interior is a body hit");

    h = picker.pick(left + 2, midY, ds, vp);
    requireTrue(h.hit && h.handle.kind == ck::HandleKind::End,
                "left edge grabs the corner that sits on it");
    std::printf("  Test 5 (rectangle pick): PASS\n");
  }

  // ---- Test 6: handle moves ----
  {
    ck::Drawing d;
    d.geom = ck::TrendLineGeom{{1, 10}, {2, 20}};
    requireTrue(ck::DrawingGeometry::moveHandle(d, {ck::HandleKind::End, 0}, {3, 30}), "move end");
    requireTrue(d.as<ck::TrendLineGeom>()->end == ck::Point{3, 30}, "end moved");
    requireTrue(!ck::DrawingGeometry::moveHandle(d, {ck::HandleKind::P2, 0}, {3, 30}),
                "segments have no p2");

    ck::Drawing ch;
    ch.geom = ck::ParallelChannelGeom{{0, 10}, {10, 20}, {0, 5}};
    requireTrue(ck::DrawingGeometry::moveHandle(ch, {ck::HandleKind::P2End, 0}, {12, 18}),
                "move parallel end");
    const auto* g = ch.as<ck::ParallelChannelGeom>();
    requireTrue(g->p2 == ck::Point{2, 8}, "p2 follows so the extent matches the baseline");

    ck::Drawing path;
    path.geom = ck::PathGeom{{{0, 0}, {1, 1}, {2, 2}}};
    requireTrue(ck::DrawingGeometry::moveHandle(path, {ck::HandleKind::Vertex, 1}, {1, 5}),
                "move path vertex");
    requireTrue(!ck::DrawingGeometry::moveHandle(path, {ck::HandleKind::Vertex, 9}, {1, 5}),
                "vertex index out of range");
    std::printf("  Test 6 (handle moves): PASS\n");
  }

  // ---- Test 7: translate ----
  {
    ck::Drawing h = hline(1, 100);
    ck::DrawingGeometry::translate(h, 500, 5);
    requireTrue(h.as<ck::HorizontalLineGeom>()->price == 105, "horizontal line moves in price");

    ck::Drawing v;
    v.geom = ck::VerticalLineGeom{1000};
    ck::DrawingGeometry::translate(v, 60, 5);
    requireTrue(v.as<ck::VerticalLineGeom>()->time == 1060, "vertical line moves in time");

    ck::Drawing pos;
    pos.geom = ck::LongPositionGeom{{0, 100}, {10, 110}, {10, 90}};
    ck::DrawingGeometry::translate(pos, 1, 1);
    const auto* g = pos.as<ck::LongPositionGeom>();
    requireTrue(g->entry == ck::Point{1, 101} && g->stop == ck::Point{11, 91}, "all anchors move");
    std::printf("  Test 7 (translate): PASS\n");
  }

  // ---- Test 8: price at time ----
  {
    ck::Drawing d;
    d.geom = ck::TrendLineGeom{{0, 100}, {100, 200}};
    double p = 0;
    requireTrue(ck::DrawingGeometry::priceAtTime(d, 50, p) && near(p, 150), "interpolated");
    requireTrue(!ck::DrawingGeometry::priceAtTime(d, 150, p), "outside a trend line's span");

    ck::Drawing r;
    r.geom = ck::RayGeom{{0, 100}, {100, 200}};
    requireTrue(ck::DrawingGeometry::priceAtTime(r, 150, p) && near(p, 250), "ray extrapolates");
    requireTrue(!ck::DrawingGeometry::priceAtTime(r, -1, p), "ray undefined before start");

    ck::Drawing rect;
    rect.geom = ck::RectangleGeom{{0, 120}, {100, 80}};
    double lo = 0, hi = 0;
    requireTrue(ck::DrawingGeometry::priceBandAtTime(rect, 50, lo, hi), "rectangle band");
    requireTrue(lo == 80 && hi == 120, "band is [min, max]");
    std::printf("  Test 8 (price at time): PASS\n");
  }

  // ---- Test 9: RDP simplification ----
  {
    std::vector<ck::PixelPoint> line{{0, 0}, {1, 1}, {2, 2}, {3, 3}, {4, 4}};
    auto out = ck::simplifyPolyline(line, 2.0);
    requireTrue(out.size() == 2, "collinear points collapse to the endpoints");
    requireTrue(out.front().x == 0 && out.back().x == 4, "endpoints kept");

    std::vector<ck::PixelPoint> bent{{0, 0}, {5, 0}, {10, 10}, {15, 0}, {20, 0}};
    out = ck::simplifyPolyline(bent, 2.0);
    bool kept = false;
    for (const auto& p : out) {
      if (p.x == 10 && p.y == 10) kept = true;
    }
    requireTrue(kept, "deviating point kept");

    std::vector<ck::PixelPoint> two{{0, 0}, {9, 9}};
    requireTrue(ck::simplifyPolyline(two, 2.0).size() == 2, "short input unchanged");
    std::printf("  Test 9 (RDP): PASS\n");
  }

  // ---- Test 10: range and position read-outs ----
  {
    ck::RangeMeasure m = ck::measureRange({0, 100}, {7200, 90}, 3600);
    requireTrue(m.valid && !m.up, "falling range");
    requireTrue(near(m.priceDelta, -10) && near(m.percentChange, 10), "delta and percent");
    requireTrue(m.bars == 2, "bars over the interval");

    ck::Drawing d = hline(1, 5);
    requireTrue(!ck::measureDrawing(d, 60).valid, "horizontal line has no range read-out");

    ck::PositionStats s = ck::positionStats({0, 100}, {0, 110}, {0, 95});
    requireTrue(s.hasRiskReward && near(s.riskReward, 2), "R:R = profit / stop");
    requireTrue(near(s.targetPercent, 10) && near(s.stopPercent, 5), "percent distances");

    s = ck::positionStats({0, 100}, {0, 110}, {0, 100});
    requireTrue(!s.hasRiskReward, "stop on entry has no R:R");
    std::printf("  Test 10 (measures): PASS\n");
  }

  // ---- Test 11: parallel channel ----
  {
    // Baseline (105,300)-(505,300), parallel line (105,200)-(505,200).
    ck::Drawing ch = make(7, ck::ParallelChannelGeom{at(10, 200), at(50, 200), at(10, 300)});
    requireTrue(body(picker.test(300, 305, ch, vp)), "baseline");
    requireTrue(body(picker.test(300, 195, ch, vp)), "parallel line");
    requireTrue(grabbed(picker.test(508, 200, ch, vp), ck::HandleKind::P2End), "p2 end handle");
    requireTrue(grabbed(picker.test(105, 203, ch, vp), ck::HandleKind::P2), "p2 handle");
    requireTrue(body(picker.test(300, 250, ch, vp)), "interior");
    requireTrue(body(picker.test(106, 250, ch, vp)), "just inside the start edge");
    requireTrue(!picker.test(104, 250, ch, vp).hit, "just outside the start edge");
    requireTrue(!picker.test(300, 180, ch, vp).hit, "beyond the parallel line");
    requireTrue(picker.test(300, 250, ch, vp).drawingId == 7, "id reported");
    std::printf("  Test 11 (parallel channel picks): PASS\n");
  }

  // ---- Test 12: levels, boxes and positions ----
  {
    // start (105,400), end (505,300); 0.236 level at y = 376.4.
    ck::Drawing fib = make(1, ck::FibRetracementGeom{at(10, 100), at(50, 200)});
    requireTrue(body(picker.test(450, 380, fib, vp)), "fib level line");
    requireTrue(!picker.test(520, 376.4, fib, vp).hit, "level line ends with the drawing");
    requireTrue(!picker.test(450, 420, fib, vp).hit, "below every level");
    requireTrue(grabbed(picker.test(107, 400, fib, vp), ck::HandleKind::Start), "fib start handle");

    ck::Drawing gann = make(2, ck::GannBoxGeom{at(10, 100), at(50, 200)});
    requireTrue(body(picker.test(300, 350, gann, vp)), "gann interior");
    requireTrue(grabbed(picker.test(110, 350, gann, vp), ck::HandleKind::Start), "gann left edge");
    requireTrue(grabbed(picker.test(503, 300, gann, vp), ck::HandleKind::End), "gann end corner");
    requireTrue(!picker.test(300, 420, gann, vp).hit, "outside the gann box");

    // entry (105,400), profit (305,350), stop (305,420).
    ck::Drawing lp = make(3, ck::LongPositionGeom{at(10, 100), at(30, 150), at(30, 80)});
    requireTrue(grabbed(picker.test(107, 402, lp, vp), ck::HandleKind::Entry), "entry handle");
    requireTrue(grabbed(picker.test(305, 353, lp, vp), ck::HandleKind::Profit), "profit handle");
    requireTrue(grabbed(picker.test(302, 420, lp, vp), ck::HandleKind::Stop), "stop handle");
    requireTrue(body(picker.test(200, 370, lp, vp)), "profit zone");
    requireTrue(body(picker.test(200, 410, lp, vp)), "stop zone");
    requireTrue(!picker.test(200, 430, lp, vp).hit, "below the stop zone");
    requireTrue(!picker.test(320, 370, lp, vp).hit, "right of the zones");

    ck::Drawing sp = make(4, ck::ShortPositionGeom{at(10, 100), at(30, 80), at(30, 150)});
    requireTrue(body(picker.test(200, 410, sp, vp)), "short profit zone below entry");
    requireTrue(body(picker.test(200, 370, sp, vp)), "short stop zone above entry");
    std::printf("  Test 12 (level, box and position picks): PASS\n");
  }

  // ---- Test 13: text note and callout ----
  {
    // 5 chars at 14 px: box x 105..163, y 378..408.
    ck::Drawing note = make(5, ck::TextNoteGeom{at(10, 100), "Hello"});
    note.style.fontSize = 14;
    requireTrue(body(picker.test(130, 390, note, vp)), "inside the note box");
    requireTrue(!picker.test(170, 390, note, vp).hit, "right of the note box");
    requireTrue(!picker.test(130, 412, note, vp).hit, "below the note box");

    // anchor (105,400); label (305,300) with a box x 285.8..324.2, y 281..319.
    ck::Drawing callout = make(6, ck::CalloutGeom{at(10, 100), at(30, 200), "Hi"});
    requireTrue(grabbed(picker.test(108, 400, callout, vp), ck::HandleKind::Anchor), "anchor handle");
    requireTrue(grabbed(picker.test(310, 300, callout, vp), ck::HandleKind::Label), "label handle");
    requireTrue(body(picker.test(320, 315, callout, vp)), "callout box");
    requireTrue(!picker.test(330, 300, callout, vp).hit, "outside the callout box");
    requireTrue(!picker.test(200, 350, callout, vp).hit, "connector is not a hit target");
    std::printf("  Test 13 (text and callout picks): PASS\n");
  }

  std::printf("drawing_geometry: ALL PASS\n");
  return 0;
}
