// DrawingStore: ids, clone, edits and JSON persistence

#include "ck/drawing/DrawingJson.hpp"
#include "ck/drawing/DrawingStore.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static ck::Drawing trend(double t0, double p0, double t1, double p1) {
  ck::Drawing d;
  d.geom = ck::TrendLineGeom{{t0, p0}, {t1, p1}};
  return d;
}

int main() {
  // ---- Test 1: id assignment ----
  {
    ck::DrawingStore store;
    ck::Id a = store.add(trend(0, 1, 10, 2));
    ck::Id b = store.add(trend(0, 1, 10, 3));
    requireTrue(a == 1 && b == 2, "sequential ids");

    ck::Drawing explicitId = trend(0, 0, 1, 1);
    explicitId.id = 10;
    requireTrue(store.add(explicitId) == 10, "explicit id kept");
    requireTrue(store.add(trend(0, 0, 1, 1)) == 11, "next id follows the max");

    ck::Drawing dup = trend(0, 0, 1, 1);
    dup.id = 10;
    ck::Id reassigned = store.add(dup);
    requireTrue(reassigned != 10 && store.get(reassigned), "duplicate id replaced");

    requireTrue(store.remove(11), "remove");
    requireTrue(store.add(trend(0, 0, 1, 1)) > 11, "ids never reused after remove");
    std::printf("  Test 1 (id assignment): PASS\n");
  }

  // ---- Test 2: clone horizontal line ----
  {
    ck::DrawingStore store;
    ck::Drawing h;
    h.geom = ck::HorizontalLineGeom{100};
    ck::Id id = store.add(h);

    ck::Id copy = store.clone(id, 3600);
    requireTrue(copy != ck::kInvalidId && copy != id, "clone gets a new id");
    const ck::Drawing* c = store.get(copy);
    requireTrue(std::fabs(c->as<ck::HorizontalLineGeom>()->price - 100.1) < 1e-9,
                "horizontal line clone raised to 100.1");
    requireTrue(store.get(id)->as<ck::HorizontalLineGeom>()->price == 100, "original untouched");
    std::printf("  Test 2 (clone horizontal line): PASS\n");
  }

  // ---- Test 3: clone shifts time by one interval ----
  {
    ck::DrawingStore store;
    ck::Id id = store.add(trend(1000, 1, 2000, 2));

    ck::Id copy = store.clone(id, 60);
    const auto* g = store.get(copy)->as<ck::TrendLineGeom>();
    requireTrue(g->start.time == 1060 && g->end.time == 2060, "shifted by the interval");
    requireTrue(g->start.price == 1 && g->end.price == 2, "prices unchanged");

    copy = store.clone(id, 0);
    g = store.get(copy)->as<ck::TrendLineGeom>();
    requireTrue(g->start.time == 4600, "zero interval falls back to 3600s");

    requireTrue(store.clone(999, 60) == ck::kInvalidId, "unknown id");
    std::printf("  Test 3 (clone shifts time): PASS\n");
  }

  // ---- Test 4: style, text and visibility ----
  {
    ck::DrawingStore store;
    ck::Drawing note;
    note.geom = ck::TextNoteGeom{{5, 5}, "Note"};
    ck::Id n = store.add(note);
    ck::Id t = store.add(trend(0, 0, 1, 1));

    requireTrue(store.setText(n, "Support"), "set text on a note");
    requireTrue(store.get(n)->as<ck::TextNoteGeom>()->text == "Support", "text stored");
    requireTrue(!store.setText(t, "x"), "trend line has no text");

    ck::DrawingStyle s;
    s.color = "#FF0000";
    s.lineStyle = ck::LineStyle::Dashed;
    requireTrue(store.updateStyle(t, s), "style updated");
    requireTrue(store.get(t)->style.color == "#FF0000", "color stored");

    requireTrue(store.toggleVisibility(t) && !store.get(t)->isVisible, "hidden");
    requireTrue(store.toggleVisibility(t) && store.get(t)->isVisible, "shown again");
    requireTrue(!store.toggleVisibility(77), "unknown id");
    std::printf("  Test 4 (style, text, visibility): PASS\n");
  }

  // ---- Test 5: JSON save / load ----
  {
    ck::DrawingStore store;
    store.add(trend(100, 1.5, 200, 2.5));

    ck::Drawing ch;
    ch.geom = ck::ParallelChannelGeom{{0, 10}, {10, 20}, {0, 5}};
    ch.style.fillColor = ck::kChannelFillColor;
    store.add(ch);

    ck::Drawing path;
    path.geom = ck::PathGeom{{{0, 1}, {1, 2}, {2, 1}}};
    store.add(path);

    ck::Drawing fib;
    fib.geom = ck::FibRetracementGeom{{0, 100}, {10, 200}};
    fib.style.levels = {0, 0.5, 1};
    store.add(fib);

    std::string json = store.toJSON();
    requireTrue(json.find("\"Trend Line\"") != std::string::npos, "type names persisted");
    requireTrue(json.find("\"p2\"") != std::string::npos, "channel p2 persisted");

    ck::DrawingStore loaded;
    requireTrue(loaded.loadJSON(json), "load");
    requireTrue(loaded.drawings() == store.drawings(), "loaded drawings equal");
    requireTrue(loaded.add(trend(0, 0, 1, 1)) == 5, "next id continues after the max");

    ck::DrawingStore dup;
    requireTrue(dup.loadJSON(
        "{\"drawings\":["
        "{\"id\":5,\"type\":\"Horizontal Line\",\"price\":1},"
        "{\"id\":5,\"type\":\"Horizontal Line\",\"price\":2},"
        "{\"id\":3,\"type\":\"Horizontal Line\",\"price\":3}]}"), "load repeated ids");
    requireTrue(dup.drawings()[0].id == 5 && dup.drawings()[1].id == 6 &&
                dup.drawings()[2].id == 3, "repeated id reassigned, first keeps it");
    requireTrue(dup.get(6)->as<ck::HorizontalLineGeom>()->price == 2, "reassigned drawing intact");
    requireTrue(dup.remove(5) && dup.count() == 2, "remove takes exactly one");

    std::vector<ck::Drawing> restored(3);
    for (int i = 0; i < 3; ++i) restored[i].geom = ck::HorizontalLineGeom{10.0 + i};
    restored[0].id = 5;
    restored[1].id = 5;
    restored[2].id = ck::kInvalidId;
    ck::DrawingStore r;
    r.replaceAll(restored);
    requireTrue(r.drawings()[0].id == 5 && r.drawings()[1].id == 6 && r.drawings()[2].id == 7,
                "zero and repeated ids get fresh ids");
    requireTrue(r.add(trend(0, 0, 1, 1)) == 8, "allocation continues past reassigned ids");
    std::printf("  Test 5 (JSON save/load): PASS\n");
  }

  // ---- Test 6: malformed JSON leaves the store unchanged ----
  {
    ck::DrawingStore store;
    store.add(trend(0, 0, 1, 1));

    requireTrue(!store.loadJSON("not json"), "parse error");
    requireTrue(!store.loadJSON("{\"drawings\": 5}"), "drawings not an array");
    requireTrue(!store.loadJSON("{\"drawings\":[{\"id\":1,\"type\":\"Bogus\"}]}"), "unknown type");
    requireTrue(store.count() == 1, "store unchanged");

    requireTrue(store.loadJSON(
        "{\"drawings\":[{\"id\":\"42\",\"type\":\"Horizontal Line\",\"price\":7}]}"),
        "string ids accepted");
    requireTrue(store.get(42) && store.get(42)->as<ck::HorizontalLineGeom>()->price == 7,
                "string id parsed");
    std::printf("  Test 6 (malformed JSON): PASS\n");
  }

  std::printf("drawing_store: ALL PASS\n");
  return 0;
}
