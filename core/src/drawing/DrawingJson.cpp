#include "ck/drawing/DrawingJson.hpp"

#include <type_traits>

namespace ck {

void writePoint(JsonWriter& w, const Point& p) {
  w.StartObject();
  w.Key("time");  w.Double(p.time);
  w.Key("price"); w.Double(p.price);
  w.EndObject();
}

bool readPoint(const rapidjson::Value& v, const char* key, Point& out) {
  if (!v.HasMember(key) || !v[key].IsObject()) return false;
  const auto& o = v[key];
  if (!o.HasMember("time") || !o["time"].IsNumber()) return false;
  if (!o.HasMember("price") || !o["price"].IsNumber()) return false;
  out.time = o["time"].GetDouble();
  out.price = o["price"].GetDouble();
  return true;
}

namespace {

void writeStyle(JsonWriter& w, const DrawingStyle& s) {
  w.StartObject();
  w.Key("color");     w.String(s.color.c_str());
  w.Key("width");     w.Double(s.width);
  w.Key("lineStyle"); w.String(lineStyleName(s.lineStyle));
  if (!s.fillColor.empty()) {
    w.Key("fillColor"); w.String(s.fillColor.c_str());
  }
  if (s.fontSize > 0) {
    w.Key("fontSize"); w.Double(s.fontSize);
  }
  if (!s.levels.empty()) {
    w.Key("levels");
    w.StartArray();
    for (double l : s.levels) w.Double(l);
    w.EndArray();
  }
  w.EndObject();
}

void readStyle(const rapidjson::Value& v, DrawingStyle& s) {
  if (v.HasMember("color") && v["color"].IsString()) s.color = v["color"].GetString();
  if (v.HasMember("width") && v["width"].IsNumber()) s.width = v["width"].GetDouble();
  if (v.HasMember("lineStyle") && v["lineStyle"].IsString())
    s.lineStyle = parseLineStyle(v["lineStyle"].GetString());
  if (v.HasMember("fillColor") && v["fillColor"].IsString()) s.fillColor = v["fillColor"].GetString();
  if (v.HasMember("fontSize") && v["fontSize"].IsNumber()) s.fontSize = v["fontSize"].GetDouble();
  if (v.HasMember("levels") && v["levels"].IsArray()) {
    s.levels.clear();
    for (const auto& l : v["levels"].GetArray()) {
      if (l.IsNumber()) s.levels.push_back(l.GetDouble());
    }
  }
}

bool readId(const rapidjson::Value& v, Id& out) {
  if (!v.HasMember("id")) return false;
  const auto& id = v["id"];
  if (id.IsUint64()) {
    out = id.GetUint64();
    return out != kInvalidId;
  }
  if (id.IsString()) {
    Id parsed = kInvalidId;
    if (!parseId(id.GetString(), parsed) || parsed == kInvalidId) return false;
    out = parsed;
    return true;
  }
  return false;
}

} // namespace

void writeDrawing(JsonWriter& w, const Drawing& d) {
  w.StartObject();
  w.Key("id");        w.Uint64(d.id);
  w.Key("type");      w.String(drawingTypeName(d.type()));
  w.Key("isVisible"); w.Bool(d.isVisible);
  w.Key("style");     writeStyle(w, d.style);

  std::visit([&](const auto& g) {
    using G = std::decay_t<decltype(g)>;
    if constexpr (std::is_same_v<G, HorizontalLineGeom>) {
      w.Key("price"); w.Double(g.price);
    } else if constexpr (std::is_same_v<G, VerticalLineGeom>) {
      w.Key("time"); w.Double(g.time);
    } else if constexpr (IsSegmentGeom<G>::value) {
      w.Key("start"); writePoint(w, g.start);
      w.Key("end");   writePoint(w, g.end);
    } else if constexpr (std::is_same_v<G, ParallelChannelGeom>) {
      w.Key("start"); writePoint(w, g.start);
      w.Key("end");   writePoint(w, g.end);
      w.Key("p2");    writePoint(w, g.p2);
    } else if constexpr (std::is_same_v<G, TextNoteGeom>) {
      w.Key("point"); writePoint(w, g.point);
      w.Key("text");  w.String(g.text.c_str());
    } else if constexpr (std::is_same_v<G, CalloutGeom>) {
      w.Key("anchor"); writePoint(w, g.anchor);
      w.Key("label");  writePoint(w, g.label);
      w.Key("text");   w.String(g.text.c_str());
    } else if constexpr (IsPositionGeom<G>::value) {
      w.Key("entry");  writePoint(w, g.entry);
      w.Key("profit"); writePoint(w, g.profit);
      w.Key("stop");   writePoint(w, g.stop);
    } else if constexpr (IsPolylineGeom<G>::value) {
      w.Key("points");
      w.StartArray();
      for (const auto& p : g.points) writePoint(w, p);
      w.EndArray();
    } else {
      static_assert(kUnhandledGeom<G>, "unhandled drawing geometry");
    }
  }, d.geom);

  w.EndObject();
}

bool readDrawing(const rapidjson::Value& v, Drawing& out) {
  if (!v.IsObject()) return false;

  Drawing d;
  if (!readId(v, d.id)) return false;

  if (!v.HasMember("type") || !v["type"].IsString()) return false;
  DrawingType type;
  if (!parseDrawingType(v["type"].GetString(), type)) return false;

  if (v.HasMember("isVisible") && v["isVisible"].IsBool()) d.isVisible = v["isVisible"].GetBool();
  if (v.HasMember("style") && v["style"].IsObject()) readStyle(v["style"], d.style);

  d.geom = makeGeometry(type, Point{});
  bool ok = std::visit([&](auto& g) -> bool {
    using G = std::decay_t<decltype(g)>;
    if constexpr (std::is_same_v<G, HorizontalLineGeom>) {
      if (!v.HasMember("price") || !v["price"].IsNumber()) return false;
      g.price = v["price"].GetDouble();
      return true;
    } else if constexpr (std::is_same_v<G, VerticalLineGeom>) {
      if (!v.HasMember("time") || !v["time"].IsNumber()) return false;
      g.time = v["time"].GetDouble();
      return true;
    } else if constexpr (IsSegmentGeom<G>::value) {
      return readPoint(v, "start", g.start) && readPoint(v, "end", g.end);
    } else if constexpr (std::is_same_v<G, ParallelChannelGeom>) {
      return readPoint(v, "start", g.start) && readPoint(v, "end", g.end) &&
             readPoint(v, "p2", g.p2);
    } else if constexpr (std::is_same_v<G, TextNoteGeom>) {
      if (v.HasMember("text") && v["text"].IsString()) g.text = v["text"].GetString();
      return readPoint(v, "point", g.point);
    } else if constexpr (std::is_same_v<G, CalloutGeom>) {
      if (v.HasMember("text") && v["text"].IsString()) g.text = v["text"].GetString();
      return readPoint(v, "anchor", g.anchor) && readPoint(v, "label", g.label);
    } else if constexpr (IsPositionGeom<G>::value) {
      return readPoint(v, "entry", g.entry) && readPoint(v, "profit", g.profit) &&
             readPoint(v, "stop", g.stop);
    } else if constexpr (IsPolylineGeom<G>::value) {
      if (!v.HasMember("points") || !v["points"].IsArray()) return false;
      g.points.clear();
      for (const auto& pv : v["points"].GetArray()) {
        if (!pv.IsObject() || !pv.HasMember("time") || !pv["time"].IsNumber() ||
            !pv.HasMember("price") || !pv["price"].IsNumber()) return false;
        g.points.push_back({pv["time"].GetDouble(), pv["price"].GetDouble()});
      }
      return true;
    } else {
      static_assert(kUnhandledGeom<G>, "unhandled drawing geometry");
    }
  }, d.geom);
  if (!ok) return false;

  out = std::move(d);
  return true;
}

} // namespace ck
