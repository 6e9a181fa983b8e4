#include "ck/session/ChartState.hpp"
#include "ck/drawing/DrawingJson.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdio>

namespace ck {

namespace {

void writeIndicator(JsonWriter& w, const IndicatorConfig& ind) {
  w.StartObject();
  w.Key("id");        w.Uint64(ind.id);
  w.Key("type");      w.String(indicatorTypeName(ind.type));
  w.Key("isVisible"); w.Bool(ind.isVisible);
  w.Key("settings");
  w.StartObject();
  for (const auto& kv : ind.settings) {
    w.Key(kv.first.c_str());
    w.Double(kv.second);
  }
  w.EndObject();
  w.EndObject();
}

bool readIndicator(const rapidjson::Value& v, IndicatorConfig& out) {
  if (!v.IsObject()) return false;
  if (!v.HasMember("id") || !v["id"].IsUint64()) return false;
  if (!v.HasMember("type") || !v["type"].IsString()) return false;

  IndicatorConfig ind;
  ind.id = v["id"].GetUint64();
  if (!parseIndicatorType(v["type"].GetString(), ind.type)) return false;
  if (v.HasMember("isVisible") && v["isVisible"].IsBool())
    ind.isVisible = v["isVisible"].GetBool();
  if (v.HasMember("settings") && v["settings"].IsObject()) {
    for (const auto& m : v["settings"].GetObject()) {
      if (m.value.IsNumber()) ind.settings[m.name.GetString()] = m.value.GetDouble();
    }
  }
  out = std::move(ind);
  return true;
}

bool finite(double v) { return std::isfinite(v); }

} // namespace

std::string serializeChartState(const ChartState& state) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();
  w.Key("version");   w.String(state.version.c_str());
  w.Key("symbol");    w.String(state.symbol.c_str());
  w.Key("timeframe"); w.String(state.timeframe.c_str());
  w.Key("chartType"); w.String(chartTypeName(state.chartType));

  if (state.hasView) {
    w.Key("view");
    w.StartObject();
    w.Key("startIndex");     w.Double(state.view.startIndex);
    w.Key("visibleCandles"); w.Double(state.view.visibleCandles);
    w.EndObject();
  }
  if (state.hasPriceRange) {
    w.Key("priceRange");
    w.StartObject();
    w.Key("min"); w.Double(state.priceRange.min);
    w.Key("max"); w.Double(state.priceRange.max);
    w.EndObject();
  }
  w.Key("autoScale"); w.Bool(state.autoScale);

  w.Key("drawings");
  w.StartArray();
  for (const auto& d : state.drawings) writeDrawing(w, d);
  w.EndArray();

  w.Key("indicators");
  w.StartArray();
  for (const auto& ind : state.indicators) writeIndicator(w, ind);
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

bool deserializeChartState(const std::string& json, ChartState& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  ChartState st;

  if (doc.HasMember("version") && doc["version"].IsString())
    st.version = doc["version"].GetString();
  if (doc.HasMember("symbol") && doc["symbol"].IsString())
    st.symbol = doc["symbol"].GetString();
  if (doc.HasMember("timeframe") && doc["timeframe"].IsString())
    st.timeframe = doc["timeframe"].GetString();
  if (doc.HasMember("chartType") && doc["chartType"].IsString()) {
    ChartType ct;
    if (parseChartType(doc["chartType"].GetString(), ct)) st.chartType = ct;
  }

  if (doc.HasMember("view") && doc["view"].IsObject()) {
    const auto& v = doc["view"];
    if (v.HasMember("startIndex") && v["startIndex"].IsNumber() &&
        v.HasMember("visibleCandles") && v["visibleCandles"].IsNumber()) {
      double start = v["startIndex"].GetDouble();
      double visible = v["visibleCandles"].GetDouble();
      if (finite(start) && finite(visible) && visible > 0) {
        st.hasView = true;
        st.view = {start, visible};
      }
    }
  }

  if (doc.HasMember("autoScale") && doc["autoScale"].IsBool())
    st.autoScale = doc["autoScale"].GetBool();

  if (doc.HasMember("priceRange") && doc["priceRange"].IsObject()) {
    const auto& r = doc["priceRange"];
    if (r.HasMember("min") && r["min"].IsNumber() &&
        r.HasMember("max") && r["max"].IsNumber()) {
      double lo = r["min"].GetDouble();
      double hi = r["max"].GetDouble();
      if (finite(lo) && finite(hi) && lo < hi) {
        st.hasPriceRange = true;
        st.priceRange = {lo, hi};
      }
    }
  }
  if (!st.hasPriceRange) st.autoScale = true;

  if (doc.HasMember("drawings") && doc["drawings"].IsArray()) {
    for (const auto& v : doc["drawings"].GetArray()) {
      Drawing d;
      if (readDrawing(v, d)) {
        st.drawings.push_back(std::move(d));
      } else {
        std::fprintf(stderr, "ChartState: skipping malformed drawing\n");
      }
    }
  }

  if (doc.HasMember("indicators") && doc["indicators"].IsArray()) {
    for (const auto& v : doc["indicators"].GetArray()) {
      IndicatorConfig ind;
      if (readIndicator(v, ind)) {
        st.indicators.push_back(std::move(ind));
      } else {
        std::fprintf(stderr, "ChartState: skipping malformed indicator\n");
      }
    }
  }

  out = std::move(st);
  return true;
}

} // namespace ck
