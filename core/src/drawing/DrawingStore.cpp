#include "ck/drawing/DrawingStore.hpp"
#include "ck/drawing/DrawingGeometry.hpp"
#include "ck/drawing/DrawingJson.hpp"

#include <algorithm>
#include <cstdio>
#include <unordered_set>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace ck {

Drawing* DrawingStore::find(Id id) {
  for (auto& d : drawings_) {
    if (d.id == id) return &d;
  }
  return nullptr;
}

const Drawing* DrawingStore::get(Id id) const {
  for (const auto& d : drawings_) {
    if (d.id == id) return &d;
  }
  return nullptr;
}

void DrawingStore::bumpNextId() {
  Id maxId = 0;
  for (const auto& d : drawings_) maxId = std::max(maxId, d.id);
  nextId_ = std::max(nextId_, maxId + 1);
}

Id DrawingStore::add(Drawing d) {
  if (d.id == kInvalidId || get(d.id) != nullptr) d.id = nextId_;
  drawings_.push_back(std::move(d));
  bumpNextId();
  return drawings_.back().id;
}

Id DrawingStore::clone(Id id, double candleInterval) {
  const Drawing* src = get(id);
  if (!src) return kInvalidId;

  Drawing copy = *src;
  copy.id = kInvalidId;
  if (auto* h = copy.as<HorizontalLineGeom>()) {
    h->price *= 1.001;
  } else {
    DrawingGeometry::shiftTime(copy, candleInterval != 0 ? candleInterval : 3600.0);
  }
  return add(std::move(copy));
}

bool DrawingStore::update(const Drawing& d) {
  Drawing* existing = find(d.id);
  if (!existing) return false;
  *existing = d;
  return true;
}

bool DrawingStore::updateStyle(Id id, const DrawingStyle& style) {
  Drawing* d = find(id);
  if (!d) return false;
  d->style = style;
  return true;
}

bool DrawingStore::setText(Id id, const std::string& text) {
  Drawing* d = find(id);
  if (!d) return false;
  if (auto* t = d->as<TextNoteGeom>()) {
    t->text = text;
    return true;
  }
  if (auto* c = d->as<CalloutGeom>()) {
    c->text = text;
    return true;
  }
  return false;
}

bool DrawingStore::toggleVisibility(Id id) {
  Drawing* d = find(id);
  if (!d) return false;
  d->isVisible = !d->isVisible;
  return true;
}

bool DrawingStore::remove(Id id) {
  auto before = drawings_.size();
  drawings_.erase(
    std::remove_if(drawings_.begin(), drawings_.end(),
      [id](const Drawing& d) { return d.id == id; }),
    drawings_.end());
  return drawings_.size() != before;
}

void DrawingStore::clear() {
  drawings_.clear();
}

void DrawingStore::assignUniqueIds(std::vector<Drawing>& drawings) {
  Id next = nextId_;
  for (const auto& d : drawings) next = std::max(next, d.id + 1);

  std::unordered_set<Id> seen;
  for (auto& d : drawings) {
    if (d.id != kInvalidId && seen.insert(d.id).second) continue;
    Id fresh = next++;
    std::fprintf(stderr, "DrawingStore: drawing id %llu reassigned to %llu\n",
                 static_cast<unsigned long long>(d.id),
                 static_cast<unsigned long long>(fresh));
    d.id = fresh;
    seen.insert(fresh);
  }
}

void DrawingStore::replaceAll(std::vector<Drawing> drawings) {
  assignUniqueIds(drawings);
  drawings_ = std::move(drawings);
  bumpNextId();
}

std::string DrawingStore::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("drawings");
  w.StartArray();
  for (const auto& d : drawings_) writeDrawing(w, d);
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

bool DrawingStore::loadJSON(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("drawings") || !doc["drawings"].IsArray()) return false;

  const auto& arr = doc["drawings"].GetArray();

  std::vector<Drawing> loaded;
  loaded.reserve(arr.Size());
  for (const auto& v : arr) {
    Drawing d;
    if (!readDrawing(v, d)) return false;
    loaded.push_back(std::move(d));
  }

  nextId_ = 1;
  assignUniqueIds(loaded);
  drawings_ = std::move(loaded);
  bumpNextId();
  return true;
}

} // namespace ck
