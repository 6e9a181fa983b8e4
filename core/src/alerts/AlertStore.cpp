#include "ck/alerts/AlertStore.hpp"

#include <algorithm>
#include <string>

namespace ck {

namespace {

std::string idDetails(const char* key, Id id) {
  return std::string("{\"") + key + "\":" + std::to_string(id) + "}";
}

} // namespace

OpResult AlertStore::add(PriceAlert a) {
  if (a.hasDrawing() && forDrawing(a.drawingId)) {
    return OpResult::fail("ALERT_DUPLICATE_DRAWING",
                          "drawing already has an alert",
                          idDetails("drawingId", a.drawingId));
  }
  if (a.id == kInvalidId || get(a.id)) a.id = nextId_;
  if (a.id >= nextId_) nextId_ = a.id + 1;
  Id created = a.id;
  alerts_.push_back(std::move(a));
  return OpResult::success(created);
}

OpResult AlertStore::update(const PriceAlert& a) {
  auto it = std::find_if(alerts_.begin(), alerts_.end(),
                         [&](const PriceAlert& x) { return x.id == a.id; });
  if (it == alerts_.end()) {
    return OpResult::fail("ALERT_NOT_FOUND", "unknown alert id", idDetails("alertId", a.id));
  }
  if (a.hasDrawing()) {
    const PriceAlert* other = forDrawing(a.drawingId);
    if (other && other->id != a.id) {
      return OpResult::fail("ALERT_DUPLICATE_DRAWING",
                            "drawing already has an alert",
                            idDetails("drawingId", a.drawingId));
    }
  }
  *it = a;
  return OpResult::success();
}

OpResult AlertStore::remove(Id id) {
  auto it = std::find_if(alerts_.begin(), alerts_.end(),
                         [&](const PriceAlert& x) { return x.id == id; });
  if (it == alerts_.end()) {
    return OpResult::fail("ALERT_NOT_FOUND", "unknown alert id", idDetails("alertId", id));
  }
  alerts_.erase(it);
  return OpResult::success();
}

Id AlertStore::removeForDrawing(Id drawingId) {
  if (drawingId == kInvalidId) return kInvalidId;
  auto it = std::find_if(alerts_.begin(), alerts_.end(),
                         [&](const PriceAlert& x) { return x.drawingId == drawingId; });
  if (it == alerts_.end()) return kInvalidId;
  Id removed = it->id;
  alerts_.erase(it);
  return removed;
}

std::vector<Id> AlertStore::removeForIndicator(Id indicatorId) {
  std::vector<Id> removed;
  if (indicatorId == kInvalidId) return removed;
  for (const auto& a : alerts_) {
    if (a.indicatorId == indicatorId) removed.push_back(a.id);
  }
  alerts_.erase(std::remove_if(alerts_.begin(), alerts_.end(),
                               [&](const PriceAlert& x) { return x.indicatorId == indicatorId; }),
                alerts_.end());
  return removed;
}

void AlertStore::clear() {
  alerts_.clear();
}

const PriceAlert* AlertStore::get(Id id) const {
  for (const auto& a : alerts_) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

const PriceAlert* AlertStore::forDrawing(Id drawingId) const {
  if (drawingId == kInvalidId) return nullptr;
  for (const auto& a : alerts_) {
    if (a.drawingId == drawingId) return &a;
  }
  return nullptr;
}

} // namespace ck
