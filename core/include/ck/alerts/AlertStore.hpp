#pragma once
#include "ck/alerts/Alert.hpp"
#include "ck/common/OpResult.hpp"

#include <cstddef>
#include <vector>

namespace ck {

// Alerts of one chart. At most one alert per drawing id.
class AlertStore {
public:
  // Appends a. A zero or already-used id is replaced by a fresh one.
  // Fails with ALERT_DUPLICATE_DRAWING when a.drawingId already has one;
  // the store is left unchanged.
  OpResult add(PriceAlert a);

  // Replaces the alert with the same id (ALERT_NOT_FOUND otherwise).
  // Moving it onto a drawing that already has another alert is rejected.
  OpResult update(const PriceAlert& a);

  OpResult remove(Id id);

  // Removes the alert linked to drawingId. Returns the removed alert id,
  // kInvalidId when there was none.
  Id removeForDrawing(Id drawingId);

  // Removes every alert linked to indicatorId, returning their ids.
  std::vector<Id> removeForIndicator(Id indicatorId);

  void clear();

  const PriceAlert* get(Id id) const;
  const PriceAlert* forDrawing(Id drawingId) const;
  const std::vector<PriceAlert>& alerts() const { return alerts_; }
  std::size_t count() const { return alerts_.size(); }

private:
  std::vector<PriceAlert> alerts_;
  Id nextId_{1};
};

} // namespace ck
