#pragma once
#include "ck/drawing/Drawing.hpp"
#include "ck/ids/Id.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ck {

// Ordered drawing collection. Later entries render on top.
class DrawingStore {
public:
  // Appends d. A zero or already-used id is replaced by a fresh one.
  Id add(Drawing d);

  // Copy of id with a new id, shifted one candle interval later (3600 s when
  // the interval is zero). A Horizontal Line is raised x1.001 instead.
  // Returns kInvalidId if id is unknown.
  Id clone(Id id, double candleInterval);

  // Replace the drawing with the same id. Returns false if not found.
  bool update(const Drawing& d);
  bool updateStyle(Id id, const DrawingStyle& style);
  bool setText(Id id, const std::string& text);
  bool toggleVisibility(Id id);
  bool remove(Id id);
  void clear();

  // Wholesale replacement (history restore, load). Zero and repeated ids
  // are reassigned; the first holder of an id keeps it.
  void replaceAll(std::vector<Drawing> drawings);

  const Drawing* get(Id id) const;
  const std::vector<Drawing>& drawings() const { return drawings_; }
  std::size_t count() const { return drawings_.size(); }

  std::string toJSON() const;
  // Same id rules as replaceAll.
  bool loadJSON(const std::string& json);

private:
  Drawing* find(Id id);
  void bumpNextId();
  void assignUniqueIds(std::vector<Drawing>& drawings);

  std::vector<Drawing> drawings_;
  Id nextId_{1};
};

} // namespace ck
