#pragma once
#include "ck/data/ChartType.hpp"
#include "ck/drawing/Drawing.hpp"
#include "ck/indicators/Indicator.hpp"
#include "ck/viewport/ChartViewport.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ck {

// Value snapshot of everything undo/redo restores together.
struct HistoryEntry {
  std::vector<Drawing> drawings;
  std::vector<IndicatorConfig> indicators;
  ViewState view;
  PriceRange priceRange;
  bool autoScale{true};
  ChartType chartType{ChartType::Candle};
  std::string label;

  // Label is not part of the state.
  bool sameState(const HistoryEntry& o) const {
    return drawings == o.drawings && indicators == o.indicators && view == o.view &&
           priceRange == o.priceRange && autoScale == o.autoScale && chartType == o.chartType;
  }
};

struct HistoryConfig {
  std::size_t limit{50};   // oldest undo entries are dropped beyond this
};

// Snapshot undo/redo. Callers commit() the current state immediately before
// each mutation; undo/redo exchange whole snapshots.
class HistoryManager {
public:
  void setConfig(const HistoryConfig& cfg);
  const HistoryConfig& config() const { return config_; }

  // Push a copy of `state` onto the undo stack and clear redo.
  void commit(const HistoryEntry& state, const std::string& label = {});

  // Push a pre-built entry (pre-gesture snapshot rebuilt at release).
  void pushEntry(HistoryEntry entry);

  // Returns false when there is nothing to undo. Otherwise `current` goes
  // to the redo stack and `out` receives the restored snapshot.
  bool undo(const HistoryEntry& current, HistoryEntry& out);
  bool redo(const HistoryEntry& current, HistoryEntry& out);

  bool canUndo() const { return !undoStack_.empty(); }
  bool canRedo() const { return !redoStack_.empty(); }

  std::size_t undoCount() const { return undoStack_.size(); }
  std::size_t redoCount() const { return redoStack_.size(); }

  // Label of the next undo/redo entry; empty when none.
  const std::string& undoLabel() const;
  const std::string& redoLabel() const;

  void clear();

private:
  void trim();

  HistoryConfig config_;
  std::vector<HistoryEntry> undoStack_;
  std::vector<HistoryEntry> redoStack_;
  static const std::string empty_;
};

} // namespace ck
