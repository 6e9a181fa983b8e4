#include "ck/history/HistoryManager.hpp"

namespace ck {

const std::string HistoryManager::empty_;

void HistoryManager::setConfig(const HistoryConfig& cfg) {
  config_ = cfg;
  if (config_.limit == 0) config_.limit = 1;
  trim();
}

void HistoryManager::commit(const HistoryEntry& state, const std::string& label) {
  HistoryEntry entry = state;
  entry.label = label;
  pushEntry(std::move(entry));
}

void HistoryManager::pushEntry(HistoryEntry entry) {
  undoStack_.push_back(std::move(entry));
  redoStack_.clear();
  trim();
}

bool HistoryManager::undo(const HistoryEntry& current, HistoryEntry& out) {
  if (undoStack_.empty()) return false;
  HistoryEntry restored = std::move(undoStack_.back());
  undoStack_.pop_back();

  HistoryEntry saved = current;
  saved.label = restored.label;
  redoStack_.push_back(std::move(saved));
  out = std::move(restored);
  return true;
}

bool HistoryManager::redo(const HistoryEntry& current, HistoryEntry& out) {
  if (redoStack_.empty()) return false;
  HistoryEntry restored = std::move(redoStack_.back());
  redoStack_.pop_back();

  HistoryEntry saved = current;
  saved.label = restored.label;
  undoStack_.push_back(std::move(saved));
  trim();
  out = std::move(restored);
  return true;
}

const std::string& HistoryManager::undoLabel() const {
  return undoStack_.empty() ? empty_ : undoStack_.back().label;
}

const std::string& HistoryManager::redoLabel() const {
  return redoStack_.empty() ? empty_ : redoStack_.back().label;
}

void HistoryManager::clear() {
  undoStack_.clear();
  redoStack_.clear();
}

void HistoryManager::trim() {
  if (undoStack_.size() <= config_.limit) return;
  auto excess = static_cast<std::ptrdiff_t>(undoStack_.size() - config_.limit);
  undoStack_.erase(undoStack_.begin(), undoStack_.begin() + excess);
}

} // namespace ck
