#include "ck/session/ChartSession.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace ck {

namespace {

std::string idDetails(const char* key, Id id) {
  return std::string("{\"") + key + "\":" + std::to_string(id) + "}";
}

OpResult drawingNotFound(Id id) {
  return OpResult::fail("DRAWING_NOT_FOUND", "unknown drawing id", idDetails("drawingId", id));
}

OpResult indicatorNotFound(Id id) {
  return OpResult::fail("INDICATOR_NOT_FOUND", "unknown indicator id", idDetails("indicatorId", id));
}

} // namespace

ChartSession::ChartSession() {
  registry_.registerBuiltins();
}

void ChartSession::setConfig(const ChartSessionConfig& cfg) {
  config_ = cfg;
  viewport_.setConfig(cfg.viewport);
  autoScaler_.setConfig(cfg.autoScale);
  history_.setConfig(cfg.history);
}

void ChartSession::setTimeframe(const std::string& timeframe) {
  viewport_.setTimeframe(timeframe);
}

void ChartSession::setCandles(const CandleSeries* candles) {
  viewport_.setCandles(candles);
  viewport_.setView(viewport_.defaultViewState());
  recomputeIndicators();
  refit();
}

void ChartSession::setSize(double width, double height) {
  viewport_.setSize(width, height);
}

// ---- history ----

HistoryEntry ChartSession::snapshot() const {
  HistoryEntry e;
  e.drawings = drawings_.drawings();
  e.indicators = indicators_;
  e.view = viewport_.view();
  e.priceRange = viewport_.priceRange();
  e.autoScale = autoScale_;
  e.chartType = chartType_;
  return e;
}

void ChartSession::commit(const std::string& label) {
  history_.commit(snapshot(), label);
}

void ChartSession::restore(const HistoryEntry& e) {
  bool indicatorsDiffer = e.indicators != indicators_;
  drawings_.replaceAll(e.drawings);
  indicators_ = e.indicators;
  viewport_.setView(e.view);
  viewport_.setPriceRange(e.priceRange);
  autoScale_ = e.autoScale;
  chartType_ = e.chartType;

  if (indicatorsDiffer) {
    recomputeIndicators();
    if (persistence_ && !persistence_->saveIndicators(symbol_, indicators_)) {
      std::fprintf(stderr, "ChartSession: saveIndicators failed (%zu indicators)\n",
                   indicators_.size());
    }
  }
  drawingsChanged();
}

bool ChartSession::undo() {
  HistoryEntry restored;
  if (!history_.undo(snapshot(), restored)) return false;
  restore(restored);
  return true;
}

bool ChartSession::redo() {
  HistoryEntry restored;
  if (!history_.redo(snapshot(), restored)) return false;
  restore(restored);
  return true;
}

// ---- view ----

void ChartSession::setView(double startIndex, double visibleCandles) {
  viewport_.setView(viewport_.clampedViewState(startIndex, visibleCandles));
  refit();
}

void ChartSession::setAutoScale(bool on) {
  autoScale_ = on;
  refit();
}

void ChartSession::refit() {
  if (!autoScale_) return;
  PriceRange r;
  if (autoScaler_.computePriceRange(viewport_, r)) viewport_.setPriceRange(r);
}

void ChartSession::resetView() {
  commit("Reset view");
  viewport_.setView(viewport_.defaultViewState());
  autoScale_ = true;
  refit();
}

void ChartSession::setChartType(ChartType type) {
  if (type == chartType_) return;
  commit("Change chart type");
  chartType_ = type;
}

// ---- drawings ----

Id ChartSession::addDrawing(Drawing d, const std::string& label) {
  commit(label);
  Id id = drawings_.add(std::move(d));
  drawingsChanged();
  return id;
}

OpResult ChartSession::updateDrawing(const Drawing& d) {
  if (!drawings_.get(d.id)) return drawingNotFound(d.id);
  commit("Edit drawing");
  drawings_.update(d);
  drawingsChanged();
  return OpResult::success();
}

OpResult ChartSession::removeDrawing(Id id) {
  if (!drawings_.get(id)) return drawingNotFound(id);
  commit("Delete drawing");
  drawings_.remove(id);

  Id alertId = alerts_.removeForDrawing(id);
  if (alertId != kInvalidId && persistence_ && !persistence_->deleteAlert(alertId)) {
    std::fprintf(stderr, "ChartSession: deleteAlert(%llu) failed\n",
                 static_cast<unsigned long long>(alertId));
  }
  drawingsChanged();
  return OpResult::success();
}

OpResult ChartSession::cloneDrawing(Id id) {
  if (!drawings_.get(id)) return drawingNotFound(id);
  commit("Clone drawing");
  Id created = drawings_.clone(id, viewport_.candleInterval());
  drawingsChanged();
  return OpResult::success(created);
}

OpResult ChartSession::updateDrawingStyle(Id id, const DrawingStyle& style) {
  if (!drawings_.get(id)) return drawingNotFound(id);
  commit("Style drawing");
  drawings_.updateStyle(id, style);
  drawingsChanged();
  return OpResult::success();
}

OpResult ChartSession::toggleDrawingVisibility(Id id) {
  if (!drawings_.get(id)) return drawingNotFound(id);
  commit("Toggle visibility");
  drawings_.toggleVisibility(id);
  drawingsChanged();
  return OpResult::success();
}

OpResult ChartSession::setDrawingText(Id id, const std::string& text) {
  const Drawing* d = drawings_.get(id);
  if (!d) return drawingNotFound(id);
  DrawingType t = d->type();
  if (t != DrawingType::TextNote && t != DrawingType::Callout) {
    return OpResult::fail("DRAWING_NO_TEXT", "drawing has no text", idDetails("drawingId", id));
  }
  commit("Edit text");
  drawings_.setText(id, text);
  drawingsChanged();
  return OpResult::success();
}

void ChartSession::removeAllDrawings() {
  if (drawings_.count() == 0) return;
  commit("Remove all drawings");
  for (const auto& d : drawings_.drawings()) {
    Id alertId = alerts_.removeForDrawing(d.id);
    if (alertId != kInvalidId && persistence_ && !persistence_->deleteAlert(alertId)) {
      std::fprintf(stderr, "ChartSession: deleteAlert(%llu) failed\n",
                   static_cast<unsigned long long>(alertId));
    }
  }
  drawings_.clear();
  drawingsChanged();
}

bool ChartSession::previewDrawing(const Drawing& d) {
  return drawings_.update(d);
}

void ChartSession::publishDrawings() {
  drawingsChanged();
}

// ---- indicators ----

OpResult ChartSession::addIndicator(IndicatorType type) {
  IndicatorConfig cfg;
  cfg.type = type;
  cfg.settings = defaultIndicatorSettings(type);
  return addIndicator(std::move(cfg));
}

OpResult ChartSession::addIndicator(IndicatorConfig config) {
  if (config.id != kInvalidId && indicator(config.id)) {
    return OpResult::fail("INDICATOR_DUPLICATE", "indicator id already in use",
                          idDetails("indicatorId", config.id));
  }
  commit("Add indicator");
  if (config.id == kInvalidId) config.id = nextIndicatorId_;
  if (config.id >= nextIndicatorId_) nextIndicatorId_ = config.id + 1;

  Id created = config.id;
  indicators_.push_back(std::move(config));
  recomputeIndicator(indicators_.back());
  indicatorsChanged();
  return OpResult::success(created);
}

OpResult ChartSession::updateIndicator(const IndicatorConfig& config) {
  auto it = std::find_if(indicators_.begin(), indicators_.end(),
                         [&](const IndicatorConfig& c) { return c.id == config.id; });
  if (it == indicators_.end()) return indicatorNotFound(config.id);
  commit("Edit indicator");
  *it = config;
  recomputeIndicator(*it);
  indicatorsChanged();
  return OpResult::success();
}

OpResult ChartSession::removeIndicator(Id id) {
  auto it = std::find_if(indicators_.begin(), indicators_.end(),
                         [&](const IndicatorConfig& c) { return c.id == id; });
  if (it == indicators_.end()) return indicatorNotFound(id);
  commit("Remove indicator");
  indicators_.erase(it);
  outputs_.erase(id);

  for (Id alertId : alerts_.removeForIndicator(id)) {
    if (persistence_ && !persistence_->deleteAlert(alertId)) {
      std::fprintf(stderr, "ChartSession: deleteAlert(%llu) failed\n",
                   static_cast<unsigned long long>(alertId));
    }
  }
  indicatorsChanged();
  return OpResult::success();
}

const IndicatorConfig* ChartSession::indicator(Id id) const {
  for (const auto& c : indicators_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

const IndicatorOutput* ChartSession::indicatorOutput(Id id) const {
  auto it = outputs_.find(id);
  return it == outputs_.end() ? nullptr : &it->second;
}

void ChartSession::recomputeIndicator(const IndicatorConfig& config) {
  const CandleSeries* candles = viewport_.candles();
  if (!candles) {
    outputs_.erase(config.id);
    return;
  }
  IndicatorOutput out;
  if (registry_.compute(config, *candles, out)) {
    outputs_[config.id] = std::move(out);
  } else {
    outputs_.erase(config.id);
  }
}

void ChartSession::recomputeIndicators() {
  outputs_.clear();
  for (const auto& c : indicators_) recomputeIndicator(c);
}

// ---- alerts ----

OpResult ChartSession::createAlert(PriceAlert a) {
  const Drawing* d = nullptr;
  if (a.hasDrawing()) {
    d = drawings_.get(a.drawingId);
    if (!d) {
      return OpResult::fail("ALERT_UNKNOWN_DRAWING", "alert references an unknown drawing",
                            idDetails("drawingId", a.drawingId));
    }
  }
  if (a.hasIndicator() && !indicator(a.indicatorId)) {
    return OpResult::fail("ALERT_UNKNOWN_INDICATOR", "alert references an unknown indicator",
                          idDetails("indicatorId", a.indicatorId));
  }
  if (a.symbol.empty()) a.symbol = symbol_;
  if (a.message.empty()) {
    ResolvedPrice target = AlertPriceResolver::resolve(a, d, indicatorOutput(a.indicatorId),
                                                       lastCandleTime());
    a.message = defaultAlertMessage(a.symbol, d, a.condition, target.price, a.fibLevel);
  }

  OpResult r = alerts_.add(std::move(a));
  if (!r.ok) {
    std::fprintf(stderr, "ChartSession: createAlert rejected: %s\n", r.err.code.c_str());
    return r;
  }
  const PriceAlert* stored = alerts_.get(r.createdId);
  if (persistence_ && stored && !persistence_->saveAlert(*stored)) {
    std::fprintf(stderr, "ChartSession: saveAlert(%llu) failed\n",
                 static_cast<unsigned long long>(r.createdId));
  }
  return r;
}

OpResult ChartSession::updateAlert(const PriceAlert& a) {
  if (a.hasDrawing() && !drawings_.get(a.drawingId)) {
    return OpResult::fail("ALERT_UNKNOWN_DRAWING", "alert references an unknown drawing",
                          idDetails("drawingId", a.drawingId));
  }
  OpResult r = alerts_.update(a);
  if (!r.ok) return r;
  if (persistence_ && !persistence_->updateAlert(a)) {
    std::fprintf(stderr, "ChartSession: updateAlert(%llu) failed\n",
                 static_cast<unsigned long long>(a.id));
  }
  return r;
}

OpResult ChartSession::removeAlert(Id id) {
  OpResult r = alerts_.remove(id);
  if (!r.ok) return r;
  if (persistence_ && !persistence_->deleteAlert(id)) {
    std::fprintf(stderr, "ChartSession: deleteAlert(%llu) failed\n",
                 static_cast<unsigned long long>(id));
  }
  return r;
}

std::vector<ResolvedAlert> ChartSession::resolvedAlerts(const Drawing* activeOverride) const {
  std::vector<ResolvedAlert> out;
  out.reserve(alerts_.count());
  double fallback = lastCandleTime();
  for (const auto& a : alerts_.alerts()) {
    const Drawing* d = nullptr;
    if (a.hasDrawing()) {
      d = (activeOverride && activeOverride->id == a.drawingId) ? activeOverride
                                                                : drawings_.get(a.drawingId);
    }
    ResolvedAlert ra;
    ra.alertId = a.id;
    ra.target = AlertPriceResolver::resolve(a, d, indicatorOutput(a.indicatorId), fallback);
    out.push_back(ra);
  }
  return out;
}

double ChartSession::lastCandleTime() const {
  std::size_t n = viewport_.candleCount();
  if (n == 0) return 0;
  return viewport_.candleAt(n - 1)->time;
}

// ---- state ----

ChartState ChartSession::saveState() const {
  ChartState st;
  st.symbol = symbol_;
  st.timeframe = viewport_.timeframe();
  st.chartType = chartType_;
  st.hasView = true;
  st.view = viewport_.view();
  st.hasPriceRange = true;
  st.priceRange = viewport_.priceRange();
  st.autoScale = autoScale_;
  st.drawings = drawings_.drawings();
  st.indicators = indicators_;
  return st;
}

void ChartSession::loadState(const ChartState& state) {
  if (!state.symbol.empty()) symbol_ = state.symbol;
  viewport_.setTimeframe(state.timeframe);
  chartType_ = state.chartType;

  drawings_.replaceAll(state.drawings);
  indicators_ = state.indicators;
  nextIndicatorId_ = 1;
  for (const auto& c : indicators_) {
    if (c.id >= nextIndicatorId_) nextIndicatorId_ = c.id + 1;
  }
  recomputeIndicators();

  if (state.hasView) {
    viewport_.setView(viewport_.clampedViewState(state.view.startIndex,
                                                 state.view.visibleCandles));
  } else {
    viewport_.setView(viewport_.defaultViewState());
  }

  if (state.hasView && state.hasPriceRange && !state.autoScale) {
    viewport_.setPriceRange(state.priceRange);
    autoScale_ = false;
  } else {
    if (state.hasPriceRange) viewport_.setPriceRange(state.priceRange);
    autoScale_ = true;
    refit();
  }

  history_.clear();
  notify();
}

// ---- notifications ----

void ChartSession::drawingsChanged() {
  if (persistence_ && !persistence_->saveDrawings(symbol_, drawings_.drawings())) {
    std::fprintf(stderr, "ChartSession: saveDrawings failed (%zu drawings)\n", drawings_.count());
  }
  notify();
}

void ChartSession::indicatorsChanged() {
  if (persistence_ && !persistence_->saveIndicators(symbol_, indicators_)) {
    std::fprintf(stderr, "ChartSession: saveIndicators failed (%zu indicators)\n",
                 indicators_.size());
  }
  notify();
}

void ChartSession::notify() {
  if (listener_) listener_(drawings_.drawings(), indicators_);
}

} // namespace ck
