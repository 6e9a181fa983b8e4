#pragma once
#include "ck/alerts/AlertPriceResolver.hpp"
#include "ck/alerts/AlertStore.hpp"
#include "ck/common/OpResult.hpp"
#include "ck/data/ChartType.hpp"
#include "ck/drawing/DrawingStore.hpp"
#include "ck/history/HistoryManager.hpp"
#include "ck/indicators/IndicatorRegistry.hpp"
#include "ck/session/ChartPersistence.hpp"
#include "ck/session/ChartState.hpp"
#include "ck/viewport/AutoScale.hpp"
#include "ck/viewport/ChartViewport.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ck {

struct ChartSessionConfig {
  ViewportConfig viewport;
  AutoScaleConfig autoScale;
  HistoryConfig history;
};

using ChangeListener = std::function<void(const std::vector<Drawing>& drawings,
                                          const std::vector<IndicatorConfig>& indicators)>;

struct ResolvedAlert {
  Id alertId{kInvalidId};
  ResolvedPrice target;
};

// Committed chart state: viewport, drawings, indicators, alerts and history.
// Every user-level mutation commits a history snapshot first, then notifies
// the change listener and the persistence collaborator.
class ChartSession {
public:
  ChartSession();

  void setConfig(const ChartSessionConfig& cfg);
  const ChartSessionConfig& config() const { return config_; }

  // Not owned. Null disables persistence.
  void setPersistence(ChartPersistence* p) { persistence_ = p; }
  void setChangeListener(ChangeListener cb) { listener_ = std::move(cb); }

  void setSymbol(const std::string& symbol) { symbol_ = symbol; }
  const std::string& symbol() const { return symbol_; }
  void setTimeframe(const std::string& timeframe);

  // Non-owning. Resets the view to the default window, recomputes
  // indicators and refits the price range.
  void setCandles(const CandleSeries* candles);
  void setSize(double width, double height);

  ChartViewport& viewport() { return viewport_; }
  const ChartViewport& viewport() const { return viewport_; }
  const DrawingStore& drawings() const { return drawings_; }
  const AlertStore& alerts() const { return alerts_; }
  const HistoryManager& history() const { return history_; }
  IndicatorRegistry& indicatorRegistry() { return registry_; }

  // ---- history ----
  HistoryEntry snapshot() const;
  void commit(const std::string& label = {});
  void pushHistory(HistoryEntry entry) { history_.pushEntry(std::move(entry)); }
  bool undo();
  bool redo();

  // ---- view ----
  // Clamped view update. Refits the price range when auto-scale is on.
  void setView(double startIndex, double visibleCandles);
  void setPriceRange(const PriceRange& r) { viewport_.setPriceRange(r); }
  bool autoScale() const { return autoScale_; }
  void setAutoScale(bool on);
  // Fit the price range to the visible candles if auto-scale is on.
  void refit();
  void resetView();

  ChartType chartType() const { return chartType_; }
  void setChartType(ChartType type);

  // ---- drawings ----
  // Commits and stores d. Returns the assigned id.
  Id addDrawing(Drawing d, const std::string& label = "Add drawing");
  OpResult updateDrawing(const Drawing& d);
  OpResult removeDrawing(Id id);
  OpResult cloneDrawing(Id id);
  OpResult updateDrawingStyle(Id id, const DrawingStyle& style);
  OpResult toggleDrawingVisibility(Id id);
  OpResult setDrawingText(Id id, const std::string& text);
  void removeAllDrawings();

  // In-gesture update without commit or notification.
  bool previewDrawing(const Drawing& d);
  // Ends a live edit: notify and persist.
  void publishDrawings();

  // ---- indicators ----
  // Adds an indicator with the type's default settings.
  OpResult addIndicator(IndicatorType type);
  // Id 0 assigns a fresh one; an existing id fails with INDICATOR_DUPLICATE.
  OpResult addIndicator(IndicatorConfig config);
  OpResult updateIndicator(const IndicatorConfig& config);
  OpResult removeIndicator(Id id);
  const std::vector<IndicatorConfig>& indicators() const { return indicators_; }
  const IndicatorConfig* indicator(Id id) const;
  const IndicatorOutput* indicatorOutput(Id id) const;

  // ---- alerts ----
  OpResult createAlert(PriceAlert a);
  OpResult updateAlert(const PriceAlert& a);
  OpResult removeAlert(Id id);

  // Live target of every alert. `activeOverride` replaces the stored drawing
  // with the same id (in-progress move / resize).
  std::vector<ResolvedAlert> resolvedAlerts(const Drawing* activeOverride = nullptr) const;

  // ---- state ----
  ChartState saveState() const;
  // Applies a restored state. Invalid view / range fall back to the default
  // view with auto-scale. History is cleared.
  void loadState(const ChartState& state);

private:
  void restore(const HistoryEntry& e);
  void recomputeIndicator(const IndicatorConfig& config);
  void recomputeIndicators();
  void drawingsChanged();
  void indicatorsChanged();
  void notify();
  double lastCandleTime() const;

  ChartSessionConfig config_;
  ChartViewport viewport_;
  AutoScale autoScaler_;
  DrawingStore drawings_;
  AlertStore alerts_;
  HistoryManager history_;
  IndicatorRegistry registry_;

  std::vector<IndicatorConfig> indicators_;
  std::map<Id, IndicatorOutput> outputs_;
  Id nextIndicatorId_{1};

  std::string symbol_;
  ChartType chartType_{ChartType::Candle};
  bool autoScale_{true};

  ChartPersistence* persistence_{nullptr};
  ChangeListener listener_;
};

} // namespace ck
