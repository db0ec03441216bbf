#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sigflow/Bar.hpp"
#include "sigflow/bars/BarAggregator.hpp"
#include "sigflow/oracle/AsyncPredictor.hpp"
#include "sigflow/sentiment/SentimentTracker.hpp"
#include "sigflow/signal/Signal.hpp"
#include "sigflow/signal/SignalBook.hpp"
#include "sigflow/signal/SignalScorer.hpp"
#include "sigflow/signal/Timeframe.hpp"
#include "sigflow/ta/IndicatorEngine.hpp"

namespace sigflow {
namespace util { class Config; }

namespace engine {

// Outputs of the pipeline. Called after the engine lock is released, in the
// order the events happened. Listeners may call the engine's const
// accessors but must not feed it ticks, news or resolution.
class IEngineListener {
public:
  virtual ~IEngineListener() = default;

  virtual void onBarSealed(const std::vector<Bar>& /*history*/) {}
  virtual void onTimeframeBars(const std::string& /*tf*/, const std::vector<Bar>& /*bars*/) {}
  virtual void onRegime(const std::string& /*tf*/, const std::string& /*regime*/, const std::string& /*debug*/) {}
  virtual void onSignalCreated(const signal::Signal& /*s*/) {}
  virtual void onSignalResolved(const signal::Signal& /*s*/) {}
};

// Tick -> 1m bar -> per-timeframe resample -> indicators -> oracle -> scorer
// -> signal book. All mutators are serialized on one mutex.
class SignalEngine {
public:
  explicit SignalEngine(const util::Config& cfg,
                        std::unique_ptr<oracle::AsyncPredictor> predictor = nullptr);
  ~SignalEngine();

  SignalEngine(const SignalEngine&)            = delete;
  SignalEngine& operator=(const SignalEngine&) = delete;

  void addListener(std::shared_ptr<IEngineListener> l);

  // Returns what the aggregator did with the tick. On Sealed every
  // timeframe without a pending signal is re-scored.
  bars::TickResult onTick(double price, int64_t tsMs, double volume = 0.0);

  // Returns the sentiment score after the event.
  double onNews(const sentiment::NewsEvent& ev);

  // Historical 1m bars ahead of the live stream. Returns the number kept.
  size_t seedHistory(const std::vector<Bar>& bars);

  // Resolves due signals against the latest price. No-op before the first tick.
  std::vector<signal::Signal> resolve(int64_t nowMs);

  std::string                 regime(const std::string& tf) const;
  signal::SignalStats         stats() const;
  signal::SignalSnapshot      signals() const;
  std::optional<double>       lastPrice() const;
  std::vector<Bar>            history() const;   // annotated 1m bars
  double                      sentimentScore() const;
  const std::vector<signal::Timeframe>& timeframes() const noexcept { return timeframes_; }

private:
  using Event = std::function<void(IEngineListener&)>;

  void onSealedLocked(int64_t nowMs, std::vector<Event>& events);
  void scoreTimeframeLocked(const signal::Timeframe& tf, int64_t nowMs, std::vector<Event>& events);
  void dispatch(std::unique_lock<std::mutex>& stateLock, std::vector<Event>& events);

private:
  // Lock order: dispatchMx_ before mx_. Never take dispatchMx_ while holding mx_.
  mutable std::mutex mx_;
  std::mutex         dispatchMx_;   // keeps listener callbacks in event order

  int64_t                          baseIntervalMs_;
  std::vector<signal::Timeframe>   timeframes_;
  ta::IndicatorParams              params_;

  bars::BarAggregator              agg_;
  sentiment::SentimentTracker      sentiment_;
  signal::SignalIdGenerator        ids_;
  signal::SignalScorer             scorer_;
  signal::SignalBook               book_;
  std::unique_ptr<oracle::AsyncPredictor> predictor_;

  std::vector<Bar>                             display_;
  std::unordered_map<std::string, std::string> regimes_;

  std::mutex                                    listenersMx_;
  std::vector<std::shared_ptr<IEngineListener>> listeners_;
};

} // namespace engine
} // namespace sigflow
