#include "sigflow/engine/SignalEngine.hpp"
#include "sigflow/bars/Resampler.hpp"
#include "sigflow/util/Config.hpp"
#include "sigflow/util/Logger.hpp"
#include "sigflow/util/Metrics.hpp"

#include <stdexcept>
#include <utility>

namespace sigflow::engine {

namespace {

std::vector<signal::Timeframe> timeframesFrom(const util::Config& cfg) {
  auto parsed = signal::parseTimeframes(cfg.timeframes);
  if (!parsed) throw std::invalid_argument("timeframes: " + parsed.error().describe());
  return std::move(*parsed);
}

signal::ScorerParams scorerParamsFrom(const util::Config& cfg) {
  signal::ScorerParams p;
  p.threshold = cfg.signalThreshold;
  return p;
}

} // namespace

SignalEngine::SignalEngine(const util::Config& cfg,
                           std::unique_ptr<oracle::AsyncPredictor> predictor)
  : baseIntervalMs_(cfg.baseIntervalMs)
  , timeframes_(timeframesFrom(cfg))
  , params_(ta::IndicatorParams::fromConfig(cfg))
  , agg_(cfg.baseIntervalMs, static_cast<size_t>(cfg.historyMax))
  , ids_(cfg.signalIdSeed)
  , scorer_(sentiment_, ids_, scorerParamsFrom(cfg))
  , book_(signal::PayoutPolicy::fromConfig(cfg), static_cast<size_t>(cfg.signalHistoryMax))
  , predictor_(std::move(predictor))
{
  for (const auto& tf : timeframes_) {
    if (tf.durationMs % baseIntervalMs_ != 0)
      throw std::invalid_argument("timeframe " + tf.id + " is not a multiple of the base interval");
    regimes_[tf.id] = signal::regime::kGathering;
  }
  util::logger().info("engine.ready", {{"timeframes", std::to_string(timeframes_.size())},
                                       {"baseIntervalMs", std::to_string(baseIntervalMs_)},
                                       {"oracle", predictor_ ? "on" : "off"}});
}

SignalEngine::~SignalEngine() = default;

void SignalEngine::addListener(std::shared_ptr<IEngineListener> l) {
  if (!l) return;
  std::lock_guard<std::mutex> lk(listenersMx_);
  listeners_.push_back(std::move(l));
}

bars::TickResult SignalEngine::onTick(double price, int64_t tsMs, double volume) {
  std::vector<Event> events;
  std::lock_guard<std::mutex> order(dispatchMx_);
  std::unique_lock<std::mutex> lk(mx_);

  const auto res = agg_.onTick(price, tsMs, volume);
  if (res == bars::TickResult::Sealed) {
    onSealedLocked(tsMs, events);
  }

  dispatch(lk, events);
  return res;
}

double SignalEngine::onNews(const sentiment::NewsEvent& ev) {
  std::lock_guard<std::mutex> lk(mx_);
  SIGFLOW_METRIC_HIT("news.received");
  return sentiment_.addNews(ev);
}

size_t SignalEngine::seedHistory(const std::vector<Bar>& bars) {
  std::vector<Event> events;
  std::lock_guard<std::mutex> order(dispatchMx_);
  std::unique_lock<std::mutex> lk(mx_);

  const size_t kept = agg_.seed(bars);
  display_ = agg_.history();
  ta::computeIndicators(display_, params_);
  util::logger().info("engine.seeded", {{"offered", std::to_string(bars.size())},
                                        {"kept", std::to_string(kept)}});

  events.emplace_back([hist = display_](IEngineListener& l) { l.onBarSealed(hist); });
  dispatch(lk, events);
  return kept;
}

std::vector<signal::Signal> SignalEngine::resolve(int64_t nowMs) {
  std::vector<Event> events;
  std::lock_guard<std::mutex> order(dispatchMx_);
  std::unique_lock<std::mutex> lk(mx_);

  std::vector<signal::Signal> resolved;
  double price = 0.0;
  if (agg_.current())              price = agg_.current()->close;
  else if (!agg_.history().empty()) price = agg_.history().back().close;
  else                              return resolved;

  resolved = book_.resolveDue(nowMs, price);
  if (!resolved.empty()) SIGFLOW_METRIC_INC("signals.resolved", static_cast<double>(resolved.size()));
  for (const auto& s : resolved) {
    events.emplace_back([s](IEngineListener& l) { l.onSignalResolved(s); });
  }

  dispatch(lk, events);
  return resolved;
}

void SignalEngine::onSealedLocked(int64_t nowMs, std::vector<Event>& events) {
  display_ = agg_.history();
  ta::computeIndicators(display_, params_);
  events.emplace_back([hist = display_](IEngineListener& l) { l.onBarSealed(hist); });

  for (const auto& tf : timeframes_) {
    if (book_.hasPending(tf.id)) {
      SIGFLOW_METRIC_HIT("timeframes.skipped_pending");
      continue;
    }
    scoreTimeframeLocked(tf, nowMs, events);
  }
}

void SignalEngine::scoreTimeframeLocked(const signal::Timeframe& tf, int64_t nowMs,
                                        std::vector<Event>& events)
{
  util::Logger::Scoped ctx({{"tf", tf.id}});

  auto bars = bars::resample(display_, tf.durationMs, baseIntervalMs_);
  ta::computeIndicators(bars, params_);

  std::optional<double> prediction;
  if (predictor_ && bars.size() >= scorer_.params().minBars && bars.size() >= predictor_->windowSize()) {
    std::vector<double> closes;
    closes.reserve(predictor_->windowSize());
    for (size_t i = bars.size() - predictor_->windowSize(); i < bars.size(); ++i)
      closes.push_back(bars[i].close);
    prediction = predictor_->predict(std::move(closes));
  }

  auto result = scorer_.evaluate(bars, tf.id, prediction, nowMs);
  regimes_[tf.id] = result.regime;
  util::logger().debug("regime", {{"regime", result.regime}, {"debug", result.debug}});

  events.emplace_back([id = tf.id, bars = std::move(bars)](IEngineListener& l) { l.onTimeframeBars(id, bars); });
  events.emplace_back([id = tf.id, r = result.regime, d = result.debug](IEngineListener& l) { l.onRegime(id, r, d); });

  if (!result.signal) return;

  auto& sig = *result.signal;
  if (sig.strength == signal::Strength::Weak) {
    SIGFLOW_METRIC_HIT("signals.weak_dropped");
    util::logger().debug("signal.weak_dropped", {{"id", sig.id}, {"score", std::to_string(sig.score)}});
    return;
  }

  if (!book_.add(sig)) return;

  util::logger().info("signal.created", {{"id", sig.id},
                                         {"direction", signal::toString(sig.direction)},
                                         {"strength", signal::toString(sig.strength)},
                                         {"entry", util::fmtPrice(sig.entryPrice)},
                                         {"strategy", sig.strategy}});
  events.emplace_back([s = std::move(sig)](IEngineListener& l) { l.onSignalCreated(s); });
}

// Caller holds dispatchMx_ (taken before mx_). State is unlocked here so
// listeners can use the const accessors; dispatchMx_ stays held to keep
// delivery in event order across threads.
void SignalEngine::dispatch(std::unique_lock<std::mutex>& stateLock, std::vector<Event>& events) {
  stateLock.unlock();
  if (events.empty()) return;

  std::vector<std::shared_ptr<IEngineListener>> ls;
  {
    std::lock_guard<std::mutex> lk(listenersMx_);
    ls = listeners_;
  }

  for (const auto& ev : events) {
    for (const auto& l : ls) {
      try {
        ev(*l);
      } catch (const std::exception& ex) {
        util::logger().error("engine.listener.exception", {{"err", ex.what()}});
      }
    }
  }
}

std::string SignalEngine::regime(const std::string& tf) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto it = regimes_.find(tf);
  return it == regimes_.end() ? std::string(signal::regime::kGathering) : it->second;
}

signal::SignalStats SignalEngine::stats() const {
  return book_.stats();
}

signal::SignalSnapshot SignalEngine::signals() const {
  return book_.snapshot();
}

std::optional<double> SignalEngine::lastPrice() const {
  std::lock_guard<std::mutex> lk(mx_);
  if (agg_.current()) return agg_.current()->close;
  if (!agg_.history().empty()) return agg_.history().back().close;
  return std::nullopt;
}

std::vector<Bar> SignalEngine::history() const {
  std::lock_guard<std::mutex> lk(mx_);
  return display_;
}

double SignalEngine::sentimentScore() const {
  return sentiment_.peek();
}

} // namespace sigflow::engine
