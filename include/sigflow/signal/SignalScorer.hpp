#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sigflow/Bar.hpp"
#include "sigflow/signal/Signal.hpp"

namespace sigflow {
namespace sentiment { class SentimentTracker; }

namespace signal {

namespace regime {
  inline constexpr const char* kGathering   = "GATHERING_DATA";
  inline constexpr const char* kCalculating = "CALCULATING";
  inline constexpr const char* kBullTrend   = "STRONG_BULL_TREND";
  inline constexpr const char* kBearTrend   = "STRONG_BEAR_TREND";
  inline constexpr const char* kChoppy      = "CHOPPY/SIDEWAYS";
  inline constexpr const char* kRanging     = "RANGING";
  inline constexpr const char* kNewsBull    = "NEWS_BULLISH";
  inline constexpr const char* kNewsBear    = "NEWS_BEARISH";
} // namespace regime

struct ScorerParams {
  size_t minBars          = 30;
  double threshold        = 70.0;
  double trendAdx         = 25.0;   // trend strategy above this
  double choppyAdx        = 20.0;
  double reversionAdx     = 30.0;   // mean reversion at or below this
  double sentimentGate    = 5.0;
  double sentimentCap     = 30.0;
  double predictionBand   = 0.0005; // 0.05% of close
  double predictionMaxRatio = 2.0;
  double predictionPointsPerRatio = 50.0;
};

struct ScoreResult {
  std::string           regime;
  double                callScore = 0.0;
  double                putScore  = 0.0;
  std::string           strategy;
  std::string           debug;
  std::optional<Signal> signal;   // may be WEAK; callers drop those
};

// Classifies the market regime of an indicator-annotated series and turns
// it into an optional CALL/PUT signal. Reads (and so decays) sentiment once
// per evaluation that gets past the readiness checks.
class SignalScorer {
public:
  SignalScorer(sentiment::SentimentTracker& sentiment,
               SignalIdGenerator& ids,
               ScorerParams params = {});

  ScoreResult evaluate(const std::vector<Bar>& bars,
                       const std::string& timeframe,
                       std::optional<double> prediction,
                       int64_t nowMs) const;

  const ScorerParams& params() const noexcept { return params_; }

private:
  sentiment::SentimentTracker& sentiment_;
  SignalIdGenerator&           ids_;
  ScorerParams                 params_;
};

} // namespace signal
} // namespace sigflow
