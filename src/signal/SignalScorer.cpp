#include "sigflow/signal/SignalScorer.hpp"
#include "sigflow/sentiment/SentimentTracker.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sigflow::signal {

static bool ready(const Bar& b) {
  return b.macd && b.bollinger && b.adx && b.rsi;
}

static std::string fmtScore(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.0f", v);
  return buf;
}

SignalScorer::SignalScorer(sentiment::SentimentTracker& sentiment,
                           SignalIdGenerator& ids,
                           ScorerParams params)
  : sentiment_(sentiment)
  , ids_(ids)
  , params_(params)
{}

ScoreResult SignalScorer::evaluate(const std::vector<Bar>& bars,
                                   const std::string& timeframe,
                                   std::optional<double> prediction,
                                   int64_t nowMs) const
{
  ScoreResult out;
  if (bars.size() < params_.minBars || bars.size() < 2) {
    out.regime = regime::kGathering;
    return out;
  }

  const Bar& last = bars[bars.size() - 1];
  const Bar& prev = bars[bars.size() - 2];
  if (!ready(last) || !ready(prev)) {
    out.regime = regime::kCalculating;
    return out;
  }

  const double adx    = *last.adx;
  const double rsi    = *last.rsi;
  const double ema200 = last.ema200.value_or(0.0);
  const auto&  m      = *last.macd;
  const auto&  pm     = *prev.macd;
  const auto&  bb     = *last.bollinger;

  // --- regime ---
  std::string label = regime::kRanging;
  if (adx > params_.trendAdx) {
    label = last.close > ema200 ? regime::kBullTrend : regime::kBearTrend;
  } else if (adx < params_.choppyAdx) {
    label = regime::kChoppy;
  }

  double callScore = 0.0;
  double putScore  = 0.0;
  std::string strategy;
  std::string sentimentContext;

  // --- sentiment ---
  const double s = sentiment_.read();
  if (s > params_.sentimentGate) {
    const double pts = std::min(s, params_.sentimentCap);
    callScore += pts;
    sentimentContext = "Bullish Sentiment (+" + std::to_string(static_cast<int>(std::floor(pts))) + ")";
    label = regime::kNewsBull;
  } else if (s < -params_.sentimentGate) {
    const double pts = std::min(std::abs(s), params_.sentimentCap);
    putScore += pts;
    sentimentContext = "Bearish Sentiment (+" + std::to_string(static_cast<int>(std::floor(pts))) + ")";
    label = regime::kNewsBear;
  }

  const bool isOverbought = rsi > 70.0;
  const bool isOversold   = rsi < 30.0;
  const bool isAboveEma   = last.close > ema200;

  const bool bullCross    = pm.line < pm.signal && m.line > m.signal;
  const bool bearCross    = pm.line > pm.signal && m.line < m.signal;
  const bool histImproving = m.hist > pm.hist;
  const bool histDeclining = m.hist < pm.hist;

  const bool bbLowerBreak   = last.close < bb.lower;
  const bool bbUpperBreak   = last.close > bb.upper;
  const bool bbMidCrossUp   = prev.close < bb.middle && last.close > bb.middle;
  const bool bbMidCrossDown = prev.close > bb.middle && last.close < bb.middle;

  // --- trend following ---
  if (adx > params_.trendAdx) {
    if (isAboveEma) {
      if (bullCross)                     callScore += 25;
      if (bbMidCrossUp)                  callScore += 20;
      if (rsi > 50 && rsi < 70)          callScore += 10;
      if (histImproving && m.hist > 0)   callScore += 5;
      if (callScore > 20) strategy = "Trend Alpha";
    } else {
      if (bearCross)                     putScore += 25;
      if (bbMidCrossDown)                putScore += 20;
      if (rsi < 50 && rsi > 30)          putScore += 10;
      if (histDeclining && m.hist < 0)   putScore += 5;
      if (putScore > 20) strategy = "Trend Alpha";
    }
  }

  // --- mean reversion (overlaps the trend band between trendAdx and reversionAdx) ---
  if (adx <= params_.reversionAdx) {
    if (bbLowerBreak) callScore += 30;
    if (isOversold)   callScore += 20;
    if (bullCross)    callScore += 10;
    if (callScore > 20 && strategy.empty()) strategy = "BB Reversion";

    if (bbUpperBreak) putScore += 30;
    if (isOverbought) putScore += 20;
    if (bearCross)    putScore += 10;
    if (putScore > 20 && strategy.empty()) strategy = "BB Reversion";
  }

  // --- prediction fusion ---
  std::optional<double> predictionScore;
  if (prediction && std::isfinite(*prediction) && last.close > 0.0) {
    const double diff  = std::abs(*prediction - last.close);
    const double band  = last.close * params_.predictionBand;
    const double ratio = std::min(diff / band, params_.predictionMaxRatio);
    const double pts   = ratio * params_.predictionPointsPerRatio;
    predictionScore = pts;

    if (*prediction > last.close) callScore += pts;
    else                          putScore  += pts;
    strategy = strategy.empty() ? "Predictor Pure" : strategy + " + Predictor";
  }

  std::string debug;
  if (!sentimentContext.empty()) {
    strategy = strategy.empty() ? "News Event" : strategy + " & News";
    debug = " [" + sentimentContext + "]";
  }
  debug = "Call: " + fmtScore(callScore) + ", Put: " + fmtScore(putScore) +
          " (Req: " + fmtScore(params_.threshold) + ")" + debug;

  out.regime    = label;
  out.callScore = callScore;
  out.putScore  = putScore;
  out.strategy  = strategy.empty() ? "Hybrid" : strategy;
  out.debug     = debug;

  std::optional<Direction> dir;
  double score = 0.0;
  if (callScore >= params_.threshold && callScore > putScore) {
    dir = Direction::Call; score = callScore;
  } else if (putScore >= params_.threshold && putScore > callScore) {
    dir = Direction::Put;  score = putScore;
  }
  if (!dir) return out;

  Signal sig;
  sig.id          = ids_.next();
  sig.createdAtMs = nowMs;
  sig.direction   = *dir;
  sig.entryPrice  = last.close;
  sig.timeframe   = timeframe;
  sig.regime      = label;
  sig.strategy    = out.strategy;
  sig.score       = score;
  sig.confidence  = std::min(score / 150.0, 0.99);
  sig.strength    = strengthFor(score);
  sig.prediction  = prediction;
  sig.predictionScore = predictionScore;
  if (!sentimentContext.empty()) sig.sentimentContext = sentimentContext;
  sig.status      = Status::Pending;

  out.signal = std::move(sig);
  return out;
}

} // namespace sigflow::signal
