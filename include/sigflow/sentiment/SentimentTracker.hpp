#pragma once

#include <mutex>
#include <optional>

#include "sigflow/sentiment/NewsEvent.hpp"

namespace sigflow::sentiment {

// Signed points a news item moves the score by.
double impactPoints(const NewsEvent& ev);

// One decaying scalar in [-100, 100]. Decay is read-triggered: every read()
// multiplies by the decay factor and snaps |score| < 1 to zero.
class SentimentTracker {
public:
  static constexpr double kMax         = 100.0;
  static constexpr double kDecay       = 0.995;
  static constexpr double kSnapToZero  = 1.0;

  SentimentTracker() = default;

  SentimentTracker(const SentimentTracker&)            = delete;
  SentimentTracker& operator=(const SentimentTracker&) = delete;

  // Returns the score after the event was applied (no decay).
  double addNews(const NewsEvent& ev);

  // Decaying read.
  double read();

  // Current value, no decay.
  double peek() const;

  std::optional<NewsEvent> lastNews() const;

  void reset();

private:
  mutable std::mutex       mx_;
  double                   score_ = 0.0;
  std::optional<NewsEvent> last_;
};

} // namespace sigflow::sentiment
