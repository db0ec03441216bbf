#include "sigflow/sentiment/SentimentTracker.hpp"
#include "sigflow/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace sigflow::sentiment {

const char* toString(Sentiment s) {
  switch (s) {
    case Sentiment::Positive: return "POSITIVE";
    case Sentiment::Negative: return "NEGATIVE";
    case Sentiment::Neutral:  return "NEUTRAL";
  }
  return "NEUTRAL";
}

const char* toString(Impact i) {
  switch (i) {
    case Impact::High:   return "HIGH";
    case Impact::Medium: return "MEDIUM";
    case Impact::Low:    return "LOW";
  }
  return "LOW";
}

static std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::optional<Sentiment> parseSentiment(const std::string& s) {
  const auto x = upper(s);
  if (x == "POSITIVE") return Sentiment::Positive;
  if (x == "NEGATIVE") return Sentiment::Negative;
  if (x == "NEUTRAL")  return Sentiment::Neutral;
  return std::nullopt;
}

std::optional<Impact> parseImpact(const std::string& s) {
  const auto x = upper(s);
  if (x == "HIGH")   return Impact::High;
  if (x == "MEDIUM") return Impact::Medium;
  if (x == "LOW")    return Impact::Low;
  return std::nullopt;
}

double impactPoints(const NewsEvent& ev) {
  double pts = 0.0;
  switch (ev.impact) {
    case Impact::High:   pts = 25.0; break;
    case Impact::Medium: pts = 15.0; break;
    case Impact::Low:    pts = 5.0;  break;
  }
  if (ev.sentiment == Sentiment::Negative) return -pts;
  if (ev.sentiment == Sentiment::Neutral)  return 0.0;
  return pts;
}

double SentimentTracker::addNews(const NewsEvent& ev) {
  double now;
  {
    std::lock_guard<std::mutex> lk(mx_);
    score_ = std::clamp(score_ + impactPoints(ev), -kMax, kMax);
    last_ = ev;
    now = score_;
  }
  util::logger().info("news", {{"sentiment", toString(ev.sentiment)},
                               {"impact", toString(ev.impact)},
                               {"score", std::to_string(now)},
                               {"headline", ev.headline}});
  return now;
}

double SentimentTracker::read() {
  std::lock_guard<std::mutex> lk(mx_);
  score_ *= kDecay;
  if (std::abs(score_) < kSnapToZero) score_ = 0.0;
  return score_;
}

double SentimentTracker::peek() const {
  std::lock_guard<std::mutex> lk(mx_);
  return score_;
}

std::optional<NewsEvent> SentimentTracker::lastNews() const {
  std::lock_guard<std::mutex> lk(mx_);
  return last_;
}

void SentimentTracker::reset() {
  std::lock_guard<std::mutex> lk(mx_);
  score_ = 0.0;
  last_.reset();
}

} // namespace sigflow::sentiment
