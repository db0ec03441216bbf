#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sigflow::sentiment {

enum class Sentiment : uint8_t { Positive, Negative, Neutral };
enum class Impact    : uint8_t { High, Medium, Low };

struct NewsEvent {
  std::string headline;
  Sentiment   sentiment = Sentiment::Neutral;
  Impact      impact    = Impact::Low;
  int64_t     timestamp = 0;   // epoch ms
  std::string source;
};

const char* toString(Sentiment s);
const char* toString(Impact i);

std::optional<Sentiment> parseSentiment(const std::string& s);
std::optional<Impact>    parseImpact(const std::string& s);

} // namespace sigflow::sentiment
