#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "sigflow/Bar.hpp"
#include "sigflow/Result.hpp"
#include "sigflow/sentiment/NewsEvent.hpp"
#include "sigflow/signal/Signal.hpp"

namespace sigflow::codec {

struct TickMessage {
  double  price  = 0.0;
  int64_t ts     = 0;
  double  volume = 0.0;
};

using FeedMessage = std::variant<TickMessage, sentiment::NewsEvent, Bar>;

// One JSON-lines feed record, discriminated by "type":
//   {"type":"tick","price":1.1,"ts":1700000000000[,"volume":1]}
//   {"type":"news","headline":"..","sentiment":"POSITIVE","impact":"HIGH","ts":..[,"source":".."]}
//   {"type":"bar","open":..,"high":..,"low":..,"close":..,"volume":..,"ts":..}
// Errors carry "line <n>" (and the field, when one is at fault) as the path.
Result<FeedMessage> decodeFeedLine(const std::string& line, size_t lineNo = 0);

// Output events, one JSON object per line, tagged with "event".
std::string encodeSignal(const char* event, const signal::Signal& s);
std::string encodeBar(const char* event, const std::string& tf, const Bar& b);
std::string encodeRegime(const std::string& tf, const std::string& regime, const std::string& debug);
std::string encodeStats(const signal::SignalStats& st);

} // namespace sigflow::codec
