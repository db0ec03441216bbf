#include "sigflow/signal/Timeframe.hpp"
#include "sigflow/util/Logger.hpp"

#include <cctype>
#include <limits>

namespace sigflow::signal {

Result<int64_t> parseTimeframeMs(const std::string& label) {
  if (label.size() < 2) return Error{"timeframe too short", label};

  const char unit = label.back();
  if (unit != 'm' && unit != 'h') return Error{"timeframe unit must be 'm' or 'h'", label};

  int64_t n = 0;
  for (size_t i = 0; i + 1 < label.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(label[i]);
    if (!std::isdigit(c)) return Error{"timeframe count must be a positive integer", label};
    if (n > std::numeric_limits<int32_t>::max()) return Error{"timeframe count out of range", label};
    n = n * 10 + (c - '0');
  }
  if (n <= 0) return Error{"timeframe count must be a positive integer", label};

  const int64_t minutes = unit == 'h' ? n * 60 : n;
  return minutes * kMinuteMs;
}

int64_t durationOrDefault(const std::string& label) {
  auto r = parseTimeframeMs(label);
  if (r) return r.value();
  util::logger().warn("timeframe.unparsed", {{"label", label}, {"error", r.error().message}});
  return kDefaultDurationMs;
}

Result<std::vector<Timeframe>> parseTimeframes(const std::vector<std::string>& labels) {
  std::vector<Timeframe> out;
  out.reserve(labels.size());
  for (const auto& l : labels) {
    auto r = parseTimeframeMs(l);
    if (!r) return r.error();
    out.push_back(Timeframe{ l, r.value() });
  }
  return out;
}

} // namespace sigflow::signal
