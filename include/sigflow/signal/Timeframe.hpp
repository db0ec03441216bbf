#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sigflow/Result.hpp"

namespace sigflow::signal {

constexpr int64_t kMinuteMs = 60'000;

// Fallback expiry when a signal carries a label that doesn't parse.
constexpr int64_t kDefaultDurationMs = 5 * kMinuteMs;

struct Timeframe {
  std::string id;          // "5m", "1h"
  int64_t     durationMs;  // bar interval and signal expiry
};

// "Nm" -> N minutes, "Nh" -> N*60 minutes. N must be a positive integer.
Result<int64_t> parseTimeframeMs(const std::string& label);

// Same as parseTimeframeMs but never fails: unparseable labels map to
// kDefaultDurationMs (and are logged).
int64_t durationOrDefault(const std::string& label);

// Parses every label; the first bad one is returned as the error.
Result<std::vector<Timeframe>> parseTimeframes(const std::vector<std::string>& labels);

} // namespace sigflow::signal
