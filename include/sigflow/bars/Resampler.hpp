#pragma once

#include <cstdint>
#include <vector>

#include "sigflow/Bar.hpp"

namespace sigflow::bars {

// Merges base-interval bars into non-overlapping buckets of intervalMs,
// keyed by floor(timestamp / intervalMs) * intervalMs of each input bar.
// intervalMs == baseIntervalMs returns the input unchanged.
// Throws std::invalid_argument unless intervalMs is a positive multiple of baseIntervalMs.
std::vector<Bar> resample(const std::vector<Bar>& bars,
                          int64_t intervalMs,
                          int64_t baseIntervalMs = 60000);

} // namespace sigflow::bars
