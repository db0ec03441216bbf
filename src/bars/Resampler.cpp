#include "sigflow/bars/Resampler.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace sigflow::bars {

static int64_t floorBucket(int64_t ts, int64_t intervalMs) {
  int64_t q = ts / intervalMs;
  if ((ts % intervalMs) < 0) --q;
  return q * intervalMs;
}

std::vector<Bar> resample(const std::vector<Bar>& bars,
                          int64_t intervalMs,
                          int64_t baseIntervalMs)
{
  if (baseIntervalMs <= 0 || intervalMs <= 0 || intervalMs % baseIntervalMs != 0) {
    throw std::invalid_argument("resample: interval must be a positive multiple of the base interval");
  }
  if (intervalMs == baseIntervalMs) return bars;

  // Ordered by bucket; input order is kept inside each bucket so open/close
  // come from the first/last bar that landed there.
  std::map<int64_t, Bar> buckets;
  for (const auto& b : bars) {
    const int64_t key = floorBucket(b.timestamp, intervalMs);
    auto it = buckets.find(key);
    if (it == buckets.end()) {
      buckets.emplace(key, makeBar(key, b.open, b.high, b.low, b.close, b.volume));
      continue;
    }
    Bar& agg = it->second;
    agg.high    = std::max(agg.high, b.high);
    agg.low     = std::min(agg.low, b.low);
    agg.close   = b.close;
    agg.volume += b.volume;
  }

  std::vector<Bar> out;
  out.reserve(buckets.size());
  for (auto& kv : buckets) out.push_back(std::move(kv.second));
  return out;
}

} // namespace sigflow::bars
