#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "sigflow/Bar.hpp"

namespace sigflow::bars {

enum class TickResult : uint8_t {
  Opened   = 0,   // first bar opened, nothing sealed
  Updated  = 1,   // merged into the open bar
  Sealed   = 2,   // previous bar sealed, new bar opened
  Rejected = 3    // malformed or out of order; nothing changed
};

const char* toString(TickResult r);

// Folds ticks into fixed-interval bars. One append-only sealed history plus
// one mutable in-progress bar; seal() is the only move between the two.
// Not thread-safe: the owner serializes access.
class BarAggregator {
public:
  explicit BarAggregator(int64_t intervalMs = 60000, size_t historyMax = 3500);

  // Install historical bars ahead of live ticks. Bars that break the OHLC
  // invariant or ordering are dropped. Returns the number accepted.
  size_t seed(const std::vector<Bar>& bars);

  TickResult onTick(double price, int64_t tsMs, double volume = 0.0);

  const std::vector<Bar>&   history() const noexcept { return history_; }
  const std::optional<Bar>& current() const noexcept { return current_; }

  int64_t interval() const noexcept { return intervalMs_; }
  int64_t bucketOf(int64_t tsMs) const noexcept;

  uint64_t sealedCount()   const noexcept { return sealed_; }
  uint64_t rejectedCount() const noexcept { return rejected_; }

private:
  void seal();
  void trim();

  int64_t            intervalMs_;
  size_t             historyMax_;
  std::vector<Bar>   history_;
  std::optional<Bar> current_;
  uint64_t           sealed_   = 0;
  uint64_t           rejected_ = 0;
};

} // namespace sigflow::bars
