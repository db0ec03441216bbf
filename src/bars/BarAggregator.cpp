#include "sigflow/bars/BarAggregator.hpp"
#include "sigflow/util/Logger.hpp"
#include "sigflow/util/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sigflow::bars {

using util::logger;

const char* toString(TickResult r) {
  switch (r) {
    case TickResult::Opened:   return "opened";
    case TickResult::Updated:  return "updated";
    case TickResult::Sealed:   return "sealed";
    case TickResult::Rejected: return "rejected";
  }
  return "unknown";
}

BarAggregator::BarAggregator(int64_t intervalMs, size_t historyMax)
  : intervalMs_(intervalMs)
  , historyMax_(historyMax)
{
  if (intervalMs_ <= 0)
    throw std::invalid_argument("BarAggregator: interval must be > 0");
  if (historyMax_ == 0)
    throw std::invalid_argument("BarAggregator: historyMax must be > 0");
}

int64_t BarAggregator::bucketOf(int64_t tsMs) const noexcept {
  // floor division, also for pre-epoch instants
  int64_t q = tsMs / intervalMs_;
  if ((tsMs % intervalMs_) < 0) --q;
  return q * intervalMs_;
}

size_t BarAggregator::seed(const std::vector<Bar>& bars) {
  size_t accepted = 0;
  for (const auto& b : bars) {
    const int64_t lastTs = history_.empty() ? INT64_MIN : history_.back().timestamp;
    const bool behindOpen = !current_ || b.timestamp < current_->timestamp;
    if (!b.wellFormed() || !std::isfinite(b.close) || b.timestamp <= lastTs || !behindOpen) {
      logger().warn("bars.seed.dropped", {{"ts", std::to_string(b.timestamp)}});
      continue;
    }
    Bar copy = b;
    copy.clearIndicators();
    history_.push_back(std::move(copy));
    ++accepted;
  }
  trim();
  return accepted;
}

TickResult BarAggregator::onTick(double price, int64_t tsMs, double volume) {
  if (!std::isfinite(price) || price <= 0.0 || !std::isfinite(volume) || volume < 0.0) {
    ++rejected_;
    SIGFLOW_METRIC_HIT("ticks.rejected");
    logger().warn("tick.malformed", {{"price", util::fmtPrice(price)}, {"ts", std::to_string(tsMs)}});
    return TickResult::Rejected;
  }

  const int64_t bucket = bucketOf(tsMs);

  if (current_ && bucket < current_->timestamp) {
    ++rejected_;
    SIGFLOW_METRIC_HIT("ticks.rejected");
    logger().warn("tick.out_of_order", {{"ts", std::to_string(tsMs)},
                                        {"open_bucket", std::to_string(current_->timestamp)}});
    return TickResult::Rejected;
  }
  if (!history_.empty() && bucket <= history_.back().timestamp) {
    ++rejected_;
    SIGFLOW_METRIC_HIT("ticks.rejected");
    logger().warn("tick.sealed_bucket", {{"ts", std::to_string(tsMs)},
                                         {"last_sealed", std::to_string(history_.back().timestamp)}});
    return TickResult::Rejected;
  }

  SIGFLOW_METRIC_HIT("ticks.accepted");

  if (current_ && bucket == current_->timestamp) {
    Bar& c = *current_;
    c.high = std::max(c.high, price);
    c.low  = std::min(c.low, price);
    c.close = price;
    c.volume += volume;
    return TickResult::Updated;
  }

  const bool hadBar = current_.has_value();
  if (hadBar) seal();

  current_ = makeBar(bucket, price, price, price, price, volume);
  return hadBar ? TickResult::Sealed : TickResult::Opened;
}

void BarAggregator::seal() {
  history_.push_back(std::move(*current_));
  current_.reset();
  ++sealed_;
  trim();
  SIGFLOW_METRIC_HIT("bars.sealed");
}

void BarAggregator::trim() {
  if (history_.size() > historyMax_) {
    const auto drop = static_cast<std::ptrdiff_t>(history_.size() - historyMax_);
    history_.erase(history_.begin(), history_.begin() + drop);
  }
}

} // namespace sigflow::bars
