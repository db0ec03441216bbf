#include "sigflow/signal/SignalBook.hpp"
#include "sigflow/signal/Timeframe.hpp"
#include "sigflow/util/Config.hpp"
#include "sigflow/util/Logger.hpp"
#include "sigflow/util/Metrics.hpp"

#include <utility>

namespace sigflow::signal {

PayoutPolicy PayoutPolicy::fromConfig(const util::Config& cfg) {
  PayoutPolicy p;
  p.win  = cfg.winPayout;
  p.loss = cfg.lossPayout;
  return p;
}

SignalBook::SignalBook(PayoutPolicy payout, size_t retainResolved)
  : payout_(payout)
  , retainResolved_(retainResolved)
  , signals_(std::make_shared<const std::vector<Signal>>())
{}

bool SignalBook::hasPending(const std::string& timeframe) const {
  std::lock_guard<std::mutex> lk(mx_);
  return pendingByTf_.count(timeframe) != 0;
}

bool SignalBook::add(Signal s) {
  if (!s.pending()) return false;

  std::lock_guard<std::mutex> lk(mx_);
  if (pendingByTf_.count(s.timeframe)) {
    util::logger().debug("signal.add.duplicate_pending", {{"timeframe", s.timeframe}, {"id", s.id}});
    return false;
  }

  auto next = std::make_shared<std::vector<Signal>>(*signals_);
  pendingByTf_.emplace(s.timeframe, s.id);
  next->push_back(std::move(s));
  signals_ = std::move(next);
  ++totals_.totalSignals;

  SIGFLOW_METRIC_HIT("signals.created");
  SIGFLOW_METRIC_SET("signals.pending", static_cast<double>(pendingByTf_.size()));
  return true;
}

std::vector<Signal> SignalBook::resolveDue(int64_t nowMs, double price) {
  std::vector<Signal> resolved;

  std::lock_guard<std::mutex> lk(mx_);
  if (pendingByTf_.empty()) return resolved;

  std::shared_ptr<std::vector<Signal>> next;
  const auto& cur = *signals_;

  for (size_t i = 0; i < cur.size(); ++i) {
    const Signal& sig = cur[i];
    if (!sig.pending()) continue;

    const int64_t durationMs = durationOrDefault(sig.timeframe);
    if (nowMs - sig.createdAtMs < durationMs) continue;

    if (!next) next = std::make_shared<std::vector<Signal>>(cur);
    Signal& out = (*next)[i];

    const bool favourable =
      (out.direction == Direction::Call && price > out.entryPrice) ||
      (out.direction == Direction::Put  && price < out.entryPrice);

    out.status       = favourable ? Status::Win : Status::Loss;
    out.pnl          = favourable ? payout_.win : payout_.loss;
    out.exitPrice    = price;
    out.resolvedAtMs = nowMs;

    pendingByTf_.erase(out.timeframe);
    resolved.push_back(out);
    if (favourable) ++totals_.wins; else ++totals_.losses;
    totals_.netPnl += *out.pnl;

    SIGFLOW_METRIC_HIT(favourable ? "signals.win" : "signals.loss");
    util::logger().info("signal.resolved", {{"id", out.id},
                                            {"timeframe", out.timeframe},
                                            {"status", toString(out.status)},
                                            {"entry", util::fmtPrice(out.entryPrice)},
                                            {"exit", util::fmtPrice(price)}});
  }

  if (next) {
    trimResolvedLocked(*next);
    signals_ = std::move(next);
    SIGFLOW_METRIC_SET("signals.pending", static_cast<double>(pendingByTf_.size()));
  }
  return resolved;
}

SignalSnapshot SignalBook::snapshot() const {
  std::lock_guard<std::mutex> lk(mx_);
  return signals_;
}

std::vector<Signal> SignalBook::pending() const {
  auto snap = snapshot();
  std::vector<Signal> out;
  for (const auto& s : *snap) if (s.pending()) out.push_back(s);
  return out;
}

SignalStats SignalBook::stats() const {
  std::lock_guard<std::mutex> lk(mx_);
  SignalStats st = totals_;
  st.activeSignals = pendingByTf_.size();
  const uint64_t finished = st.wins + st.losses;
  st.winRate = finished > 0 ? 100.0 * double(st.wins) / double(finished) : 0.0;
  return st;
}

// Drops the oldest resolved signals beyond the retention limit. Pending
// signals are never dropped; relative order is kept.
void SignalBook::trimResolvedLocked(std::vector<Signal>& v) const {
  size_t resolvedCount = 0;
  for (const auto& s : v) if (!s.pending()) ++resolvedCount;
  if (resolvedCount <= retainResolved_) return;

  size_t toDrop = resolvedCount - retainResolved_;
  std::vector<Signal> kept;
  kept.reserve(v.size() - toDrop);
  for (auto& s : v) {
    if (toDrop > 0 && !s.pending()) { --toDrop; continue; }
    kept.push_back(std::move(s));
  }
  v.swap(kept);
}

} // namespace sigflow::signal
