#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sigflow/signal/Signal.hpp"

namespace sigflow {
namespace util { class Config; }

namespace signal {

struct PayoutPolicy {
  double win  = 0.85;
  double loss = -1.0;

  static PayoutPolicy fromConfig(const util::Config& cfg);
};

using SignalSnapshot = std::shared_ptr<const std::vector<Signal>>;

// Owns every emitted signal and is the only writer of their resolution
// fields. At most one PENDING signal per timeframe, tracked by an index so
// hasPending() never scans the history.
//
// Readers take immutable snapshots; add() and resolveDue() build a new
// vector and swap the pointer, so a snapshot never changes under a reader.
// The snapshot holds every pending signal plus the most recent
// `retainResolved` resolved ones; stats() covers the whole run.
class SignalBook {
public:
  static constexpr size_t kDefaultRetainResolved = 1000;

  explicit SignalBook(PayoutPolicy payout = {}, size_t retainResolved = kDefaultRetainResolved);

  bool hasPending(const std::string& timeframe) const;

  // False (nothing stored) if the timeframe already has a pending signal or
  // the signal isn't PENDING.
  bool add(Signal s);

  // Resolves every pending signal whose timeframe has elapsed at nowMs
  // against price. Returns the signals that changed, in creation order.
  std::vector<Signal> resolveDue(int64_t nowMs, double price);

  SignalSnapshot snapshot() const;
  std::vector<Signal> pending() const;
  SignalStats stats() const;

  const PayoutPolicy& payout() const noexcept { return payout_; }
  size_t retainResolved() const noexcept { return retainResolved_; }

private:
  void trimResolvedLocked(std::vector<Signal>& v) const;

private:
  mutable std::mutex mx_;
  PayoutPolicy payout_;
  size_t retainResolved_;
  SignalSnapshot signals_;
  SignalStats totals_;   // run totals; activeSignals/winRate filled in by stats()
  std::unordered_map<std::string, std::string> pendingByTf_;   // timeframe -> signal id
};

} // namespace signal
} // namespace sigflow
