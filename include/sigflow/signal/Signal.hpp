#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace sigflow::signal {

enum class Direction : uint8_t { Call = 0, Put = 1 };
enum class Strength  : uint8_t { Weak = 0, Moderate = 1, Strong = 2, Max = 3 };
enum class Status    : uint8_t { Pending = 0, Win = 1, Loss = 2 };

const char* toString(Direction d);
const char* toString(Strength s);
const char* toString(Status s);

// >100 MAX, >85 STRONG, >70 MODERATE, otherwise WEAK.
Strength strengthFor(double score);

// One scoring decision. Everything except the resolution block is fixed at
// creation; status/exitPrice/pnl/resolvedAtMs are written once by SignalBook.
struct Signal {
  std::string id;
  int64_t     createdAtMs = 0;
  Direction   direction   = Direction::Call;
  double      entryPrice  = 0.0;
  std::string timeframe;
  std::string regime;
  std::string strategy;
  double      score       = 0.0;
  double      confidence  = 0.0;   // min(score/150, 0.99)
  Strength    strength    = Strength::Weak;

  std::optional<double>      prediction;        // oracle's next close
  std::optional<double>      predictionScore;   // points it contributed, 0..100
  std::optional<std::string> sentimentContext;

  // resolution
  Status                 status = Status::Pending;
  std::optional<double>  exitPrice;
  std::optional<double>  pnl;
  std::optional<int64_t> resolvedAtMs;

  bool pending() const noexcept { return status == Status::Pending; }
};

// Monotonic ids ("sig-1", "sig-2", ...). Seedable so replays are reproducible.
class SignalIdGenerator {
public:
  explicit SignalIdGenerator(uint64_t seed = 0) : next_(seed) {}
  std::string next() { return "sig-" + std::to_string(next_.fetch_add(1, std::memory_order_relaxed) + 1); }
  void reseed(uint64_t seed) { next_.store(seed, std::memory_order_relaxed); }

private:
  std::atomic<uint64_t> next_;
};

struct SignalStats {
  uint64_t totalSignals  = 0;
  uint64_t wins          = 0;
  uint64_t losses        = 0;
  uint64_t activeSignals = 0;
  double   winRate       = 0.0;   // percent of resolved
  double   netPnl        = 0.0;
};

} // namespace sigflow::signal
