#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace sigflow {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: can run a background reporter thread that logs a snapshot.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  // Start/stop a background reporter that logs counters every N seconds.
  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;
  double gauge(const std::string& name) const;

  // Snapshots (cheap copies) for diagnostics.
  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::mutex              sleepMu_;
  std::condition_variable sleepCv_;
  std::atomic<bool> running_{false};
  std::thread thr_;
};

} // namespace util
} // namespace sigflow

// -----------------------------------------------------------------------------
// Convenience macros
// -----------------------------------------------------------------------------
#define SIGFLOW_METRIC_INC(name, d) ::sigflow::util::MetricRegistry::instance().increment((name), (d))
#define SIGFLOW_METRIC_HIT(name)    ::sigflow::util::MetricRegistry::instance().increment((name), 1.0)
#define SIGFLOW_METRIC_SET(name, v) ::sigflow::util::MetricRegistry::instance().setGauge((name), (v))
