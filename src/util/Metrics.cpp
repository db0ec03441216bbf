#include "sigflow/util/Metrics.hpp"
#include "sigflow/util/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <vector>

namespace sigflow {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  // If already running, restart with new interval.
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(sleepMu_);
    running_.store(false, std::memory_order_release);
  }
  sleepCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricRegistry::gauge(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

static std::string joinSorted(const std::unordered_map<std::string, double>& m) {
  std::vector<std::pair<std::string, double>> v(m.begin(), m.end());
  std::sort(v.begin(), v.end());
  std::ostringstream oss;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) oss << ' ';
    oss << v[i].first << '=' << v[i].second;
  }
  return oss.str();
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  const auto sleepDur = std::chrono::seconds(intervalSeconds > 0 ? intervalSeconds : 10);

  while (running_.load(std::memory_order_acquire)) {
    {
      std::unique_lock<std::mutex> lk(sleepMu_);
      sleepCv_.wait_for(lk, sleepDur, [this]{ return !running_.load(std::memory_order_acquire); });
    }
    if (!running_.load(std::memory_order_acquire)) break;

    auto c = snapshotCounters();
    auto g = snapshotGauges();
    if (!c.empty() || !g.empty()) {
      logger().info("metrics", {{"counters", joinSorted(c)}, {"gauges", joinSorted(g)}});
    }
  }
}

} // namespace util
} // namespace sigflow
