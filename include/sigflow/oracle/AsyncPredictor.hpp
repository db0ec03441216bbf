#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "sigflow/oracle/PredictionOracle.hpp"

namespace sigflow {
namespace rt { class ThreadPool; }

namespace oracle {

// Runs an oracle on the worker pool and waits at most `timeout` for it.
// A timeout, an oracle exception or a refused post all yield nullopt; the
// scorer then proceeds without a prediction contribution.
class AsyncPredictor {
public:
  AsyncPredictor(std::shared_ptr<PredictionOracle> oracle,
                 rt::ThreadPool& pool,
                 std::chrono::milliseconds timeout);

  std::optional<double> predict(std::vector<double> closes);

  size_t windowSize() const { return oracle_->windowSize(); }
  std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
  std::shared_ptr<PredictionOracle> oracle_;
  rt::ThreadPool&                   pool_;
  std::chrono::milliseconds         timeout_;
  // A timed-out call may still be running when the next one is posted.
  std::shared_ptr<std::mutex>       oracleMx_;
};

} // namespace oracle
} // namespace sigflow
