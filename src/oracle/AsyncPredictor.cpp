#include "sigflow/oracle/AsyncPredictor.hpp"
#include "sigflow/rt/ThreadPool.hpp"
#include "sigflow/util/Logger.hpp"
#include "sigflow/util/Metrics.hpp"

#include <future>
#include <stdexcept>
#include <utility>

namespace sigflow::oracle {

AsyncPredictor::AsyncPredictor(std::shared_ptr<PredictionOracle> oracle,
                               rt::ThreadPool& pool,
                               std::chrono::milliseconds timeout)
  : oracle_(std::move(oracle))
  , pool_(pool)
  , timeout_(timeout)
  , oracleMx_(std::make_shared<std::mutex>())
{
  if (!oracle_) throw std::invalid_argument("AsyncPredictor requires an oracle");
}

std::optional<double> AsyncPredictor::predict(std::vector<double> closes) {
  if (closes.size() < oracle_->windowSize()) return std::nullopt;

  auto promise = std::make_shared<std::promise<std::optional<double>>>();
  auto future  = promise->get_future();

  const bool posted = pool_.post([promise, oracle = oracle_, mx = oracleMx_,
                                  closes = std::move(closes)] {
    try {
      std::lock_guard<std::mutex> lk(*mx);
      promise->set_value(oracle->predict(closes));
    } catch (const std::exception&) {
      promise->set_exception(std::current_exception());
    }
  });
  if (!posted) {
    util::logger().warn("oracle.rejected", {{"reason", "pool stopping"}});
    return std::nullopt;
  }

  if (future.wait_for(timeout_) != std::future_status::ready) {
    SIGFLOW_METRIC_HIT("oracle.timeout");
    util::logger().warn("oracle.timeout", {{"timeoutMs", std::to_string(timeout_.count())}});
    return std::nullopt;
  }

  try {
    return future.get();
  } catch (const std::exception& ex) {
    SIGFLOW_METRIC_HIT("oracle.error");
    util::logger().warn("oracle.error", {{"err", ex.what()}});
    return std::nullopt;
  }
}

} // namespace sigflow::oracle
