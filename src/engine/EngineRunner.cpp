#include "sigflow/engine/EngineRunner.hpp"
#include "sigflow/engine/SignalEngine.hpp"
#include "sigflow/util/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace sigflow::engine {

int64_t EngineRunner::systemNowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

EngineRunner::EngineRunner(IoContext& ioc,
                           SignalEngine& engine,
                           std::chrono::milliseconds resolveInterval,
                           Clock clock)
  : strand_(boost::asio::make_strand(ioc))
  , timer_(strand_)
  , engine_(engine)
  , interval_(resolveInterval)
  , clock_(std::move(clock))
{
  if (interval_.count() <= 0) throw std::invalid_argument("resolve interval must be positive");
  if (!clock_) throw std::invalid_argument("EngineRunner requires a clock");
}

void EngineRunner::start() {
  if (running_.exchange(true)) return;
  boost::asio::post(strand_, [self = shared_from_this()] { self->armTimer(); });
  util::logger().info("runner.start", {{"resolveIntervalMs", std::to_string(interval_.count())}});
}

void EngineRunner::stop() {
  if (!running_.exchange(false)) return;
  boost::asio::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });
  util::logger().info("runner.stop", {{"ticks", std::to_string(ticks_.load())}});
}

void EngineRunner::submitTick(double price, int64_t tsMs, double volume) {
  boost::asio::post(strand_, [self = shared_from_this(), price, tsMs, volume] {
    const auto res = self->engine_.onTick(price, tsMs, volume);
    self->ticks_.fetch_add(1, std::memory_order_relaxed);
    if (res != bars::TickResult::Rejected && tsMs > self->feedTimeMs_.load()) {
      self->feedTimeMs_.store(tsMs);
    }
  });
}

void EngineRunner::submitNews(sentiment::NewsEvent ev) {
  boost::asio::post(strand_, [self = shared_from_this(), ev = std::move(ev)] {
    self->engine_.onNews(ev);
  });
}

void EngineRunner::submitBars(std::vector<Bar> bars) {
  boost::asio::post(strand_, [self = shared_from_this(), bars = std::move(bars)] {
    self->engine_.seedHistory(bars);
  });
}

void EngineRunner::submitResolve() {
  boost::asio::post(strand_, [self = shared_from_this()] {
    self->engine_.resolve(self->clock_());
  });
}

void EngineRunner::submitResolveAt(int64_t nowMs) {
  boost::asio::post(strand_, [self = shared_from_this(), nowMs] {
    self->engine_.resolve(nowMs);
  });
}

void EngineRunner::armTimer() {
  if (!running_.load()) return;
  timer_.expires_after(interval_);
  timer_.async_wait(
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](const boost::system::error_code& ec) {
        self->onTimer(ec);
      }
    )
  );
}

void EngineRunner::onTimer(const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted) return;
  if (ec) {
    util::logger().warn("runner.timer.error", {{"err", ec.message()}});
    return;
  }
  engine_.resolve(clock_());
  armTimer();
}

} // namespace sigflow::engine
