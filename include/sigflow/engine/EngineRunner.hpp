#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "sigflow/Bar.hpp"
#include "sigflow/sentiment/NewsEvent.hpp"

namespace sigflow::engine {

class SignalEngine;

// Funnels every engine input onto one strand and drives periodic
// resolution from a steady_timer. Inputs queue without limit; none are
// dropped. The clock supplies "now" for resolution so a replay can run on
// feed time instead of the wall clock.
class EngineRunner : public std::enable_shared_from_this<EngineRunner> {
public:
  using IoContext = boost::asio::io_context;
  using Clock     = std::function<int64_t()>;

  static int64_t systemNowMs();

  EngineRunner(IoContext& ioc,
               SignalEngine& engine,
               std::chrono::milliseconds resolveInterval,
               Clock clock = &EngineRunner::systemNowMs);

  static std::shared_ptr<EngineRunner>
  create(IoContext& ioc,
         SignalEngine& engine,
         std::chrono::milliseconds resolveInterval,
         Clock clock = &EngineRunner::systemNowMs)
  {
    return std::make_shared<EngineRunner>(ioc, engine, resolveInterval, std::move(clock));
  }

  // Arms the resolution timer.
  void start();
  // Cancels the timer; inputs already queued still run. Idempotent.
  void stop();

  void submitTick(double price, int64_t tsMs, double volume = 0.0);
  void submitNews(sentiment::NewsEvent ev);
  void submitBars(std::vector<Bar> bars);
  // One resolution pass at clock() now, outside the timer cadence.
  void submitResolve();
  // Same, at an explicit instant (replay feeds pass the tick's timestamp).
  void submitResolveAt(int64_t nowMs);

  bool running() const noexcept { return running_.load(); }
  uint64_t ticksProcessed() const noexcept { return ticks_.load(); }
  // Latest tick timestamp the engine has processed (0 before the first).
  // Advanced on the strand after onTick, so a clock built on it never runs
  // ahead of the engine's price.
  int64_t feedTimeMs() const noexcept { return feedTimeMs_.load(); }

private:
  void armTimer();
  void onTimer(const boost::system::error_code& ec);

private:
  boost::asio::strand<IoContext::executor_type> strand_;
  boost::asio::steady_timer                     timer_;
  SignalEngine&                                 engine_;
  std::chrono::milliseconds                     interval_;
  Clock                                         clock_;
  std::atomic<bool>                             running_{false};
  std::atomic<uint64_t>                         ticks_{0};
  std::atomic<int64_t>                          feedTimeMs_{0};
};

} // namespace sigflow::engine
