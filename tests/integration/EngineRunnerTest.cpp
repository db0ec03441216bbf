#include "sigflow/engine/EngineRunner.hpp"
#include "sigflow/engine/SignalEngine.hpp"
#include "sigflow/oracle/AsyncPredictor.hpp"
#include "sigflow/rt/ThreadPool.hpp"
#include "sigflow/util/Config.hpp"
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sigflow;
using namespace std::chrono_literals;

namespace {

constexpr int64_t kMin = 60'000;
constexpr int64_t kT0  = 1'700'000'100'000;

double priceAt(int minute) { return 1.1000 + 0.0001 * minute; }

std::vector<Bar> risingHistory(int minutes) {
    std::vector<Bar> out;
    for (int i = 0; i < minutes; ++i) {
        const double open  = priceAt(i - 1);
        const double close = priceAt(i);
        out.push_back(makeBar(kT0 + i * kMin, open, close + 0.00005, open - 0.00005, close, 1.0));
    }
    return out;
}

class BullishOracle : public oracle::PredictionOracle {
public:
    size_t windowSize() const override { return 5; }
    std::optional<double> predict(const std::vector<double>& closes) override {
        return closes.back() * 1.01;
    }
};

class ResolvedCounter : public engine::IEngineListener {
public:
    void onSignalCreated(const signal::Signal&) override { created.fetch_add(1); }
    void onSignalResolved(const signal::Signal&) override { resolved.fetch_add(1); }
    std::atomic<int> created{0};
    std::atomic<int> resolved{0};
};

util::Config fiveMinuteConfig() {
    util::Config cfg;
    cfg.timeframes = {"5m"};
    return cfg;
}

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

} // namespace

TEST(EngineRunnerTest, RejectsBadConstruction) {
    boost::asio::io_context ioc;
    engine::SignalEngine eng(fiveMinuteConfig());
    EXPECT_THROW(engine::EngineRunner::create(ioc, eng, 0ms), std::invalid_argument);
    EXPECT_THROW(engine::EngineRunner::create(ioc, eng, 10ms, engine::EngineRunner::Clock{}), std::invalid_argument);
}

TEST(EngineRunnerTest, InputsRunInSubmissionOrder) {
    boost::asio::io_context ioc;
    engine::SignalEngine eng(fiveMinuteConfig());
    auto runner = engine::EngineRunner::create(ioc, eng, 1000ms);

    runner->start();
    EXPECT_TRUE(runner->running());
    runner->submitTick(1.10, kT0);
    runner->submitTick(1.11, kT0 + kMin);
    runner->submitTick(1.12, kT0 + 2 * kMin);

    sentiment::NewsEvent ev;
    ev.headline = "Strong jobs report";
    ev.sentiment = sentiment::Sentiment::Positive;
    ev.impact = sentiment::Impact::High;
    runner->submitNews(ev);

    runner->stop();
    runner->stop();
    EXPECT_FALSE(runner->running());

    // Everything queued before stop() still runs; the timer never fires.
    ioc.run();

    EXPECT_EQ(runner->ticksProcessed(), 3u);
    EXPECT_EQ(runner->feedTimeMs(), kT0 + 2 * kMin);
    EXPECT_EQ(eng.history().size(), 2u);
    EXPECT_DOUBLE_EQ(*eng.lastPrice(), 1.12);
    EXPECT_DOUBLE_EQ(eng.sentimentScore(), 25.0);
}

TEST(EngineRunnerTest, FeedTimeFollowsProcessedTicksOnly) {
    boost::asio::io_context ioc;
    engine::SignalEngine eng(fiveMinuteConfig());
    auto runner = engine::EngineRunner::create(ioc, eng, 1000ms);

    runner->submitTick(1.10, kT0 + kMin);
    EXPECT_EQ(runner->feedTimeMs(), 0);   // queued, not yet processed

    runner->submitTick(1.05, kT0);            // older than the open bar: rejected
    runner->submitTick(-1.0, kT0 + 3 * kMin); // malformed: rejected
    ioc.run();

    EXPECT_EQ(runner->ticksProcessed(), 3u);
    EXPECT_EQ(runner->feedTimeMs(), kT0 + kMin);
}

TEST(EngineRunnerTest, SeedBatchLandsBeforeLaterTicks) {
    boost::asio::io_context ioc;
    engine::SignalEngine eng(fiveMinuteConfig());
    auto runner = engine::EngineRunner::create(ioc, eng, 1000ms);

    runner->submitBars(risingHistory(50));
    runner->submitTick(priceAt(50), kT0 + 50 * kMin);
    runner->submitTick(priceAt(51), kT0 + 51 * kMin);
    ioc.run();

    EXPECT_EQ(eng.history().size(), 51u);
    EXPECT_EQ(eng.history().back().timestamp, kT0 + 50 * kMin);
}

TEST(EngineRunnerTest, TimerDrivesResolutionFromInjectedClock) {
    rt::ThreadPool pool(1);
    engine::SignalEngine eng(fiveMinuteConfig(),
        std::make_unique<oracle::AsyncPredictor>(std::make_shared<BullishOracle>(), pool, 2000ms));
    auto counter = std::make_shared<ResolvedCounter>();
    eng.addListener(counter);

    std::atomic<int64_t> now{kT0};
    std::atomic<int> clockReads{0};

    boost::asio::io_context ioc;
    auto runner = engine::EngineRunner::create(ioc, eng, 5ms, [&]{
        clockReads.fetch_add(1);
        return now.load();
    });
    runner->start();
    std::thread io([&ioc]{ ioc.run(); });

    runner->submitBars(risingHistory(200));
    runner->submitTick(priceAt(200), kT0 + 200 * kMin);
    runner->submitTick(priceAt(201), kT0 + 201 * kMin);

    ASSERT_TRUE(waitFor([&]{ return counter->created.load() == 1; }));
    EXPECT_TRUE(waitFor([&]{ return clockReads.load() >= 3; }));
    EXPECT_EQ(counter->resolved.load(), 0);

    now.store(kT0 + 206 * kMin);
    EXPECT_TRUE(waitFor([&]{ return counter->resolved.load() == 1; }));

    runner->stop();
    io.join();

    const auto st = eng.stats();
    EXPECT_EQ(st.totalSignals, 1u);
    EXPECT_EQ(st.activeSignals, 0u);
}

TEST(EngineRunnerTest, ExplicitResolveUsesGivenInstant) {
    rt::ThreadPool pool(1);
    engine::SignalEngine eng(fiveMinuteConfig(),
        std::make_unique<oracle::AsyncPredictor>(std::make_shared<BullishOracle>(), pool, 2000ms));

    boost::asio::io_context ioc;
    auto runner = engine::EngineRunner::create(ioc, eng, 1000ms, []{ return int64_t{0}; });
    runner->submitBars(risingHistory(200));
    runner->submitTick(priceAt(200), kT0 + 200 * kMin);
    runner->submitTick(priceAt(201), kT0 + 201 * kMin);
    runner->submitResolve();                        // clock says 0: nothing due
    runner->submitResolveAt(kT0 + 210 * kMin);
    ioc.run();

    const auto st = eng.stats();
    EXPECT_EQ(st.totalSignals, 1u);
    EXPECT_EQ(st.wins + st.losses, 1u);
}
