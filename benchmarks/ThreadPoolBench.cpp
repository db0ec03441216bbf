#include <benchmark/benchmark.h>
#include "sigflow/rt/ThreadPool.hpp"
#include <atomic>

static void BM_ThreadPoolPost(benchmark::State& state) {
    sigflow::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        benchmark::DoNotOptimize(pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); }));
    }
    pool.drain();
    pool.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThreadPoolPost)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kNanosecond);

// One oracle-sized job per iteration, as the predictor submits them.
static void BM_ThreadPoolRoundTrip(benchmark::State& state) {
    sigflow::rt::ThreadPool pool(1);
    std::atomic<int> done{0};

    for (auto _ : state) {
        const int target = done.load() + 1;
        benchmark::DoNotOptimize(pool.post([&done]() { done.fetch_add(1, std::memory_order_release); }));
        pool.drain();
        if (done.load(std::memory_order_acquire) != target) state.SkipWithError("job lost");
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThreadPoolRoundTrip)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
