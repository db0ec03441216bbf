#include <benchmark/benchmark.h>
#include "sigflow/Bar.hpp"
#include "sigflow/bars/Resampler.hpp"
#include <vector>

static std::vector<sigflow::Bar> makeMinuteBars(size_t n) {
    std::vector<sigflow::Bar> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double px = 1.1 + 0.0001 * static_cast<double>(i % 50);
        out.push_back(sigflow::makeBar(static_cast<int64_t>(i) * 60'000, px, px + 0.0001, px - 0.0001, px, 1.0));
    }
    return out;
}

static void BM_Resample(benchmark::State& state) {
    const auto bars = makeMinuteBars(3500);
    const int64_t interval = state.range(0) * 60'000;

    for (auto _ : state) {
        auto out = sigflow::bars::resample(bars, interval, 60'000);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * 3500);
}

BENCHMARK(BM_Resample)->Arg(5)->Arg(15)->Arg(60)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
