#include <benchmark/benchmark.h>
#include "sigflow/Bar.hpp"
#include "sigflow/ta/IndicatorEngine.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

static std::vector<sigflow::Bar> makeBars(size_t n) {
    std::vector<sigflow::Bar> out;
    out.reserve(n);
    double prev = 1.1;
    for (size_t i = 0; i < n; ++i) {
        const double close = 1.1 + 0.002 * std::sin(static_cast<double>(i) * 0.1);
        const double hi = std::max(prev, close) + 0.0002;
        const double lo = std::min(prev, close) - 0.0002;
        out.push_back(sigflow::makeBar(static_cast<int64_t>(i) * 60'000, prev, hi, lo, close, 10.0));
        prev = close;
    }
    return out;
}

static void BM_ComputeIndicators(benchmark::State& state) {
    const auto base = makeBars(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto bars = base;
        sigflow::ta::computeIndicators(bars);
        benchmark::DoNotOptimize(bars.back().adx);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_ComputeIndicators)
    ->Arg(100)
    ->Arg(700)
    ->Arg(3500)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
