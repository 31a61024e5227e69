#include <benchmark/benchmark.h>
#include "alert/volume_baseline.hpp"
#include <random>
#include <string>
#include <vector>

using namespace moverwatch;

// Benchmark single sample addition with a full window
static void BM_BaselineAdd(benchmark::State& state) {
    auto window_size = static_cast<std::size_t>(state.range(0));
    VolumeBaseline baseline(window_size, 5);

    for (std::size_t i = 0; i < window_size; ++i) {
        baseline.add(10000 + static_cast<Shares>(i));
    }

    Shares volume = 10000;
    for (auto _ : state) {
        baseline.add(volume++);
        benchmark::DoNotOptimize(baseline.average());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BaselineAdd)->Range(8, 1024);

// Benchmark one scan worth of observations across a symbol universe
static void BM_TrackerScan(benchmark::State& state) {
    auto universe = static_cast<std::size_t>(state.range(0));
    VolumeBaselineTracker tracker(30, 5);

    std::vector<Symbol> symbols;
    symbols.reserve(universe);
    for (std::size_t i = 0; i < universe; ++i) {
        symbols.push_back("SYM" + std::to_string(i));
    }

    std::mt19937 rng(42);
    std::uniform_int_distribution<Shares> volume(1000, 5000000);

    for (auto _ : state) {
        for (const auto& symbol : symbols) {
            benchmark::DoNotOptimize(tracker.average(symbol));
            benchmark::DoNotOptimize(tracker.observe(symbol, volume(rng)));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(universe));
}
BENCHMARK(BM_TrackerScan)->Range(25, 2000);

BENCHMARK_MAIN();
