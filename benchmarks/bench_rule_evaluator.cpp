#include <benchmark/benchmark.h>
#include "alert/rule_evaluator.hpp"
#include <random>
#include <vector>

using namespace moverwatch;

namespace {

std::vector<InstrumentSnapshot> make_batch(std::size_t count) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> change(-300.0, 300.0);
    std::uniform_int_distribution<Shares> volume(0, 5000000);
    std::uniform_int_distribution<int> bid_kind(0, 9);

    std::vector<InstrumentSnapshot> batch(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto& s = batch[i];
        s.symbol = "SYM" + std::to_string(i);
        s.price = 10.0;
        s.change_percent = change(rng);
        s.volume = volume(rng);
        switch (bid_kind(rng)) {
            case 0:  s.bid = 199999.0; s.bid_size = 100; break;
            case 1:  s.bid = 2500.0; s.bid_size = 40; break;
            default: s.bid = 9.99; s.bid_size = 300; break;
        }
    }
    return batch;
}

}  // namespace

// Benchmark primary rule evaluation over a screener batch
static void BM_EvaluateBatch(benchmark::State& state) {
    RuleEvaluator evaluator(Config::defaults().rules);
    auto batch = make_batch(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        for (const auto& snapshot : batch) {
            benchmark::DoNotOptimize(evaluator.evaluate(snapshot, 25000.0));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EvaluateBatch)->Range(25, 1000);

// Benchmark the multiplier step table
static void BM_SpikeMultiplier(benchmark::State& state) {
    double change = 0.0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(RuleEvaluator::spike_multiplier(change));
        change = change > 300.0 ? 0.0 : change + 0.7;
    }
}
BENCHMARK(BM_SpikeMultiplier);

BENCHMARK_MAIN();
