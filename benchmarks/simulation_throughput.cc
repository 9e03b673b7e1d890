// SPDX-License-Identifier: MIT
/// @file simulation_throughput.cc
/// @brief Throughput benchmark: environment episodes and strategy backtests
///
/// Measures full 252-step episodes through HedgingEnvironment (delta-tracking
/// policy) and backtests of each baseline through HedgingEvaluator. The
/// backtest benchmark picks up OpenMP parallelism when built with it.
///
/// Usage:
///   ./build/benchmarks/simulation_throughput

#include "hedgelab/env/hedging_env.hpp"
#include "hedgelab/evaluation/hedging_evaluator.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>

using namespace hedgelab;

namespace {

HedgingEnvironment MakeEnvironment(size_t n_steps) {
    auto env = HedgingEnvironment::create(EnvironmentConfig{.n_steps = n_steps});
    if (!env) throw std::runtime_error("MakeEnvironment: invalid config");
    return std::move(*env);
}

const HedgingEvaluator& GetEvaluator() {
    static HedgingEvaluator* evaluator = [] {
        auto e = HedgingEvaluator::create(EvaluatorConfig{});
        if (!e) throw std::runtime_error("GetEvaluator: invalid config");
        return new HedgingEvaluator(std::move(*e));
    }();
    return *evaluator;
}

static void BM_Environment_Step(benchmark::State& state) {
    auto env = MakeEnvironment(252);
    env.reset(42);
    double target = 0.5;
    for (auto _ : state) {
        auto result = env.step(std::span<const double>(&target, 1));
        if (result->terminated) {
            state.PauseTiming();
            env.reset();
            state.ResumeTiming();
        }
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Environment_Step);

static void BM_Environment_Episode(benchmark::State& state) {
    auto env = MakeEnvironment(static_cast<size_t>(state.range(0)));
    uint64_t seed = 0;
    for (auto _ : state) {
        auto reset = env.reset(seed++);
        Observation obs = reset.observation;
        while (true) {
            double target = obs[kObsDelta];
            auto result = env.step(std::span<const double>(&target, 1));
            if (!result || result->terminated) break;
            obs = result->observation;
        }
        benchmark::DoNotOptimize(env.episode_metrics());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Environment_Episode)->Arg(52)->Arg(252);

static void BM_PricePath(benchmark::State& state) {
    const auto& evaluator = GetEvaluator();
    uint64_t seed = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(evaluator.simulate_price_path(seed++));
    }
}
BENCHMARK(BM_PricePath);

template <typename Params>
static void BM_Backtest(benchmark::State& state) {
    const auto& evaluator = GetEvaluator();
    const size_t episodes = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        auto result = evaluator.backtest_strategy(evaluator.strategy_config(), Params{},
                                                  "bench", episodes, 42);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_TEMPLATE(BM_Backtest, DeltaParams)->Arg(100)->Unit(benchmark::kMillisecond);
BENCHMARK_TEMPLATE(BM_Backtest, DeltaGammaVegaParams)->Arg(100)->Unit(benchmark::kMillisecond);
BENCHMARK_TEMPLATE(BM_Backtest, MinimumVarianceParams)->Arg(100)->Unit(benchmark::kMillisecond);

}  // namespace

BENCHMARK_MAIN();
