// SPDX-License-Identifier: MIT
/// @file pricing_latency.cc
/// @brief Latency benchmark: per-query time for Black-Scholes price and Greeks
///
/// Every environment step and every strategy rebalance reprices the option,
/// so these numbers bound simulation throughput. Reports ns/query on a
/// single ATM point and across a moneyness sweep.
///
/// Usage:
///   ./build/benchmarks/pricing_latency

#include "hedgelab/option/european_option.hpp"
#include <benchmark/benchmark.h>
#include <vector>

using namespace hedgelab;

namespace {

// Shared query point
constexpr double S = 100.0, K = 100.0, tau = 0.5, sigma = 0.20, rate = 0.05;

static void BM_Price_Call(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_price(S, K, tau, rate, sigma, OptionType::CALL));
    }
}
BENCHMARK(BM_Price_Call);

static void BM_Price_Put(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_price(S, K, tau, rate, sigma, OptionType::PUT));
    }
}
BENCHMARK(BM_Price_Put);

static void BM_Greeks(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_greeks(S, K, tau, rate, sigma, OptionType::CALL));
    }
}
BENCHMARK(BM_Greeks);

// One d1/d2 evaluation for both outputs vs. two separate calls
static void BM_Quote(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_quote(S, K, tau, rate, sigma, OptionType::CALL));
    }
}
BENCHMARK(BM_Quote);

static void BM_PriceAndGreeks_Separate(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_price(S, K, tau, rate, sigma, OptionType::CALL));
        benchmark::DoNotOptimize(bs_greeks(S, K, tau, rate, sigma, OptionType::CALL));
    }
}
BENCHMARK(BM_PriceAndGreeks_Separate);

static void BM_Price_MoneynessSweep(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<double> spots(n);
    for (size_t i = 0; i < n; ++i) {
        spots[i] = 60.0 + 80.0 * static_cast<double>(i) / static_cast<double>(n - 1);
    }

    for (auto _ : state) {
        double sum = 0.0;
        for (double s : spots) {
            sum += bs_price(s, K, tau, rate, sigma, OptionType::PUT);
        }
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_Price_MoneynessSweep)->Arg(64)->Arg(1024);

}  // namespace

BENCHMARK_MAIN();
