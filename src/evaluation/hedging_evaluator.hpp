// SPDX-License-Identifier: MIT
/**
 * @file hedging_evaluator.hpp
 * @brief Backtester for the baseline hedging strategies
 *
 * Replays strategies against simulated GBM paths without the environment's
 * reward machinery. Every episode i of a backtest draws its path from its
 * own generator seeded with seed + i and hedges with a fresh strategy, so
 * a fixed seed reproduces the exact episode set whether or not episodes
 * run in parallel.
 *
 * Usage:
 * ```cpp
 * auto evaluator = HedgingEvaluator::create(EvaluatorConfig{});
 * std::vector<StrategyEntry> entries = {
 *     {evaluator->strategy_config(0.001), DeltaParams{}, "Delta"},
 *     {evaluator->strategy_config(0.001), MinimumVarianceParams{}, "Min-Var"},
 * };
 * auto table = evaluator->compare_strategies(entries, 100, 42);
 * ```
 */

#pragma once

#include "hedgelab/hedging/hedge_strategy.hpp"
#include "hedgelab/option/option_spec.hpp"
#include "hedgelab/support/error_types.hpp"
#include "hedgelab/support/record.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hedgelab {

/// Market model the evaluator simulates
struct EvaluatorConfig {
    double spot = 100.0;
    double strike = 100.0;
    double maturity = 1.0;
    double rate = 0.05;
    double volatility = 0.2;
    size_t n_steps = 252;
    OptionType option_type = OptionType::CALL;
};

std::expected<void, ValidationError> validate_evaluator_config(const EvaluatorConfig& config);

/// Outcome of one strategy on one price path
struct EpisodeResult {
    std::string strategy_name;
    double final_pnl = 0.0;          ///< Book value at expiry minus the premium
    double total_costs = 0.0;
    double net_pnl = 0.0;            ///< final_pnl − total_costs
    double sharpe_ratio = 0.0;       ///< mean(pnl) / (std(pnl) + 1e-8) over the path
    double max_drawdown = 0.0;       ///< Lowest pnl along the path
    double hedge_error_mean = 0.0;   ///< |position − Δ| averaged where τ > 0
    double hedge_error_std = 0.0;
    size_t num_rebalances = 0;
    double avg_position = 0.0;       ///< Signed mean stock position
    double final_stock_price = 0.0;
    size_t episode_length = 0;

    Record to_record() const;
};

/// Aggregate of a strategy over many episodes
struct BacktestResult {
    std::string strategy_name;
    size_t num_episodes = 0;
    double mean_pnl = 0.0;
    double std_pnl = 0.0;
    double mean_sharpe = 0.0;
    double mean_costs = 0.0;
    double win_rate = 0.0;           ///< Fraction of episodes with final_pnl > 0
    double best_pnl = 0.0;
    double worst_pnl = 0.0;
    double mean_hedge_error = 0.0;
    std::vector<EpisodeResult> episodes;

    /// Summary fields only; per-episode results are not included
    Record to_record() const;
};

/// One row of a strategy comparison
struct StrategyEntry {
    StrategyConfig config;
    StrategyParams params;
    std::string name;
};

class HedgingEvaluator {
public:
    static std::expected<HedgingEvaluator, ValidationError> create(const EvaluatorConfig& config);

    /// GBM path of n_steps + 1 prices starting at S0
    std::vector<double> simulate_price_path(uint64_t seed) const;

    /// Replay `strategy` (not yet initialized) along `price_path`.
    /// The path must hold n_steps + 1 prices.
    std::expected<EpisodeResult, ValidationError>
    evaluate_strategy(HedgingStrategy& strategy, std::span<const double> price_path,
                      std::string_view strategy_name) const;

    /// Run num_episodes independent episodes (seed + i) in parallel
    std::expected<BacktestResult, ValidationError>
    backtest_strategy(const StrategyConfig& strategy_config, const StrategyParams& params,
                      std::string_view strategy_name, size_t num_episodes = 100,
                      uint64_t seed = 0) const;

    /// Backtest every entry; sorted by mean_pnl, best first
    std::expected<std::vector<BacktestResult>, ValidationError>
    compare_strategies(std::span<const StrategyEntry> strategies, size_t num_episodes = 100,
                       uint64_t seed = 0) const;

    /// StrategyConfig describing the evaluator's own contract
    StrategyConfig strategy_config(double transaction_cost = 0.001) const;

    const EvaluatorConfig& config() const { return config_; }
    double dt() const { return dt_; }

private:
    explicit HedgingEvaluator(const EvaluatorConfig& config);

    EpisodeResult run_episode(HedgingStrategy& strategy, std::span<const double> price_path,
                              std::string_view strategy_name) const;

    EvaluatorConfig config_;
    double dt_;
};

}  // namespace hedgelab
