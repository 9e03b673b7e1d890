// SPDX-License-Identifier: MIT
#include "hedgelab/evaluation/hedging_evaluator.hpp"
#include "hedgelab/option/european_option.hpp"
#include "hedgelab/math/statistics.hpp"
#include "hedgelab/support/hedge_trace.h"
#include "hedgelab/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace hedgelab {

namespace {

std::unexpected<ValidationError> fail(ValidationErrorCode code, double value, size_t index = 0) {
    HEDGELAB_TRACE_VALIDATION_ERROR(MODULE_EVALUATOR, static_cast<int>(code), value);
    return std::unexpected(ValidationError(code, value, index));
}

}  // namespace

std::expected<void, ValidationError> validate_evaluator_config(const EvaluatorConfig& config) {
    auto contract = validate_option_contract(OptionContract{
        .spot = config.spot,
        .strike = config.strike,
        .maturity = config.maturity,
        .rate = config.rate,
        .volatility = config.volatility,
        .option_type = config.option_type
    });
    if (!contract) {
        return contract;
    }
    if (config.n_steps == 0) {
        return fail(ValidationErrorCode::InvalidStepCount, 0.0);
    }
    return {};
}

Record EpisodeResult::to_record() const {
    return {
        {"strategy_name", strategy_name},
        {"final_pnl", final_pnl},
        {"total_costs", total_costs},
        {"net_pnl", net_pnl},
        {"sharpe_ratio", sharpe_ratio},
        {"max_drawdown", max_drawdown},
        {"hedge_error_mean", hedge_error_mean},
        {"hedge_error_std", hedge_error_std},
        {"num_rebalances", static_cast<int64_t>(num_rebalances)},
        {"avg_position", avg_position},
        {"final_stock_price", final_stock_price},
        {"episode_length", static_cast<int64_t>(episode_length)},
    };
}

Record BacktestResult::to_record() const {
    return {
        {"strategy_name", strategy_name},
        {"num_episodes", static_cast<int64_t>(num_episodes)},
        {"mean_pnl", mean_pnl},
        {"std_pnl", std_pnl},
        {"mean_sharpe", mean_sharpe},
        {"mean_costs", mean_costs},
        {"win_rate", win_rate},
        {"best_pnl", best_pnl},
        {"worst_pnl", worst_pnl},
        {"mean_hedge_error", mean_hedge_error},
    };
}

HedgingEvaluator::HedgingEvaluator(const EvaluatorConfig& config)
    : config_(config)
    , dt_(config.maturity / static_cast<double>(config.n_steps))
{}

std::expected<HedgingEvaluator, ValidationError>
HedgingEvaluator::create(const EvaluatorConfig& config) {
    auto ok = validate_evaluator_config(config);
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return HedgingEvaluator(config);
}

StrategyConfig HedgingEvaluator::strategy_config(double transaction_cost) const {
    return StrategyConfig{
        .spot = config_.spot,
        .strike = config_.strike,
        .maturity = config_.maturity,
        .rate = config_.rate,
        .volatility = config_.volatility,
        .option_type = config_.option_type,
        .transaction_cost = transaction_cost
    };
}

std::vector<double> HedgingEvaluator::simulate_price_path(uint64_t seed) const {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);

    const double sigma = config_.volatility;
    const double drift = (config_.rate - 0.5 * sigma * sigma) * dt_;
    const double diffusion = sigma * std::sqrt(dt_);

    std::vector<double> prices(config_.n_steps + 1);
    prices[0] = config_.spot;
    for (size_t i = 0; i < config_.n_steps; ++i) {
        prices[i + 1] = prices[i] * std::exp(drift + diffusion * normal(rng));
    }
    return prices;
}

std::expected<EpisodeResult, ValidationError>
HedgingEvaluator::evaluate_strategy(HedgingStrategy& strategy, std::span<const double> price_path,
                                    std::string_view strategy_name) const {
    if (price_path.size() != config_.n_steps + 1) {
        return fail(ValidationErrorCode::InvalidStepCount,
                    static_cast<double>(price_path.size()));
    }
    return run_episode(strategy, price_path, strategy_name);
}

EpisodeResult HedgingEvaluator::run_episode(HedgingStrategy& strategy,
                                            std::span<const double> price_path,
                                            std::string_view strategy_name) const {
    const size_t n = config_.n_steps;
    double premium = strategy.initialize();

    std::vector<double> pnl_history;
    std::vector<double> position_history;
    std::vector<double> hedge_errors;
    pnl_history.reserve(n);
    position_history.reserve(n);
    hedge_errors.reserve(n);

    for (size_t step = 0; step < n; ++step) {
        double spot = price_path[step];
        double tau = config_.maturity - static_cast<double>(step) * dt_;

        // The initial hedge was placed by initialize()
        if (step > 0) {
            strategy.rebalance(spot, tau);
        }

        PortfolioValue value = strategy.portfolio_value(spot, tau);
        pnl_history.push_back(value.portfolio_value - premium);
        position_history.push_back(strategy.stock_position());

        // Error against the true delta, whatever the strategy believes
        if (tau > 0.0) {
            Greeks g = bs_greeks(spot, config_.strike, tau, config_.rate,
                                 config_.volatility, config_.option_type);
            hedge_errors.push_back(std::abs(strategy.stock_position() - g.delta));
        }
    }

    double final_spot = price_path[n];
    PortfolioValue final_value = strategy.portfolio_value(final_spot, 0.0);
    double final_pnl = final_value.portfolio_value - premium;

    EpisodeResult result;
    result.strategy_name = std::string(strategy_name);
    result.final_pnl = final_pnl;
    result.total_costs = strategy.total_costs();
    result.net_pnl = final_pnl - strategy.total_costs();
    result.sharpe_ratio = stats::mean(pnl_history) / (stats::stddev(pnl_history) + 1e-8);
    result.max_drawdown = *std::min_element(pnl_history.begin(), pnl_history.end());
    result.hedge_error_mean = stats::mean(hedge_errors);
    result.hedge_error_std = stats::stddev(hedge_errors);
    result.num_rebalances = n;
    result.avg_position = stats::mean(position_history);
    result.final_stock_price = final_spot;
    result.episode_length = n;
    return result;
}

std::expected<BacktestResult, ValidationError>
HedgingEvaluator::backtest_strategy(const StrategyConfig& strategy_config,
                                    const StrategyParams& params,
                                    std::string_view strategy_name, size_t num_episodes,
                                    uint64_t seed) const {
    if (num_episodes == 0) {
        return fail(ValidationErrorCode::InvalidEpisodeCount, 0.0);
    }

    // Validate once; every episode copies this untouched prototype
    auto prototype = HedgingStrategy::create(strategy_config, params);
    if (!prototype) {
        return std::unexpected(prototype.error());
    }

    HEDGELAB_TRACE_BACKTEST_START(MODULE_EVALUATOR, num_episodes, seed);

    std::vector<EpisodeResult> episodes(num_episodes);

    HEDGELAB_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < num_episodes; ++i) {
        std::vector<double> path = simulate_price_path(seed + i);
        HedgingStrategy strategy = *prototype;
        episodes[i] = run_episode(strategy, path, strategy_name);
    }

    std::vector<double> pnls, sharpes, costs, errors;
    pnls.reserve(num_episodes);
    sharpes.reserve(num_episodes);
    costs.reserve(num_episodes);
    errors.reserve(num_episodes);
    for (const auto& ep : episodes) {
        pnls.push_back(ep.final_pnl);
        sharpes.push_back(ep.sharpe_ratio);
        costs.push_back(ep.total_costs);
        errors.push_back(ep.hedge_error_mean);
    }

    auto wins = std::count_if(pnls.begin(), pnls.end(), [](double p) { return p > 0.0; });

    BacktestResult result;
    result.strategy_name = std::string(strategy_name);
    result.num_episodes = num_episodes;
    result.mean_pnl = stats::mean(pnls);
    result.std_pnl = stats::stddev(pnls);
    result.mean_sharpe = stats::mean(sharpes);
    result.mean_costs = stats::mean(costs);
    result.win_rate = static_cast<double>(wins) / static_cast<double>(num_episodes);
    result.best_pnl = *std::max_element(pnls.begin(), pnls.end());
    result.worst_pnl = *std::min_element(pnls.begin(), pnls.end());
    result.mean_hedge_error = stats::mean(errors);
    result.episodes = std::move(episodes);

    HEDGELAB_TRACE_BACKTEST_COMPLETE(MODULE_EVALUATOR, num_episodes, result.mean_pnl);
    return result;
}

std::expected<std::vector<BacktestResult>, ValidationError>
HedgingEvaluator::compare_strategies(std::span<const StrategyEntry> strategies,
                                     size_t num_episodes, uint64_t seed) const {
    std::vector<BacktestResult> results;
    results.reserve(strategies.size());

    for (const auto& entry : strategies) {
        auto result = backtest_strategy(entry.config, entry.params, entry.name,
                                        num_episodes, seed);
        if (!result) {
            return std::unexpected(result.error());
        }
        results.push_back(std::move(*result));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const BacktestResult& a, const BacktestResult& b) {
                         return a.mean_pnl > b.mean_pnl;
                     });
    return results;
}

}  // namespace hedgelab
