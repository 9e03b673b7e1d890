// SPDX-License-Identifier: MIT
#include "hedgelab/evaluation/agent_evaluator.hpp"
#include "hedgelab/math/statistics.hpp"
#include "hedgelab/support/hedge_trace.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace hedgelab {

namespace {

std::unexpected<ValidationError> fail(ValidationErrorCode code, double value, size_t index = 0) {
    HEDGELAB_TRACE_VALIDATION_ERROR(MODULE_AGENT_EVALUATOR, static_cast<int>(code), value);
    return std::unexpected(ValidationError(code, value, index));
}

/// Per-episode numbers pulled from HedgingEnvironment::episode_metrics()
struct EpisodeTotals {
    double pnl = 0.0;
    double costs = 0.0;
    double sharpe = 0.0;
};

EpisodeTotals totals_of(const HedgingEnvironment& env) {
    Record metrics = env.episode_metrics();
    return EpisodeTotals{
        .pnl = get_number(metrics, "total_pnl").value_or(0.0),
        .costs = get_number(metrics, "total_costs").value_or(0.0),
        .sharpe = get_number(metrics, "sharpe_ratio").value_or(0.0)
    };
}

}  // namespace

Record AgentEvaluation::to_record() const {
    return {
        {"agent_name", agent_name},
        {"mean_reward", mean_reward},
        {"std_reward", std_reward},
        {"mean_pnl", mean_pnl},
        {"std_pnl", std_pnl},
        {"mean_costs", mean_costs},
        {"sharpe_ratio", sharpe_ratio},
        {"success_rate", success_rate},
    };
}

AgentEvaluator::AgentEvaluator(HedgingEnvironment env, size_t n_episodes, uint64_t seed)
    : env_(std::move(env))
    , n_episodes_(n_episodes)
    , seed_(seed)
{}

std::expected<AgentEvaluator, ValidationError>
AgentEvaluator::create(const EnvironmentConfig& config, size_t n_episodes, uint64_t seed) {
    if (n_episodes == 0) {
        return fail(ValidationErrorCode::InvalidEpisodeCount, 0.0);
    }
    auto env = HedgingEnvironment::create(config);
    if (!env) {
        return std::unexpected(env.error());
    }
    return AgentEvaluator(std::move(*env), n_episodes, seed);
}

std::expected<AgentEvaluation, ValidationError>
AgentEvaluator::evaluate_policy(const Policy& policy, std::string_view agent_name) {
    const bool discrete = env_.config().action_mode == ActionMode::Discrete;

    std::vector<double> rewards, pnls, costs, sharpes;
    HEDGELAB_TRACE_BACKTEST_START(MODULE_AGENT_EVALUATOR, n_episodes_, seed_);

    for (size_t episode = 0; episode < n_episodes_; ++episode) {
        Observation obs = env_.reset(seed_ + episode).observation;

        double episode_reward = 0.0;
        bool done = false;
        while (!done) {
            std::vector<double> action = policy(obs);

            std::expected<StepResult, ValidationError> result;
            if (discrete) {
                if (action.size() != 1) {
                    return fail(ValidationErrorCode::InvalidAction,
                                action.empty() ? 0.0 : action[0], action.size());
                }
                auto index = discrete_action_index(action[0]);
                if (!index) {
                    return std::unexpected(index.error());
                }
                result = env_.step(*index);
            } else {
                result = env_.step(std::span<const double>(action));
            }
            if (!result) {
                return std::unexpected(result.error());
            }

            episode_reward += result->reward;
            done = result->terminated || result->truncated;
            obs = result->observation;
        }

        EpisodeTotals totals = totals_of(env_);
        rewards.push_back(episode_reward);
        pnls.push_back(totals.pnl);
        costs.push_back(totals.costs);
        sharpes.push_back(totals.sharpe);
    }

    return summarize(agent_name, std::move(rewards), std::move(pnls), std::move(costs), sharpes);
}

std::expected<AgentEvaluation, ValidationError>
AgentEvaluator::evaluate_baseline(const StrategyParams& params, std::string_view strategy_name) {
    const EnvironmentConfig& config = env_.config();
    if (config.action_mode != ActionMode::Continuous) {
        return fail(ValidationErrorCode::InvalidActionMode, 0.0);
    }

    auto prototype = HedgingStrategy::create(StrategyConfig{
        .spot = config.spot,
        .strike = config.strike,
        .maturity = config.maturity,
        .rate = config.rate,
        .volatility = config.volatility,
        .option_type = config.option_type,
        .transaction_cost = config.transaction_cost
    }, params);
    if (!prototype) {
        return std::unexpected(prototype.error());
    }

    std::vector<double> rewards, pnls, costs, sharpes;
    HEDGELAB_TRACE_BACKTEST_START(MODULE_AGENT_EVALUATOR, n_episodes_, seed_);

    for (size_t episode = 0; episode < n_episodes_; ++episode) {
        auto reset = env_.reset(seed_ + episode);
        StepInfo info = reset.info;

        HedgingStrategy strategy = *prototype;
        strategy.initialize();

        double episode_reward = 0.0;
        bool done = false;
        size_t step = 0;
        while (!done) {
            double tau = std::max(config.maturity - static_cast<double>(step) * env_.dt(), 0.0);
            double target = strategy.hedge_positions(info.spot, tau).stock;

            auto result = env_.step(std::span<const double>(&target, 1));
            if (!result) {
                return std::unexpected(result.error());
            }

            episode_reward += result->reward;
            done = result->terminated || result->truncated;
            info = result->info;
            ++step;
        }

        EpisodeTotals totals = totals_of(env_);
        rewards.push_back(episode_reward);
        pnls.push_back(totals.pnl);
        costs.push_back(totals.costs);
        sharpes.push_back(totals.sharpe);
    }

    return summarize(strategy_name, std::move(rewards), std::move(pnls), std::move(costs), sharpes);
}

std::expected<std::vector<AgentEvaluation>, ValidationError>
AgentEvaluator::evaluate_all_baselines() {
    const std::vector<std::pair<StrategyParams, const char*>> baselines = {
        {DeltaParams{}, "Delta Hedging"},
        {DeltaGammaParams{.gamma_target = 0.0}, "Delta-Gamma Hedging"},
        {DeltaGammaVegaParams{.gamma_weight = 0.5, .vega_weight = 0.5}, "Delta-Gamma-Vega Hedging"},
        {MinimumVarianceParams{.lookback_window = 20}, "Minimum Variance Hedging"},
    };

    std::vector<AgentEvaluation> out;
    out.reserve(baselines.size());
    for (const auto& [params, name] : baselines) {
        auto evaluation = evaluate_baseline(params, name);
        if (!evaluation) {
            return std::unexpected(evaluation.error());
        }
        out.push_back(std::move(*evaluation));
    }
    return out;
}

AgentEvaluation AgentEvaluator::summarize(std::string_view name, std::vector<double> rewards,
                                          std::vector<double> pnls, std::vector<double> costs,
                                          const std::vector<double>& sharpes) {
    auto wins = std::count_if(pnls.begin(), pnls.end(), [](double p) { return p > 0.0; });

    AgentEvaluation evaluation;
    evaluation.agent_name = std::string(name);
    evaluation.mean_reward = stats::mean(rewards);
    evaluation.std_reward = stats::stddev(rewards);
    evaluation.mean_pnl = stats::mean(pnls);
    evaluation.std_pnl = stats::stddev(pnls);
    evaluation.mean_costs = stats::mean(costs);
    evaluation.sharpe_ratio = stats::mean(sharpes);
    evaluation.success_rate = static_cast<double>(wins) / static_cast<double>(pnls.size());
    evaluation.episode_rewards = std::move(rewards);
    evaluation.episode_pnls = std::move(pnls);
    evaluation.episode_costs = std::move(costs);

    HEDGELAB_TRACE_BACKTEST_COMPLETE(MODULE_AGENT_EVALUATOR, n_episodes_, evaluation.mean_pnl);

    // A re-run under the same name replaces the earlier entry
    auto existing = std::find_if(results_.begin(), results_.end(),
                                 [&](const AgentEvaluation& e) { return e.agent_name == name; });
    if (existing != results_.end()) {
        *existing = evaluation;
    } else {
        results_.push_back(evaluation);
    }
    return evaluation;
}

std::vector<AgentEvaluation> AgentEvaluator::ranked() const {
    std::vector<AgentEvaluation> sorted = results_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const AgentEvaluation& a, const AgentEvaluation& b) {
                         return a.mean_reward > b.mean_reward;
                     });
    return sorted;
}

std::string AgentEvaluator::report() const {
    const EnvironmentConfig& config = env_.config();
    std::ostringstream os;

    os << std::string(80, '=') << "\n";
    os << "HEDGING AGENT EVALUATION REPORT\n";
    os << std::string(80, '=') << "\n\n";
    os << "Evaluation settings:\n";
    os << "  Episodes:         " << n_episodes_ << "\n";
    os << "  Option type:      " << to_string(config.option_type) << "\n";
    os << std::fixed << std::setprecision(1);
    os << "  Volatility:       " << config.volatility * 100.0 << "%\n";
    os << std::setprecision(2);
    os << "  Transaction cost: " << config.transaction_cost * 100.0 << "%\n\n";

    auto sorted = ranked();
    if (sorted.empty()) {
        os << "No evaluations recorded.\n";
        return os.str();
    }

    os << "Results (sorted by mean reward):\n";
    os << std::string(80, '-') << "\n";
    for (const auto& e : sorted) {
        os << "\n" << e.agent_name << ":\n";
        os << std::setprecision(2);
        os << "  Mean reward:  " << std::setw(10) << e.mean_reward << " +/- " << e.std_reward << "\n";
        os << "  Mean pnl:     " << std::setw(10) << e.mean_pnl << " +/- " << e.std_pnl << "\n";
        os << "  Mean costs:   " << std::setw(10) << e.mean_costs << "\n";
        os << std::setprecision(3);
        os << "  Sharpe ratio: " << std::setw(10) << e.sharpe_ratio << "\n";
        os << std::setprecision(1);
        os << "  Success rate: " << std::setw(10) << e.success_rate * 100.0 << "%\n";
    }

    os << "\n" << std::string(80, '=') << "\n";
    os << "BEST: " << sorted.front().agent_name << "\n";
    os << std::string(80, '=') << "\n";
    return os.str();
}

}  // namespace hedgelab
