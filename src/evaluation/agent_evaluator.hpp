// SPDX-License-Identifier: MIT
/**
 * @file agent_evaluator.hpp
 * @brief Runs policies and baselines through the hedging environment
 *
 * Unlike HedgingEvaluator, which replays strategies on bare price paths,
 * AgentEvaluator scores everything through HedgingEnvironment so learned
 * policies and baselines are compared on the same reward. Episode i is
 * reset with seed + i.
 */

#pragma once

#include "hedgelab/env/hedging_env.hpp"
#include "hedgelab/hedging/hedge_strategy.hpp"
#include "hedgelab/support/error_types.hpp"
#include "hedgelab/support/record.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace hedgelab {

/// Maps an observation to an action. Continuous mode: {target position}.
/// Discrete mode: {action index}.
using Policy = std::function<std::vector<double>(const Observation&)>;

/// Aggregate of one policy over all evaluation episodes
struct AgentEvaluation {
    std::string agent_name;
    double mean_reward = 0.0;
    double std_reward = 0.0;
    double mean_pnl = 0.0;
    double std_pnl = 0.0;
    double mean_costs = 0.0;
    double sharpe_ratio = 0.0;    ///< Mean of per-episode Sharpe ratios
    double success_rate = 0.0;    ///< Fraction of episodes with positive pnl
    std::vector<double> episode_rewards;
    std::vector<double> episode_costs;
    std::vector<double> episode_pnls;

    /// Summary fields only
    Record to_record() const;
};

class AgentEvaluator {
public:
    static std::expected<AgentEvaluator, ValidationError>
    create(const EnvironmentConfig& config, size_t n_episodes = 100, uint64_t seed = 0);

    /// Evaluate an opaque policy
    std::expected<AgentEvaluation, ValidationError>
    evaluate_policy(const Policy& policy, std::string_view agent_name);

    /// Evaluate a baseline: each step its hedge target becomes the action.
    /// Requires a continuous action mode.
    std::expected<AgentEvaluation, ValidationError>
    evaluate_baseline(const StrategyParams& params, std::string_view strategy_name);

    /// The four baselines with their reference parameters
    std::expected<std::vector<AgentEvaluation>, ValidationError> evaluate_all_baselines();

    /// Every evaluation so far, best mean reward first
    std::vector<AgentEvaluation> ranked() const;

    /// Plain-text summary table of ranked()
    std::string report() const;

    const std::vector<AgentEvaluation>& results() const { return results_; }
    size_t n_episodes() const { return n_episodes_; }
    uint64_t seed() const { return seed_; }

private:
    AgentEvaluator(HedgingEnvironment env, size_t n_episodes, uint64_t seed);

    AgentEvaluation summarize(std::string_view name, std::vector<double> rewards,
                              std::vector<double> pnls, std::vector<double> costs,
                              const std::vector<double>& sharpes);

    HedgingEnvironment env_;
    size_t n_episodes_;
    uint64_t seed_;
    std::vector<AgentEvaluation> results_;
};

}  // namespace hedgelab
