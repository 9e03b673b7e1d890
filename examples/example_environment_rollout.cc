// SPDX-License-Identifier: MIT
/**
 * @file example_environment_rollout.cc
 * @brief Drive the hedging environment with a hand-written policy
 *
 * Demonstrates:
 * - Creating and resetting HedgingEnvironment with a seed
 * - Continuous and discrete action modes
 * - Reading episode metrics and comparing policies with AgentEvaluator
 */

#include "hedgelab/env/hedging_env.hpp"
#include "hedgelab/evaluation/agent_evaluator.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_metrics(const std::string& title, const hedgelab::Record& metrics) {
    std::cout << "\n" << title << "\n";
    std::cout << std::string(40, '-') << "\n";
    for (const auto& [key, value] : metrics) {
        std::cout << "  " << std::left << std::setw(16) << key << std::right;
        if (const auto* d = std::get_if<double>(&value)) {
            std::cout << std::setw(12) << std::fixed << std::setprecision(4) << *d << "\n";
        } else if (const auto* i = std::get_if<int64_t>(&value)) {
            std::cout << std::setw(12) << *i << "\n";
        }
    }
}

}  // namespace

int main() {
    std::cout << "=== Hedging Environment Rollout ===\n";

    // Continuous mode: follow the observed delta
    auto env = hedgelab::HedgingEnvironment::create(hedgelab::EnvironmentConfig{
        .n_steps = 52,
        .transaction_cost = 0.001
    });
    if (!env) {
        std::cerr << "Invalid config: " << env.error() << "\n";
        return 1;
    }

    auto reset = env->reset(7);
    std::cout << "Premium received: " << std::fixed << std::setprecision(4)
              << env->initial_premium() << "\n";

    hedgelab::Observation obs = reset.observation;
    double total_reward = 0.0;
    while (true) {
        double target = obs[hedgelab::kObsDelta];
        auto result = env->step(std::span<const double>(&target, 1));
        if (!result) {
            std::cerr << "step failed: " << result.error() << "\n";
            return 1;
        }
        total_reward += result->reward;
        obs = result->observation;
        if (result->terminated) break;
    }
    std::cout << "Total reward (delta policy): " << total_reward << "\n";
    print_metrics("Episode metrics (weekly delta hedge)", env->episode_metrics());

    // Discrete mode: nudge towards delta in fixed increments
    auto discrete = hedgelab::HedgingEnvironment::create(hedgelab::EnvironmentConfig{
        .n_steps = 52,
        .action_mode = hedgelab::ActionMode::Discrete
    });
    if (!discrete) {
        std::cerr << "Invalid config: " << discrete.error() << "\n";
        return 1;
    }
    obs = discrete->reset(7).observation;
    while (true) {
        double gap = obs[hedgelab::kObsDelta] - obs[hedgelab::kObsPosition];
        size_t action = gap > 0.3 ? 4 : gap > 0.05 ? 3 : gap < -0.3 ? 0 : gap < -0.05 ? 1 : 2;
        auto result = discrete->step(action);
        if (!result) {
            std::cerr << "step failed: " << result.error() << "\n";
            return 1;
        }
        obs = result->observation;
        if (result->terminated) break;
    }
    print_metrics("Episode metrics (discrete nudging)", discrete->episode_metrics());

    // Policy vs baselines on identical seeds
    auto evaluator = hedgelab::AgentEvaluator::create(
        hedgelab::EnvironmentConfig{.n_steps = 52}, 20, 100);
    if (!evaluator) {
        std::cerr << "Invalid evaluator: " << evaluator.error() << "\n";
        return 1;
    }
    auto half_delta = evaluator->evaluate_policy(
        [](const hedgelab::Observation& o) { return std::vector<double>{0.5 * o[hedgelab::kObsDelta]}; },
        "Half Delta");
    auto baselines = evaluator->evaluate_all_baselines();
    if (!half_delta || !baselines) {
        std::cerr << "Evaluation failed\n";
        return 1;
    }
    std::cout << "\n" << evaluator->report();

    return 0;
}
