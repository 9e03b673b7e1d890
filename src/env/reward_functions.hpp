// SPDX-License-Identifier: MIT
/**
 * @file reward_functions.hpp
 * @brief Reward shaping models for the hedging environment
 *
 * The environment's default reward is the tracking/cost/terminal-PnL mix
 * (DefaultReward). The alternatives trade it for risk-sensitive signals:
 *
 * - StandardReward:          pnl / pnl_scale
 * - AsymmetricReward:        losses weighted more heavily than gains
 * - CVaRReward:              blends in the mean of the worst alpha tail
 * - SharpeReward:            rolling annualized Sharpe of the pnl stream
 * - VariancePenalizedReward: penalizes an unstable hedge ratio
 * - CompositeReward:         normalized weighted sum of the above
 *
 * Parameter structs are plain configuration; RewardModel holds the rolling
 * windows and must be reset at the start of every episode.
 */

#pragma once

#include "hedgelab/support/error_types.hpp"
#include "hedgelab/support/ring_buffer.hpp"
#include <cstddef>
#include <expected>
#include <utility>
#include <variant>
#include <vector>

namespace hedgelab {

/// −|position − Δ|·risk_penalty − total_costs·0.1 (+ pnl on the terminal step)
struct DefaultReward {};

struct StandardReward {
    double pnl_scale = 10.0;
};

struct AsymmetricReward {
    double loss_multiplier = 2.0;
    double gain_multiplier = 1.0;
    double pnl_scale = 10.0;
};

struct CVaRReward {
    double alpha = 0.05;        ///< Tail fraction (0.05 → 95% CVaR)
    double lambda_cvar = 0.3;   ///< Weight of the tail term in [0, 1]
    size_t window = 20;
    double pnl_scale = 10.0;
};

struct SharpeReward {
    size_t window = 50;
    double target_sharpe = 1.5;
};

struct VariancePenalizedReward {
    double variance_penalty = 0.5;
    size_t window = 20;
};

/// Models that may appear inside a CompositeReward
using RewardComponent = std::variant<StandardReward, AsymmetricReward, CVaRReward,
                                     SharpeReward, VariancePenalizedReward>;

/// Weighted blend; weights are normalized to sum to one
struct CompositeReward {
    std::vector<std::pair<RewardComponent, double>> components;
};

using RewardSpec = std::variant<DefaultReward, StandardReward, AsymmetricReward, CVaRReward,
                                SharpeReward, VariancePenalizedReward, CompositeReward>;

std::expected<void, ValidationError> validate_reward_spec(const RewardSpec& spec);

/// Per-step quantities a reward model may consume
struct RewardInputs {
    double pnl = 0.0;           ///< Current pnl relative to the premium
    double hedge_error = 0.0;   ///< |position − Δ|, or |position| at expiry
    double hedge_ratio = 0.0;   ///< Position after the trade
    double total_costs = 0.0;   ///< Cumulative transaction costs
    bool terminal = false;
};

/**
 * @brief Stateful evaluator for a RewardSpec
 *
 * Rolling windows are ring buffers sized once at construction.
 */
class RewardModel {
public:
    static std::expected<RewardModel, ValidationError>
    create(const RewardSpec& spec, double risk_penalty);

    double compute(const RewardInputs& inputs);

    /// Drop all rolling history (new episode)
    void reset();

    bool is_default() const { return std::holds_alternative<DefaultReward>(spec_); }
    const RewardSpec& spec() const { return spec_; }

private:
    struct Component {
        RewardComponent params;
        double weight;
        RingBuffer<double> history;
    };

    RewardModel(const RewardSpec& spec, double risk_penalty);

    double compute_component(Component& component, const RewardInputs& inputs);

    RewardSpec spec_;
    double risk_penalty_;
    std::vector<Component> components_;
};

}  // namespace hedgelab
