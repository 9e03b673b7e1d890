// SPDX-License-Identifier: MIT
/**
 * @file hedging_env.hpp
 * @brief Episodic simulator for hedging a short European option
 *
 * The hedger is short one option and trades the underlying to offset it.
 * The underlying follows geometric Brownian motion driven by a generator
 * owned by the environment instance, so two environments reset with the
 * same seed and fed the same actions produce identical trajectories.
 *
 * State machine:
 *
 *   UNINITIALIZED --reset()--> ACTIVE --step() x n_steps--> TERMINATED
 *                                ^                              |
 *                                +-----------reset()------------+
 *
 * Observation layout (11 values, order is part of the agent contract):
 *
 *   [S/K, 1.0, τ, σ, r, position, Δ, Γ, vega/100, pnl/S0, steps_remaining]
 *
 * Usage:
 * ```cpp
 * auto env = HedgingEnvironment::create(EnvironmentConfig{.n_steps = 50});
 * auto [obs, info] = env->reset(42);
 * while (true) {
 *     double target = obs[kObsDelta];
 *     auto result = env->step(std::span<const double>(&target, 1));
 *     if (!result || result->terminated) break;
 *     obs = result->observation;
 * }
 * Record metrics = env->episode_metrics();
 * ```
 */

#pragma once

#include "hedgelab/env/reward_functions.hpp"
#include "hedgelab/hedging/portfolio.hpp"
#include "hedgelab/option/european_option.hpp"
#include "hedgelab/option/option_spec.hpp"
#include "hedgelab/support/error_types.hpp"
#include "hedgelab/support/record.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <random>
#include <span>
#include <string_view>
#include <vector>

namespace hedgelab {

/// How step() interprets an action
enum class ActionMode {
    Continuous,  ///< Action is the target position
    Discrete     ///< Action indexes an adjustment added to the current position
};

/// Parse "continuous" / "discrete"
std::expected<ActionMode, ValidationError> parse_action_mode(std::string_view text);

const char* to_string(ActionMode mode);

/// Hedge adjustments selected by a discrete action index
inline constexpr std::array<double, 5> kDiscreteAdjustments = {-0.5, -0.1, 0.0, 0.1, 0.5};

/// Convert a numeric discrete action (e.g. a policy output) to an index
///
/// Rejects negative, fractional, non-finite and out-of-range values with
/// InvalidAction.
std::expected<size_t, ValidationError> discrete_action_index(double action);

/// Positions are clipped to [-kMaxPosition, kMaxPosition]
inline constexpr double kMaxPosition = 2.0;

inline constexpr size_t kObservationSize = 11;
using Observation = std::array<double, kObservationSize>;

/// Observation indices
enum ObservationIndex : size_t {
    kObsSpot = 0,
    kObsStrike,
    kObsTau,
    kObsVolatility,
    kObsRate,
    kObsPosition,
    kObsDelta,
    kObsGamma,
    kObsVega,
    kObsPnl,
    kObsStepsRemaining
};

/// Environment configuration (defaults describe a one-year ATM call hedged daily)
struct EnvironmentConfig {
    double spot = 100.0;              ///< Initial spot S0
    double strike = 100.0;            ///< Strike K
    double maturity = 1.0;            ///< T in years
    double rate = 0.05;               ///< Risk-free rate r
    double volatility = 0.2;          ///< σ
    size_t n_steps = 252;             ///< Hedging steps per episode
    OptionType option_type = OptionType::CALL;
    ActionMode action_mode = ActionMode::Continuous;
    double transaction_cost = 0.001;  ///< Fraction of traded notional
    double risk_penalty = 0.1;        ///< Weight of the hedge tracking error
    RewardSpec reward = DefaultReward{};
};

std::expected<void, ValidationError> validate_environment_config(const EnvironmentConfig& config);

/// Diagnostics returned alongside every observation
struct StepInfo {
    size_t step = 0;
    double spot = 0.0;
    double s0 = 0.0;
    double strike = 0.0;
    double maturity = 0.0;
    double tau = 0.0;          ///< Remaining time, clamped at 0
    double position = 0.0;
    double cash = 0.0;
    double pnl = 0.0;
    double total_costs = 0.0;
    Greeks greeks;             ///< Zero at τ <= 0
    std::optional<double> final_pnl;  ///< Set on the terminating step only

    /// Scalar fields only; the bindings nest greeks as a sub-dict
    Record to_record() const;
};

/// One row of the per-episode history
struct StepRecord {
    size_t step = 0;
    double spot = 0.0;
    double position = 0.0;
    double cash = 0.0;
    double pnl = 0.0;
    double option_value = 0.0;
    double transaction_cost = 0.0;

    Record to_record() const;
};

struct ResetResult {
    Observation observation;
    StepInfo info;
};

struct StepResult {
    Observation observation;
    double reward = 0.0;
    bool terminated = false;
    bool truncated = false;   ///< Always false; episodes run their full horizon
    StepInfo info;
};

enum class EnvState {
    Uninitialized,
    Active,
    Terminated
};

/**
 * @brief Short-option hedging environment
 *
 * One instance owns its generator, portfolio and histories; run concurrent
 * episodes on separate instances.
 */
class HedgingEnvironment {
public:
    static std::expected<HedgingEnvironment, ValidationError> create(const EnvironmentConfig& config);

    /// Start a new episode. A seed reseeds the generator; std::nullopt
    /// continues the current random stream.
    ResetResult reset(std::optional<uint64_t> seed = std::nullopt);

    /// Continuous action: span of length 1 holding the target position
    std::expected<StepResult, ValidationError> step(std::span<const double> action);

    /// Discrete action: index into kDiscreteAdjustments
    std::expected<StepResult, ValidationError> step(size_t action_index);

    /// Episode summary; empty before the first step
    Record episode_metrics() const;

    Observation observation() const;
    StepInfo info() const;

    EnvState state() const { return state_; }
    const EnvironmentConfig& config() const { return config_; }
    size_t current_step() const { return current_step_; }
    double dt() const { return dt_; }
    double tau() const;
    double spot() const { return spot_; }
    double position() const { return portfolio_.stock_position(); }
    double cash() const { return portfolio_.cash(); }
    double pnl() const { return pnl_; }
    double total_costs() const { return portfolio_.total_costs(); }
    double initial_premium() const { return initial_premium_; }

    const std::vector<double>& price_history() const { return price_history_; }
    const std::vector<double>& position_history() const { return position_history_; }
    const std::vector<double>& pnl_history() const { return pnl_history_; }
    const std::vector<StepRecord>& history() const { return history_; }

private:
    HedgingEnvironment(const EnvironmentConfig& config, RewardModel reward);

    std::expected<StepResult, ValidationError> advance(double target_position);
    Greeks greeks_at(double tau) const;

    EnvironmentConfig config_;
    RewardModel reward_;
    double dt_;
    double initial_premium_;

    EnvState state_ = EnvState::Uninitialized;
    std::mt19937_64 rng_;
    std::normal_distribution<double> normal_{0.0, 1.0};

    Portfolio portfolio_;
    size_t current_step_ = 0;
    double spot_;
    double pnl_ = 0.0;

    std::vector<double> price_history_;
    std::vector<double> position_history_;
    std::vector<double> pnl_history_;
    std::vector<StepRecord> history_;
};

}  // namespace hedgelab
