// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "hedgelab/env/hedging_env.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace hedgelab {
namespace {

HedgingEnvironment make_env(EnvironmentConfig config = {}) {
    auto env = HedgingEnvironment::create(config);
    EXPECT_TRUE(env.has_value());
    return std::move(*env);
}

std::expected<StepResult, ValidationError> step_to(HedgingEnvironment& env, double target) {
    return env.step(std::span<const double>(&target, 1));
}

// ===========================================================================
// Configuration
// ===========================================================================

TEST(HedgingEnvConfigTest, DefaultConfigIsValid) {
    EXPECT_TRUE(validate_environment_config(EnvironmentConfig{}).has_value());
}

TEST(HedgingEnvConfigTest, RejectsZeroSteps) {
    auto env = HedgingEnvironment::create(EnvironmentConfig{.n_steps = 0});
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().code, ValidationErrorCode::InvalidStepCount);
}

TEST(HedgingEnvConfigTest, RejectsNegativeTransactionCost) {
    auto env = HedgingEnvironment::create(EnvironmentConfig{.transaction_cost = -0.01});
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().code, ValidationErrorCode::InvalidTransactionCost);
}

TEST(HedgingEnvConfigTest, RejectsBadContract) {
    auto env = HedgingEnvironment::create(EnvironmentConfig{.volatility = 0.0});
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST(HedgingEnvConfigTest, RejectsBadRewardSpec) {
    auto env = HedgingEnvironment::create(EnvironmentConfig{.reward = CVaRReward{.window = 0}});
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().code, ValidationErrorCode::InvalidWindow);
}

TEST(HedgingEnvConfigTest, ParseActionMode) {
    EXPECT_EQ(*parse_action_mode("continuous"), ActionMode::Continuous);
    EXPECT_EQ(*parse_action_mode("discrete"), ActionMode::Discrete);
    auto bad = parse_action_mode("binary");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ValidationErrorCode::InvalidActionMode);
    EXPECT_STREQ(to_string(ActionMode::Discrete), "discrete");
}

TEST(HedgingEnvConfigTest, DiscreteActionIndex) {
    EXPECT_EQ(*discrete_action_index(0.0), 0u);
    EXPECT_EQ(*discrete_action_index(4.0), 4u);

    for (double bad : {-1.0, 2.5, 5.0, 1e30, std::numeric_limits<double>::infinity(),
                       std::numeric_limits<double>::quiet_NaN()}) {
        auto index = discrete_action_index(bad);
        ASSERT_FALSE(index.has_value()) << "action " << bad;
        EXPECT_EQ(index.error().code, ValidationErrorCode::InvalidAction);
    }
}

// ===========================================================================
// State machine
// ===========================================================================

TEST(HedgingEnvStateTest, StepBeforeResetFails) {
    auto env = make_env();
    EXPECT_EQ(env.state(), EnvState::Uninitialized);
    auto result = step_to(env, 0.5);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidState);
}

TEST(HedgingEnvStateTest, EpisodeRunsExactlyNSteps) {
    auto env = make_env(EnvironmentConfig{.n_steps = 10});
    env.reset(1);
    EXPECT_EQ(env.state(), EnvState::Active);

    for (size_t i = 1; i <= 10; ++i) {
        auto result = step_to(env, 0.5);
        ASSERT_TRUE(result.has_value()) << i;
        EXPECT_EQ(result->terminated, i == 10) << i;
        EXPECT_FALSE(result->truncated);
        EXPECT_EQ(result->info.step, i);
    }
    EXPECT_EQ(env.state(), EnvState::Terminated);

    auto extra = step_to(env, 0.5);
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().code, ValidationErrorCode::InvalidState);

    env.reset(2);
    EXPECT_EQ(env.state(), EnvState::Active);
    EXPECT_EQ(env.current_step(), 0u);
    EXPECT_TRUE(step_to(env, 0.5).has_value());
}

TEST(HedgingEnvStateTest, ResetRestoresInitialBook) {
    auto env = make_env(EnvironmentConfig{.n_steps = 5});
    env.reset(3);
    step_to(env, 1.0);
    step_to(env, -1.0);

    auto reset = env.reset(3);
    EXPECT_DOUBLE_EQ(env.position(), 0.0);
    EXPECT_DOUBLE_EQ(env.total_costs(), 0.0);
    EXPECT_DOUBLE_EQ(env.cash(), env.initial_premium());
    EXPECT_DOUBLE_EQ(env.spot(), 100.0);
    EXPECT_EQ(env.price_history().size(), 1u);
    EXPECT_TRUE(env.history().empty());
    EXPECT_TRUE(env.episode_metrics().empty());
    EXPECT_EQ(reset.info.step, 0u);
}

// ===========================================================================
// Observations
// ===========================================================================

TEST(HedgingEnvObservationTest, InitialObservationLayout) {
    auto env = make_env();
    Observation obs = env.reset(42).observation;

    EXPECT_DOUBLE_EQ(obs[kObsSpot], 1.0);
    EXPECT_DOUBLE_EQ(obs[kObsStrike], 1.0);
    EXPECT_DOUBLE_EQ(obs[kObsTau], 1.0);
    EXPECT_DOUBLE_EQ(obs[kObsVolatility], 0.2);
    EXPECT_DOUBLE_EQ(obs[kObsRate], 0.05);
    EXPECT_DOUBLE_EQ(obs[kObsPosition], 0.0);
    EXPECT_NEAR(obs[kObsDelta], 0.6368306511756191, 1e-10);
    EXPECT_NEAR(obs[kObsGamma], 0.018762017345846895, 1e-10);
    EXPECT_NEAR(obs[kObsVega], 0.3752403469169379 / 100.0, 1e-12);
    EXPECT_DOUBLE_EQ(obs[kObsPnl], 0.0);
    EXPECT_DOUBLE_EQ(obs[kObsStepsRemaining], 252.0);
}

TEST(HedgingEnvObservationTest, InitialInfo) {
    auto env = make_env();
    StepInfo info = env.reset(42).info;
    EXPECT_NEAR(env.initial_premium(), 10.450583572185565, 1e-9);
    EXPECT_DOUBLE_EQ(info.cash, env.initial_premium());
    EXPECT_DOUBLE_EQ(info.s0, 100.0);
    EXPECT_DOUBLE_EQ(info.tau, 1.0);
    EXPECT_FALSE(info.final_pnl.has_value());
    EXPECT_EQ(find_field(info.to_record(), "final_pnl"), nullptr);
}

TEST(HedgingEnvObservationTest, InfoRecordKeepsGreeksSeparate) {
    auto env = make_env();
    StepInfo info = env.reset(42).info;

    std::vector<std::string> keys;
    for (const auto& [key, value] : info.to_record()) {
        keys.push_back(key);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"step", "S", "S0", "K", "T", "tau",
                                              "position", "cash", "pnl", "total_costs"}));
    EXPECT_EQ(find_field(info.to_record(), "delta"), nullptr);
    EXPECT_NEAR(info.greeks.delta, 0.6368306511756191, 1e-10);
}

TEST(HedgingEnvObservationTest, PutDeltaIsNegative) {
    auto env = make_env(EnvironmentConfig{.option_type = OptionType::PUT});
    Observation obs = env.reset(0).observation;
    EXPECT_NEAR(obs[kObsDelta], -0.3631693488243809, 1e-10);
    EXPECT_NEAR(env.initial_premium(), 5.573526022256971, 1e-9);
}

TEST(HedgingEnvObservationTest, ClockAdvancesByDt) {
    auto env = make_env(EnvironmentConfig{.maturity = 0.5, .n_steps = 4});
    env.reset(9);
    for (size_t k = 1; k < 4; ++k) {
        auto result = step_to(env, 0.0);
        ASSERT_TRUE(result.has_value());
        EXPECT_NEAR(result->info.tau, 0.5 - 0.125 * static_cast<double>(k), 1e-12);
        EXPECT_DOUBLE_EQ(result->observation[kObsStepsRemaining], static_cast<double>(4 - k));
    }
}

TEST(HedgingEnvObservationTest, TerminalStepAtExpiry) {
    auto env = make_env(EnvironmentConfig{.n_steps = 3});
    env.reset(11);
    step_to(env, 0.5);
    step_to(env, 0.5);
    auto last = step_to(env, 0.5);
    ASSERT_TRUE(last.has_value());
    ASSERT_TRUE(last->terminated);

    EXPECT_DOUBLE_EQ(last->info.tau, 0.0);
    EXPECT_DOUBLE_EQ(last->info.greeks.delta, 0.0);
    EXPECT_DOUBLE_EQ(last->info.greeks.gamma, 0.0);
    EXPECT_DOUBLE_EQ(last->observation[kObsTau], 0.0);
    EXPECT_DOUBLE_EQ(last->observation[kObsStepsRemaining], 0.0);

    ASSERT_TRUE(last->info.final_pnl.has_value());
    EXPECT_DOUBLE_EQ(*last->info.final_pnl, last->info.pnl);
    EXPECT_NE(find_field(last->info.to_record(), "final_pnl"), nullptr);
}

// ===========================================================================
// Actions
// ===========================================================================

TEST(HedgingEnvActionTest, ContinuousActionIsTargetPosition) {
    auto env = make_env();
    env.reset(5);
    auto result = step_to(env, 0.63);
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->info.position, 0.63);
    EXPECT_DOUBLE_EQ(result->observation[kObsPosition], 0.63);
}

TEST(HedgingEnvActionTest, PositionsAreClipped) {
    auto env = make_env();
    env.reset(5);
    EXPECT_DOUBLE_EQ(step_to(env, 10.0)->info.position, 2.0);
    EXPECT_DOUBLE_EQ(step_to(env, -10.0)->info.position, -2.0);
}

TEST(HedgingEnvActionTest, RejectsMalformedContinuousAction) {
    auto env = make_env();
    env.reset(5);

    std::vector<double> two = {0.1, 0.2};
    auto wrong_size = env.step(std::span<const double>(two));
    ASSERT_FALSE(wrong_size.has_value());
    EXPECT_EQ(wrong_size.error().code, ValidationErrorCode::InvalidAction);

    auto nan = step_to(env, std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(nan.has_value());
    EXPECT_EQ(nan.error().code, ValidationErrorCode::InvalidAction);

    auto wrong_mode = env.step(size_t{2});
    ASSERT_FALSE(wrong_mode.has_value());
    EXPECT_EQ(wrong_mode.error().code, ValidationErrorCode::InvalidActionMode);

    // Rejected actions do not advance the episode
    EXPECT_EQ(env.current_step(), 0u);
}

TEST(HedgingEnvActionTest, DiscreteActionsAdjustPosition) {
    auto env = make_env(EnvironmentConfig{.action_mode = ActionMode::Discrete});
    env.reset(5);

    EXPECT_DOUBLE_EQ(env.step(size_t{4})->info.position, 0.5);
    EXPECT_DOUBLE_EQ(env.step(size_t{4})->info.position, 1.0);
    EXPECT_NEAR(env.step(size_t{1})->info.position, 0.9, 1e-12);
    EXPECT_NEAR(env.step(size_t{2})->info.position, 0.9, 1e-12);
    EXPECT_NEAR(env.step(size_t{0})->info.position, 0.4, 1e-12);
}

TEST(HedgingEnvActionTest, DiscreteActionsAreClipped) {
    auto env = make_env(EnvironmentConfig{.action_mode = ActionMode::Discrete});
    env.reset(5);
    double position = 0.0;
    for (int i = 0; i < 6; ++i) {
        position = env.step(size_t{4})->info.position;
    }
    EXPECT_DOUBLE_EQ(position, 2.0);
}

TEST(HedgingEnvActionTest, RejectsMalformedDiscreteAction) {
    auto env = make_env(EnvironmentConfig{.action_mode = ActionMode::Discrete});
    env.reset(5);

    auto out_of_range = env.step(size_t{5});
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, ValidationErrorCode::InvalidAction);

    auto wrong_mode = step_to(env, 0.5);
    ASSERT_FALSE(wrong_mode.has_value());
    EXPECT_EQ(wrong_mode.error().code, ValidationErrorCode::InvalidActionMode);
}

// ===========================================================================
// Dynamics and accounting
// ===========================================================================

TEST(HedgingEnvDynamicsTest, SameSeedSameTrajectory) {
    auto a = make_env(EnvironmentConfig{.n_steps = 20});
    auto b = make_env(EnvironmentConfig{.n_steps = 20});
    a.reset(123);
    b.reset(123);

    for (int i = 0; i < 20; ++i) {
        double target = 0.05 * i;
        auto ra = step_to(a, target);
        auto rb = step_to(b, target);
        ASSERT_TRUE(ra.has_value() && rb.has_value());
        EXPECT_EQ(ra->observation, rb->observation);
        EXPECT_DOUBLE_EQ(ra->reward, rb->reward);
    }
    EXPECT_EQ(a.price_history(), b.price_history());
}

TEST(HedgingEnvDynamicsTest, ReseedingReplaysThePath) {
    auto env = make_env(EnvironmentConfig{.n_steps = 15});
    env.reset(77);
    for (int i = 0; i < 15; ++i) step_to(env, 0.5);
    std::vector<double> first = env.price_history();

    env.reset(77);
    for (int i = 0; i < 15; ++i) step_to(env, 0.5);
    EXPECT_EQ(env.price_history(), first);
}

TEST(HedgingEnvDynamicsTest, DifferentSeedsDiffer) {
    auto env = make_env(EnvironmentConfig{.n_steps = 5});
    env.reset(1);
    step_to(env, 0.0);
    double s1 = env.spot();
    env.reset(2);
    step_to(env, 0.0);
    EXPECT_NE(env.spot(), s1);
}

TEST(HedgingEnvDynamicsTest, UnseededResetContinuesStream) {
    auto a = make_env(EnvironmentConfig{.n_steps = 5});
    auto b = make_env(EnvironmentConfig{.n_steps = 5});
    for (auto* env : {&a, &b}) {
        env->reset(8);
        for (int i = 0; i < 5; ++i) step_to(*env, 0.0);
        env->reset();
        step_to(*env, 0.0);
    }
    EXPECT_DOUBLE_EQ(a.spot(), b.spot());

    // The continued stream is not a replay of the seeded one
    auto c = make_env(EnvironmentConfig{.n_steps = 5});
    c.reset(8);
    step_to(c, 0.0);
    EXPECT_NE(a.spot(), c.spot());
}

TEST(HedgingEnvDynamicsTest, CashAccruesInterest) {
    auto env = make_env(EnvironmentConfig{.n_steps = 10, .transaction_cost = 0.0});
    env.reset(4);
    for (int k = 1; k <= 4; ++k) {
        step_to(env, 0.0);
        EXPECT_NEAR(env.cash(), env.initial_premium() * std::exp(0.05 * 0.1 * k), 1e-10);
    }
}

TEST(HedgingEnvDynamicsTest, TradesAtPreMovePrice) {
    auto env = make_env(EnvironmentConfig{.transaction_cost = 0.001});
    env.reset(6);
    auto result = step_to(env, 0.5);
    ASSERT_TRUE(result.has_value());

    const StepRecord& rec = env.history().back();
    EXPECT_NEAR(rec.transaction_cost, 0.5 * 100.0 * 0.001, 1e-12);
    double cash_after_trade = env.initial_premium() - 50.0 - 0.05;
    EXPECT_NEAR(rec.cash, cash_after_trade * std::exp(0.05 * env.dt()), 1e-10);
}

TEST(HedgingEnvDynamicsTest, PnlIsBookValueLessPremium) {
    auto env = make_env(EnvironmentConfig{.n_steps = 6});
    env.reset(10);
    for (double target : {0.6, 0.4, 0.7, 0.3, 0.5, 0.5}) {
        step_to(env, target);
        const StepRecord& rec = env.history().back();
        double book = rec.cash + rec.position * rec.spot - rec.option_value;
        EXPECT_NEAR(rec.pnl, book - env.initial_premium(), 1e-10);
    }
    // Expired: option carried at intrinsic
    const StepRecord& last = env.history().back();
    EXPECT_DOUBLE_EQ(last.option_value, std::max(last.spot - 100.0, 0.0));
}

TEST(HedgingEnvDynamicsTest, CostsAreMonotone) {
    auto env = make_env(EnvironmentConfig{.n_steps = 30, .transaction_cost = 0.002});
    env.reset(12);
    double previous = 0.0;
    for (int i = 0; i < 30; ++i) {
        auto result = step_to(env, (i % 2 == 0) ? 1.5 : -0.5);
        ASSERT_TRUE(result.has_value());
        EXPECT_GE(result->info.total_costs, previous);
        previous = result->info.total_costs;
    }
    EXPECT_GT(previous, 0.0);
}

// ===========================================================================
// Reward
// ===========================================================================

TEST(HedgingEnvRewardTest, DefaultRewardOnIntermediateStep) {
    auto env = make_env(EnvironmentConfig{.risk_penalty = 0.1});
    env.reset(21);
    auto result = step_to(env, 0.4);
    ASSERT_TRUE(result.has_value());

    const StepInfo& info = result->info;
    double expected = -std::abs(info.position - info.greeks.delta) * 0.1 - info.total_costs * 0.1;
    EXPECT_NEAR(result->reward, expected, 1e-12);
}

TEST(HedgingEnvRewardTest, DefaultRewardOnTerminalStep) {
    auto env = make_env(EnvironmentConfig{.n_steps = 2, .risk_penalty = 0.3});
    env.reset(22);
    step_to(env, 0.6);
    auto result = step_to(env, 0.7);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->terminated);

    const StepInfo& info = result->info;
    // Flat is the target at expiry
    double expected = -0.7 * 0.3 - info.total_costs * 0.1 + info.pnl;
    EXPECT_NEAR(result->reward, expected, 1e-12);
}

TEST(HedgingEnvRewardTest, AlternativeRewardIsUsed) {
    auto env = make_env(EnvironmentConfig{.reward = StandardReward{.pnl_scale = 10.0}});
    env.reset(23);
    auto result = step_to(env, 0.5);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->reward, result->info.pnl / 10.0, 1e-12);
}

TEST(HedgingEnvRewardTest, ResetClearsRewardHistory) {
    auto config = EnvironmentConfig{.n_steps = 12, .reward = CVaRReward{}};
    auto a = make_env(config);
    auto b = make_env(config);

    a.reset(30);
    for (int i = 0; i < 12; ++i) step_to(a, 0.5);
    a.reset(31);
    b.reset(31);
    EXPECT_DOUBLE_EQ(step_to(a, 0.5)->reward, step_to(b, 0.5)->reward);
}

// ===========================================================================
// Episode metrics
// ===========================================================================

TEST(HedgingEnvMetricsTest, ConstantHedgeMetrics) {
    const size_t n = 8;
    auto env = make_env(EnvironmentConfig{.n_steps = n});
    env.reset(40);
    for (size_t i = 0; i < n; ++i) step_to(env, 0.5);

    Record m = env.episode_metrics();
    EXPECT_EQ(std::get<int64_t>(*find_field(m, "num_rebalances")), 1);
    EXPECT_EQ(std::get<int64_t>(*find_field(m, "num_trades")), 1);
    // Initial flat position is part of the history
    EXPECT_NEAR(get_number(m, "avg_position").value(), 0.5 * n / (n + 1.0), 1e-12);
    EXPECT_DOUBLE_EQ(get_number(m, "final_pnl").value(), env.pnl());
    EXPECT_NEAR(get_number(m, "total_costs").value(), 0.05, 1e-12);
    EXPECT_NEAR(get_number(m, "net_pnl").value(), env.pnl() - 0.05, 1e-12);
}

TEST(HedgingEnvMetricsTest, DrawdownIsLowestPnl) {
    auto env = make_env(EnvironmentConfig{.n_steps = 20});
    env.reset(41);
    for (int i = 0; i < 20; ++i) step_to(env, 0.6);

    Record m = env.episode_metrics();
    const auto& pnls = env.pnl_history();
    ASSERT_EQ(pnls.size(), 20u);
    EXPECT_DOUBLE_EQ(get_number(m, "max_drawdown").value(),
                     *std::min_element(pnls.begin(), pnls.end()));
    EXPECT_GE(get_number(m, "std_pnl").value(), 0.0);
    EXPECT_GE(get_number(m, "mean_abs_pnl").value(), 0.0);
}

TEST(HedgingEnvMetricsTest, HistoriesHaveEpisodeLength) {
    const size_t n = 12;
    auto env = make_env(EnvironmentConfig{.n_steps = n});
    env.reset(42);
    for (size_t i = 0; i < n; ++i) step_to(env, 0.5);

    EXPECT_EQ(env.price_history().size(), n + 1);
    EXPECT_EQ(env.position_history().size(), n + 1);
    EXPECT_EQ(env.pnl_history().size(), n);
    EXPECT_EQ(env.history().size(), n);
    EXPECT_EQ(env.history().back().step, n);
    EXPECT_DOUBLE_EQ(env.price_history().front(), 100.0);
}

}  // namespace
}  // namespace hedgelab
