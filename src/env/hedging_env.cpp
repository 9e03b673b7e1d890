// SPDX-License-Identifier: MIT
#include "hedgelab/env/hedging_env.hpp"
#include "hedgelab/math/statistics.hpp"
#include "hedgelab/support/hedge_trace.h"
#include <algorithm>
#include <cmath>

namespace hedgelab {

namespace {

std::unexpected<ValidationError> fail(ValidationErrorCode code, double value, size_t index = 0) {
    HEDGELAB_TRACE_VALIDATION_ERROR(MODULE_ENVIRONMENT, static_cast<int>(code), value);
    return std::unexpected(ValidationError(code, value, index));
}

}  // namespace

std::expected<ActionMode, ValidationError> parse_action_mode(std::string_view text) {
    if (text == "continuous") return ActionMode::Continuous;
    if (text == "discrete") return ActionMode::Discrete;
    return fail(ValidationErrorCode::InvalidActionMode, 0.0);
}

const char* to_string(ActionMode mode) {
    return mode == ActionMode::Discrete ? "discrete" : "continuous";
}

std::expected<size_t, ValidationError> discrete_action_index(double action) {
    // Range check first: out-of-range doubles do not convert to size_t
    if (!(action >= 0.0) || action >= static_cast<double>(kDiscreteAdjustments.size()) ||
        action != std::floor(action)) {
        return fail(ValidationErrorCode::InvalidAction, action);
    }
    return static_cast<size_t>(action);
}

std::expected<void, ValidationError> validate_environment_config(const EnvironmentConfig& config) {
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
    if (config.transaction_cost < 0.0 || !std::isfinite(config.transaction_cost)) {
        return fail(ValidationErrorCode::InvalidTransactionCost, config.transaction_cost);
    }
    if (!std::isfinite(config.risk_penalty)) {
        return fail(ValidationErrorCode::InvalidWeight, config.risk_penalty);
    }
    return validate_reward_spec(config.reward);
}

Record StepInfo::to_record() const {
    Record record = {
        {"step", static_cast<int64_t>(step)},
        {"S", spot},
        {"S0", s0},
        {"K", strike},
        {"T", maturity},
        {"tau", tau},
        {"position", position},
        {"cash", cash},
        {"pnl", pnl},
        {"total_costs", total_costs},
    };
    if (final_pnl) {
        record.emplace_back("final_pnl", *final_pnl);
    }
    return record;
}

Record StepRecord::to_record() const {
    return {
        {"step", static_cast<int64_t>(step)},
        {"S", spot},
        {"position", position},
        {"cash", cash},
        {"pnl", pnl},
        {"option_value", option_value},
        {"transaction_cost", transaction_cost},
    };
}

// ===========================================================================
// HedgingEnvironment
// ===========================================================================

HedgingEnvironment::HedgingEnvironment(const EnvironmentConfig& config, RewardModel reward)
    : config_(config)
    , reward_(std::move(reward))
    , dt_(config.maturity / static_cast<double>(config.n_steps))
    , initial_premium_(bs_price(config.spot, config.strike, config.maturity, config.rate,
                                config.volatility, config.option_type))
    , portfolio_(config.transaction_cost)
    , spot_(config.spot)
{}

std::expected<HedgingEnvironment, ValidationError>
HedgingEnvironment::create(const EnvironmentConfig& config) {
    auto ok = validate_environment_config(config);
    if (!ok) {
        return std::unexpected(ok.error());
    }
    auto reward = RewardModel::create(config.reward, config.risk_penalty);
    if (!reward) {
        return std::unexpected(reward.error());
    }
    return HedgingEnvironment(config, std::move(*reward));
}

ResetResult HedgingEnvironment::reset(std::optional<uint64_t> seed) {
    if (seed) {
        rng_.seed(*seed);
    }
    normal_.reset();
    reward_.reset();

    current_step_ = 0;
    spot_ = config_.spot;
    pnl_ = 0.0;

    // Sell the option at its fair value; the first hedge comes from the caller
    portfolio_.reset();
    portfolio_.credit_premium(initial_premium_);

    price_history_.assign(1, config_.spot);
    position_history_.assign(1, 0.0);
    pnl_history_.clear();
    history_.clear();
    price_history_.reserve(config_.n_steps + 1);
    position_history_.reserve(config_.n_steps + 1);
    pnl_history_.reserve(config_.n_steps);
    history_.reserve(config_.n_steps);

    state_ = EnvState::Active;
    HEDGELAB_TRACE_ENV_RESET(seed.value_or(0), initial_premium_, config_.n_steps);

    return ResetResult{.observation = observation(), .info = info()};
}

std::expected<StepResult, ValidationError> HedgingEnvironment::step(std::span<const double> action) {
    if (config_.action_mode != ActionMode::Continuous) {
        return fail(ValidationErrorCode::InvalidActionMode, static_cast<double>(action.size()));
    }
    if (action.size() != 1) {
        return fail(ValidationErrorCode::InvalidAction, static_cast<double>(action.size()));
    }
    if (std::isnan(action[0])) {
        return fail(ValidationErrorCode::InvalidAction, action[0]);
    }
    return advance(action[0]);
}

std::expected<StepResult, ValidationError> HedgingEnvironment::step(size_t action_index) {
    if (config_.action_mode != ActionMode::Discrete) {
        return fail(ValidationErrorCode::InvalidActionMode, static_cast<double>(action_index));
    }
    if (action_index >= kDiscreteAdjustments.size()) {
        return fail(ValidationErrorCode::InvalidAction, static_cast<double>(action_index), action_index);
    }
    return advance(portfolio_.stock_position() + kDiscreteAdjustments[action_index]);
}

std::expected<StepResult, ValidationError> HedgingEnvironment::advance(double target_position) {
    if (state_ != EnvState::Active) {
        return fail(ValidationErrorCode::InvalidState, static_cast<double>(current_step_));
    }

    // Clip to the risk bound and trade at the pre-move price
    double target = std::clamp(target_position, -kMaxPosition, kMaxPosition);
    TradeInfo trade = portfolio_.trade_to(target, spot_);

    // One GBM step from the instance generator
    double z = normal_(rng_);
    double sigma = config_.volatility;
    spot_ *= std::exp((config_.rate - 0.5 * sigma * sigma) * dt_ + sigma * std::sqrt(dt_) * z);

    // Cash earns the risk-free rate
    portfolio_.accrue_interest(config_.rate, dt_);

    // Advance the clock and reprice (intrinsic once expired)
    ++current_step_;
    double remaining = tau();
    double option_value = bs_price(spot_, config_.strike, remaining, config_.rate,
                                   sigma, config_.option_type);

    // pnl against the premium received at inception
    PortfolioValue value = portfolio_.mark_to_market(spot_, option_value);
    pnl_ = value.portfolio_value - initial_premium_;

    bool terminated = current_step_ >= config_.n_steps;

    // Tracking error against the true delta; flat is the target at expiry
    double hedge_error = remaining > 0.0
        ? std::abs(portfolio_.stock_position() - greeks_at(remaining).delta)
        : std::abs(portfolio_.stock_position());

    double reward = reward_.compute(RewardInputs{
        .pnl = pnl_,
        .hedge_error = hedge_error,
        .hedge_ratio = portfolio_.stock_position(),
        .total_costs = portfolio_.total_costs(),
        .terminal = terminated
    });

    history_.push_back(StepRecord{
        .step = current_step_,
        .spot = spot_,
        .position = portfolio_.stock_position(),
        .cash = portfolio_.cash(),
        .pnl = pnl_,
        .option_value = option_value,
        .transaction_cost = trade.transaction_cost
    });
    price_history_.push_back(spot_);
    position_history_.push_back(portfolio_.stock_position());
    pnl_history_.push_back(pnl_);

    HEDGELAB_TRACE_ENV_STEP(current_step_, spot_, portfolio_.stock_position(), reward);

    if (terminated) {
        state_ = EnvState::Terminated;
        HEDGELAB_TRACE_ENV_TERMINATED(current_step_, pnl_, portfolio_.total_costs());
    }

    StepResult result{
        .observation = observation(),
        .reward = reward,
        .terminated = terminated,
        .truncated = false,
        .info = info()
    };
    if (terminated) {
        result.info.final_pnl = pnl_;
    }
    return result;
}

double HedgingEnvironment::tau() const {
    // Exactly zero on the final step, whatever T - n·dt rounds to
    if (current_step_ >= config_.n_steps) {
        return 0.0;
    }
    return std::max(config_.maturity - static_cast<double>(current_step_) * dt_, 0.0);
}

Greeks HedgingEnvironment::greeks_at(double tau) const {
    if (tau <= 0.0) {
        return Greeks{};
    }
    return bs_greeks(spot_, config_.strike, tau, config_.rate, config_.volatility,
                     config_.option_type);
}

Observation HedgingEnvironment::observation() const {
    double t = tau();
    Greeks g = greeks_at(t);

    Observation obs;
    obs[kObsSpot] = spot_ / config_.strike;
    obs[kObsStrike] = 1.0;
    obs[kObsTau] = t;
    obs[kObsVolatility] = config_.volatility;
    obs[kObsRate] = config_.rate;
    obs[kObsPosition] = portfolio_.stock_position();
    obs[kObsDelta] = g.delta;
    obs[kObsGamma] = g.gamma;
    obs[kObsVega] = g.vega / 100.0;
    obs[kObsPnl] = pnl_ / config_.spot;
    obs[kObsStepsRemaining] = static_cast<double>(config_.n_steps - current_step_);
    return obs;
}

StepInfo HedgingEnvironment::info() const {
    double t = tau();
    return StepInfo{
        .step = current_step_,
        .spot = spot_,
        .s0 = config_.spot,
        .strike = config_.strike,
        .maturity = config_.maturity,
        .tau = t,
        .position = portfolio_.stock_position(),
        .cash = portfolio_.cash(),
        .pnl = pnl_,
        .total_costs = portfolio_.total_costs(),
        .greeks = greeks_at(t),
        .final_pnl = std::nullopt
    };
}

Record HedgingEnvironment::episode_metrics() const {
    if (history_.empty()) {
        return {};
    }

    std::vector<double> abs_pnl(pnl_history_.size());
    std::transform(pnl_history_.begin(), pnl_history_.end(), abs_pnl.begin(),
                   [](double p) { return std::abs(p); });

    std::vector<double> abs_position(position_history_.size());
    std::transform(position_history_.begin(), position_history_.end(), abs_position.begin(),
                   [](double p) { return std::abs(p); });

    auto rebalances = static_cast<int64_t>(std::count_if(
        history_.begin(), history_.end(),
        [](const StepRecord& r) { return r.transaction_cost > 0.0; }));

    double total_costs = portfolio_.total_costs();
    double std_pnl = stats::stddev(pnl_history_);

    return {
        {"total_pnl", pnl_},
        {"final_pnl", pnl_},
        {"total_costs", total_costs},
        {"net_pnl", pnl_ - total_costs},
        {"mean_abs_pnl", stats::mean(abs_pnl)},
        {"std_pnl", std_pnl},
        {"max_drawdown", *std::min_element(pnl_history_.begin(), pnl_history_.end())},
        {"sharpe_ratio", stats::mean(pnl_history_) / (std_pnl + 1e-8)},
        {"num_trades", rebalances},
        {"num_rebalances", rebalances},
        {"avg_position", stats::mean(abs_position)},
    };
}

}  // namespace hedgelab
