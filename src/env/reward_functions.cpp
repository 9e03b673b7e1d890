// SPDX-License-Identifier: MIT
#include "hedgelab/env/reward_functions.hpp"
#include "hedgelab/math/statistics.hpp"
#include "hedgelab/support/hedge_trace.h"
#include <algorithm>
#include <cmath>

namespace hedgelab {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

/// Minimum history before the CVaR and Sharpe terms switch on
constexpr size_t kMinTailHistory = 10;
/// Minimum history before the hedge-ratio variance penalty switches on
constexpr size_t kMinVarianceHistory = 5;
constexpr double kTradingDaysPerYear = 252.0;

std::unexpected<ValidationError> fail(ValidationErrorCode code, double value, size_t index = 0) {
    HEDGELAB_TRACE_VALIDATION_ERROR(MODULE_ENVIRONMENT, static_cast<int>(code), value);
    return std::unexpected(ValidationError(code, value, index));
}

bool is_scale(double x) {
    return std::isfinite(x) && x != 0.0;
}

std::expected<void, ValidationError> validate_component(const RewardComponent& c, size_t index) {
    return std::visit(overloaded{
        [&](const StandardReward& r) -> std::expected<void, ValidationError> {
            if (!is_scale(r.pnl_scale)) return fail(ValidationErrorCode::InvalidWeight, r.pnl_scale, index);
            return {};
        },
        [&](const AsymmetricReward& r) -> std::expected<void, ValidationError> {
            if (!std::isfinite(r.loss_multiplier)) {
                return fail(ValidationErrorCode::InvalidWeight, r.loss_multiplier, index);
            }
            if (!std::isfinite(r.gain_multiplier)) {
                return fail(ValidationErrorCode::InvalidWeight, r.gain_multiplier, index);
            }
            if (!is_scale(r.pnl_scale)) return fail(ValidationErrorCode::InvalidWeight, r.pnl_scale, index);
            return {};
        },
        [&](const CVaRReward& r) -> std::expected<void, ValidationError> {
            if (!(r.alpha > 0.0 && r.alpha <= 1.0)) {
                return fail(ValidationErrorCode::InvalidWeight, r.alpha, index);
            }
            if (!(r.lambda_cvar >= 0.0 && r.lambda_cvar <= 1.0)) {
                return fail(ValidationErrorCode::InvalidWeight, r.lambda_cvar, index);
            }
            if (r.window == 0) return fail(ValidationErrorCode::InvalidWindow, 0.0, index);
            if (!is_scale(r.pnl_scale)) return fail(ValidationErrorCode::InvalidWeight, r.pnl_scale, index);
            return {};
        },
        [&](const SharpeReward& r) -> std::expected<void, ValidationError> {
            if (r.window == 0) return fail(ValidationErrorCode::InvalidWindow, 0.0, index);
            if (!is_scale(r.target_sharpe)) {
                return fail(ValidationErrorCode::InvalidWeight, r.target_sharpe, index);
            }
            return {};
        },
        [&](const VariancePenalizedReward& r) -> std::expected<void, ValidationError> {
            if (!std::isfinite(r.variance_penalty)) {
                return fail(ValidationErrorCode::InvalidWeight, r.variance_penalty, index);
            }
            if (r.window == 0) return fail(ValidationErrorCode::InvalidWindow, 0.0, index);
            return {};
        },
    }, c);
}

size_t window_of(const RewardComponent& c) {
    return std::visit(overloaded{
        [](const CVaRReward& r) { return r.window; },
        [](const SharpeReward& r) { return r.window; },
        [](const VariancePenalizedReward& r) { return r.window; },
        [](const auto&) { return size_t{0}; },
    }, c);
}

}  // namespace

std::expected<void, ValidationError> validate_reward_spec(const RewardSpec& spec) {
    return std::visit(overloaded{
        [](const DefaultReward&) -> std::expected<void, ValidationError> { return {}; },
        [](const CompositeReward& composite) -> std::expected<void, ValidationError> {
            if (composite.components.empty()) {
                return fail(ValidationErrorCode::InvalidWeight, 0.0);
            }
            double total = 0.0;
            for (size_t i = 0; i < composite.components.size(); ++i) {
                const auto& [component, weight] = composite.components[i];
                if (!std::isfinite(weight) || weight < 0.0) {
                    return fail(ValidationErrorCode::InvalidWeight, weight, i);
                }
                auto ok = validate_component(component, i);
                if (!ok) return ok;
                total += weight;
            }
            if (total <= 0.0) {
                return fail(ValidationErrorCode::InvalidWeight, total);
            }
            return {};
        },
        [](const auto& single) -> std::expected<void, ValidationError> {
            return validate_component(RewardComponent{single}, 0);
        },
    }, spec);
}

RewardModel::RewardModel(const RewardSpec& spec, double risk_penalty)
    : spec_(spec)
    , risk_penalty_(risk_penalty)
{
    std::visit(overloaded{
        [](const DefaultReward&) {},
        [this](const CompositeReward& composite) {
            double total = 0.0;
            for (const auto& [component, weight] : composite.components) {
                total += weight;
            }
            components_.reserve(composite.components.size());
            for (const auto& [component, weight] : composite.components) {
                components_.push_back(Component{component, weight / total,
                                                RingBuffer<double>(window_of(component))});
            }
        },
        [this](const auto& single) -> void {
            RewardComponent component{single};
            components_.push_back(Component{component, 1.0,
                                            RingBuffer<double>(window_of(component))});
        },
    }, spec_);
}

std::expected<RewardModel, ValidationError>
RewardModel::create(const RewardSpec& spec, double risk_penalty) {
    auto ok = validate_reward_spec(spec);
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return RewardModel(spec, risk_penalty);
}

void RewardModel::reset() {
    for (auto& component : components_) {
        component.history.clear();
    }
}

double RewardModel::compute(const RewardInputs& in) {
    if (is_default()) {
        double hedging_penalty = -in.hedge_error * risk_penalty_;
        double cost_penalty = -in.total_costs * 0.1;
        double terminal_reward = in.terminal ? in.pnl : 0.0;
        return hedging_penalty + cost_penalty + terminal_reward;
    }

    double total = 0.0;
    for (auto& component : components_) {
        total += component.weight * compute_component(component, in);
    }
    return total;
}

double RewardModel::compute_component(Component& component, const RewardInputs& in) {
    auto& history = component.history;

    return std::visit(overloaded{
        [&](const StandardReward& r) {
            return in.pnl / r.pnl_scale;
        },
        [&](const AsymmetricReward& r) {
            double weighted = in.pnl >= 0.0 ? in.pnl * r.gain_multiplier
                                            : in.pnl * r.loss_multiplier;
            return weighted / r.pnl_scale - in.hedge_error * 5.0;
        },
        [&](const CVaRReward& r) {
            history.push(in.pnl);

            double cvar_penalty = 0.0;
            if (history.size() >= kMinTailHistory) {
                auto sorted = history.to_vector();
                std::sort(sorted.begin(), sorted.end());
                size_t n_tail = std::max<size_t>(
                    1, static_cast<size_t>(r.alpha * static_cast<double>(sorted.size())));
                double cvar = stats::mean(std::span<const double>(sorted.data(), n_tail));
                cvar_penalty = -std::abs(cvar) / r.pnl_scale;
            }

            return (1.0 - r.lambda_cvar) * (in.pnl / r.pnl_scale)
                 + r.lambda_cvar * cvar_penalty
                 - in.hedge_error * 3.0;
        },
        [&](const SharpeReward& r) {
            history.push(in.pnl);

            double sharpe_reward;
            if (history.size() >= kMinTailHistory) {
                auto window = history.to_vector();
                double sd = stats::stddev(window);
                if (sd > 0.0) {
                    double sharpe = stats::mean(window) / sd * std::sqrt(kTradingDaysPerYear);
                    sharpe_reward = sharpe / r.target_sharpe;
                } else {
                    sharpe_reward = 0.0;
                }
            } else {
                sharpe_reward = in.pnl / 10.0;
            }
            return sharpe_reward - in.hedge_error * 3.0;
        },
        [&](const VariancePenalizedReward& r) {
            history.push(in.hedge_ratio);

            double variance_penalty = 0.0;
            if (history.size() >= kMinVarianceHistory) {
                variance_penalty = -r.variance_penalty * stats::variance(history.to_vector());
            }
            return in.pnl / 10.0 + variance_penalty - in.hedge_error * 3.0;
        },
    }, component.params);
}

}  // namespace hedgelab
