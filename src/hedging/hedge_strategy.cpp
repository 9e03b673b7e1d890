// SPDX-License-Identifier: MIT
#include "hedgelab/hedging/hedge_strategy.hpp"
#include "hedgelab/option/european_option.hpp"
#include "hedgelab/math/statistics.hpp"
#include "hedgelab/support/hedge_trace.h"
#include <cmath>

namespace hedgelab {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

std::expected<void, ValidationError> fail(ValidationErrorCode code, double value) {
    HEDGELAB_TRACE_VALIDATION_ERROR(MODULE_STRATEGY, static_cast<int>(code), value);
    return std::unexpected(ValidationError(code, value));
}

std::expected<void, ValidationError> validate_params(const StrategyParams& params) {
    return std::visit(overloaded{
        [](const DeltaParams&) -> std::expected<void, ValidationError> { return {}; },
        [](const DeltaGammaParams& p) -> std::expected<void, ValidationError> {
            if (!std::isfinite(p.gamma_target)) {
                return fail(ValidationErrorCode::InvalidWeight, p.gamma_target);
            }
            return {};
        },
        [](const DeltaGammaVegaParams& p) -> std::expected<void, ValidationError> {
            if (!std::isfinite(p.gamma_weight)) {
                return fail(ValidationErrorCode::InvalidWeight, p.gamma_weight);
            }
            if (!std::isfinite(p.vega_weight)) {
                return fail(ValidationErrorCode::InvalidWeight, p.vega_weight);
            }
            return {};
        },
        [](const MinimumVarianceParams& p) -> std::expected<void, ValidationError> {
            if (p.lookback_window == 0) {
                return fail(ValidationErrorCode::InvalidWindow, 0.0);
            }
            return {};
        },
    }, params);
}

size_t history_window(const StrategyParams& params) {
    if (const auto* p = std::get_if<MinimumVarianceParams>(&params)) {
        return p->lookback_window;
    }
    return 0;
}

}  // namespace

const char* to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Delta:           return "Delta";
        case StrategyKind::DeltaGamma:      return "Delta-Gamma";
        case StrategyKind::DeltaGammaVega:  return "Delta-Gamma-Vega";
        case StrategyKind::MinimumVariance: return "Minimum-Variance";
    }
    return "Unknown";
}

std::expected<void, ValidationError> validate_strategy_config(const StrategyConfig& config) {
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

    if (config.transaction_cost < 0.0 || !std::isfinite(config.transaction_cost)) {
        return fail(ValidationErrorCode::InvalidTransactionCost, config.transaction_cost);
    }

    return {};
}

// ===========================================================================
// Hedge rules
// ===========================================================================

double delta_hedge(const StrategyConfig& config, double spot, double tau) {
    if (tau <= 0.0) return 0.0;

    Greeks g = bs_greeks(spot, config.strike, tau, config.rate, config.volatility,
                         config.option_type);
    return -Portfolio::kOptionPosition * g.delta;
}

double delta_gamma_hedge(const StrategyConfig& config, const DeltaGammaParams& /*params*/,
                         double spot, double tau) {
    if (tau <= 0.0) return 0.0;

    Greeks g = bs_greeks(spot, config.strike, tau, config.rate, config.volatility,
                         config.option_type);

    // Stock-only approximation: no second option is modelled
    double gamma_adjustment = g.gamma * (spot - config.spot) * 0.5;
    return -Portfolio::kOptionPosition * (g.delta + gamma_adjustment);
}

double delta_gamma_vega_hedge(const StrategyConfig& config, const DeltaGammaVegaParams& params,
                              double spot, double tau) {
    if (tau <= 0.0) return 0.0;

    Greeks g = bs_greeks(spot, config.strike, tau, config.rate, config.volatility,
                         config.option_type);

    double gamma_adjustment = params.gamma_weight * g.gamma * (spot - config.spot);
    double vega_adjustment = params.vega_weight * g.vega * (config.volatility - kTargetVolatility);
    return -Portfolio::kOptionPosition * (g.delta + gamma_adjustment + vega_adjustment);
}

double minimum_variance_hedge(const StrategyConfig& config, MinimumVarianceHistory& history,
                              double spot, double tau) {
    if (tau <= 0.0) return 0.0;

    double option_value = bs_price(spot, config.strike, tau, config.rate, config.volatility,
                                   config.option_type);
    history.prices.push(spot);
    history.option_values.push(option_value);

    if (history.size() < kMinVarianceObservations) {
        HEDGELAB_TRACE_MINVAR_FALLBACK(history.size());
        return delta_hedge(config, spot, tau);
    }

    auto prices = history.prices.to_vector();
    auto values = history.option_values.to_vector();
    auto stock_returns = stats::simple_returns(prices);
    auto option_returns = stats::simple_returns(values);

    double hedge_ratio = stats::sample_covariance(option_returns, stock_returns) /
                         (stats::variance(stock_returns) + kVarianceEpsilon);
    return -Portfolio::kOptionPosition * hedge_ratio;
}

// ===========================================================================
// HedgingStrategy
// ===========================================================================

HedgingStrategy::HedgingStrategy(const StrategyConfig& config, StrategyParams params)
    : config_(config)
    , params_(params)
    , portfolio_(config.transaction_cost)
    , history_(history_window(params))
{}

std::expected<HedgingStrategy, ValidationError>
HedgingStrategy::create(const StrategyConfig& config, StrategyParams params) {
    auto config_ok = validate_strategy_config(config);
    if (!config_ok) {
        return std::unexpected(config_ok.error());
    }
    auto params_ok = validate_params(params);
    if (!params_ok) {
        return std::unexpected(params_ok.error());
    }
    return HedgingStrategy(config, params);
}

HedgePositions HedgingStrategy::hedge_positions(double spot, double tau) {
    double target = std::visit(overloaded{
        [&](const DeltaParams&) { return delta_hedge(config_, spot, tau); },
        [&](const DeltaGammaParams& p) { return delta_gamma_hedge(config_, p, spot, tau); },
        [&](const DeltaGammaVegaParams& p) { return delta_gamma_vega_hedge(config_, p, spot, tau); },
        [&](const MinimumVarianceParams&) { return minimum_variance_hedge(config_, history_, spot, tau); },
    }, params_);
    return HedgePositions{.stock = target};
}

double HedgingStrategy::initialize() {
    double premium = bs_price(config_.spot, config_.strike, config_.maturity, config_.rate,
                              config_.volatility, config_.option_type);
    portfolio_.credit_premium(premium);

    HedgePositions target = hedge_positions(config_.spot, config_.maturity);
    portfolio_.trade_to(target.stock, config_.spot);

    return premium;
}

TradeInfo HedgingStrategy::rebalance(double spot, double tau) {
    HedgePositions target = hedge_positions(spot, tau);
    TradeInfo info = portfolio_.trade_to(target.stock, spot);
    HEDGELAB_TRACE_STRATEGY_REBALANCE(static_cast<int>(kind()), spot,
                                      info.stock_trade, info.transaction_cost);
    return info;
}

PortfolioValue HedgingStrategy::portfolio_value(double spot, double tau) const {
    double option_value = bs_price(spot, config_.strike, tau, config_.rate,
                                   config_.volatility, config_.option_type);
    return portfolio_.mark_to_market(spot, option_value);
}

}  // namespace hedgelab
