// SPDX-License-Identifier: MIT
/**
 * @file hedge_strategy.hpp
 * @brief Analytic baseline hedging strategies for a short European option
 *
 * The four baselines differ only in how they turn market state into a
 * target stock position. They are a closed set: a std::variant of parameter
 * structs selects one of four hedge rules, and every strategy shares the
 * same Portfolio bookkeeping.
 *
 * Usage:
 * ```cpp
 * StrategyConfig config{.spot = 100.0, .strike = 100.0, .maturity = 1.0,
 *                       .rate = 0.05, .volatility = 0.2};
 * auto strategy = HedgingStrategy::create(config, DeltaGammaVegaParams{});
 * if (!strategy) return;
 * double premium = strategy->initialize();
 * strategy->rebalance(102.0, 0.99);
 * auto value = strategy->portfolio_value(102.0, 0.99);
 * ```
 */

#pragma once

#include "hedgelab/option/option_spec.hpp"
#include "hedgelab/hedging/portfolio.hpp"
#include "hedgelab/support/error_types.hpp"
#include "hedgelab/support/ring_buffer.hpp"
#include <cstddef>
#include <expected>
#include <variant>

namespace hedgelab {

/// Market and contract parameters shared by every baseline
struct StrategyConfig {
    double spot = 100.0;              ///< Initial spot S0
    double strike = 100.0;            ///< Strike K
    double maturity = 1.0;            ///< Time to maturity T (years)
    double rate = 0.05;               ///< Risk-free rate r
    double volatility = 0.2;          ///< Volatility σ
    OptionType option_type = OptionType::CALL;
    double transaction_cost = 0.001;  ///< Fraction of traded notional
};

/// Validate contract fields and a non-negative, finite transaction cost
std::expected<void, ValidationError> validate_strategy_config(const StrategyConfig& config);

/// Plain delta hedge: hold Δ shares against the short option
struct DeltaParams {};

/// Delta hedge plus the heuristic gamma correction γ·(S − S0)·0.5
struct DeltaGammaParams {
    double gamma_target = 0.0;  ///< Accepted for API compatibility; the heuristic does not use it
};

/// Delta hedge plus weighted gamma and vega corrections
struct DeltaGammaVegaParams {
    double gamma_weight = 0.5;
    double vega_weight = 0.01;
};

/// Covariance-ratio hedge over a rolling window of (S, option value)
struct MinimumVarianceParams {
    size_t lookback_window = 20;
};

/// Strategy selection; each alternative carries its own knobs
using StrategyParams = std::variant<DeltaParams, DeltaGammaParams,
                                    DeltaGammaVegaParams, MinimumVarianceParams>;

enum class StrategyKind {
    Delta,
    DeltaGamma,
    DeltaGammaVega,
    MinimumVariance
};

/// Display name ("Delta", "Delta-Gamma", ...)
const char* to_string(StrategyKind kind);

/// Kind selected by a parameter variant
inline StrategyKind kind_of(const StrategyParams& params) {
    return static_cast<StrategyKind>(params.index());
}

/// Target stock holding returned by a hedge rule
struct HedgePositions {
    double stock = 0.0;
};

/// Volatility the delta-gamma-vega heuristic treats as "normal"
inline constexpr double kTargetVolatility = 0.20;

/// Epsilon added to the minimum-variance denominator
inline constexpr double kVarianceEpsilon = 1e-8;

/// Fewer observations than this fall back to delta hedging
inline constexpr size_t kMinVarianceObservations = 3;

// ===========================================================================
// Hedge rules (flat target at tau <= 0)
// ===========================================================================

/// target = −option_position · Δ
double delta_hedge(const StrategyConfig& config, double spot, double tau);

/// target = −option_position · (Δ + γ·(S − S0)·0.5)
double delta_gamma_hedge(const StrategyConfig& config, const DeltaGammaParams& params,
                         double spot, double tau);

/// target = −option_position · (Δ + w_γ·γ·(S − S0) + w_ν·ν·(σ − 0.20))
double delta_gamma_vega_hedge(const StrategyConfig& config, const DeltaGammaVegaParams& params,
                              double spot, double tau);

/// Rolling (S, option value) observations for minimum-variance hedging
struct MinimumVarianceHistory {
    RingBuffer<double> prices;
    RingBuffer<double> option_values;

    explicit MinimumVarianceHistory(size_t window)
        : prices(window), option_values(window) {}

    size_t size() const { return prices.size(); }
};

/// Records (S, option value) then hedges with Cov(opt, stock)/Var(stock);
/// delta hedge while fewer than 3 observations are held
double minimum_variance_hedge(const StrategyConfig& config, MinimumVarianceHistory& history,
                              double spot, double tau);

// ===========================================================================
// HedgingStrategy
// ===========================================================================

/**
 * @brief A baseline hedger: one hedge rule plus its own Portfolio
 *
 * Lifecycle: create() → initialize() once → rebalance() per step →
 * portfolio_value() any time. Instances are never shared between
 * episodes; the evaluator builds a fresh one per episode.
 */
class HedgingStrategy {
public:
    /// Factory with validation of the config and the rule parameters
    static std::expected<HedgingStrategy, ValidationError>
    create(const StrategyConfig& config, StrategyParams params = DeltaParams{});

    /// Sell the option at its t=0 fair value, put on the initial hedge.
    /// @return Premium received
    double initialize();

    /// Move the stock position to the rule's target at (S, τ)
    TradeInfo rebalance(double spot, double tau);

    /// Mark the book to market at (S, τ); intrinsic option value at τ <= 0
    PortfolioValue portfolio_value(double spot, double tau) const;

    /// Target holding at (S, τ). Minimum-variance records the observation.
    HedgePositions hedge_positions(double spot, double tau);

    StrategyKind kind() const { return kind_of(params_); }
    const StrategyConfig& config() const { return config_; }
    const StrategyParams& params() const { return params_; }
    const Portfolio& portfolio() const { return portfolio_; }

    double cash() const { return portfolio_.cash(); }
    double stock_position() const { return portfolio_.stock_position(); }
    double option_position() const { return portfolio_.option_position(); }
    double total_costs() const { return portfolio_.total_costs(); }

private:
    HedgingStrategy(const StrategyConfig& config, StrategyParams params);

    StrategyConfig config_;
    StrategyParams params_;
    Portfolio portfolio_;
    MinimumVarianceHistory history_;
};

}  // namespace hedgelab
