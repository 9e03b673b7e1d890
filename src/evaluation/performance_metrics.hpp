// SPDX-License-Identifier: MIT
/**
 * @file performance_metrics.hpp
 * @brief Risk and performance statistics for pnl / return series
 *
 * All moments are population moments. Empty inputs return 0 except for the
 * tail measures (VaR, CVaR), which return NaN.
 */

#pragma once

#include <span>

namespace hedgelab {

/// mean(r − rf) / (std(r − rf) + 1e-8)
double sharpe_ratio(std::span<const double> returns, double risk_free_rate = 0.0);

/// mean(r − rf) / std(r | r < 0); the denominator is 1e-8 without losses
double sortino_ratio(std::span<const double> returns, double risk_free_rate = 0.0);

/// Largest peak-to-trough drop of the cumulative sum of `pnl` (>= 0)
double max_drawdown(std::span<const double> pnl);

/// mean(returns) / max_drawdown(pnl), 0 when there is no drawdown
double calmar_ratio(std::span<const double> returns, std::span<const double> pnl);

/// Lower (1 − confidence) percentile of the returns
double value_at_risk(std::span<const double> returns, double confidence = 0.95);

/// Mean of the returns at or below value_at_risk (expected shortfall)
double conditional_value_at_risk(std::span<const double> returns, double confidence = 0.95);

/// 1 − Var(hedged) / (Var(unhedged) + 1e-8)
double hedge_effectiveness(std::span<const double> hedged_pnl,
                           std::span<const double> unhedged_pnl);

}  // namespace hedgelab
