// SPDX-License-Identifier: MIT
#include "hedgelab/evaluation/performance_metrics.hpp"
#include "hedgelab/math/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <vector>

namespace hedgelab {

namespace {

constexpr double kEpsilon = 1e-8;

std::vector<double> excess(std::span<const double> returns, double risk_free_rate) {
    std::vector<double> out(returns.begin(), returns.end());
    for (double& r : out) {
        r -= risk_free_rate;
    }
    return out;
}

}  // namespace

double sharpe_ratio(std::span<const double> returns, double risk_free_rate) {
    if (returns.empty()) return 0.0;
    auto ex = excess(returns, risk_free_rate);
    return stats::mean(ex) / (stats::stddev(ex) + kEpsilon);
}

double sortino_ratio(std::span<const double> returns, double risk_free_rate) {
    if (returns.empty()) return 0.0;
    auto ex = excess(returns, risk_free_rate);

    std::vector<double> downside;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(downside),
                 [](double r) { return r < 0.0; });
    double downside_std = downside.empty() ? kEpsilon : stats::stddev(downside);

    return stats::mean(ex) / downside_std;
}

double max_drawdown(std::span<const double> pnl) {
    double cumulative = 0.0;
    double peak = 0.0;
    double worst = 0.0;
    bool first = true;
    for (double p : pnl) {
        cumulative += p;
        peak = first ? cumulative : std::max(peak, cumulative);
        first = false;
        worst = std::max(worst, peak - cumulative);
    }
    return worst;
}

double calmar_ratio(std::span<const double> returns, std::span<const double> pnl) {
    double dd = max_drawdown(pnl);
    if (dd > 0.0) {
        return stats::mean(returns) / dd;
    }
    return 0.0;
}

double value_at_risk(std::span<const double> returns, double confidence) {
    return stats::percentile(returns, (1.0 - confidence) * 100.0);
}

double conditional_value_at_risk(std::span<const double> returns, double confidence) {
    if (returns.empty()) return std::nan("");
    double threshold = value_at_risk(returns, confidence);

    std::vector<double> tail;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(tail),
                 [threshold](double r) { return r <= threshold; });
    return stats::mean(tail);
}

double hedge_effectiveness(std::span<const double> hedged_pnl,
                           std::span<const double> unhedged_pnl) {
    return 1.0 - stats::variance(hedged_pnl) / (stats::variance(unhedged_pnl) + kEpsilon);
}

}  // namespace hedgelab
