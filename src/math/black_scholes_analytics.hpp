// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cmath>

#include "hedgelab/option/option_spec.hpp"

namespace hedgelab {

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF: Φ(x)
inline double norm_cdf(double x) {
    // Use erfc for numerical stability
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// Black-Scholes d1 term
/// d1 = [ln(S/K) + (r + σ²/2)τ] / (σ√τ)
inline double bs_d1(double spot, double strike, double tau, double rate, double sigma) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate + 0.5 * sigma * sigma) * tau) / sigma_sqrt_tau;
}

/// Payoff at expiry: max(S-K, 0) for calls, max(K-S, 0) for puts
inline double intrinsic_value(double spot, double strike, OptionType option_type) {
    if (option_type == OptionType::PUT) {
        return std::max(strike - spot, 0.0);
    }
    return std::max(spot - strike, 0.0);
}

}  // namespace hedgelab
