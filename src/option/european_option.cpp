// SPDX-License-Identifier: MIT
#include "hedgelab/option/european_option.hpp"
#include <cmath>

namespace hedgelab {

namespace {

constexpr double kPerPercent = 1.0 / 100.0;
constexpr double kPerDay = 1.0 / 365.0;

/// Price once d1/d2 are known (tau > 0)
double price_from_d(double spot, double strike, double tau, double rate,
                    OptionType option_type, double d1, double d2) {
    double exp_rt = std::exp(-rate * tau);
    if (option_type == OptionType::PUT) {
        return strike * exp_rt * norm_cdf(-d2) - spot * norm_cdf(-d1);
    }
    return spot * norm_cdf(d1) - strike * exp_rt * norm_cdf(d2);
}

/// Greeks once d1/d2 are known (tau > 0)
Greeks greeks_from_d(double spot, double strike, double tau, double rate, double sigma,
                     OptionType option_type, double d1, double d2) {
    double sqrt_tau = std::sqrt(tau);
    double exp_rt = std::exp(-rate * tau);
    double pdf_d1 = norm_pdf(d1);

    Greeks g;
    g.gamma = pdf_d1 / (spot * sigma * sqrt_tau);
    g.vega = spot * pdf_d1 * sqrt_tau * kPerPercent;

    // Common term: -S·φ(d1)·σ/(2√τ)
    double common = -(spot * pdf_d1 * sigma) / (2.0 * sqrt_tau);

    if (option_type == OptionType::PUT) {
        g.delta = -norm_cdf(-d1);
        g.theta = (common + rate * strike * exp_rt * norm_cdf(-d2)) * kPerDay;
        g.rho = -strike * tau * exp_rt * norm_cdf(-d2) * kPerPercent;
    } else {
        g.delta = norm_cdf(d1);
        g.theta = (common - rate * strike * exp_rt * norm_cdf(d2)) * kPerDay;
        g.rho = strike * tau * exp_rt * norm_cdf(d2) * kPerPercent;
    }
    return g;
}

Greeks expiry_greeks(double spot, double strike, OptionType option_type) {
    Greeks g;
    // Only in-the-money calls carry delta at expiry; puts report 0.
    g.delta = (option_type == OptionType::CALL && spot > strike) ? 1.0 : 0.0;
    return g;
}

}  // namespace

double bs_price(double spot, double strike, double tau, double rate, double sigma,
                OptionType option_type) {
    if (tau <= 0.0) {
        return intrinsic_value(spot, strike, option_type);
    }
    double d1 = bs_d1(spot, strike, tau, rate, sigma);
    double d2 = d1 - sigma * std::sqrt(tau);
    return price_from_d(spot, strike, tau, rate, option_type, d1, d2);
}

Greeks bs_greeks(double spot, double strike, double tau, double rate, double sigma,
                 OptionType option_type) {
    if (tau <= 0.0) {
        return expiry_greeks(spot, strike, option_type);
    }
    double d1 = bs_d1(spot, strike, tau, rate, sigma);
    double d2 = d1 - sigma * std::sqrt(tau);
    return greeks_from_d(spot, strike, tau, rate, sigma, option_type, d1, d2);
}

EuropeanQuote bs_quote(double spot, double strike, double tau, double rate, double sigma,
                       OptionType option_type) {
    if (tau <= 0.0) {
        return EuropeanQuote{
            .price = intrinsic_value(spot, strike, option_type),
            .greeks = expiry_greeks(spot, strike, option_type)
        };
    }

    double d1 = bs_d1(spot, strike, tau, rate, sigma);
    double d2 = d1 - sigma * std::sqrt(tau);
    return EuropeanQuote{
        .price = price_from_d(spot, strike, tau, rate, option_type, d1, d2),
        .greeks = greeks_from_d(spot, strike, tau, rate, sigma, option_type, d1, d2)
    };
}

}  // namespace hedgelab
