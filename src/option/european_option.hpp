// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option pricing with closed-form Black-Scholes formulas
 *
 * Stateless pricing engine shared by the hedging environment, the baseline
 * strategies and the evaluator. Inputs are not validated: σ <= 0 with
 * τ > 0 propagates NaN/inf, and callers clamp τ >= 0 themselves.
 *
 * Greeks follow desk conventions rather than raw derivatives:
 * - vega and rho are per 1% move (divided by 100)
 * - theta is per calendar day (divided by 365)
 */

#pragma once

#include "hedgelab/option/option_spec.hpp"
#include "hedgelab/math/black_scholes_analytics.hpp"
#include <cmath>

namespace hedgelab {

/// First and second order sensitivities of a European option
struct Greeks {
    double delta = 0.0;  ///< ∂V/∂S
    double gamma = 0.0;  ///< ∂²V/∂S²
    double vega = 0.0;   ///< ∂V/∂σ per 1% volatility
    double theta = 0.0;  ///< ∂V/∂t per calendar day
    double rho = 0.0;    ///< ∂V/∂r per 1% rate
};

/// Price and Greeks from a single d1/d2 evaluation
struct EuropeanQuote {
    double price = 0.0;
    Greeks greeks;
};

/// Black-Scholes European option price
///
/// @param spot Current underlying price
/// @param strike Strike price
/// @param tau Time to expiry in years
/// @param rate Risk-free rate
/// @param sigma Volatility
/// @param option_type PUT or CALL
/// @return Option price; intrinsic value when tau <= 0
double bs_price(double spot, double strike, double tau, double rate, double sigma,
                OptionType option_type);

/// Black-Scholes Greeks
///
/// At tau <= 0 delta is 1 for an in-the-money call and 0 otherwise
/// (puts included); all other Greeks are 0.
Greeks bs_greeks(double spot, double strike, double tau, double rate, double sigma,
                 OptionType option_type);

/// Price and Greeks together
EuropeanQuote bs_quote(double spot, double strike, double tau, double rate, double sigma,
                       OptionType option_type);

/// Contract-level convenience: price at the contract's own spot and maturity
inline double price(const OptionContract& c) {
    return bs_price(c.spot, c.strike, c.maturity, c.rate, c.volatility, c.option_type);
}

/// Contract-level convenience: Greeks at the contract's own spot and maturity
inline Greeks greeks(const OptionContract& c) {
    return bs_greeks(c.spot, c.strike, c.maturity, c.rate, c.volatility, c.option_type);
}

}  // namespace hedgelab
