// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "hedgelab/option/european_option.hpp"
#include <cmath>

namespace hedgelab {
namespace {

// ===========================================================================
// Reference prices
// ===========================================================================

TEST(EuropeanPriceTest, AtTheMoneyCall) {
    // S=K=100, T=1, r=5%, σ=20%
    EXPECT_NEAR(bs_price(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::CALL), 10.450583572185565, 1e-9);
}

TEST(EuropeanPriceTest, AtTheMoneyPut) {
    EXPECT_NEAR(bs_price(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::PUT), 5.573526022256971, 1e-9);
}

TEST(EuropeanPriceTest, InTheMoneyCall) {
    EXPECT_NEAR(bs_price(110.0, 100.0, 1.0, 0.05, 0.2, OptionType::CALL), 17.662953740590453, 1e-9);
}

TEST(EuropeanPriceTest, InTheMoneyPutShortDated) {
    // S=90, K=100, T=0.5, r=3%, σ=25%
    EXPECT_NEAR(bs_price(90.0, 100.0, 0.5, 0.03, 0.25, OptionType::PUT), 11.740148017182378, 1e-9);
}

TEST(EuropeanPriceTest, PutCallParity) {
    // C − P = S − K·e^{−rτ}
    for (double spot : {70.0, 95.0, 100.0, 120.0, 150.0}) {
        double tau = 0.75, rate = 0.04, sigma = 0.3, strike = 100.0;
        double call = bs_price(spot, strike, tau, rate, sigma, OptionType::CALL);
        double put = bs_price(spot, strike, tau, rate, sigma, OptionType::PUT);
        EXPECT_NEAR(call - put, spot - strike * std::exp(-rate * tau), 1e-10) << "S=" << spot;
    }
}

TEST(EuropeanPriceTest, IntrinsicAtExpiry) {
    EXPECT_DOUBLE_EQ(bs_price(120.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL), 20.0);
    EXPECT_DOUBLE_EQ(bs_price(80.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL), 0.0);
    EXPECT_DOUBLE_EQ(bs_price(80.0, 100.0, -0.1, 0.05, 0.2, OptionType::PUT), 20.0);
}

TEST(EuropeanPriceTest, ZeroVolatilityAtTheMoneyIsNaN) {
    // Inputs are not validated: 0/0 in d1 propagates
    EXPECT_TRUE(std::isnan(bs_price(100.0, 100.0, 1.0, 0.0, 0.0, OptionType::CALL)));
}

TEST(EuropeanPriceTest, ContractConvenienceMatches) {
    OptionContract c{.spot = 100.0, .strike = 105.0, .maturity = 0.5,
                     .rate = 0.02, .volatility = 0.3, .option_type = OptionType::PUT};
    EXPECT_DOUBLE_EQ(price(c), bs_price(100.0, 105.0, 0.5, 0.02, 0.3, OptionType::PUT));
    EXPECT_DOUBLE_EQ(greeks(c).delta, bs_greeks(100.0, 105.0, 0.5, 0.02, 0.3, OptionType::PUT).delta);
}

// ===========================================================================
// Greeks
// ===========================================================================

TEST(EuropeanGreeksTest, AtTheMoneyCall) {
    Greeks g = bs_greeks(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::CALL);
    EXPECT_NEAR(g.delta, 0.6368306511756191, 1e-10);
    EXPECT_NEAR(g.gamma, 0.018762017345846895, 1e-10);
    EXPECT_NEAR(g.vega, 0.3752403469169379, 1e-10);     // per 1% vol
    EXPECT_NEAR(g.theta, -0.01757267820941972, 1e-10);  // per day
    EXPECT_NEAR(g.rho, 0.5323248154537634, 1e-10);      // per 1% rate
}

TEST(EuropeanGreeksTest, AtTheMoneyPut) {
    Greeks g = bs_greeks(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::PUT);
    EXPECT_NEAR(g.delta, -0.3631693488243809, 1e-10);
    EXPECT_NEAR(g.gamma, 0.018762017345846895, 1e-10);
    EXPECT_NEAR(g.vega, 0.3752403469169379, 1e-10);
    EXPECT_NEAR(g.theta, -0.004542138147766099, 1e-10);
    EXPECT_NEAR(g.rho, -0.4189046090469506, 1e-10);
}

TEST(EuropeanGreeksTest, DeltaParity) {
    // Δcall − Δput = 1 for any state
    for (double spot : {80.0, 100.0, 125.0}) {
        Greeks c = bs_greeks(spot, 100.0, 0.4, 0.05, 0.25, OptionType::CALL);
        Greeks p = bs_greeks(spot, 100.0, 0.4, 0.05, 0.25, OptionType::PUT);
        EXPECT_NEAR(c.delta - p.delta, 1.0, 1e-12);
        EXPECT_DOUBLE_EQ(c.gamma, p.gamma);
        EXPECT_DOUBLE_EQ(c.vega, p.vega);
    }
}

TEST(EuropeanGreeksTest, CallDeltaBounded) {
    for (double spot : {10.0, 50.0, 100.0, 200.0, 1000.0}) {
        Greeks g = bs_greeks(spot, 100.0, 1.0, 0.05, 0.2, OptionType::CALL);
        EXPECT_GE(g.delta, 0.0);
        EXPECT_LE(g.delta, 1.0);
        EXPECT_GE(g.gamma, 0.0);
    }
}

TEST(EuropeanGreeksTest, GammaMatchesFiniteDifference) {
    const double h = 0.01;
    double up = bs_greeks(100.0 + h, 100.0, 1.0, 0.05, 0.2, OptionType::CALL).delta;
    double dn = bs_greeks(100.0 - h, 100.0, 1.0, 0.05, 0.2, OptionType::CALL).delta;
    double gamma = bs_greeks(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::CALL).gamma;
    EXPECT_NEAR((up - dn) / (2.0 * h), gamma, 1e-6);
}

TEST(EuropeanGreeksTest, ExpiryCallInTheMoney) {
    Greeks g = bs_greeks(110.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL);
    EXPECT_DOUBLE_EQ(g.delta, 1.0);
    EXPECT_DOUBLE_EQ(g.gamma, 0.0);
    EXPECT_DOUBLE_EQ(g.vega, 0.0);
    EXPECT_DOUBLE_EQ(g.theta, 0.0);
    EXPECT_DOUBLE_EQ(g.rho, 0.0);
}

TEST(EuropeanGreeksTest, ExpiryCallOutOfTheMoney) {
    EXPECT_DOUBLE_EQ(bs_greeks(90.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL).delta, 0.0);
    EXPECT_DOUBLE_EQ(bs_greeks(100.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL).delta, 0.0);
}

TEST(EuropeanGreeksTest, ClosedFormNearExpiryCallInTheMoney) {
    // Closed-form branch, not the tau == 0 shortcut
    Greeks g = bs_greeks(110.0, 100.0, 1e-10, 0.05, 0.2, OptionType::CALL);
    EXPECT_NEAR(g.delta, 1.0, 1e-12);
    EXPECT_NEAR(g.gamma, 0.0, 1e-12);
    EXPECT_NEAR(g.vega, 0.0, 1e-12);
    EXPECT_NEAR(g.rho, 0.0, 1e-9);
    // Carry on the strike survives the limit: theta -> -rK/365
    EXPECT_NEAR(g.theta, -0.05 * 100.0 / 365.0, 1e-9);
}

TEST(EuropeanGreeksTest, ClosedFormNearExpiryOutOfTheMoney) {
    Greeks call = bs_greeks(90.0, 100.0, 1e-10, 0.05, 0.2, OptionType::CALL);
    EXPECT_NEAR(call.delta, 0.0, 1e-12);
    EXPECT_NEAR(call.gamma, 0.0, 1e-12);
    EXPECT_NEAR(call.vega, 0.0, 1e-12);
    EXPECT_NEAR(call.theta, 0.0, 1e-12);
    EXPECT_NEAR(call.rho, 0.0, 1e-12);

    Greeks put = bs_greeks(110.0, 100.0, 1e-10, 0.05, 0.2, OptionType::PUT);
    EXPECT_NEAR(put.delta, 0.0, 1e-12);
    EXPECT_NEAR(put.gamma, 0.0, 1e-12);
    EXPECT_NEAR(put.vega, 0.0, 1e-12);
    EXPECT_NEAR(put.theta, 0.0, 1e-12);
    EXPECT_NEAR(put.rho, 0.0, 1e-12);
}

TEST(EuropeanGreeksTest, ExpiryPutDeltaIsZero) {
    // Even deep in the money
    EXPECT_DOUBLE_EQ(bs_greeks(50.0, 100.0, 0.0, 0.05, 0.2, OptionType::PUT).delta, 0.0);
}

// ===========================================================================
// Quote
// ===========================================================================

TEST(EuropeanQuoteTest, MatchesSeparateCalls) {
    for (auto type : {OptionType::CALL, OptionType::PUT}) {
        EuropeanQuote q = bs_quote(95.0, 100.0, 0.3, 0.02, 0.35, type);
        Greeks g = bs_greeks(95.0, 100.0, 0.3, 0.02, 0.35, type);
        EXPECT_NEAR(q.price, bs_price(95.0, 100.0, 0.3, 0.02, 0.35, type), 1e-12);
        EXPECT_NEAR(q.greeks.delta, g.delta, 1e-12);
        EXPECT_NEAR(q.greeks.gamma, g.gamma, 1e-12);
        EXPECT_NEAR(q.greeks.vega, g.vega, 1e-12);
        EXPECT_NEAR(q.greeks.theta, g.theta, 1e-12);
        EXPECT_NEAR(q.greeks.rho, g.rho, 1e-12);
    }
}

TEST(EuropeanQuoteTest, ExpiryQuote) {
    EuropeanQuote q = bs_quote(104.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL);
    EXPECT_DOUBLE_EQ(q.price, 4.0);
    EXPECT_DOUBLE_EQ(q.greeks.delta, 1.0);
}

}  // namespace
}  // namespace hedgelab
