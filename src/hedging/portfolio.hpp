// SPDX-License-Identifier: MIT
/**
 * @file portfolio.hpp
 * @brief Cash / stock / short-option book shared by strategies and the environment
 */

#pragma once

#include "hedgelab/support/record.hpp"

namespace hedgelab {

/// Outcome of moving the stock position to a new target
struct TradeInfo {
    double stock_trade = 0.0;        ///< Signed number of shares bought (+) or sold (-)
    double transaction_cost = 0.0;   ///< |trade| · S · cost rate
    double new_position = 0.0;       ///< Stock position after the trade

    Record to_record() const;
};

/// Mark-to-market breakdown of the book
struct PortfolioValue {
    double portfolio_value = 0.0;    ///< cash + stock_value + option_liability
    double cash = 0.0;
    double stock_value = 0.0;        ///< stock_position · S
    double option_value = 0.0;       ///< Fair value of one option (intrinsic at expiry)
    double option_liability = 0.0;   ///< option_position · option_value (negative when short)

    Record to_record() const;
};

/**
 * @brief Book for a hedger that is short exactly one option contract
 *
 * Owns cash, the stock hedge and cumulative transaction costs. Every trade,
 * whatever its origin, goes through trade_to() so that costs and cash are
 * booked identically:
 *
 *   cost  = |Δ| · S · transaction_cost_rate
 *   cash -= Δ · S + cost
 *
 * Total transaction cost is non-decreasing for any non-negative rate.
 */
class Portfolio {
public:
    /// Always short one contract
    static constexpr double kOptionPosition = -1.0;

    explicit Portfolio(double transaction_cost_rate);

    /// Credit the premium received for selling the option
    void credit_premium(double premium) { cash_ += premium; }

    /// Trade the stock position to `target` at price `spot`
    TradeInfo trade_to(double target, double spot);

    /// Grow cash at the risk-free rate over dt: cash *= exp(r·dt)
    void accrue_interest(double rate, double dt);

    /// Value the book given the current option fair value
    PortfolioValue mark_to_market(double spot, double option_value) const;

    /// Flatten everything (new episode)
    void reset();

    double cash() const { return cash_; }
    double stock_position() const { return stock_position_; }
    double option_position() const { return kOptionPosition; }
    double total_costs() const { return total_costs_; }
    double transaction_cost_rate() const { return transaction_cost_rate_; }

private:
    double transaction_cost_rate_;
    double cash_ = 0.0;
    double stock_position_ = 0.0;
    double total_costs_ = 0.0;
};

}  // namespace hedgelab
