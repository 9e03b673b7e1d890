// SPDX-License-Identifier: MIT
#include "hedgelab/hedging/portfolio.hpp"
#include <cmath>

namespace hedgelab {

Record TradeInfo::to_record() const {
    return {
        {"stock_trade", stock_trade},
        {"transaction_cost", transaction_cost},
        {"new_position", new_position},
    };
}

Record PortfolioValue::to_record() const {
    return {
        {"portfolio_value", portfolio_value},
        {"cash", cash},
        {"stock_value", stock_value},
        {"option_value", option_value},
        {"option_liability", option_liability},
    };
}

Portfolio::Portfolio(double transaction_cost_rate)
    : transaction_cost_rate_(transaction_cost_rate)
{}

TradeInfo Portfolio::trade_to(double target, double spot) {
    double trade = target - stock_position_;
    double cost = std::abs(trade) * spot * transaction_cost_rate_;

    cash_ -= trade * spot + cost;
    stock_position_ = target;
    total_costs_ += cost;

    return TradeInfo{
        .stock_trade = trade,
        .transaction_cost = cost,
        .new_position = stock_position_
    };
}

void Portfolio::accrue_interest(double rate, double dt) {
    cash_ *= std::exp(rate * dt);
}

PortfolioValue Portfolio::mark_to_market(double spot, double option_value) const {
    PortfolioValue v;
    v.cash = cash_;
    v.stock_value = stock_position_ * spot;
    v.option_value = option_value;
    v.option_liability = kOptionPosition * option_value;
    v.portfolio_value = v.cash + v.stock_value + v.option_liability;
    return v;
}

void Portfolio::reset() {
    cash_ = 0.0;
    stock_position_ = 0.0;
    total_costs_ = 0.0;
}

}  // namespace hedgelab
