// src/portfolio/portfolio_manager.cpp

#include "hedge_ngin/portfolio/portfolio_manager.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace hedge_ngin {

namespace {

Quantity affordable_shares(double cash, double price_per_share) {
    if (!(cash > 0.0) || !(price_per_share > 0.0)) {
        return 0;
    }
    double shares = std::floor(cash / price_per_share + 1e-9);
    if (shares >= static_cast<double>(std::numeric_limits<Quantity>::max())) {
        return std::numeric_limits<Quantity>::max();
    }
    return static_cast<Quantity>(shares);
}

Order hold(const std::string& ticker, const std::string& reasoning) {
    Order order;
    order.ticker = ticker;
    order.action = Action::HOLD;
    order.quantity = 0;
    order.reasoning = reasoning;
    return order;
}

}  // namespace

nlohmann::json SignalConsensus::to_json() const {
    nlohmann::json j;
    j["bullish_weight"] = bullish_weight;
    j["bearish_weight"] = bearish_weight;
    j["neutral_weight"] = neutral_weight;
    j["direction"] = direction_to_string(direction);
    j["tie"] = tie;
    return j;
}

SignalConsensus PortfolioManager::consensus(const std::vector<Signal>& signals) {
    SignalConsensus result;
    for (const auto& signal : signals) {
        switch (signal.direction) {
            case Direction::BULLISH:
                result.bullish_weight += signal.confidence;
                break;
            case Direction::BEARISH:
                result.bearish_weight += signal.confidence;
                break;
            case Direction::NEUTRAL:
                result.neutral_weight += signal.confidence;
                break;
        }
    }

    const double top =
        std::max({result.bullish_weight, result.bearish_weight, result.neutral_weight});
    int at_top = (result.bullish_weight == top) + (result.bearish_weight == top) +
                 (result.neutral_weight == top);

    if (at_top > 1) {
        result.tie = true;
        result.direction = Direction::NEUTRAL;
    } else if (result.bullish_weight == top) {
        result.direction = Direction::BULLISH;
    } else if (result.bearish_weight == top) {
        result.direction = Direction::BEARISH;
    } else {
        result.direction = Direction::NEUTRAL;
    }
    return result;
}

Order PortfolioManager::decide(const std::string& ticker, const std::vector<Signal>& signals,
                               const PositionLimit& limit, const Portfolio& portfolio,
                               double margin_requirement, double free_cash) {
    SignalConsensus vote = consensus(signals);

    std::ostringstream weights;
    weights << "bullish " << vote.bullish_weight << " / bearish " << vote.bearish_weight
            << " / neutral " << vote.neutral_weight;

    if (vote.tie) {
        return hold(ticker, "Tied consensus (" + weights.str() + ")");
    }
    if (vote.direction == Direction::NEUTRAL) {
        return hold(ticker, "Neutral consensus (" + weights.str() + ")");
    }

    const Price price = limit.price;
    if (!(price > 0.0)) {
        return hold(ticker, "No price available");
    }

    const Position& position = portfolio.position(ticker);

    Order order;
    order.ticker = ticker;

    if (vote.direction == Direction::BULLISH) {
        if (position.short_quantity > 0) {
            // Each covered share frees its slice of collateral: q * (p - margin/share) <= cash
            double margin_per_share =
                position.short_margin_used / static_cast<double>(position.short_quantity);
            double net_cost = price - margin_per_share;
            order.action = Action::COVER;
            order.quantity = net_cost > 0.0
                                 ? std::min(position.short_quantity,
                                            affordable_shares(free_cash, net_cost))
                                 : position.short_quantity;
        } else {
            order.action = Action::BUY;
            order.quantity = std::min(limit.max_shares, affordable_shares(free_cash, price));
        }
    } else {
        if (position.long_quantity > 0) {
            order.action = Action::SELL;
            order.quantity = position.long_quantity;
        } else {
            order.action = Action::SHORT;
            Quantity margin_affordable = margin_requirement > 0.0
                                             ? affordable_shares(free_cash, price * margin_requirement)
                                             : std::numeric_limits<Quantity>::max();
            order.quantity = std::min(limit.max_shares, margin_affordable);
        }
    }

    if (order.quantity <= 0) {
        return hold(ticker, "No capacity for " + action_to_string(order.action) + " (" +
                                weights.str() + ")");
    }

    order.reasoning = direction_to_string(vote.direction) + " consensus (" + weights.str() + ")";
    return order;
}

std::vector<Order> PortfolioManager::generate_orders(
    const std::vector<std::string>& tickers,
    const std::map<std::string, std::vector<Signal>>& signals, const RiskLimits& limits,
    const Portfolio& portfolio, double margin_requirement) {
    static const std::vector<Signal> no_signals;

    double budget = portfolio.free_cash();
    std::vector<Order> orders;
    orders.reserve(tickers.size());
    for (const auto& ticker : tickers) {
        auto limit_it = limits.find(ticker);
        if (limit_it == limits.end()) {
            orders.push_back(hold(ticker, "No risk limit"));
            continue;
        }
        auto signal_it = signals.find(ticker);
        const auto& ticker_signals = signal_it != signals.end() ? signal_it->second : no_signals;
        Order order = decide(ticker, ticker_signals, limit_it->second, portfolio,
                             margin_requirement, budget);
        budget -= cash_drawn(order, portfolio, limit_it->second.price, margin_requirement);
        orders.push_back(std::move(order));
    }
    return orders;
}

double PortfolioManager::cash_drawn(const Order& order, const Portfolio& portfolio, Price price,
                                    double margin_requirement) {
    const double notional = static_cast<double>(order.quantity) * price;
    switch (order.action) {
        case Action::BUY:
            return notional;
        case Action::SHORT:
            return notional * margin_requirement;
        case Action::COVER: {
            const Position& position = portfolio.position(order.ticker);
            double release = position.short_quantity > 0
                                 ? position.short_margin_used * order.quantity /
                                       static_cast<double>(position.short_quantity)
                                 : 0.0;
            return notional - release;
        }
        case Action::SELL:
        case Action::HOLD:
        default:
            return 0.0;
    }
}

}  // namespace hedge_ngin
