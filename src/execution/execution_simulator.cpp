// src/execution/execution_simulator.cpp

#include "hedge_ngin/execution/execution_simulator.hpp"
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {

nlohmann::json ExecutionReport::to_json() const {
    nlohmann::json j = order.to_json();
    j["price"] = price;
    j["notional"] = notional;
    j["realized_gain"] = realized_gain;
    j["portfolio_value"] = portfolio_value;
    return j;
}

Result<std::vector<ExecutionReport>> ExecutionSimulator::execute(PortfolioLedger& ledger,
                                                                 const std::vector<Order>& orders,
                                                                 const PriceMap& prices,
                                                                 const PriceMap& valuation_prices) {
    Portfolio working = ledger.portfolio();
    std::vector<ExecutionReport> reports;

    for (const auto& order : orders) {
        if (order.action == Action::HOLD) {
            continue;
        }

        auto price_it = prices.find(order.ticker);
        if (price_it == prices.end()) {
            return make_error<std::vector<ExecutionReport>>(
                ErrorCode::COMPUTE_ERROR,
                "No closing price for " + order.ticker + " " + action_to_string(order.action),
                "ExecutionSimulator");
        }

        auto fill = PortfolioLedger::apply_fill(working, order.ticker, order.action,
                                                order.quantity, price_it->second,
                                                ledger.margin_requirement());
        if (fill.is_error()) {
            return make_error<std::vector<ExecutionReport>>(
                ErrorCode::COMPUTE_ERROR,
                "Order " + action_to_string(order.action) + " " +
                    std::to_string(order.quantity) + " " + order.ticker +
                    " rejected: " + fill.error()->what(),
                "ExecutionSimulator");
        }

        ExecutionReport report;
        report.order = order;
        report.price = price_it->second;
        report.notional = static_cast<double>(order.quantity) * price_it->second;
        report.realized_gain = fill.value();
        report.portfolio_value = working.total_value(valuation_prices);
        reports.push_back(report);
    }

    auto committed = ledger.commit(working);
    if (committed.is_error()) {
        return forward_error<std::vector<ExecutionReport>>(committed.error());
    }

    DEBUG("Executed " << reports.size() << " orders, cash " << ledger.portfolio().cash);
    return Result<std::vector<ExecutionReport>>(std::move(reports));
}

}  // namespace hedge_ngin
