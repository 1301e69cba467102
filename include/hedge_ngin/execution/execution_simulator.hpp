// include/hedge_ngin/execution/execution_simulator.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/portfolio/ledger.hpp"
#include "hedge_ngin/portfolio/types.hpp"

namespace hedge_ngin {

/**
 * @brief Outcome of one executed order
 */
struct ExecutionReport {
    Order order;
    Price price{0.0};
    double notional{0.0};
    double realized_gain{0.0};
    double portfolio_value{0.0};  // Total value right after this fill

    nlohmann::json to_json() const;
};

/**
 * @brief Fills a day's orders at the closing price
 *
 * All orders are applied to a working copy of the account first. The copy replaces the
 * ledger's state only when every order filled and the invariants hold; otherwise the
 * ledger is left exactly as it was.
 */
class ExecutionSimulator {
public:
    /**
     * @brief Execute the orders of one day
     * @param ledger Ledger to update
     * @param orders One order per ticker
     * @param prices Closing prices of the day
     * @param valuation_prices Prices used to value the account after each fill
     * @return One report per non-hold order, or COMPUTE_ERROR
     */
    static Result<std::vector<ExecutionReport>> execute(PortfolioLedger& ledger,
                                                        const std::vector<Order>& orders,
                                                        const PriceMap& prices,
                                                        const PriceMap& valuation_prices);
};

}  // namespace hedge_ngin
