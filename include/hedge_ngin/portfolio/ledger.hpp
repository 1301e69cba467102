// include/hedge_ngin/portfolio/ledger.hpp
#pragma once

#include <vector>
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/portfolio/types.hpp"

namespace hedge_ngin {

/**
 * @brief Account state of one session plus its append-only snapshot history
 *
 * Margin model: a short credits its full proceeds to cash and reserves
 * quantity * price * margin_requirement of that cash as collateral. Buys, covers
 * and new collateral draw on free cash only, so cash >= margin_used >= 0 holds
 * after every committed fill.
 */
class PortfolioLedger {
public:
    static constexpr double kTolerance = 1e-6;

    PortfolioLedger(double initial_cash, double margin_requirement);

    /**
     * @brief Apply one fill to a portfolio
     *
     * Validates before mutating: on error the portfolio is unchanged.
     *
     * @param portfolio Portfolio to update
     * @param ticker Ticker traded
     * @param action Trade direction; HOLD is a no-op
     * @param quantity Shares, must be >= 0
     * @param price Fill price, must be > 0 for a non-zero trade
     * @param margin_requirement Collateral fraction for shorts
     * @return Realized gain of the fill (0 for opening trades), or
     *         INVALID_ORDER / INSUFFICIENT_FUNDS
     */
    static Result<double> apply_fill(Portfolio& portfolio, const std::string& ticker,
                                     Action action, Quantity quantity, Price price,
                                     double margin_requirement);

    /**
     * @brief Check the bookkeeping invariants of a portfolio
     * @return COMPUTE_ERROR describing the first violation
     */
    static Result<void> check_invariants(const Portfolio& portfolio);

    /**
     * @brief Replace the account state with a validated working copy
     * @return COMPUTE_ERROR if the copy violates an invariant; state is unchanged then
     */
    Result<void> commit(const Portfolio& updated);

    /**
     * @brief Append the end-of-day snapshot valued at the given prices
     * @return COMPUTE_ERROR if the date does not follow the last snapshot
     */
    Result<DailySnapshot> record_snapshot(const Timestamp& date, const PriceMap& prices);

    const Portfolio& portfolio() const {
        return portfolio_;
    }

    const std::vector<DailySnapshot>& history() const {
        return history_;
    }

    double initial_cash() const {
        return initial_cash_;
    }

    double margin_requirement() const {
        return margin_requirement_;
    }

    /**
     * @brief Value of the last snapshot, or the initial cash before the first one
     */
    double last_value() const {
        return history_.empty() ? initial_cash_ : history_.back().total_value;
    }

private:
    Portfolio portfolio_;
    std::vector<DailySnapshot> history_;
    double initial_cash_;
    double margin_requirement_;
};

}  // namespace hedge_ngin
