// include/hedge_ngin/portfolio/portfolio_manager.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "hedge_ngin/portfolio/types.hpp"
#include "hedge_ngin/risk/risk_manager.hpp"
#include "hedge_ngin/signals/types.hpp"

namespace hedge_ngin {

/**
 * @brief Confidence-weighted vote of a ticker's signals
 */
struct SignalConsensus {
    double bullish_weight{0.0};
    double bearish_weight{0.0};
    double neutral_weight{0.0};
    Direction direction{Direction::NEUTRAL};
    bool tie{false};  // Top weight shared by two or more directions

    nlohmann::json to_json() const;
};

/**
 * @brief Turns signals and risk caps into one order per ticker
 *
 * Stateless: the same signals, limits and portfolio always produce the same orders.
 */
class PortfolioManager {
public:
    /**
     * @brief Sum confidences per direction and pick the strict winner
     */
    static SignalConsensus consensus(const std::vector<Signal>& signals);

    /**
     * @brief Order for a single ticker
     * @param ticker Ticker to decide on
     * @param signals Signals collected for the ticker
     * @param limit Risk limit of the ticker (carries the day's price)
     * @param portfolio Current account state
     * @param margin_requirement Collateral fraction for shorts
     * @param free_cash Cash available to this order
     */
    static Order decide(const std::string& ticker, const std::vector<Signal>& signals,
                        const PositionLimit& limit, const Portfolio& portfolio,
                        double margin_requirement, double free_cash);

    /**
     * @brief Free cash an order draws when executed at the given price
     *
     * Proceeds of sells are not counted back, so the estimate never overstates
     * what later orders of the same day can spend.
     */
    static double cash_drawn(const Order& order, const Portfolio& portfolio, Price price,
                             double margin_requirement);

    /**
     * @brief Orders for every ticker, in ticker order
     *
     * Orders are sized one after another against a running free-cash budget, so the
     * day's orders are affordable together. Tickers without a limit get a hold.
     */
    static std::vector<Order> generate_orders(
        const std::vector<std::string>& tickers,
        const std::map<std::string, std::vector<Signal>>& signals, const RiskLimits& limits,
        const Portfolio& portfolio, double margin_requirement);
};

}  // namespace hedge_ngin
