// include/hedge_ngin/portfolio/types.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "hedge_ngin/core/types.hpp"

namespace hedge_ngin {

/**
 * @brief Closing prices of the day, keyed by ticker
 */
using PriceMap = std::map<std::string, Price>;

/**
 * @brief Trading action of an order
 */
enum class Action { BUY, SELL, SHORT, COVER, HOLD };

std::string action_to_string(Action action);
std::optional<Action> action_from_string(const std::string& text);

/**
 * @brief Exactly one per ticker per day
 */
struct Order {
    std::string ticker;
    Action action{Action::HOLD};
    Quantity quantity{0};
    std::string reasoning;

    nlohmann::json to_json() const;
};

/**
 * @brief Holdings in one ticker; long and short sides may both be open
 */
struct Position {
    Quantity long_quantity{0};
    Quantity short_quantity{0};
    double long_cost_basis{0.0};   // Weighted average entry of the long side
    double short_cost_basis{0.0};  // Weighted average entry of the short side
    double short_margin_used{0.0};  // Collateral reserved for the short side

    bool is_flat() const {
        return long_quantity == 0 && short_quantity == 0;
    }

    /**
     * @brief Signed market value: long minus short at the given price
     */
    double market_value(Price price) const {
        return (static_cast<double>(long_quantity) - static_cast<double>(short_quantity)) * price;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Cash, holdings and realized gains of a simulated account
 *
 * margin_used is part of cash that is reserved as short collateral;
 * free_cash() is what buys, covers and new margin can draw on.
 */
struct Portfolio {
    double cash{0.0};
    double margin_used{0.0};
    std::map<std::string, Position> positions;
    std::map<std::string, double> realized_gains;

    double free_cash() const {
        return cash - margin_used;
    }

    /**
     * @brief Cash plus the signed market value of every position
     * @param prices Prices to value at; tickers without a price count as zero
     */
    double total_value(const PriceMap& prices) const;

    /**
     * @brief Sum of the short side valued at the given prices
     */
    double short_exposure(const PriceMap& prices) const;

    double total_realized_gains() const;

    const Position& position(const std::string& ticker) const;

    nlohmann::json to_json() const;
};

/**
 * @brief Holdings of one ticker at a snapshot
 */
struct PositionSnapshot {
    Quantity long_quantity{0};
    Quantity short_quantity{0};
    double long_cost_basis{0.0};
    double short_cost_basis{0.0};
    Price price{0.0};
    double market_value{0.0};

    nlohmann::json to_json() const;
    static PositionSnapshot from_json(const nlohmann::json& j);
};

/**
 * @brief End-of-day record; the series of these feeds every performance metric
 */
struct DailySnapshot {
    Timestamp date;
    double cash{0.0};
    double total_value{0.0};
    double daily_return{0.0};
    double margin_used{0.0};
    double realized_gains{0.0};
    std::map<std::string, PositionSnapshot> positions;

    nlohmann::json to_json() const;

    /**
     * @brief Rebuild a snapshot from to_json output or a portfolio_update payload
     * @throws nlohmann::json::exception on missing or mistyped fields
     */
    static DailySnapshot from_json(const nlohmann::json& j);

    /**
     * @brief Snapshot of a portfolio valued at the given prices
     */
    static DailySnapshot capture(const Timestamp& date, const Portfolio& portfolio,
                                 const PriceMap& prices, double previous_value);
};

}  // namespace hedge_ngin
