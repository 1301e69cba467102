// src/portfolio/types.cpp

#include "hedge_ngin/portfolio/types.hpp"
#include <algorithm>
#include <cctype>
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {

std::string action_to_string(Action action) {
    switch (action) {
        case Action::BUY:
            return "buy";
        case Action::SELL:
            return "sell";
        case Action::SHORT:
            return "short";
        case Action::COVER:
            return "cover";
        case Action::HOLD:
            return "hold";
        default:
            return "hold";
    }
}

std::optional<Action> action_from_string(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "buy")
        return Action::BUY;
    if (lower == "sell")
        return Action::SELL;
    if (lower == "short")
        return Action::SHORT;
    if (lower == "cover")
        return Action::COVER;
    if (lower == "hold")
        return Action::HOLD;
    return std::nullopt;
}

nlohmann::json Order::to_json() const {
    nlohmann::json j;
    j["ticker"] = ticker;
    j["action"] = action_to_string(action);
    j["quantity"] = quantity;
    j["reasoning"] = reasoning;
    return j;
}

nlohmann::json Position::to_json() const {
    nlohmann::json j;
    j["long"] = long_quantity;
    j["short"] = short_quantity;
    j["long_cost_basis"] = long_cost_basis;
    j["short_cost_basis"] = short_cost_basis;
    j["short_margin_used"] = short_margin_used;
    return j;
}

double Portfolio::total_value(const PriceMap& prices) const {
    double value = cash;
    for (const auto& [ticker, position] : positions) {
        auto it = prices.find(ticker);
        if (it != prices.end()) {
            value += position.market_value(it->second);
        }
    }
    return value;
}

double Portfolio::short_exposure(const PriceMap& prices) const {
    double exposure = 0.0;
    for (const auto& [ticker, position] : positions) {
        auto it = prices.find(ticker);
        if (it != prices.end()) {
            exposure += static_cast<double>(position.short_quantity) * it->second;
        }
    }
    return exposure;
}

double Portfolio::total_realized_gains() const {
    double total = 0.0;
    for (const auto& entry : realized_gains) {
        total += entry.second;
    }
    return total;
}

const Position& Portfolio::position(const std::string& ticker) const {
    static const Position empty{};
    auto it = positions.find(ticker);
    return it != positions.end() ? it->second : empty;
}

nlohmann::json Portfolio::to_json() const {
    nlohmann::json j;
    j["cash"] = cash;
    j["margin_used"] = margin_used;

    nlohmann::json positions_json = nlohmann::json::object();
    for (const auto& [ticker, position] : positions) {
        positions_json[ticker] = position.to_json();
    }
    j["positions"] = positions_json;

    nlohmann::json gains_json = nlohmann::json::object();
    for (const auto& [ticker, gain] : realized_gains) {
        gains_json[ticker] = gain;
    }
    j["realized_gains"] = gains_json;
    return j;
}

nlohmann::json PositionSnapshot::to_json() const {
    nlohmann::json j;
    j["long"] = long_quantity;
    j["short"] = short_quantity;
    j["long_cost_basis"] = long_cost_basis;
    j["short_cost_basis"] = short_cost_basis;
    j["price"] = price;
    j["market_value"] = market_value;
    return j;
}

PositionSnapshot PositionSnapshot::from_json(const nlohmann::json& j) {
    PositionSnapshot snapshot;
    snapshot.long_quantity = j.at("long").get<Quantity>();
    snapshot.short_quantity = j.at("short").get<Quantity>();
    snapshot.long_cost_basis = j.at("long_cost_basis").get<double>();
    snapshot.short_cost_basis = j.at("short_cost_basis").get<double>();
    snapshot.price = j.at("price").get<double>();
    snapshot.market_value = j.at("market_value").get<double>();
    return snapshot;
}

nlohmann::json DailySnapshot::to_json() const {
    nlohmann::json j;
    j["date"] = core::format_date(date);
    j["cash"] = cash;
    j["total_value"] = total_value;
    j["daily_return"] = daily_return;
    j["margin_used"] = margin_used;
    j["realized_gains"] = realized_gains;

    nlohmann::json positions_json = nlohmann::json::object();
    for (const auto& [ticker, position] : positions) {
        positions_json[ticker] = position.to_json();
    }
    j["positions"] = positions_json;
    return j;
}

DailySnapshot DailySnapshot::from_json(const nlohmann::json& j) {
    DailySnapshot snapshot;
    auto date = core::parse_date(j.at("date").get<std::string>());
    if (!date) {
        throw HedgeError(ErrorCode::CONVERSION_ERROR,
                         "Invalid snapshot date: " + j.at("date").get<std::string>(),
                         "DailySnapshot");
    }
    snapshot.date = *date;
    snapshot.cash = j.at("cash").get<double>();
    snapshot.total_value = j.at("total_value").get<double>();
    snapshot.daily_return = j.at("daily_return").get<double>();
    snapshot.margin_used = j.at("margin_used").get<double>();
    snapshot.realized_gains = j.at("realized_gains").get<double>();
    for (const auto& [ticker, position] : j.at("positions").items()) {
        snapshot.positions[ticker] = PositionSnapshot::from_json(position);
    }
    return snapshot;
}

DailySnapshot DailySnapshot::capture(const Timestamp& date, const Portfolio& portfolio,
                                     const PriceMap& prices, double previous_value) {
    DailySnapshot snapshot;
    snapshot.date = date;
    snapshot.cash = portfolio.cash;
    snapshot.total_value = portfolio.total_value(prices);
    snapshot.daily_return =
        previous_value > 0.0 ? snapshot.total_value / previous_value - 1.0 : 0.0;
    snapshot.margin_used = portfolio.margin_used;
    snapshot.realized_gains = portfolio.total_realized_gains();

    for (const auto& [ticker, position] : portfolio.positions) {
        if (position.is_flat()) {
            continue;
        }
        PositionSnapshot entry;
        entry.long_quantity = position.long_quantity;
        entry.short_quantity = position.short_quantity;
        entry.long_cost_basis = position.long_cost_basis;
        entry.short_cost_basis = position.short_cost_basis;
        auto it = prices.find(ticker);
        entry.price = it != prices.end() ? it->second : 0.0;
        entry.market_value = position.market_value(entry.price);
        snapshot.positions[ticker] = entry;
    }
    return snapshot;
}

}  // namespace hedge_ngin
