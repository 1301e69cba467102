// src/risk/risk_manager.cpp

#include "hedge_ngin/risk/risk_manager.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace hedge_ngin {

namespace {

Quantity floor_shares(double value) {
    if (!(value > 0.0)) {
        return 0;
    }
    // Guard against 599.9999999 style artefacts of value / price
    double shares = std::floor(value + 1e-9);
    // Tiny margin requirements push the quotient past what a Quantity can hold
    if (shares >= static_cast<double>(std::numeric_limits<Quantity>::max())) {
        return std::numeric_limits<Quantity>::max();
    }
    return static_cast<Quantity>(shares);
}

}  // namespace

nlohmann::json PositionLimit::to_json() const {
    nlohmann::json j;
    j["ticker"] = ticker;
    j["price"] = price;
    j["position_limit_value"] = position_limit_value;
    j["remaining_position_value"] = remaining_position_value;
    j["share_limit"] = share_limit;
    j["margin_limit"] = margin_limit;
    j["max_shares"] = max_shares;
    j["reasoning"] = reasoning;
    return j;
}

RiskManager::RiskManager(RiskConfig config) : config_(std::move(config)) {}

Result<void> RiskManager::update_config(const RiskConfig& config) {
    if (!(config.max_position_fraction > 0.0) || config.max_position_fraction > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_position_fraction must be in (0, 1]", "RiskManager");
    }
    config_ = config;
    return Result<void>();
}

Result<RiskLimits> RiskManager::compute_limits(
    const Portfolio& portfolio, const PriceMap& prices, const std::vector<std::string>& tickers,
    const std::map<std::string, std::vector<Signal>>& signals, double margin_requirement) const {
    if (!(margin_requirement >= 0.0) || margin_requirement > 1.0) {
        return make_error<RiskLimits>(ErrorCode::INVALID_ARGUMENT,
                                      "Margin requirement must be in [0, 1]", "RiskManager");
    }

    const double total_value = portfolio.total_value(prices);
    const double free_cash = std::max(0.0, portfolio.free_cash());
    const double short_exposure = portfolio.short_exposure(prices);

    RiskLimits limits;
    for (const auto& ticker : tickers) {
        PositionLimit limit;
        limit.ticker = ticker;

        auto price_it = prices.find(ticker);
        if (price_it == prices.end() || !(price_it->second > 0.0)) {
            limit.reasoning = "No price available";
            limits[ticker] = limit;
            continue;
        }

        const Price price = price_it->second;
        const Position& position = portfolio.position(ticker);
        limit.price = price;
        limit.position_limit_value = config_.max_position_fraction * std::max(0.0, total_value);

        double current_exposure =
            static_cast<double>(position.long_quantity + position.short_quantity) * price;
        limit.remaining_position_value =
            std::max(0.0, limit.position_limit_value - current_exposure);
        limit.share_limit = floor_shares(limit.remaining_position_value / price);

        if (margin_requirement > 0.0) {
            Quantity by_free_cash = floor_shares(free_cash / (price * margin_requirement));
            double short_headroom =
                std::max(0.0, total_value / margin_requirement - short_exposure);
            Quantity by_aggregate = floor_shares(short_headroom / price);
            limit.margin_limit = std::min(by_free_cash, by_aggregate);
        } else {
            limit.margin_limit = limit.share_limit;
        }

        limit.max_shares = std::max<Quantity>(0, std::min(limit.share_limit, limit.margin_limit));

        std::ostringstream reasoning;
        reasoning << "Limit " << limit.position_limit_value << ", exposure " << current_exposure
                  << ", remaining " << limit.remaining_position_value;
        auto signal_it = signals.find(ticker);
        if (signal_it != signals.end()) {
            reasoning << ", " << signal_it->second.size() << " signals";
        }
        limit.reasoning = reasoning.str();

        limits[ticker] = limit;
    }

    return Result<RiskLimits>(std::move(limits));
}

}  // namespace hedge_ngin
