// src/signals/trend_signal_producer.cpp

#include "hedge_ngin/signals/trend_signal_producer.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace hedge_ngin {

TrendSignalProducer::TrendSignalProducer(std::string id, TrendConfig config)
    : id_(std::move(id)), config_(config) {}

std::vector<double> TrendSignalProducer::calculate_ewma(const std::vector<double>& prices,
                                                        int span) {
    std::vector<double> ewma;
    if (prices.empty() || span < 1) {
        return ewma;
    }

    const double alpha = 2.0 / (span + 1.0);
    ewma.reserve(prices.size());
    ewma.push_back(prices[0]);
    for (size_t i = 1; i < prices.size(); ++i) {
        ewma.push_back(alpha * prices[i] + (1.0 - alpha) * ewma.back());
    }
    return ewma;
}

double TrendSignalProducer::calculate_return_volatility(const std::vector<double>& prices) {
    if (prices.size() < 3) {
        return 0.0;
    }

    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] > 0.0) {
            returns.push_back(prices[i] / prices[i - 1] - 1.0);
        }
    }
    if (returns.empty()) {
        return 0.0;
    }

    double mean = 0.0;
    for (double r : returns) {
        mean += r;
    }
    mean /= returns.size();

    double sum_sq = 0.0;
    for (double r : returns) {
        sum_sq += (r - mean) * (r - mean);
    }
    return std::sqrt(sum_sq / returns.size());
}

Result<Signal> TrendSignalProducer::generate_signal(const SignalContext& context) const {
    Signal signal;
    signal.producer_id = id_;
    signal.ticker = context.ticker;
    signal.date = context.date;

    auto prices = context.closes();
    if (prices.size() < static_cast<size_t>(std::max(config_.min_history, 2))) {
        signal.direction = Direction::NEUTRAL;
        signal.reasoning = "Insufficient history (" + std::to_string(prices.size()) + " bars)";
        return Result<Signal>(std::move(signal));
    }

    auto fast = calculate_ewma(prices, config_.fast_window);
    auto slow = calculate_ewma(prices, config_.slow_window);
    double price = prices.back();
    double volatility = calculate_return_volatility(prices);

    double forecast = 0.0;
    if (price > 0.0 && volatility > 1e-8) {
        forecast = (fast.back() - slow.back()) / (price * volatility / 16.0);
    }
    forecast = std::clamp(forecast, -config_.forecast_cap, config_.forecast_cap);

    if (std::abs(forecast) < config_.neutral_band) {
        signal.direction = Direction::NEUTRAL;
    } else {
        signal.direction = forecast > 0.0 ? Direction::BULLISH : Direction::BEARISH;
    }
    signal.confidence = std::min(100.0, std::abs(forecast) / config_.forecast_cap * 100.0);

    std::ostringstream reasoning;
    reasoning << "EWMA(" << config_.fast_window << ")=" << fast.back() << " vs EWMA("
              << config_.slow_window << ")=" << slow.back() << ", forecast " << forecast;
    signal.reasoning = reasoning.str();

    return Result<Signal>(std::move(signal));
}

}  // namespace hedge_ngin
