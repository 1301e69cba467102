// src/signals/mean_reversion_signal_producer.cpp

#include "hedge_ngin/signals/mean_reversion_signal_producer.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace hedge_ngin {

MeanReversionSignalProducer::MeanReversionSignalProducer(std::string id,
                                                         MeanReversionConfig config)
    : id_(std::move(id)), config_(config) {}

double MeanReversionSignalProducer::calculate_sma(const std::vector<double>& prices, int period) {
    if (prices.empty() || period < 1) {
        return 0.0;
    }
    size_t n = std::min(prices.size(), static_cast<size_t>(period));
    double sum = 0.0;
    for (size_t i = prices.size() - n; i < prices.size(); ++i) {
        sum += prices[i];
    }
    return sum / n;
}

double MeanReversionSignalProducer::calculate_std_dev(const std::vector<double>& prices,
                                                      int period, double mean) {
    if (prices.empty() || period < 1) {
        return 0.0;
    }
    size_t n = std::min(prices.size(), static_cast<size_t>(period));
    double sum_squared_diff = 0.0;
    for (size_t i = prices.size() - n; i < prices.size(); ++i) {
        double diff = prices[i] - mean;
        sum_squared_diff += diff * diff;
    }
    return std::sqrt(sum_squared_diff / n);
}

double MeanReversionSignalProducer::calculate_z_score(double price, double mean,
                                                      double std_dev) {
    if (std_dev < 1e-8) {
        return 0.0;
    }
    return (price - mean) / std_dev;
}

Result<Signal> MeanReversionSignalProducer::generate_signal(const SignalContext& context) const {
    Signal signal;
    signal.producer_id = id_;
    signal.ticker = context.ticker;
    signal.date = context.date;

    auto prices = context.closes();
    if (prices.size() < 2) {
        signal.direction = Direction::NEUTRAL;
        signal.reasoning = "Insufficient history (" + std::to_string(prices.size()) + " bars)";
        return Result<Signal>(std::move(signal));
    }

    double mean = calculate_sma(prices, config_.lookback_period);
    double std_dev = calculate_std_dev(prices, config_.lookback_period, mean);
    double z = calculate_z_score(prices.back(), mean, std_dev);

    if (z > config_.entry_threshold) {
        signal.direction = Direction::BEARISH;
    } else if (z < -config_.entry_threshold) {
        signal.direction = Direction::BULLISH;
    } else {
        signal.direction = Direction::NEUTRAL;
    }
    signal.confidence = std::min(100.0, std::abs(z) / config_.full_confidence_z * 100.0);

    std::ostringstream reasoning;
    reasoning << "Close " << prices.back() << " vs mean " << mean << ", z-score " << z;
    signal.reasoning = reasoning.str();

    return Result<Signal>(std::move(signal));
}

}  // namespace hedge_ngin
