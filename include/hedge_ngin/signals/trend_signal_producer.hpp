// include/hedge_ngin/signals/trend_signal_producer.hpp
#pragma once

#include <string>
#include <vector>
#include "hedge_ngin/signals/signal_producer.hpp"

namespace hedge_ngin {

struct TrendConfig {
    int fast_window{4};             // Fast EWMA span
    int slow_window{16};            // Slow EWMA span
    double forecast_cap{20.0};      // Absolute forecast cap
    double neutral_band{1.0};       // |forecast| below this is neutral
    int min_history{5};             // Bars needed before forming a view
};

/**
 * @brief EWMA crossover producer
 *
 * The raw forecast is (fast - slow) / (price * daily_vol / 16), capped at
 * ±forecast_cap. Confidence is |forecast| / forecast_cap scaled to [0, 100].
 */
class TrendSignalProducer : public SignalProducer {
public:
    explicit TrendSignalProducer(std::string id = "trend", TrendConfig config = TrendConfig{});

    const std::string& id() const override {
        return id_;
    }

    Result<Signal> generate_signal(const SignalContext& context) const override;

    /**
     * @brief Exponentially weighted moving average, one value per input price
     */
    static std::vector<double> calculate_ewma(const std::vector<double>& prices, int span);

    /**
     * @brief Population standard deviation of simple daily returns
     */
    static double calculate_return_volatility(const std::vector<double>& prices);

private:
    std::string id_;
    TrendConfig config_;
};

}  // namespace hedge_ngin
