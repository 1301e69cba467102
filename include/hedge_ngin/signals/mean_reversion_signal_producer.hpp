// include/hedge_ngin/signals/mean_reversion_signal_producer.hpp
#pragma once

#include <string>
#include <vector>
#include "hedge_ngin/signals/signal_producer.hpp"

namespace hedge_ngin {

struct MeanReversionConfig {
    int lookback_period{20};      // Bars in the moving average
    double entry_threshold{2.0};  // Z-score needed for a directional view
    double full_confidence_z{4.0};  // Z-score mapped to confidence 100
};

/**
 * @brief Z-score producer: stretched above the mean is bearish, below is bullish
 */
class MeanReversionSignalProducer : public SignalProducer {
public:
    explicit MeanReversionSignalProducer(std::string id = "mean_reversion",
                                         MeanReversionConfig config = MeanReversionConfig{});

    const std::string& id() const override {
        return id_;
    }

    Result<Signal> generate_signal(const SignalContext& context) const override;

    static double calculate_sma(const std::vector<double>& prices, int period);
    static double calculate_std_dev(const std::vector<double>& prices, int period, double mean);
    static double calculate_z_score(double price, double mean, double std_dev);

private:
    std::string id_;
    MeanReversionConfig config_;
};

}  // namespace hedge_ngin
