// include/hedge_ngin/backtest/performance_calculator.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "hedge_ngin/portfolio/types.hpp"

namespace hedge_ngin {

/**
 * @brief Risk-adjusted performance of a snapshot series
 */
struct PerformanceMetrics {
    double total_return{0.0};  // Fraction: 0.10 = 10%
    double final_value{0.0};
    double initial_capital{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double max_drawdown{0.0};  // <= 0
    double volatility{0.0};    // Annualized
    int trading_days{0};

    nlohmann::json to_json() const;
    static PerformanceMetrics from_json(const nlohmann::json& j);
};

/**
 * @brief Pure stateless calculation of performance metrics
 *
 * Ratios use the population standard deviation of daily returns annualized with
 * sqrt(252). A zero denominator or fewer than two returns yields 0, never NaN.
 */
class PerformanceCalculator {
public:
    static constexpr double kTradingDaysPerYear = 252.0;
    static constexpr double kEpsilon = 1e-12;

    /**
     * @brief Recompute every metric from the full series
     * @param snapshots Append-only snapshot history
     * @param initial_capital Starting cash; seeds the drawdown peak
     */
    PerformanceMetrics calculate(const std::vector<DailySnapshot>& snapshots,
                                 double initial_capital) const;

    double calculate_sharpe_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Sortino ratio using the downside deviation over all returns
     */
    double calculate_sortino_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Most negative value / running peak - 1, with the peak seeded by initial capital
     */
    double calculate_max_drawdown(const std::vector<double>& values, double initial_capital) const;

    double calculate_volatility(const std::vector<double>& returns) const;

    static std::vector<double> extract_returns(const std::vector<DailySnapshot>& snapshots);
};

/**
 * @brief Running-sum form of PerformanceCalculator, updated one snapshot at a time
 *
 * Agrees with PerformanceCalculator::calculate on the same series.
 */
class PerformanceTracker {
public:
    explicit PerformanceTracker(double initial_capital);

    void update(const DailySnapshot& snapshot);

    PerformanceMetrics metrics() const;

    size_t count() const {
        return count_;
    }

private:
    double initial_capital_;
    size_t count_{0};
    double mean_{0.0};
    double m2_{0.0};             // Sum of squared deviations from the running mean
    double downside_sq_sum_{0.0};
    double peak_;
    double max_drawdown_{0.0};
    double last_value_;
};

}  // namespace hedge_ngin
