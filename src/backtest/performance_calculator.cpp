// src/backtest/performance_calculator.cpp

#include "hedge_ngin/backtest/performance_calculator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace hedge_ngin {

namespace {

double safe_ratio(double numerator, double denominator) {
    if (denominator <= PerformanceCalculator::kEpsilon || !std::isfinite(denominator) ||
        !std::isfinite(numerator)) {
        return 0.0;
    }
    return numerator / denominator * std::sqrt(PerformanceCalculator::kTradingDaysPerYear);
}

}  // namespace

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j;
    j["total_return"] = total_return;
    j["total_return_pct"] = total_return * 100.0;
    j["final_value"] = final_value;
    j["initial_capital"] = initial_capital;
    j["sharpe_ratio"] = sharpe_ratio;
    j["sortino_ratio"] = sortino_ratio;
    j["max_drawdown"] = max_drawdown;
    j["volatility"] = volatility;
    j["trading_days"] = trading_days;
    return j;
}

PerformanceMetrics PerformanceMetrics::from_json(const nlohmann::json& j) {
    PerformanceMetrics metrics;
    metrics.total_return = j.at("total_return").get<double>();
    metrics.final_value = j.at("final_value").get<double>();
    metrics.initial_capital = j.at("initial_capital").get<double>();
    metrics.sharpe_ratio = j.at("sharpe_ratio").get<double>();
    metrics.sortino_ratio = j.at("sortino_ratio").get<double>();
    metrics.max_drawdown = j.at("max_drawdown").get<double>();
    metrics.volatility = j.value("volatility", 0.0);
    metrics.trading_days = j.value("trading_days", 0);
    return metrics;
}

std::vector<double> PerformanceCalculator::extract_returns(
    const std::vector<DailySnapshot>& snapshots) {
    std::vector<double> returns;
    returns.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        returns.push_back(snapshot.daily_return);
    }
    return returns;
}

double PerformanceCalculator::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    Eigen::Map<const Eigen::VectorXd> r(returns.data(), static_cast<Eigen::Index>(returns.size()));
    double mean = r.mean();
    double std_dev = std::sqrt((r.array() - mean).square().mean());
    return safe_ratio(mean, std_dev);
}

double PerformanceCalculator::calculate_sortino_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    Eigen::Map<const Eigen::VectorXd> r(returns.data(), static_cast<Eigen::Index>(returns.size()));
    double mean = r.mean();
    double downside_dev = std::sqrt(r.array().min(0.0).square().mean());
    return safe_ratio(mean, downside_dev);
}

double PerformanceCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    Eigen::Map<const Eigen::VectorXd> r(returns.data(), static_cast<Eigen::Index>(returns.size()));
    double mean = r.mean();
    return std::sqrt((r.array() - mean).square().mean()) * std::sqrt(kTradingDaysPerYear);
}

double PerformanceCalculator::calculate_max_drawdown(const std::vector<double>& values,
                                                     double initial_capital) const {
    double peak = initial_capital;
    double max_drawdown = 0.0;
    for (double value : values) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            max_drawdown = std::min(max_drawdown, value / peak - 1.0);
        }
    }
    return max_drawdown;
}

PerformanceMetrics PerformanceCalculator::calculate(const std::vector<DailySnapshot>& snapshots,
                                                    double initial_capital) const {
    PerformanceMetrics metrics;
    metrics.initial_capital = initial_capital;
    metrics.final_value = snapshots.empty() ? initial_capital : snapshots.back().total_value;
    metrics.total_return =
        initial_capital > 0.0 ? metrics.final_value / initial_capital - 1.0 : 0.0;
    metrics.trading_days = static_cast<int>(snapshots.size());

    auto returns = extract_returns(snapshots);
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns);
    metrics.sortino_ratio = calculate_sortino_ratio(returns);
    metrics.volatility = calculate_volatility(returns);

    std::vector<double> values;
    values.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        values.push_back(snapshot.total_value);
    }
    metrics.max_drawdown = calculate_max_drawdown(values, initial_capital);
    return metrics;
}

PerformanceTracker::PerformanceTracker(double initial_capital)
    : initial_capital_(initial_capital), peak_(initial_capital), last_value_(initial_capital) {}

void PerformanceTracker::update(const DailySnapshot& snapshot) {
    ++count_;
    double r = snapshot.daily_return;
    double delta = r - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (r - mean_);
    if (r < 0.0) {
        downside_sq_sum_ += r * r;
    }

    peak_ = std::max(peak_, snapshot.total_value);
    if (peak_ > 0.0) {
        max_drawdown_ = std::min(max_drawdown_, snapshot.total_value / peak_ - 1.0);
    }
    last_value_ = snapshot.total_value;
}

PerformanceMetrics PerformanceTracker::metrics() const {
    PerformanceMetrics metrics;
    metrics.initial_capital = initial_capital_;
    metrics.final_value = last_value_;
    metrics.total_return = initial_capital_ > 0.0 ? last_value_ / initial_capital_ - 1.0 : 0.0;
    metrics.trading_days = static_cast<int>(count_);
    metrics.max_drawdown = max_drawdown_;

    if (count_ >= 2) {
        double n = static_cast<double>(count_);
        double std_dev = std::sqrt(std::max(0.0, m2_ / n));
        double downside_dev = std::sqrt(downside_sq_sum_ / n);
        metrics.sharpe_ratio = safe_ratio(mean_, std_dev);
        metrics.sortino_ratio = safe_ratio(mean_, downside_dev);
        metrics.volatility =
            std_dev * std::sqrt(PerformanceCalculator::kTradingDaysPerYear);
    }
    return metrics;
}

}  // namespace hedge_ngin
