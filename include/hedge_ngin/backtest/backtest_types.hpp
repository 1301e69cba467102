// include/hedge_ngin/backtest/backtest_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "hedge_ngin/backtest/performance_calculator.hpp"
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/core/types.hpp"
#include "hedge_ngin/portfolio/types.hpp"

namespace hedge_ngin {
namespace backtest {

/**
 * @brief Parameters of one backtest
 */
struct BacktestRequest {
    std::vector<std::string> tickers;
    std::vector<std::string> selected_signal_producers;
    std::string start_date;  // YYYY-MM-DD
    std::string end_date;    // YYYY-MM-DD, inclusive
    double initial_cash{100000.0};
    double margin_requirement{0.0};

    /**
     * @brief Check the request on its own, without consulting the producer registry
     * @return VALIDATION_ERROR naming the first problem found
     */
    Result<void> validate() const;

    Timestamp start() const;
    Timestamp end() const;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a request body
     *
     * `selected_agents` and `initial_capital` are accepted in place of
     * `selected_signal_producers` and `initial_cash`. Missing numeric fields keep
     * their defaults.
     *
     * @return VALIDATION_ERROR for a body that is not an object or has mistyped fields
     */
    static Result<BacktestRequest> from_json(const nlohmann::json& j);
};

/**
 * @brief Lifecycle state of a session
 */
enum class SessionStatus { PENDING, RUNNING, COMPLETED, CANCELLED, FAILED };

std::string session_status_to_string(SessionStatus status);

inline bool is_terminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED || status == SessionStatus::CANCELLED ||
           status == SessionStatus::FAILED;
}

/**
 * @brief pending -> running -> {completed, cancelled, failed}, plus pending -> cancelled
 */
bool is_valid_transition(SessionStatus from, SessionStatus to);

/**
 * @brief Point-in-time copy of a session's state
 */
struct SessionView {
    std::string backtest_id;
    SessionStatus status{SessionStatus::PENDING};
    double progress{0.0};
    std::string current_date;
    std::optional<std::string> error_message;
    Timestamp start_time;
    int completed_days{0};
    int total_days{0};
    std::vector<std::string> warnings;
    BacktestRequest request;

    bool is_running() const {
        return status == SessionStatus::RUNNING;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of a synchronous run
 */
struct BacktestRunResult {
    SessionStatus status{SessionStatus::COMPLETED};
    PerformanceMetrics performance_metrics;
    std::vector<DailySnapshot> portfolio_history;
    Portfolio final_portfolio;
    std::vector<std::string> warnings;
    std::optional<std::string> error_message;
    int total_days{0};

    nlohmann::json to_json() const;
};

}  // namespace backtest
}  // namespace hedge_ngin
