// include/hedge_ngin/backtest/events.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>
#include "hedge_ngin/backtest/performance_calculator.hpp"
#include "hedge_ngin/core/types.hpp"
#include "hedge_ngin/portfolio/types.hpp"

namespace hedge_ngin {
namespace backtest {

/**
 * @brief Type of session event
 */
enum class EventType {
    START,
    PROGRESS,
    TRADING,
    PORTFOLIO_UPDATE,
    PERFORMANCE_UPDATE,
    COMPLETE,
    ERROR
};

/**
 * @brief Name used for the SSE `event:` line and the `type` field
 */
std::string event_type_name(EventType type);

struct StartPayload {
    int total_days{0};
    std::vector<std::string> tickers;
    std::string start_date;
    std::string end_date;
};

struct ProgressPayload {
    std::string current_date;
    double progress{0.0};  // completed_days / total_days
    int completed_days{0};
    int total_days{0};
    std::string message;
};

struct TradingPayload {
    std::string date;
    std::string ticker;
    Action action{Action::HOLD};
    Quantity quantity{0};
    Price price{0.0};
    double portfolio_value{0.0};
};

struct PortfolioUpdatePayload {
    DailySnapshot snapshot;
    std::vector<std::string> warnings;
};

struct PerformanceUpdatePayload {
    std::string date;
    PerformanceMetrics metrics;
};

struct CompletePayload {
    std::string status;  // "completed" or "cancelled"
    PerformanceMetrics final_performance;
    std::vector<DailySnapshot> portfolio_history;
};

struct ErrorPayload {
    std::string message;
    std::string code;
};

using EventPayload = std::variant<StartPayload, ProgressPayload, TradingPayload,
                                  PortfolioUpdatePayload, PerformanceUpdatePayload,
                                  CompletePayload, ErrorPayload>;

/**
 * @brief One event of a session's stream
 */
struct Event {
    std::string backtest_id;
    Timestamp timestamp;
    EventPayload payload;

    EventType type() const;

    /**
     * @brief complete and error end a stream
     */
    bool is_terminal() const {
        EventType t = type();
        return t == EventType::COMPLETE || t == EventType::ERROR;
    }

    nlohmann::json to_json() const;

    /**
     * @brief Server-Sent Events frame: "event: <type>\ndata: <json>\n\n"
     */
    std::string to_sse() const;
};

Event make_event(const std::string& backtest_id, EventPayload payload);

/**
 * @brief Rebuild the snapshot series from a stream of portfolio_update events
 */
std::vector<DailySnapshot> replay_snapshots(const std::vector<Event>& events);

/**
 * @brief Same as replay_snapshots, reading the JSON form of the events
 */
std::vector<DailySnapshot> replay_snapshots(const std::vector<nlohmann::json>& events);

}  // namespace backtest
}  // namespace hedge_ngin
