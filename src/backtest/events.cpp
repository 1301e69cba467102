// src/backtest/events.cpp

#include "hedge_ngin/backtest/events.hpp"
#include <chrono>
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {
namespace backtest {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

nlohmann::json history_to_json(const std::vector<DailySnapshot>& history) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& snapshot : history) {
        j.push_back(snapshot.to_json());
    }
    return j;
}

}  // namespace

std::string event_type_name(EventType type) {
    switch (type) {
        case EventType::START:
            return "backtest_start";
        case EventType::PROGRESS:
            return "backtest_progress";
        case EventType::TRADING:
            return "trading";
        case EventType::PORTFOLIO_UPDATE:
            return "portfolio_update";
        case EventType::PERFORMANCE_UPDATE:
            return "performance_update";
        case EventType::COMPLETE:
            return "backtest_complete";
        case EventType::ERROR:
            return "error";
        default:
            return "unknown";
    }
}

EventType Event::type() const {
    return std::visit(overloaded{
                          [](const StartPayload&) { return EventType::START; },
                          [](const ProgressPayload&) { return EventType::PROGRESS; },
                          [](const TradingPayload&) { return EventType::TRADING; },
                          [](const PortfolioUpdatePayload&) { return EventType::PORTFOLIO_UPDATE; },
                          [](const PerformanceUpdatePayload&) {
                              return EventType::PERFORMANCE_UPDATE;
                          },
                          [](const CompletePayload&) { return EventType::COMPLETE; },
                          [](const ErrorPayload&) { return EventType::ERROR; },
                      },
                      payload);
}

nlohmann::json Event::to_json() const {
    nlohmann::json j = std::visit(
        overloaded{
            [](const StartPayload& p) {
                nlohmann::json d;
                d["total_days"] = p.total_days;
                d["tickers"] = p.tickers;
                d["start_date"] = p.start_date;
                d["end_date"] = p.end_date;
                return d;
            },
            [](const ProgressPayload& p) {
                nlohmann::json d;
                d["current_date"] = p.current_date;
                d["progress"] = p.progress;
                d["completed_days"] = p.completed_days;
                d["total_days"] = p.total_days;
                d["message"] = p.message;
                return d;
            },
            [](const TradingPayload& p) {
                nlohmann::json d;
                d["date"] = p.date;
                d["ticker"] = p.ticker;
                d["action"] = action_to_string(p.action);
                d["quantity"] = p.quantity;
                d["price"] = p.price;
                d["portfolio_value"] = p.portfolio_value;
                return d;
            },
            [](const PortfolioUpdatePayload& p) {
                nlohmann::json d = p.snapshot.to_json();
                d["warnings"] = p.warnings;
                return d;
            },
            [](const PerformanceUpdatePayload& p) {
                nlohmann::json d = p.metrics.to_json();
                d["date"] = p.date;
                return d;
            },
            [](const CompletePayload& p) {
                nlohmann::json d;
                d["status"] = p.status;
                d["final_performance"] = p.final_performance.to_json();
                d["portfolio_history"] = history_to_json(p.portfolio_history);
                return d;
            },
            [](const ErrorPayload& p) {
                nlohmann::json d;
                d["message"] = p.message;
                d["code"] = p.code;
                return d;
            },
        },
        payload);

    j["type"] = event_type_name(type());
    j["backtest_id"] = backtest_id;
    j["timestamp"] = core::format_iso8601(timestamp);
    return j;
}

std::string Event::to_sse() const {
    return "event: " + event_type_name(type()) + "\ndata: " + to_json().dump() + "\n\n";
}

Event make_event(const std::string& backtest_id, EventPayload payload) {
    Event event;
    event.backtest_id = backtest_id;
    event.timestamp = std::chrono::system_clock::now();
    event.payload = std::move(payload);
    return event;
}

std::vector<DailySnapshot> replay_snapshots(const std::vector<Event>& events) {
    std::vector<DailySnapshot> snapshots;
    for (const auto& event : events) {
        if (const auto* update = std::get_if<PortfolioUpdatePayload>(&event.payload)) {
            snapshots.push_back(update->snapshot);
        }
    }
    return snapshots;
}

std::vector<DailySnapshot> replay_snapshots(const std::vector<nlohmann::json>& events) {
    std::vector<DailySnapshot> snapshots;
    const std::string wanted = event_type_name(EventType::PORTFOLIO_UPDATE);
    for (const auto& event : events) {
        if (event.value("type", "") == wanted) {
            snapshots.push_back(DailySnapshot::from_json(event));
        }
    }
    return snapshots;
}

}  // namespace backtest
}  // namespace hedge_ngin
