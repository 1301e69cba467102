// src/backtest/backtest_types.cpp

#include "hedge_ngin/backtest/backtest_types.hpp"
#include <cmath>
#include <set>
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {
namespace backtest {

Result<void> BacktestRequest::validate() const {
    if (tickers.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "At least one ticker is required",
                                "BacktestRequest");
    }
    std::set<std::string> seen;
    for (const auto& ticker : tickers) {
        if (ticker.empty()) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR, "Ticker must not be empty",
                                    "BacktestRequest");
        }
        if (!seen.insert(ticker).second) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR, "Duplicate ticker: " + ticker,
                                    "BacktestRequest");
        }
    }

    if (selected_signal_producers.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "At least one signal producer must be selected",
                                "BacktestRequest");
    }

    auto start_ts = core::parse_date(start_date);
    if (!start_ts) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Invalid start_date (expected YYYY-MM-DD): " + start_date,
                                "BacktestRequest");
    }
    auto end_ts = core::parse_date(end_date);
    if (!end_ts) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Invalid end_date (expected YYYY-MM-DD): " + end_date,
                                "BacktestRequest");
    }
    if (!(*start_ts < *end_ts)) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "start_date must be before end_date", "BacktestRequest");
    }

    if (!std::isfinite(initial_cash) || initial_cash <= 0.0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "initial_cash must be positive",
                                "BacktestRequest");
    }
    if (!std::isfinite(margin_requirement) || margin_requirement < 0.0 ||
        margin_requirement > 1.0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "margin_requirement must be between 0 and 1",
                                "BacktestRequest");
    }
    return Result<void>();
}

Timestamp BacktestRequest::start() const {
    return core::parse_date(start_date).value_or(Timestamp{});
}

Timestamp BacktestRequest::end() const {
    return core::parse_date(end_date).value_or(Timestamp{});
}

nlohmann::json BacktestRequest::to_json() const {
    nlohmann::json j;
    j["tickers"] = tickers;
    j["selected_signal_producers"] = selected_signal_producers;
    j["start_date"] = start_date;
    j["end_date"] = end_date;
    j["initial_cash"] = initial_cash;
    j["margin_requirement"] = margin_requirement;
    return j;
}

Result<BacktestRequest> BacktestRequest::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<BacktestRequest>(ErrorCode::VALIDATION_ERROR,
                                           "Request body must be a JSON object",
                                           "BacktestRequest");
    }

    try {
        BacktestRequest request;
        if (j.contains("tickers"))
            request.tickers = j.at("tickers").get<std::vector<std::string>>();

        if (j.contains("selected_signal_producers"))
            request.selected_signal_producers =
                j.at("selected_signal_producers").get<std::vector<std::string>>();
        else if (j.contains("selected_agents"))
            request.selected_signal_producers =
                j.at("selected_agents").get<std::vector<std::string>>();

        if (j.contains("start_date"))
            request.start_date = j.at("start_date").get<std::string>();
        if (j.contains("end_date"))
            request.end_date = j.at("end_date").get<std::string>();

        if (j.contains("initial_cash"))
            request.initial_cash = j.at("initial_cash").get<double>();
        else if (j.contains("initial_capital"))
            request.initial_cash = j.at("initial_capital").get<double>();

        if (j.contains("margin_requirement"))
            request.margin_requirement = j.at("margin_requirement").get<double>();

        return Result<BacktestRequest>(std::move(request));
    } catch (const nlohmann::json::exception& e) {
        return make_error<BacktestRequest>(ErrorCode::VALIDATION_ERROR,
                                           std::string("Malformed request: ") + e.what(),
                                           "BacktestRequest");
    }
}

std::string session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING:
            return "pending";
        case SessionStatus::RUNNING:
            return "running";
        case SessionStatus::COMPLETED:
            return "completed";
        case SessionStatus::CANCELLED:
            return "cancelled";
        case SessionStatus::FAILED:
            return "failed";
        default:
            return "unknown";
    }
}

bool is_valid_transition(SessionStatus from, SessionStatus to) {
    switch (from) {
        case SessionStatus::PENDING:
            return to == SessionStatus::RUNNING || to == SessionStatus::CANCELLED;
        case SessionStatus::RUNNING:
            return to == SessionStatus::COMPLETED || to == SessionStatus::CANCELLED ||
                   to == SessionStatus::FAILED;
        default:
            return false;
    }
}

nlohmann::json SessionView::to_json() const {
    nlohmann::json j;
    j["backtest_id"] = backtest_id;
    j["status"] = session_status_to_string(status);
    j["progress"] = progress;
    j["current_date"] = current_date;
    j["is_running"] = is_running();
    if (error_message) {
        j["error_message"] = *error_message;
    } else {
        j["error_message"] = nullptr;
    }
    j["start_time"] = core::format_iso8601(start_time);
    j["completed_days"] = completed_days;
    j["total_days"] = total_days;
    j["warnings"] = warnings;
    j["request_summary"] = {{"tickers", request.tickers},
                            {"selected_signal_producers", request.selected_signal_producers},
                            {"start_date", request.start_date},
                            {"end_date", request.end_date},
                            {"initial_cash", request.initial_cash}};
    return j;
}

nlohmann::json BacktestRunResult::to_json() const {
    nlohmann::json j;
    j["status"] = session_status_to_string(status);
    j["performance_metrics"] = performance_metrics.to_json();

    nlohmann::json history = nlohmann::json::array();
    for (const auto& snapshot : portfolio_history) {
        nlohmann::json entry = snapshot.to_json();
        entry["value"] = snapshot.total_value;
        history.push_back(entry);
    }
    j["portfolio_history"] = history;
    j["final_portfolio"] = final_portfolio.to_json();
    j["warnings"] = warnings;
    j["total_days"] = total_days;
    if (error_message) {
        j["error_message"] = *error_message;
    }
    return j;
}

}  // namespace backtest
}  // namespace hedge_ngin
