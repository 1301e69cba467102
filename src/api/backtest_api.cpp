// src/api/backtest_api.cpp

#include "hedge_ngin/api/backtest_api.hpp"
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {

using backtest::BacktestRequest;
using backtest::SessionStatus;

BacktestApi::BacktestApi(std::shared_ptr<backtest::SessionController> controller)
    : controller_(std::move(controller)) {
    if (!controller_) {
        throw HedgeError(ErrorCode::INVALID_ARGUMENT, "Backtest API needs a session controller",
                         "BacktestApi");
    }
}

int BacktestApi::http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR:
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::JSON_PARSE_ERROR:
            return 400;
        case ErrorCode::NOT_FOUND:
            return 404;
        case ErrorCode::INVALID_STATE_TRANSITION:
            return 409;
        case ErrorCode::NOT_INITIALIZED:
            return 503;
        default:
            return 500;
    }
}

ApiResponse BacktestApi::error_response(const HedgeError& error) {
    ApiResponse response;
    response.status_code = http_status(error.code());
    response.body["error"] = {{"code", error_code_to_string(error.code())},
                              {"message", error.what()},
                              {"component", error.component()}};
    return response;
}

Result<BacktestRequest> BacktestApi::parse_request(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<BacktestRequest>(ErrorCode::VALIDATION_ERROR,
                                           std::string("Malformed JSON body: ") + e.what(),
                                           "BacktestApi");
    }
    if (!j.is_object()) {
        return make_error<BacktestRequest>(ErrorCode::VALIDATION_ERROR,
                                           "Request body must be a JSON object", "BacktestApi");
    }
    return BacktestRequest::from_json(j);
}

ApiResponse BacktestApi::start(const std::string& body) const {
    auto request = parse_request(body);
    if (request.is_error()) {
        return error_response(*request.error());
    }

    auto started = controller_->start(request.value());
    if (started.is_error()) {
        WARN("Rejected backtest start: " << started.error()->what());
        return error_response(*started.error());
    }

    const std::string& id = started.value();
    ApiResponse response;
    response.body = {{"backtest_id", id},
                     {"status", "started"},
                     {"stream_url", stream_path(id)},
                     {"status_url", status_path(id)}};
    return response;
}

ApiResponse BacktestApi::status(const std::string& id) const {
    auto view = controller_->status(id);
    if (view.is_error()) {
        return error_response(*view.error());
    }
    ApiResponse response;
    response.body = view.value().to_json();
    return response;
}

ApiResponse BacktestApi::run_sync(const std::string& body) const {
    auto request = parse_request(body);
    if (request.is_error()) {
        return error_response(*request.error());
    }

    auto outcome = controller_->run_sync(request.value());
    if (outcome.is_error()) {
        return error_response(*outcome.error());
    }

    const auto& result = outcome.value();
    ApiResponse response;
    response.body = result.to_json();
    if (result.status == SessionStatus::FAILED) {
        response.status_code = 500;
        response.body["error"] = {{"code", error_code_to_string(ErrorCode::COMPUTE_ERROR)},
                                  {"message", result.error_message.value_or("Backtest failed")},
                                  {"component", "BacktestRunner"}};
    }
    return response;
}

ApiResponse BacktestApi::cancel(const std::string& id) const {
    auto view = controller_->cancel(id);
    if (view.is_error()) {
        return error_response(*view.error());
    }
    ApiResponse response;
    response.body = {{"backtest_id", id},
                     {"status", "cancelled"},
                     {"session_status", session_status_to_string(view.value().status)}};
    return response;
}

ApiResponse BacktestApi::health() const {
    ApiResponse response;
    response.body = {{"status", "ok"}, {"sessions", controller_->session_count()}};
    return response;
}

Result<std::shared_ptr<backtest::Subscription>> BacktestApi::open_stream(
    const std::string& id) const {
    return controller_->subscribe(id);
}

void BacktestApi::close_stream(const std::string& id,
                               const std::shared_ptr<backtest::Subscription>& subscription,
                               bool remove_finished) const {
    controller_->unsubscribe(id, subscription);
    if (!remove_finished || !subscription->finished()) {
        return;
    }

    auto removed = controller_->remove(id);
    if (removed.is_error() && removed.error()->code() != ErrorCode::NOT_FOUND) {
        DEBUG("Kept backtest " << id << " after stream end: " << removed.error()->what());
    }
}

}  // namespace hedge_ngin
