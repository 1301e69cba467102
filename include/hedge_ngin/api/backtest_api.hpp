// include/hedge_ngin/api/backtest_api.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "hedge_ngin/backtest/session_controller.hpp"
#include "hedge_ngin/core/error.hpp"

namespace hedge_ngin {

/**
 * @brief Status code and JSON body of one HTTP answer
 */
struct ApiResponse {
    int status_code{200};
    nlohmann::json body;
};

/**
 * @brief Transport-independent request handlers of the backtest service
 *
 * Each handler maps the controller's Result to a status code and a JSON body.
 * Error bodies have the shape {"error": {"code", "message", "component"}}.
 */
class BacktestApi {
public:
    explicit BacktestApi(std::shared_ptr<backtest::SessionController> controller);

    /**
     * @brief POST /backtest/start
     */
    ApiResponse start(const std::string& body) const;

    /**
     * @brief GET /backtest/status/{id}
     */
    ApiResponse status(const std::string& id) const;

    /**
     * @brief POST /backtest/run-sync
     *
     * A run that ends in status failed answers 500 with the partial result and an
     * error object.
     */
    ApiResponse run_sync(const std::string& body) const;

    /**
     * @brief DELETE /backtest/{id}
     */
    ApiResponse cancel(const std::string& id) const;

    /**
     * @brief GET /health
     */
    ApiResponse health() const;

    /**
     * @brief Attach to a session's events for GET /backtest/stream/{id}
     * @return Subscription, or NOT_FOUND
     */
    Result<std::shared_ptr<backtest::Subscription>> open_stream(const std::string& id) const;

    /**
     * @brief Detach a finished stream consumer
     * @param remove_finished Also drop the session when it has reached a terminal status
     */
    void close_stream(const std::string& id,
                      const std::shared_ptr<backtest::Subscription>& subscription,
                      bool remove_finished) const;

    static int http_status(ErrorCode code);

    static ApiResponse error_response(const HedgeError& error);

    static std::string stream_path(const std::string& id) {
        return "/backtest/stream/" + id;
    }

    static std::string status_path(const std::string& id) {
        return "/backtest/status/" + id;
    }

private:
    /**
     * @brief Parse a request body into a BacktestRequest
     * @return VALIDATION_ERROR for malformed JSON or fields
     */
    static Result<backtest::BacktestRequest> parse_request(const std::string& body);

    std::shared_ptr<backtest::SessionController> controller_;
};

}  // namespace hedge_ngin
