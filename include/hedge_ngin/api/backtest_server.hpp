// include/hedge_ngin/api/backtest_server.hpp
#pragma once

#include <httplib.h>
#include <memory>
#include "hedge_ngin/api/backtest_api.hpp"
#include "hedge_ngin/api/engine_config.hpp"

namespace hedge_ngin {

/**
 * @brief HTTP front end binding BacktestApi to cpp-httplib routes
 *
 * Streams are served as text/event-stream from a chunked content provider that
 * writes one SSE frame per event and a keepalive frame whenever the stream idles.
 */
class BacktestServer {
public:
    BacktestServer(std::shared_ptr<BacktestApi> api, ServerConfig server_config,
                   backtest::StreamConfig stream_config);

    /**
     * @brief Bind and serve until stop() is called
     * @return FILE_IO_ERROR if the listener could not bind
     */
    Result<void> listen();

    void stop();

private:
    void setup_routes();

    void handle_stream(const std::string& id, httplib::Response& res);

    static void write_json(httplib::Response& res, const ApiResponse& response);

    std::shared_ptr<BacktestApi> api_;
    ServerConfig server_config_;
    backtest::StreamConfig stream_config_;
    httplib::Server server_;
};

}  // namespace hedge_ngin
