// src/api/backtest_server.cpp

#include "hedge_ngin/api/backtest_server.hpp"
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {

namespace {

const char kKeepaliveFrame[] = "event: keepalive\ndata: {}\n\n";

}  // namespace

BacktestServer::BacktestServer(std::shared_ptr<BacktestApi> api, ServerConfig server_config,
                               backtest::StreamConfig stream_config)
    : api_(std::move(api)),
      server_config_(std::move(server_config)),
      stream_config_(std::move(stream_config)) {
    setup_routes();
}

void BacktestServer::write_json(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status_code;
    res.set_content(response.body.dump(), "application/json");
}

void BacktestServer::setup_routes() {
    server_.Post("/backtest/start", [this](const httplib::Request& req, httplib::Response& res) {
        write_json(res, api_->start(req.body));
    });

    server_.Post("/backtest/run-sync",
                 [this](const httplib::Request& req, httplib::Response& res) {
                     write_json(res, api_->run_sync(req.body));
                 });

    server_.Get("/backtest/status/:id",
                [this](const httplib::Request& req, httplib::Response& res) {
                    write_json(res, api_->status(req.path_params.at("id")));
                });

    server_.Get("/backtest/stream/:id",
                [this](const httplib::Request& req, httplib::Response& res) {
                    handle_stream(req.path_params.at("id"), res);
                });

    server_.Delete("/backtest/:id", [this](const httplib::Request& req, httplib::Response& res) {
        write_json(res, api_->cancel(req.path_params.at("id")));
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        write_json(res, api_->health());
    });

    server_.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "Unexpected error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                message = e.what();
            }
            ERROR("Unhandled exception serving " << req.method << " " << req.path << ": "
                                                 << message);
            write_json(res, BacktestApi::error_response(
                                HedgeError(ErrorCode::UNKNOWN_ERROR, message, "BacktestServer")));
        });
}

void BacktestServer::handle_stream(const std::string& id, httplib::Response& res) {
    auto opened = api_->open_stream(id);
    if (opened.is_error()) {
        write_json(res, BacktestApi::error_response(*opened.error()));
        return;
    }

    auto subscription = opened.value();
    auto api = api_;
    const auto keepalive = std::chrono::milliseconds(stream_config_.keepalive_ms);
    const bool cleanup = server_config_.cleanup_after_stream;

    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [subscription, keepalive](size_t, httplib::DataSink& sink) {
            auto event = subscription->next(keepalive);
            if (event) {
                std::string frame = event->to_sse();
                if (!sink.write(frame.data(), frame.size())) {
                    return false;
                }
                if (event->is_terminal()) {
                    sink.done();
                }
                return true;
            }
            if (subscription->finished()) {
                sink.done();
                return true;
            }
            return sink.write(kKeepaliveFrame, sizeof(kKeepaliveFrame) - 1);
        },
        [api, id, subscription, cleanup](bool) {
            if (subscription->dropped() > 0) {
                WARN("Stream of " << id << " dropped " << subscription->dropped()
                                  << " events for a slow consumer");
            }
            api->close_stream(id, subscription, cleanup);
        });
}

Result<void> BacktestServer::listen() {
    INFO("Listening on " << server_config_.host << ":" << server_config_.port);
    if (!server_.listen(server_config_.host, server_config_.port)) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Could not listen on " + server_config_.host + ":" +
                                    std::to_string(server_config_.port),
                                "BacktestServer");
    }
    return Result<void>();
}

void BacktestServer::stop() {
    server_.stop();
}

}  // namespace hedge_ngin
