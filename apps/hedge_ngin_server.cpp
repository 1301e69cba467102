#include <csignal>
#include <iostream>
#include "hedge_ngin/api/backtest_api.hpp"
#include "hedge_ngin/api/backtest_server.hpp"
#include "hedge_ngin/api/engine_config.hpp"
#include "hedge_ngin/backtest/session_controller.hpp"
#include "hedge_ngin/core/logger.hpp"
#include "hedge_ngin/data/csv_market_data_provider.hpp"

using namespace hedge_ngin;
using namespace hedge_ngin::backtest;

namespace {

BacktestServer* g_server = nullptr;

void handle_signal(int) {
    if (g_server) {
        g_server->stop();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        EngineConfig config;
        if (argc > 1) {
            auto loaded = config.load_from_file(argv[1]);
            if (loaded.is_error()) {
                std::cerr << "Failed to load config " << argv[1] << ": "
                          << loaded.error()->to_string() << std::endl;
                return 1;
            }
        }

        auto valid = config.validate();
        if (valid.is_error()) {
            std::cerr << "Invalid config: " << valid.error()->what() << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("Server");

        auto registry = create_producer_registry(config);
        if (registry.is_error()) {
            ERROR("Failed to register signal producers: " << registry.error()->what());
            return 1;
        }
        INFO("Registered " << registry.value()->size() << " signal producers");

        auto market_data = std::make_shared<CsvMarketDataProvider>(config.data_directory);
        INFO("Reading market data from " << config.data_directory);

        auto controller = std::make_shared<SessionController>(
            registry.value(), market_data, config.aggregator, config.risk, config.stream,
            config.sessions);
        auto api = std::make_shared<BacktestApi>(controller);
        BacktestServer server(api, config.server, config.stream);

        g_server = &server;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto served = server.listen();
        g_server = nullptr;

        controller->shutdown();
        if (served.is_error()) {
            ERROR(served.error()->what());
            return 1;
        }
        INFO("Server stopped");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
