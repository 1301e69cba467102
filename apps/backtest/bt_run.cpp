#include <fstream>
#include <iomanip>
#include <iostream>
#include "hedge_ngin/api/engine_config.hpp"
#include "hedge_ngin/backtest/session_controller.hpp"
#include "hedge_ngin/core/logger.hpp"
#include "hedge_ngin/data/csv_market_data_provider.hpp"

using namespace hedge_ngin;
using namespace hedge_ngin::backtest;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <request.json> [engine_config.json]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        Logger::reset_for_tests();

        EngineConfig config;
        config.logger.filename_prefix = "bt_run";
        if (argc > 2) {
            auto loaded = config.load_from_file(argv[2]);
            if (loaded.is_error()) {
                std::cerr << "Failed to load config " << argv[2] << ": "
                          << loaded.error()->to_string() << std::endl;
                return 1;
            }
        }
        auto valid = config.validate();
        if (valid.is_error()) {
            std::cerr << "Invalid config: " << valid.error()->what() << std::endl;
            return 1;
        }

        // Keep stdout for the JSON result
        config.logger.destination = LogDestination::FILE;
        Logger::instance().initialize(config.logger);
        Logger::register_component("bt_run");

        std::ifstream request_file(argv[1]);
        if (!request_file.is_open()) {
            std::cerr << "Cannot open request file " << argv[1] << std::endl;
            return 1;
        }
        nlohmann::json request_json;
        try {
            request_file >> request_json;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Malformed request file: " << e.what() << std::endl;
            return 1;
        }

        auto request = BacktestRequest::from_json(request_json);
        if (request.is_error()) {
            std::cerr << request.error()->to_string() << std::endl;
            return 1;
        }

        auto registry = create_producer_registry(config);
        if (registry.is_error()) {
            std::cerr << registry.error()->to_string() << std::endl;
            return 1;
        }

        auto market_data = std::make_shared<CsvMarketDataProvider>(config.data_directory);
        SessionController controller(registry.value(), market_data, config.aggregator,
                                     config.risk, config.stream);

        INFO("Running backtest over " << request.value().tickers.size() << " tickers from "
                                      << request.value().start_date << " to "
                                      << request.value().end_date);
        auto outcome = controller.run_sync(request.value());
        if (outcome.is_error()) {
            std::cerr << outcome.error()->to_string() << std::endl;
            return 1;
        }

        const auto& result = outcome.value();
        std::cout << std::setw(2) << result.to_json() << std::endl;

        std::cerr << "Status: " << session_status_to_string(result.status)
                  << "  Total return: " << std::fixed << std::setprecision(2)
                  << result.performance_metrics.total_return * 100.0 << "%"
                  << "  Sharpe: " << std::setprecision(3)
                  << result.performance_metrics.sharpe_ratio << std::endl;
        return result.status == SessionStatus::FAILED ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
