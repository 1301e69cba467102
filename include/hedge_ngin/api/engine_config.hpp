// include/hedge_ngin/api/engine_config.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "hedge_ngin/backtest/event_stream.hpp"
#include "hedge_ngin/backtest/session_controller.hpp"
#include "hedge_ngin/core/config_base.hpp"
#include "hedge_ngin/core/logger.hpp"
#include "hedge_ngin/risk/risk_manager.hpp"
#include "hedge_ngin/signals/producer_registry.hpp"
#include "hedge_ngin/signals/remote_signal_producer.hpp"
#include "hedge_ngin/signals/signal_aggregator.hpp"

namespace hedge_ngin {

/**
 * @brief Listener settings of the HTTP front end
 */
struct ServerConfig : public ConfigBase {
    std::string host{"0.0.0.0"};
    int port{8080};
    bool cleanup_after_stream{true};  // Drop a finished session once its stream has ended

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["host"] = host;
        j["port"] = port;
        j["cleanup_after_stream"] = cleanup_after_stream;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("host"))
            host = j.at("host").get<std::string>();
        if (j.contains("port"))
            port = j.at("port").get<int>();
        if (j.contains("cleanup_after_stream"))
            cleanup_after_stream = j.at("cleanup_after_stream").get<bool>();
    }
};

/**
 * @brief Top-level settings read by the server and CLI executables
 *
 * Every section is optional in the file; missing keys keep their defaults.
 */
struct EngineConfig : public ConfigBase {
    LoggerConfig logger;
    RiskConfig risk;
    AggregatorConfig aggregator;
    backtest::StreamConfig stream;
    backtest::SessionConfig sessions;
    ServerConfig server;
    std::string data_directory{"data"};  // Holds <TICKER>.csv files
    std::vector<RemoteProducerConfig> remote_producers;
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Reject settings the engine cannot run with
     * @return INVALID_ARGUMENT naming the first bad field
     */
    Result<void> validate() const;

    /**
     * @brief Settings that are valid but work against each other
     *
     * Currently flags remote producers whose retries cannot all finish inside the
     * aggregator's per-call deadline.
     */
    std::vector<std::string> budget_warnings() const;
};

/**
 * @brief Registry holding the built-in trend and mean_reversion producers plus one
 * RemoteSignalProducer per configured remote
 *
 * Logs every budget_warnings() entry.
 */
Result<std::shared_ptr<ProducerRegistry>> create_producer_registry(const EngineConfig& config);

}  // namespace hedge_ngin
