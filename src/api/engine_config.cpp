// src/api/engine_config.cpp

#include "hedge_ngin/api/engine_config.hpp"
#include <algorithm>
#include <set>
#include "hedge_ngin/signals/mean_reversion_signal_producer.hpp"
#include "hedge_ngin/signals/trend_signal_producer.hpp"

namespace hedge_ngin {

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["logger"] = logger.to_json();
    j["risk"] = risk.to_json();
    j["aggregator"] = aggregator.to_json();
    j["stream"] = stream.to_json();
    j["sessions"] = sessions.to_json();
    j["server"] = server.to_json();
    j["data_directory"] = data_directory;

    nlohmann::json remotes = nlohmann::json::array();
    for (const auto& remote : remote_producers) {
        remotes.push_back(remote.to_json());
    }
    j["remote_producers"] = remotes;
    j["version"] = version;
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
    if (j.contains("risk"))
        risk.from_json(j.at("risk"));
    if (j.contains("aggregator"))
        aggregator.from_json(j.at("aggregator"));
    if (j.contains("stream"))
        stream.from_json(j.at("stream"));
    if (j.contains("sessions"))
        sessions.from_json(j.at("sessions"));
    if (j.contains("server"))
        server.from_json(j.at("server"));
    if (j.contains("data_directory"))
        data_directory = j.at("data_directory").get<std::string>();
    if (j.contains("remote_producers")) {
        remote_producers.clear();
        for (const auto& item : j.at("remote_producers")) {
            RemoteProducerConfig remote;
            remote.from_json(item);
            remote_producers.push_back(remote);
        }
    }
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> EngineConfig::validate() const {
    if (risk.max_position_fraction <= 0.0 || risk.max_position_fraction > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "risk.max_position_fraction must be in (0, 1]", "EngineConfig");
    }
    if (aggregator.worker_threads == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "aggregator.worker_threads must be positive", "EngineConfig");
    }
    if (aggregator.producer_timeout_ms <= 0 || aggregator.max_queue_wait_ms <= 0 ||
        aggregator.max_attempts < 1 || aggregator.retry_backoff_ms < 0 ||
        aggregator.lookback_days < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "aggregator timeouts, attempts and lookback must be positive",
                                "EngineConfig");
    }
    if (stream.subscriber_buffer_size == 0 || stream.keepalive_ms <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "stream buffer size and keepalive must be positive",
                                "EngineConfig");
    }
    if (sessions.finished_session_ttl_ms < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "sessions.finished_session_ttl_ms must not be negative",
                                "EngineConfig");
    }
    if (server.port <= 0 || server.port > 65535) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "server.port out of range: " + std::to_string(server.port),
                                "EngineConfig");
    }

    std::set<std::string> ids;
    for (const auto& remote : remote_producers) {
        if (remote.id.empty() || remote.endpoint.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "remote producers need an id and an endpoint",
                                    "EngineConfig");
        }
        if (remote.timeout_ms <= 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "remote producer " + remote.id +
                                        " needs a positive timeout_ms",
                                    "EngineConfig");
        }
        if (!ids.insert(remote.id).second) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "duplicate remote producer id: " + remote.id,
                                    "EngineConfig");
        }
    }
    return Result<void>();
}

std::vector<std::string> EngineConfig::budget_warnings() const {
    std::vector<std::string> warnings;
    const int attempts = std::max(aggregator.max_attempts, 1);
    for (const auto& remote : remote_producers) {
        // Worst case: every attempt times out, with doubling backoff in between
        long worst_ms = remote.timeout_ms * attempts;
        long backoff_ms = aggregator.retry_backoff_ms;
        for (int i = 1; i < attempts; ++i) {
            worst_ms += backoff_ms;
            backoff_ms *= 2;
        }
        if (worst_ms > aggregator.producer_timeout_ms) {
            warnings.push_back("remote producer " + remote.id + " may need " +
                               std::to_string(worst_ms) + "ms over " + std::to_string(attempts) +
                               " attempts but aggregator.producer_timeout_ms is " +
                               std::to_string(aggregator.producer_timeout_ms) + "ms");
        }
    }
    return warnings;
}

Result<std::shared_ptr<ProducerRegistry>> create_producer_registry(const EngineConfig& config) {
    for (const auto& warning : config.budget_warnings()) {
        WARN(warning);
    }

    auto registry = std::make_shared<ProducerRegistry>();

    std::vector<std::shared_ptr<SignalProducer>> producers = {
        std::make_shared<TrendSignalProducer>(),
        std::make_shared<MeanReversionSignalProducer>()};
    for (const auto& remote : config.remote_producers) {
        try {
            producers.push_back(std::make_shared<RemoteSignalProducer>(remote));
        } catch (const HedgeError& e) {
            return make_error<std::shared_ptr<ProducerRegistry>>(e.code(), e.what(),
                                                                 e.component());
        }
    }

    for (const auto& producer : producers) {
        auto registered = registry->register_producer(producer);
        if (registered.is_error()) {
            return forward_error<std::shared_ptr<ProducerRegistry>>(registered.error());
        }
    }
    return Result<std::shared_ptr<ProducerRegistry>>(registry);
}

}  // namespace hedge_ngin
