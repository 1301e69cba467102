// include/hedge_ngin/signals/remote_signal_producer.hpp
#pragma once

#include <string>
#include "hedge_ngin/core/config_base.hpp"
#include "hedge_ngin/signals/signal_producer.hpp"

namespace hedge_ngin {

/**
 * @brief Connection settings for a producer reached over HTTP
 */
struct RemoteProducerConfig : public ConfigBase {
    std::string id;
    std::string endpoint;    // Full URL receiving the POST
    long timeout_ms{10000};  // Transport timeout for one call

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["id"] = id;
        j["endpoint"] = endpoint;
        j["timeout_ms"] = timeout_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("id"))
            id = j.at("id").get<std::string>();
        if (j.contains("endpoint"))
            endpoint = j.at("endpoint").get<std::string>();
        if (j.contains("timeout_ms"))
            timeout_ms = j.at("timeout_ms").get<long>();
    }
};

/**
 * @brief Adapter for an external producer service
 *
 * POSTs the signal context as JSON and expects
 * {"direction": "...", "confidence": n, "reasoning": "..."} back.
 * A transport timeout maps to UPSTREAM_TIMEOUT; any other transport, HTTP or
 * parse failure maps to API_ERROR.
 */
class RemoteSignalProducer : public SignalProducer {
public:
    explicit RemoteSignalProducer(RemoteProducerConfig config);

    const std::string& id() const override {
        return config_.id;
    }

    Result<Signal> generate_signal(const SignalContext& context) const override;

    /**
     * @brief Request body sent for a context
     */
    nlohmann::json build_request(const SignalContext& context) const;

    const RemoteProducerConfig& config() const {
        return config_;
    }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* out);

    RemoteProducerConfig config_;
};

}  // namespace hedge_ngin
