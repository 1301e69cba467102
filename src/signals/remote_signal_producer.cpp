// src/signals/remote_signal_producer.cpp

#include "hedge_ngin/signals/remote_signal_producer.hpp"
#include <curl/curl.h>
#include <mutex>
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {

namespace {

std::once_flag curl_init_flag;

}  // namespace

RemoteSignalProducer::RemoteSignalProducer(RemoteProducerConfig config)
    : config_(std::move(config)) {
    // curl treats a zero timeout as no timeout at all
    if (config_.timeout_ms <= 0) {
        throw HedgeError(ErrorCode::INVALID_ARGUMENT,
                         "Remote producer " + config_.id + " needs a positive timeout_ms",
                         "RemoteSignalProducer");
    }
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t RemoteSignalProducer::write_callback(void* contents, size_t size, size_t nmemb,
                                            std::string* out) {
    size_t total = size * nmemb;
    out->append(static_cast<char*>(contents), total);
    return total;
}

nlohmann::json RemoteSignalProducer::build_request(const SignalContext& context) const {
    nlohmann::json body = context.to_json();
    body["producer_id"] = config_.id;
    return body;
}

Result<Signal> RemoteSignalProducer::generate_signal(const SignalContext& context) const {
    const std::string payload = build_request(context).dump();
    std::string response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<Signal>(ErrorCode::API_ERROR, "Failed to initialize curl",
                                  "RemoteSignalProducer");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, RemoteSignalProducer::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<Signal>(ErrorCode::UPSTREAM_TIMEOUT,
                                  config_.id + " timed out after " +
                                      std::to_string(config_.timeout_ms) + "ms",
                                  "RemoteSignalProducer");
    }
    if (res != CURLE_OK) {
        return make_error<Signal>(ErrorCode::API_ERROR,
                                  config_.id + " request failed: " + curl_easy_strerror(res),
                                  "RemoteSignalProducer");
    }
    if (http_code < 200 || http_code >= 300) {
        return make_error<Signal>(ErrorCode::API_ERROR,
                                  config_.id + " returned HTTP " + std::to_string(http_code),
                                  "RemoteSignalProducer");
    }

    nlohmann::json body = nlohmann::json::parse(response, nullptr, false);
    if (body.is_discarded()) {
        return make_error<Signal>(ErrorCode::API_ERROR,
                                  config_.id + " returned a body that is not JSON",
                                  "RemoteSignalProducer");
    }

    auto signal = Signal::from_json(body, config_.id, context.ticker, context.date);
    if (signal.is_error()) {
        return make_error<Signal>(ErrorCode::API_ERROR,
                                  config_.id + ": " + signal.error()->what(),
                                  "RemoteSignalProducer");
    }

    TRACE(config_.id << " -> " << context.ticker << ": "
                     << direction_to_string(signal.value().direction));
    return signal;
}

}  // namespace hedge_ngin
