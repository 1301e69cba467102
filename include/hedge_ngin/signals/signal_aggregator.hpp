// include/hedge_ngin/signals/signal_aggregator.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "hedge_ngin/core/config_base.hpp"
#include "hedge_ngin/core/thread_pool.hpp"
#include "hedge_ngin/signals/signal_producer.hpp"

namespace hedge_ngin {

/**
 * @brief Settings for collecting producer signals
 */
struct AggregatorConfig : public ConfigBase {
    size_t worker_threads{4};        // Shared worker pool size
    size_t max_queue_size{1024};     // Bounded task queue of the pool
    long producer_timeout_ms{30000};  // Per-call deadline measured from the call's start
    long max_queue_wait_ms{300000};   // How long a day waits for queued calls to start
    int max_attempts{3};             // Attempts for calls failing with UPSTREAM_TIMEOUT
    long retry_backoff_ms{100};      // Delay before the first retry, doubled afterwards
    int lookback_days{30};           // Calendar days of bars handed to producers

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["worker_threads"] = worker_threads;
        j["max_queue_size"] = max_queue_size;
        j["producer_timeout_ms"] = producer_timeout_ms;
        j["max_queue_wait_ms"] = max_queue_wait_ms;
        j["max_attempts"] = max_attempts;
        j["retry_backoff_ms"] = retry_backoff_ms;
        j["lookback_days"] = lookback_days;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("worker_threads"))
            worker_threads = j.at("worker_threads").get<size_t>();
        if (j.contains("max_queue_size"))
            max_queue_size = j.at("max_queue_size").get<size_t>();
        if (j.contains("producer_timeout_ms"))
            producer_timeout_ms = j.at("producer_timeout_ms").get<long>();
        if (j.contains("max_queue_wait_ms"))
            max_queue_wait_ms = j.at("max_queue_wait_ms").get<long>();
        if (j.contains("max_attempts"))
            max_attempts = j.at("max_attempts").get<int>();
        if (j.contains("retry_backoff_ms"))
            retry_backoff_ms = j.at("retry_backoff_ms").get<long>();
        if (j.contains("lookback_days"))
            lookback_days = j.at("lookback_days").get<int>();
    }
};

/**
 * @brief Signals gathered for one ticker on one day
 */
struct TickerSignals {
    std::string ticker;
    std::vector<Signal> signals;        // In producer selection order, failed calls omitted
    std::vector<std::string> warnings;  // One entry per omitted call
};

/**
 * @brief Fans producer calls out on the worker pool and joins them
 *
 * Every (producer, ticker) call of a day is dispatched before any is awaited, and
 * collect_day returns only once each call has finished or passed its deadline.
 * The deadline of a call starts when a worker picks it up, so time spent queued behind
 * other calls does not count against producer_timeout_ms. A call that fails or misses
 * its deadline contributes a warning instead of a signal. Calls still running past their
 * deadline are abandoned, not interrupted; calls abandoned while queued never run.
 */
class SignalAggregator {
public:
    SignalAggregator(std::shared_ptr<ThreadPool> pool, AggregatorConfig config);

    /**
     * @brief Collect the signals of every producer for every context
     * @param producers Selected producers, in request order
     * @param contexts One context per tradable ticker
     * @return Map keyed by ticker
     */
    std::map<std::string, TickerSignals> collect_day(
        const std::vector<std::shared_ptr<SignalProducer>>& producers,
        const std::vector<SignalContext>& contexts) const;

    /**
     * @brief Collect signals for a single ticker
     */
    TickerSignals collect(const std::vector<std::shared_ptr<SignalProducer>>& producers,
                          const SignalContext& context) const;

    const AggregatorConfig& config() const {
        return config_;
    }

private:
    /**
     * @brief Call a producer with retry on UPSTREAM_TIMEOUT, converting exceptions to errors
     */
    static Result<Signal> call_producer(const SignalProducer& producer,
                                        const SignalContext& context,
                                        const AggregatorConfig& config);

    std::shared_ptr<ThreadPool> pool_;
    AggregatorConfig config_;
};

}  // namespace hedge_ngin
