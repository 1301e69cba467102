// src/signals/signal_aggregator.cpp

#include "hedge_ngin/signals/signal_aggregator.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include "hedge_ngin/core/logger.hpp"
#include "hedge_ngin/core/retry.hpp"

namespace hedge_ngin {

namespace {

constexpr std::chrono::milliseconds kStartPollInterval{50};

/**
 * @brief Start handshake between a queued task and the thread awaiting it
 */
class CallState {
public:
    /**
     * @brief Called by the worker before running the producer
     * @return false if the caller already gave up on this call
     */
    bool begin() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_) {
            return false;
        }
        started_ = true;
        started_at_ = std::chrono::steady_clock::now();
        cv_.notify_all();
        return true;
    }

    /**
     * @brief Wait until the call starts or `until` passes
     * @return Start time if a worker has picked the call up
     */
    std::optional<std::chrono::steady_clock::time_point> wait_start(
        std::chrono::steady_clock::time_point until) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_until(lock, until, [this] { return started_; })) {
            return std::nullopt;
        }
        return started_at_;
    }

    /**
     * @brief Give up on a call that has not started
     * @return Start time if a worker won the race and started it anyway
     */
    std::optional<std::chrono::steady_clock::time_point> abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return started_at_;
        }
        abandoned_ = true;
        return std::nullopt;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool started_{false};
    bool abandoned_{false};
    std::chrono::steady_clock::time_point started_at_;
};

struct PendingCall {
    std::string ticker;
    std::string producer_id;
    std::shared_ptr<CallState> state;
    std::future<Result<Signal>> future;
    bool dispatched{false};
    std::string dispatch_error;
};

}  // namespace

SignalAggregator::SignalAggregator(std::shared_ptr<ThreadPool> pool, AggregatorConfig config)
    : pool_(std::move(pool)), config_(config) {
    if (!pool_) {
        throw HedgeError(ErrorCode::INVALID_ARGUMENT, "Signal aggregator needs a thread pool",
                         "SignalAggregator");
    }
}

Result<Signal> SignalAggregator::call_producer(const SignalProducer& producer,
                                               const SignalContext& context,
                                               const AggregatorConfig& config) {
    auto attempt = [&producer, &context]() -> Result<Signal> {
        try {
            return producer.generate_signal(context);
        } catch (const std::exception& e) {
            return make_error<Signal>(ErrorCode::PRODUCER_ERROR,
                                      producer.id() + " threw: " + e.what(),
                                      "SignalAggregator");
        }
    };

    auto result = utils::retry_with_backoff(attempt, std::max(config.max_attempts, 1),
                                            std::chrono::milliseconds(config.retry_backoff_ms),
                                            ErrorCode::UPSTREAM_TIMEOUT);
    if (result.is_error()) {
        return result;
    }

    Signal signal = result.value();
    signal.producer_id = producer.id();
    signal.ticker = context.ticker;
    signal.date = context.date;

    auto valid = validate_signal(signal);
    if (valid.is_error()) {
        return forward_error<Signal>(valid.error());
    }
    return Result<Signal>(std::move(signal));
}

std::map<std::string, TickerSignals> SignalAggregator::collect_day(
    const std::vector<std::shared_ptr<SignalProducer>>& producers,
    const std::vector<SignalContext>& contexts) const {
    std::map<std::string, TickerSignals> results;
    std::vector<PendingCall> calls;
    calls.reserve(producers.size() * contexts.size());

    const auto timeout = std::chrono::milliseconds(config_.producer_timeout_ms);
    const auto queue_deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.max_queue_wait_ms);

    for (const auto& context : contexts) {
        results[context.ticker].ticker = context.ticker;
        auto shared_context = std::make_shared<const SignalContext>(context);

        for (const auto& producer : producers) {
            PendingCall call;
            call.ticker = context.ticker;
            call.producer_id = producer->id();
            call.state = std::make_shared<CallState>();

            // The task owns copies of its inputs so an abandoned call never dangles
            try {
                call.future = pool_->submit([producer, shared_context, state = call.state,
                                             config = config_]() {
                    if (!state->begin()) {
                        return make_error<Signal>(ErrorCode::UPSTREAM_TIMEOUT,
                                                  producer->id() + " abandoned before start",
                                                  "SignalAggregator");
                    }
                    return call_producer(*producer, *shared_context, config);
                });
                call.dispatched = true;
            } catch (const std::exception& e) {
                call.dispatch_error = e.what();
            }
            calls.push_back(std::move(call));
        }
    }

    for (auto& call : calls) {
        auto& bucket = results[call.ticker];

        if (!call.dispatched) {
            bucket.warnings.push_back(call.ticker + ": " + call.producer_id +
                                      " could not be dispatched: " + call.dispatch_error);
            WARN(bucket.warnings.back());
            continue;
        }

        // Poll so a task the pool discards (broken promise) is noticed before queue_deadline
        std::optional<std::chrono::steady_clock::time_point> started_at;
        while (!started_at) {
            auto slice = std::min(queue_deadline,
                                  std::chrono::steady_clock::now() + kStartPollInterval);
            started_at = call.state->wait_start(slice);
            if (started_at) {
                break;
            }
            if (std::chrono::steady_clock::now() >= queue_deadline ||
                call.future.wait_for(std::chrono::milliseconds(0)) ==
                    std::future_status::ready) {
                started_at = call.state->abandon();
                break;
            }
        }

        if (!started_at) {
            if (call.future.wait_for(std::chrono::milliseconds(0)) !=
                std::future_status::ready) {
                bucket.warnings.push_back(call.ticker + ": " + call.producer_id +
                                          " still queued after " +
                                          std::to_string(config_.max_queue_wait_ms) + "ms");
                WARN(bucket.warnings.back());
                continue;
            }
            // Discarded by the pool; get() below reports the broken promise
        } else if (call.future.wait_until(*started_at + timeout) != std::future_status::ready) {
            bucket.warnings.push_back(call.ticker + ": " + call.producer_id + " timed out after " +
                                      std::to_string(config_.producer_timeout_ms) + "ms");
            WARN(bucket.warnings.back());
            continue;
        }

        try {
            auto result = call.future.get();
            if (result.is_error()) {
                bucket.warnings.push_back(call.ticker + ": " + call.producer_id +
                                          " signal dropped: " + result.error()->what());
                WARN(bucket.warnings.back());
                continue;
            }
            bucket.signals.push_back(result.value());
        } catch (const std::exception& e) {
            bucket.warnings.push_back(call.ticker + ": " + call.producer_id +
                                      " signal dropped: " + e.what());
            WARN(bucket.warnings.back());
        }
    }

    return results;
}

TickerSignals SignalAggregator::collect(
    const std::vector<std::shared_ptr<SignalProducer>>& producers,
    const SignalContext& context) const {
    auto day = collect_day(producers, {context});
    return day[context.ticker];
}

}  // namespace hedge_ngin
