// include/hedge_ngin/backtest/event_stream.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "hedge_ngin/backtest/events.hpp"
#include "hedge_ngin/core/config_base.hpp"

namespace hedge_ngin {
namespace backtest {

/**
 * @brief Settings for session event streams
 */
struct StreamConfig : public ConfigBase {
    size_t subscriber_buffer_size{1024};  // Events buffered per subscriber
    long keepalive_ms{15000};             // Idle time before an SSE keepalive frame

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["subscriber_buffer_size"] = subscriber_buffer_size;
        j["keepalive_ms"] = keepalive_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("subscriber_buffer_size"))
            subscriber_buffer_size = j.at("subscriber_buffer_size").get<size_t>();
        if (j.contains("keepalive_ms"))
            keepalive_ms = j.at("keepalive_ms").get<long>();
    }
};

/**
 * @brief One consumer's view of a session stream
 *
 * Holds at most `capacity` events. When full, the oldest non-terminal event is
 * dropped to make room; terminal events are always kept.
 */
class Subscription {
public:
    Subscription(size_t id, size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /**
     * @brief Wait for the next event
     * @param timeout Maximum wait
     * @return The event, or nullopt on timeout or once the stream is finished
     */
    std::optional<Event> next(std::chrono::milliseconds timeout);

    /**
     * @brief Closed and fully drained
     */
    bool finished() const;

    bool is_closed() const;

    /**
     * @brief Number of events discarded because the buffer was full
     */
    size_t dropped() const;

    size_t id() const {
        return id_;
    }

private:
    friend class EventBroadcaster;

    void push(const Event& event);
    void close();

    const size_t id_;
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> buffer_;
    bool closed_{false};
    size_t dropped_{0};
};

/**
 * @brief Fans a session's events out to every attached subscription
 *
 * publish never blocks on a consumer. No replay: a subscriber only sees events
 * published after it attached. Once a terminal event is published the broadcaster
 * closes and later subscribers get an already closed subscription.
 */
class EventBroadcaster {
public:
    explicit EventBroadcaster(size_t buffer_size = 1024);

    std::shared_ptr<Subscription> subscribe();

    void unsubscribe(const std::shared_ptr<Subscription>& subscription);

    /**
     * @brief Deliver an event to every subscriber
     * @return false if the broadcaster was already closed and the event was discarded
     */
    bool publish(const Event& event);

    /**
     * @brief Close every subscription without a terminal event
     */
    void close();

    bool is_closed() const;

    size_t subscriber_count() const;

private:
    const size_t buffer_size_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Subscription>> subscribers_;
    size_t next_id_{1};
    bool closed_{false};
};

}  // namespace backtest
}  // namespace hedge_ngin
