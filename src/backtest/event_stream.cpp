// src/backtest/event_stream.cpp

#include "hedge_ngin/backtest/event_stream.hpp"
#include <algorithm>
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {
namespace backtest {

Subscription::Subscription(size_t id, size_t capacity)
    : id_(id), capacity_(capacity == 0 ? 1 : capacity) {}

void Subscription::push(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }

        if (buffer_.size() >= capacity_) {
            auto victim = std::find_if(buffer_.begin(), buffer_.end(),
                                       [](const Event& e) { return !e.is_terminal(); });
            if (victim != buffer_.end()) {
                buffer_.erase(victim);
                ++dropped_;
            } else if (!event.is_terminal()) {
                ++dropped_;
                return;
            }
        }

        buffer_.push_back(event);
        if (event.is_terminal()) {
            closed_ = true;
        }
    }
    cv_.notify_all();
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<Event> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !buffer_.empty() || closed_; });
    if (buffer_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(buffer_.front());
    buffer_.pop_front();
    return event;
}

bool Subscription::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && buffer_.empty();
}

bool Subscription::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Subscription::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

EventBroadcaster::EventBroadcaster(size_t buffer_size) : buffer_size_(buffer_size) {}

std::shared_ptr<Subscription> EventBroadcaster::subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto subscription = std::make_shared<Subscription>(next_id_++, buffer_size_);
    if (closed_) {
        subscription->close();
        return subscription;
    }
    subscribers_.push_back(subscription);
    return subscription;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription),
                       subscribers_.end());
}

bool EventBroadcaster::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        WARN("Discarding " << event_type_name(event.type()) << " event for closed stream "
                           << event.backtest_id);
        return false;
    }

    for (const auto& subscriber : subscribers_) {
        subscriber->push(event);
    }

    if (event.is_terminal()) {
        closed_ = true;
        subscribers_.clear();
    }
    return true;
}

void EventBroadcaster::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (const auto& subscriber : subscribers_) {
        subscriber->close();
    }
    subscribers_.clear();
}

bool EventBroadcaster::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

}  // namespace backtest
}  // namespace hedge_ngin
