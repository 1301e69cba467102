// src/signals/producer_registry.cpp

#include "hedge_ngin/signals/producer_registry.hpp"
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {

Result<void> ProducerRegistry::register_producer(std::shared_ptr<SignalProducer> producer) {
    if (!producer) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Null signal producer",
                                "ProducerRegistry");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = producer->id();
    if (id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Signal producer has an empty id",
                                "ProducerRegistry");
    }
    if (producers_.count(id) > 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Signal producer already registered: " + id, "ProducerRegistry");
    }

    producers_.emplace(id, std::move(producer));
    DEBUG("Registered signal producer " << id);
    return Result<void>();
}

Result<std::shared_ptr<SignalProducer>> ProducerRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = producers_.find(id);
    if (it == producers_.end()) {
        return make_error<std::shared_ptr<SignalProducer>>(
            ErrorCode::NOT_FOUND, "Unknown signal producer: " + id, "ProducerRegistry");
    }
    return Result<std::shared_ptr<SignalProducer>>(it->second);
}

Result<std::vector<std::shared_ptr<SignalProducer>>> ProducerRegistry::resolve(
    const std::vector<std::string>& ids) const {
    std::vector<std::shared_ptr<SignalProducer>> resolved;
    resolved.reserve(ids.size());
    for (const auto& id : ids) {
        auto producer = get(id);
        if (producer.is_error()) {
            return forward_error<std::vector<std::shared_ptr<SignalProducer>>>(producer.error());
        }
        resolved.push_back(producer.value());
    }
    return Result<std::vector<std::shared_ptr<SignalProducer>>>(std::move(resolved));
}

bool ProducerRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return producers_.count(id) > 0;
}

std::vector<std::string> ProducerRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(producers_.size());
    for (const auto& entry : producers_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t ProducerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return producers_.size();
}

}  // namespace hedge_ngin
