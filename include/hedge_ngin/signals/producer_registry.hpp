// include/hedge_ngin/signals/producer_registry.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "hedge_ngin/signals/signal_producer.hpp"

namespace hedge_ngin {

/**
 * @brief Named set of signal producers available to backtest requests
 */
class ProducerRegistry {
public:
    /**
     * @brief Register a producer under its id
     * @return INVALID_ARGUMENT for a null producer or a duplicate id
     */
    Result<void> register_producer(std::shared_ptr<SignalProducer> producer);

    /**
     * @brief Look up a producer by id
     * @return NOT_FOUND if no producer has that id
     */
    Result<std::shared_ptr<SignalProducer>> get(const std::string& id) const;

    /**
     * @brief Resolve a list of ids, preserving order
     * @return NOT_FOUND naming the first unknown id
     */
    Result<std::vector<std::shared_ptr<SignalProducer>>> resolve(
        const std::vector<std::string>& ids) const;

    bool contains(const std::string& id) const;

    std::vector<std::string> ids() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SignalProducer>> producers_;
};

}  // namespace hedge_ngin
