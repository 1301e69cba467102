// include/hedge_ngin/signals/signal_producer.hpp
#pragma once

#include <string>
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/signals/types.hpp"

namespace hedge_ngin {

/**
 * @brief Interface for decision sources consulted once per ticker per day
 *
 * A single producer instance is shared by every session, so generate_signal must be
 * safe to call from several threads at once.
 */
class SignalProducer {
public:
    virtual ~SignalProducer() = default;

    /**
     * @brief Identifier used to select the producer in a backtest request
     */
    virtual const std::string& id() const = 0;

    /**
     * @brief Form a view on context.ticker for context.date
     * @param context Market and position context for the call
     * @return Signal, UPSTREAM_TIMEOUT when a remote producer timed out, or any other error
     */
    virtual Result<Signal> generate_signal(const SignalContext& context) const = 0;
};

}  // namespace hedge_ngin
