// include/hedge_ngin/data/market_data_provider.hpp
#pragma once

#include <string>
#include <vector>
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/core/types.hpp"

namespace hedge_ngin {

/**
 * @brief Source of daily bars for the simulation
 *
 * Implementations must be safe to call concurrently from several session threads.
 * Dates are UTC-midnight timestamps and ranges are inclusive on both ends.
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /**
     * @brief Bar for one ticker on one day
     * @return DATA_NOT_FOUND if the ticker did not trade that day
     */
    virtual Result<Bar> get_bar(const std::string& ticker, const Timestamp& date) const = 0;

    /**
     * @brief All bars of a ticker within [start, end], ascending by date
     * @return Possibly empty vector, or an error if the ticker's data cannot be read
     */
    virtual Result<std::vector<Bar>> get_bars(const std::string& ticker, const Timestamp& start,
                                              const Timestamp& end) const = 0;

    /**
     * @brief Dates within [start, end] on which the ticker has a bar, ascending
     */
    virtual Result<std::vector<Timestamp>> get_trading_dates(const std::string& ticker,
                                                             const Timestamp& start,
                                                             const Timestamp& end) const = 0;
};

}  // namespace hedge_ngin
