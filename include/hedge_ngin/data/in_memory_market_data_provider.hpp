// include/hedge_ngin/data/in_memory_market_data_provider.hpp
#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "hedge_ngin/data/market_data_provider.hpp"

namespace hedge_ngin {

/**
 * @brief Market data held in memory, keyed by ticker and UTC day
 */
class InMemoryMarketDataProvider : public MarketDataProvider {
public:
    InMemoryMarketDataProvider() = default;

    /**
     * @brief Insert or replace a bar
     * @param bar Bar whose symbol names the ticker; the timestamp is truncated to its UTC day
     * @return INVALID_DATA for an empty symbol or a non-positive close
     */
    Result<void> add_bar(const Bar& bar);

    /**
     * @brief Insert several bars, stopping at the first invalid one
     */
    Result<void> add_bars(const std::vector<Bar>& bars);

    bool has_ticker(const std::string& ticker) const;

    Result<Bar> get_bar(const std::string& ticker, const Timestamp& date) const override;

    Result<std::vector<Bar>> get_bars(const std::string& ticker, const Timestamp& start,
                                      const Timestamp& end) const override;

    Result<std::vector<Timestamp>> get_trading_dates(const std::string& ticker,
                                                     const Timestamp& start,
                                                     const Timestamp& end) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<Timestamp, Bar>> bars_;
};

}  // namespace hedge_ngin
