// src/data/in_memory_market_data_provider.cpp

#include "hedge_ngin/data/in_memory_market_data_provider.hpp"
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {

Result<void> InMemoryMarketDataProvider::add_bar(const Bar& bar) {
    if (bar.symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Bar has no symbol",
                                "InMemoryMarketDataProvider");
    }
    if (!(bar.close > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Non-positive close for " + bar.symbol + " on " +
                                    core::format_date(bar.timestamp),
                                "InMemoryMarketDataProvider");
    }

    Bar stored = bar;
    stored.timestamp = core::to_utc_day(bar.timestamp);

    std::lock_guard<std::mutex> lock(mutex_);
    bars_[stored.symbol][stored.timestamp] = stored;
    return Result<void>();
}

Result<void> InMemoryMarketDataProvider::add_bars(const std::vector<Bar>& bars) {
    for (const auto& bar : bars) {
        auto result = add_bar(bar);
        if (result.is_error()) {
            return result;
        }
    }
    return Result<void>();
}

bool InMemoryMarketDataProvider::has_ticker(const std::string& ticker) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bars_.find(ticker) != bars_.end();
}

Result<Bar> InMemoryMarketDataProvider::get_bar(const std::string& ticker,
                                                const Timestamp& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bars_.find(ticker);
    if (it != bars_.end()) {
        auto bar_it = it->second.find(core::to_utc_day(date));
        if (bar_it != it->second.end()) {
            return Result<Bar>(bar_it->second);
        }
    }
    return make_error<Bar>(ErrorCode::DATA_NOT_FOUND,
                           "No bar for " + ticker + " on " + core::format_date(date),
                           "InMemoryMarketDataProvider");
}

Result<std::vector<Bar>> InMemoryMarketDataProvider::get_bars(const std::string& ticker,
                                                              const Timestamp& start,
                                                              const Timestamp& end) const {
    std::vector<Bar> result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bars_.find(ticker);
    if (it == bars_.end()) {
        return Result<std::vector<Bar>>(result);
    }

    auto first = it->second.lower_bound(core::to_utc_day(start));
    auto last = it->second.upper_bound(core::to_utc_day(end));
    for (auto bar_it = first; bar_it != last; ++bar_it) {
        result.push_back(bar_it->second);
    }
    return Result<std::vector<Bar>>(result);
}

Result<std::vector<Timestamp>> InMemoryMarketDataProvider::get_trading_dates(
    const std::string& ticker, const Timestamp& start, const Timestamp& end) const {
    std::vector<Timestamp> dates;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bars_.find(ticker);
    if (it == bars_.end()) {
        return Result<std::vector<Timestamp>>(dates);
    }

    auto first = it->second.lower_bound(core::to_utc_day(start));
    auto last = it->second.upper_bound(core::to_utc_day(end));
    for (auto bar_it = first; bar_it != last; ++bar_it) {
        dates.push_back(bar_it->first);
    }
    return Result<std::vector<Timestamp>>(dates);
}

}  // namespace hedge_ngin
