// include/hedge_ngin/data/csv_market_data_provider.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "hedge_ngin/data/in_memory_market_data_provider.hpp"

namespace hedge_ngin {

/**
 * @brief Market data read from per-ticker CSV files
 *
 * Each ticker lives in `<directory>/<TICKER>.csv` with the header
 * `date,open,high,low,close,volume` and dates formatted as YYYY-MM-DD.
 * A file is parsed through the Arrow CSV reader the first time its ticker is
 * requested and cached for the lifetime of the provider.
 */
class CsvMarketDataProvider : public MarketDataProvider {
public:
    explicit CsvMarketDataProvider(std::string directory);

    Result<Bar> get_bar(const std::string& ticker, const Timestamp& date) const override;

    Result<std::vector<Bar>> get_bars(const std::string& ticker, const Timestamp& start,
                                      const Timestamp& end) const override;

    Result<std::vector<Timestamp>> get_trading_dates(const std::string& ticker,
                                                     const Timestamp& start,
                                                     const Timestamp& end) const override;

    /**
     * @brief Read a CSV file into an Arrow table
     * @param path File path
     * @return Table with `date` as utf8 and price/volume columns as float64
     */
    static Result<std::shared_ptr<arrow::Table>> read_table(const std::string& path);

    /**
     * @brief Convert a table produced by read_table into bars
     * @param table Arrow table
     * @param ticker Symbol assigned to every bar
     */
    static Result<std::vector<Bar>> table_to_bars(const std::shared_ptr<arrow::Table>& table,
                                                  const std::string& ticker);

    const std::string& directory() const {
        return directory_;
    }

private:
    Result<void> ensure_loaded(const std::string& ticker) const;

    std::string directory_;
    mutable std::mutex load_mutex_;
    mutable std::unordered_set<std::string> loaded_;
    mutable InMemoryMarketDataProvider cache_;
};

}  // namespace hedge_ngin
