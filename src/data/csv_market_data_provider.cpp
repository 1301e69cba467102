// src/data/csv_market_data_provider.cpp

#include "hedge_ngin/data/csv_market_data_provider.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <filesystem>
#include "hedge_ngin/core/logger.hpp"
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {

namespace {

const std::vector<std::string> kRequiredColumns = {"date", "open", "high", "low", "close",
                                                   "volume"};

Result<double> extract_double(const std::shared_ptr<arrow::DoubleArray>& array, int64_t index,
                              const std::string& column) {
    if (array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null " + column + " value at row " + std::to_string(index),
                                  "CsvMarketDataProvider");
    }
    return Result<double>(array->Value(index));
}

}  // namespace

CsvMarketDataProvider::CsvMarketDataProvider(std::string directory)
    : directory_(std::move(directory)) {}

Result<std::shared_ptr<arrow::Table>> CsvMarketDataProvider::read_table(const std::string& path) {
    auto maybe_input = arrow::io::ReadableFile::Open(path);
    if (!maybe_input.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_NOT_FOUND,
            "Cannot open " + path + ": " + maybe_input.status().ToString(),
            "CsvMarketDataProvider");
    }
    std::shared_ptr<arrow::io::ReadableFile> input = *maybe_input;

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.column_types["date"] = arrow::utf8();
    for (const char* column : {"open", "high", "low", "close", "volume"}) {
        convert_options.column_types[column] = arrow::float64();
    }

    auto maybe_reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                                      read_options, parse_options,
                                                      convert_options);
    if (!maybe_reader.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR,
            "Cannot create CSV reader for " + path + ": " + maybe_reader.status().ToString(),
            "CsvMarketDataProvider");
    }

    auto maybe_table = (*maybe_reader)->Read();
    if (!maybe_table.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Cannot parse " + path + ": " + maybe_table.status().ToString(),
            "CsvMarketDataProvider");
    }

    // Single chunk per column so rows can be addressed directly
    auto maybe_combined = (*maybe_table)->CombineChunks(arrow::default_memory_pool());
    if (!maybe_combined.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Cannot combine chunks of " + path + ": " + maybe_combined.status().ToString(),
            "CsvMarketDataProvider");
    }
    return Result<std::shared_ptr<arrow::Table>>(*maybe_combined);
}

Result<std::vector<Bar>> CsvMarketDataProvider::table_to_bars(
    const std::shared_ptr<arrow::Table>& table, const std::string& ticker) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "CsvMarketDataProvider");
    }

    for (const auto& col : kRequiredColumns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Missing required column: " + col,
                                                "CsvMarketDataProvider");
        }
    }

    std::vector<Bar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<Bar>>(bars);
    }

    auto date_array =
        std::static_pointer_cast<arrow::StringArray>(table->GetColumnByName("date")->chunk(0));
    auto open_array =
        std::static_pointer_cast<arrow::DoubleArray>(table->GetColumnByName("open")->chunk(0));
    auto high_array =
        std::static_pointer_cast<arrow::DoubleArray>(table->GetColumnByName("high")->chunk(0));
    auto low_array =
        std::static_pointer_cast<arrow::DoubleArray>(table->GetColumnByName("low")->chunk(0));
    auto close_array =
        std::static_pointer_cast<arrow::DoubleArray>(table->GetColumnByName("close")->chunk(0));
    auto volume_array =
        std::static_pointer_cast<arrow::DoubleArray>(table->GetColumnByName("volume")->chunk(0));

    bars.reserve(table->num_rows());

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        if (date_array->IsNull(i)) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Null date at row " + std::to_string(i),
                                                "CsvMarketDataProvider");
        }
        std::string date_str = date_array->GetString(i);
        auto date = core::parse_date(date_str);
        if (!date) {
            return make_error<std::vector<Bar>>(
                ErrorCode::CONVERSION_ERROR,
                "Invalid date '" + date_str + "' at row " + std::to_string(i),
                "CsvMarketDataProvider");
        }

        auto open_result = extract_double(open_array, i, "open");
        auto high_result = extract_double(high_array, i, "high");
        auto low_result = extract_double(low_array, i, "low");
        auto close_result = extract_double(close_array, i, "close");
        auto volume_result = extract_double(volume_array, i, "volume");

        if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
            close_result.is_error() || volume_result.is_error()) {
            return make_error<std::vector<Bar>>(
                ErrorCode::CONVERSION_ERROR,
                "Error extracting OHLCV values at row " + std::to_string(i),
                "CsvMarketDataProvider");
        }

        bars.emplace_back(*date, open_result.value(), high_result.value(), low_result.value(),
                          close_result.value(), volume_result.value(), ticker);
    }

    return Result<std::vector<Bar>>(bars);
}

Result<void> CsvMarketDataProvider::ensure_loaded(const std::string& ticker) const {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (loaded_.count(ticker) > 0) {
        return Result<void>();
    }

    std::filesystem::path path = std::filesystem::path(directory_) / (ticker + ".csv");
    if (!std::filesystem::exists(path)) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND,
                                "No data file for " + ticker + ": " + path.string(),
                                "CsvMarketDataProvider");
    }

    auto table_result = read_table(path.string());
    if (table_result.is_error()) {
        return forward_error<void>(table_result.error());
    }

    auto bars_result = table_to_bars(table_result.value(), ticker);
    if (bars_result.is_error()) {
        return forward_error<void>(bars_result.error());
    }

    auto add_result = cache_.add_bars(bars_result.value());
    if (add_result.is_error()) {
        return add_result;
    }

    loaded_.insert(ticker);
    INFO("Loaded " << bars_result.value().size() << " bars for " << ticker << " from "
                   << path.string());
    return Result<void>();
}

Result<Bar> CsvMarketDataProvider::get_bar(const std::string& ticker,
                                           const Timestamp& date) const {
    auto loaded = ensure_loaded(ticker);
    if (loaded.is_error()) {
        return forward_error<Bar>(loaded.error());
    }
    return cache_.get_bar(ticker, date);
}

Result<std::vector<Bar>> CsvMarketDataProvider::get_bars(const std::string& ticker,
                                                         const Timestamp& start,
                                                         const Timestamp& end) const {
    auto loaded = ensure_loaded(ticker);
    if (loaded.is_error()) {
        return forward_error<std::vector<Bar>>(loaded.error());
    }
    return cache_.get_bars(ticker, start, end);
}

Result<std::vector<Timestamp>> CsvMarketDataProvider::get_trading_dates(
    const std::string& ticker, const Timestamp& start, const Timestamp& end) const {
    auto loaded = ensure_loaded(ticker);
    if (loaded.is_error()) {
        return forward_error<std::vector<Timestamp>>(loaded.error());
    }
    return cache_.get_trading_dates(ticker, start, end);
}

}  // namespace hedge_ngin
