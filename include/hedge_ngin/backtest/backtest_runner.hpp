// include/hedge_ngin/backtest/backtest_runner.hpp
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "hedge_ngin/backtest/backtest_types.hpp"
#include "hedge_ngin/backtest/events.hpp"
#include "hedge_ngin/backtest/performance_calculator.hpp"
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/data/market_data_provider.hpp"
#include "hedge_ngin/execution/execution_simulator.hpp"
#include "hedge_ngin/portfolio/ledger.hpp"
#include "hedge_ngin/portfolio/portfolio_manager.hpp"
#include "hedge_ngin/risk/risk_manager.hpp"
#include "hedge_ngin/signals/signal_aggregator.hpp"

namespace hedge_ngin {
namespace backtest {

/**
 * @brief Progress of a run, reported after each day boundary
 */
struct DayProgress {
    std::string current_date;
    int completed_days{0};
    int total_days{0};
    std::vector<std::string> new_warnings;
};

/**
 * @brief Runs the day-iteration loop of one backtest
 *
 * Per trading day: progress event, signal collection, risk limits, order synthesis,
 * execution at the close, snapshot and performance update. Cancellation is honoured
 * only between days so a day's mutations are never partially applied.
 *
 * The runner never emits the terminal event; callers publish terminal_event() once
 * the session status reflects the outcome.
 */
class BacktestRunner {
public:
    using EventSink = std::function<void(const Event&)>;
    using ProgressCallback = std::function<void(const DayProgress&)>;

    BacktestRunner(std::string backtest_id, BacktestRequest request,
                   std::vector<std::shared_ptr<SignalProducer>> producers,
                   std::shared_ptr<const MarketDataProvider> market_data,
                   std::shared_ptr<const SignalAggregator> aggregator, RiskConfig risk_config);

    /**
     * @brief Run every day of the request's range
     * @param cancel_requested Checked at each day boundary
     * @param sink Receives every non-terminal event, in order
     * @param on_progress Called when a day starts and when it is committed
     * @return Outcome; status is COMPLETED, CANCELLED or FAILED
     */
    BacktestRunResult run(const std::atomic<bool>& cancel_requested, const EventSink& sink,
                          const ProgressCallback& on_progress = nullptr);

    /**
     * @brief Union of the tickers' trading dates within the requested range
     * @param warnings Receives one entry per ticker whose data could not be read
     */
    std::vector<Timestamp> trading_dates(std::vector<std::string>& warnings) const;

    /**
     * @brief complete for completed or cancelled runs, error for failed ones
     */
    static Event terminal_event(const std::string& backtest_id, const BacktestRunResult& result);

    const std::string& backtest_id() const {
        return backtest_id_;
    }

private:
    /**
     * @brief Simulate one trading day
     * @return COMPUTE_ERROR (or another fatal error) when the day cannot be committed
     */
    Result<void> process_day(const Timestamp& date, PortfolioLedger& ledger,
                             PerformanceTracker& tracker, PriceMap& valuation_prices,
                             std::vector<std::string>& day_warnings, const EventSink& sink);

    void emit(const EventSink& sink, EventPayload payload) const;

    std::string backtest_id_;
    BacktestRequest request_;
    std::vector<std::shared_ptr<SignalProducer>> producers_;
    std::shared_ptr<const MarketDataProvider> market_data_;
    std::shared_ptr<const SignalAggregator> aggregator_;
    RiskManager risk_manager_;
    PerformanceCalculator performance_calculator_;
};

}  // namespace backtest
}  // namespace hedge_ngin
