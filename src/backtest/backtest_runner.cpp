// src/backtest/backtest_runner.cpp

#include "hedge_ngin/backtest/backtest_runner.hpp"
#include <set>
#include "hedge_ngin/core/logger.hpp"
#include "hedge_ngin/core/time_utils.hpp"

namespace hedge_ngin {
namespace backtest {

BacktestRunner::BacktestRunner(std::string backtest_id, BacktestRequest request,
                               std::vector<std::shared_ptr<SignalProducer>> producers,
                               std::shared_ptr<const MarketDataProvider> market_data,
                               std::shared_ptr<const SignalAggregator> aggregator,
                               RiskConfig risk_config)
    : backtest_id_(std::move(backtest_id)),
      request_(std::move(request)),
      producers_(std::move(producers)),
      market_data_(std::move(market_data)),
      aggregator_(std::move(aggregator)),
      risk_manager_(std::move(risk_config)) {}

void BacktestRunner::emit(const EventSink& sink, EventPayload payload) const {
    if (sink) {
        sink(make_event(backtest_id_, std::move(payload)));
    }
}

std::vector<Timestamp> BacktestRunner::trading_dates(std::vector<std::string>& warnings) const {
    std::set<Timestamp> dates;
    for (const auto& ticker : request_.tickers) {
        auto ticker_dates = market_data_->get_trading_dates(ticker, request_.start(), request_.end());
        if (ticker_dates.is_error()) {
            warnings.push_back(ticker + ": market data unavailable: " +
                               ticker_dates.error()->what());
            WARN(warnings.back());
            continue;
        }
        dates.insert(ticker_dates.value().begin(), ticker_dates.value().end());
    }
    return std::vector<Timestamp>(dates.begin(), dates.end());
}

Result<void> BacktestRunner::process_day(const Timestamp& date, PortfolioLedger& ledger,
                                         PerformanceTracker& tracker, PriceMap& valuation_prices,
                                         std::vector<std::string>& day_warnings,
                                         const EventSink& sink) {
    const std::string date_str = core::format_date(date);
    const Portfolio& portfolio = ledger.portfolio();

    // Prices of the day and producer contexts for every ticker that traded
    PriceMap day_prices;
    std::vector<SignalContext> contexts;
    const Timestamp lookback_start =
        core::add_days(date, -aggregator_->config().lookback_days);

    for (const auto& ticker : request_.tickers) {
        auto bar = market_data_->get_bar(ticker, date);
        if (bar.is_error()) {
            day_warnings.push_back(ticker + ": no market data for " + date_str);
            WARN(day_warnings.back());
            continue;
        }
        day_prices[ticker] = bar.value().close;
        valuation_prices[ticker] = bar.value().close;

        auto lookback = market_data_->get_bars(ticker, lookback_start, date);
        if (lookback.is_error()) {
            day_warnings.push_back(ticker + ": lookback unavailable for " + date_str + ": " +
                                   lookback.error()->what());
            WARN(day_warnings.back());
            continue;
        }

        SignalContext context;
        context.ticker = ticker;
        context.date = date;
        context.lookback = lookback.value();
        context.cash = portfolio.cash;
        const Position& position = portfolio.position(ticker);
        context.long_quantity = position.long_quantity;
        context.short_quantity = position.short_quantity;
        contexts.push_back(std::move(context));
    }

    // Fan out to producers; returns once every call finished or timed out
    std::map<std::string, std::vector<Signal>> signals;
    if (!contexts.empty()) {
        auto collected = aggregator_->collect_day(producers_, contexts);
        for (auto& [ticker, ticker_signals] : collected) {
            signals[ticker] = std::move(ticker_signals.signals);
            day_warnings.insert(day_warnings.end(), ticker_signals.warnings.begin(),
                                ticker_signals.warnings.end());
        }
    }

    auto limits = risk_manager_.compute_limits(portfolio, valuation_prices, request_.tickers,
                                               signals, request_.margin_requirement);
    if (limits.is_error()) {
        return make_error<void>(ErrorCode::COMPUTE_ERROR,
                                "Risk limits failed on " + date_str + ": " +
                                    limits.error()->what(),
                                "BacktestRunner");
    }

    // Tickers without a bar today hold regardless of their last known price
    RiskLimits tradable_limits;
    for (const auto& [ticker, limit] : limits.value()) {
        if (day_prices.count(ticker) > 0) {
            tradable_limits[ticker] = limit;
        }
    }

    auto orders = PortfolioManager::generate_orders(request_.tickers, signals, tradable_limits,
                                                    portfolio, request_.margin_requirement);

    auto executed = ExecutionSimulator::execute(ledger, orders, day_prices, valuation_prices);
    if (executed.is_error()) {
        return forward_error<void>(executed.error());
    }

    for (const auto& report : executed.value()) {
        TradingPayload trading;
        trading.date = date_str;
        trading.ticker = report.order.ticker;
        trading.action = report.order.action;
        trading.quantity = report.order.quantity;
        trading.price = report.price;
        trading.portfolio_value = report.portfolio_value;
        emit(sink, trading);
    }

    auto snapshot = ledger.record_snapshot(date, valuation_prices);
    if (snapshot.is_error()) {
        return forward_error<void>(snapshot.error());
    }

    PortfolioUpdatePayload update;
    update.snapshot = snapshot.value();
    update.warnings = day_warnings;
    emit(sink, update);

    tracker.update(snapshot.value());
    PerformanceUpdatePayload performance;
    performance.date = date_str;
    performance.metrics = tracker.metrics();
    emit(sink, performance);

    DEBUG(date_str << ": " << executed.value().size() << " trades, value "
                   << snapshot.value().total_value);
    return Result<void>();
}

BacktestRunResult BacktestRunner::run(const std::atomic<bool>& cancel_requested,
                                      const EventSink& sink,
                                      const ProgressCallback& on_progress) {
    BacktestRunResult result;
    PortfolioLedger ledger(request_.initial_cash, request_.margin_requirement);
    PerformanceTracker tracker(request_.initial_cash);
    PriceMap valuation_prices;

    auto finish = [&](SessionStatus status) {
        result.status = status;
        result.portfolio_history = ledger.history();
        result.final_portfolio = ledger.portfolio();
        result.performance_metrics =
            performance_calculator_.calculate(ledger.history(), request_.initial_cash);
        return result;
    };

    try {
        std::vector<std::string> setup_warnings;
        auto dates = trading_dates(setup_warnings);
        result.total_days = static_cast<int>(dates.size());
        result.warnings = setup_warnings;

        StartPayload start;
        start.total_days = result.total_days;
        start.tickers = request_.tickers;
        start.start_date = request_.start_date;
        start.end_date = request_.end_date;
        emit(sink, start);

        INFO("Backtest " << backtest_id_ << " starting: " << result.total_days
                         << " trading days, " << request_.tickers.size() << " tickers, "
                         << producers_.size() << " producers");

        if (dates.empty()) {
            // Opening snapshot only, so the series is never empty
            auto opening = ledger.record_snapshot(request_.start(), valuation_prices);
            if (opening.is_error()) {
                result.error_message = opening.error()->what();
                return finish(SessionStatus::FAILED);
            }
            PortfolioUpdatePayload update;
            update.snapshot = opening.value();
            update.warnings = setup_warnings;
            emit(sink, update);
            INFO("Backtest " << backtest_id_ << " has no trading days in range");
            return finish(SessionStatus::COMPLETED);
        }

        for (size_t i = 0; i < dates.size(); ++i) {
            if (cancel_requested.load()) {
                INFO("Backtest " << backtest_id_ << " cancelled after " << i << " of "
                                 << dates.size() << " days");
                return finish(SessionStatus::CANCELLED);
            }

            const std::string date_str = core::format_date(dates[i]);

            ProgressPayload progress;
            progress.current_date = date_str;
            progress.completed_days = static_cast<int>(i);
            progress.total_days = result.total_days;
            progress.progress = static_cast<double>(i) / static_cast<double>(dates.size());
            progress.message = "Processing " + date_str;
            emit(sink, progress);

            if (on_progress) {
                on_progress(DayProgress{date_str, static_cast<int>(i), result.total_days, {}});
            }

            std::vector<std::string> day_warnings;
            auto day = process_day(dates[i], ledger, tracker, valuation_prices, day_warnings,
                                   sink);
            result.warnings.insert(result.warnings.end(), day_warnings.begin(),
                                   day_warnings.end());

            if (day.is_error()) {
                ERROR("Backtest " << backtest_id_ << " failed on " << date_str << ": "
                                  << day.error()->to_string());
                result.error_message = std::string(day.error()->what());
                return finish(SessionStatus::FAILED);
            }

            if (on_progress) {
                on_progress(DayProgress{date_str, static_cast<int>(i + 1), result.total_days,
                                        day_warnings});
            }
        }

        INFO("Backtest " << backtest_id_ << " completed, final value " << ledger.last_value());
        return finish(SessionStatus::COMPLETED);
    } catch (const std::exception& e) {
        ERROR("Backtest " << backtest_id_ << " aborted: " << e.what());
        result.error_message = std::string("Unexpected error: ") + e.what();
        return finish(SessionStatus::FAILED);
    }
}

Event BacktestRunner::terminal_event(const std::string& backtest_id,
                                     const BacktestRunResult& result) {
    if (result.status == SessionStatus::FAILED) {
        ErrorPayload error;
        error.message = result.error_message.value_or("Backtest failed");
        error.code = error_code_to_string(ErrorCode::COMPUTE_ERROR);
        return make_event(backtest_id, error);
    }

    CompletePayload complete;
    complete.status = session_status_to_string(result.status);
    complete.final_performance = result.performance_metrics;
    complete.portfolio_history = result.portfolio_history;
    return make_event(backtest_id, complete);
}

}  // namespace backtest
}  // namespace hedge_ngin
