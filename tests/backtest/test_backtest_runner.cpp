#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>
#include "../core/test_base.hpp"
#include "../data/test_market_data.hpp"
#include "../signals/mock_signal_producer.hpp"
#include "hedge_ngin/backtest/backtest_runner.hpp"

using namespace hedge_ngin;
using namespace hedge_ngin::backtest;
using namespace hedge_ngin::testing;

namespace {

class ThrowingLookbackProvider : public InMemoryMarketDataProvider {
public:
    Result<std::vector<Bar>> get_bars(const std::string&, const Timestamp&,
                                      const Timestamp&) const override {
        throw std::runtime_error("storage offline");
    }
};

}  // namespace

class BacktestRunnerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        market_data = std::make_shared<InMemoryMarketDataProvider>();
        add_series(*market_data, "X", "2024-01-01", {150.0, 150.0, 160.0, 155.0, 170.0});

        pool = std::make_shared<ThreadPool>(2);
        AggregatorConfig aggregator_config;
        aggregator_config.producer_timeout_ms = 2000;
        aggregator = std::make_shared<SignalAggregator>(pool, aggregator_config);

        risk.max_position_fraction = 1.0;

        request.tickers = {"X"};
        request.selected_signal_producers = {"bull"};
        request.start_date = "2024-01-01";
        request.end_date = "2024-01-05";
        request.initial_cash = 100000.0;
        request.margin_requirement = 0.0;
    }

    void TearDown() override {
        pool->shutdown();
        TestBase::TearDown();
    }

    BacktestRunner runner_with(std::vector<std::shared_ptr<SignalProducer>> producers,
                               std::shared_ptr<const MarketDataProvider> data = nullptr) {
        if (!data) {
            data = market_data;
        }
        return BacktestRunner("BT_TEST", request, std::move(producers), data, aggregator, risk);
    }

    BacktestRunResult run(BacktestRunner& runner,
                          const BacktestRunner::ProgressCallback& on_progress = nullptr) {
        return runner.run(cancel, [this](const Event& event) { events.push_back(event); },
                          on_progress);
    }

    size_t count(EventType type) const {
        size_t n = 0;
        for (const auto& event : events) {
            n += event.type() == type ? 1 : 0;
        }
        return n;
    }

    std::shared_ptr<InMemoryMarketDataProvider> market_data;
    std::shared_ptr<ThreadPool> pool;
    std::shared_ptr<SignalAggregator> aggregator;
    RiskConfig risk;
    BacktestRequest request;
    std::atomic<bool> cancel{false};
    std::vector<Event> events;
};

TEST_F(BacktestRunnerTest, RunsEveryTradingDay) {
    auto bull = std::make_shared<ScriptedSignalProducer>("bull", Direction::BULLISH, 80);
    auto runner = runner_with({bull});
    auto result = run(runner);

    ASSERT_EQ(result.status, SessionStatus::COMPLETED);
    EXPECT_EQ(result.total_days, 5);
    EXPECT_EQ(result.portfolio_history.size(), 5u);
    EXPECT_EQ(bull->calls(), 5);

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().type(), EventType::START);
    EXPECT_EQ(std::get<StartPayload>(events.front().payload).total_days, 5);
    EXPECT_EQ(count(EventType::PROGRESS), 5u);
    EXPECT_EQ(count(EventType::PORTFOLIO_UPDATE), 5u);
    EXPECT_EQ(count(EventType::PERFORMANCE_UPDATE), 5u);
    EXPECT_EQ(count(EventType::COMPLETE), 0u);

    // Day one: progress, the buy, then the snapshot and metrics
    ASSERT_GE(events.size(), 5u);
    EXPECT_EQ(events[1].type(), EventType::PROGRESS);
    EXPECT_EQ(events[2].type(), EventType::TRADING);
    const auto& buy = std::get<TradingPayload>(events[2].payload);
    EXPECT_EQ(buy.action, Action::BUY);
    EXPECT_EQ(buy.quantity, 666);
    EXPECT_DOUBLE_EQ(buy.price, 150.0);
    EXPECT_EQ(events[3].type(), EventType::PORTFOLIO_UPDATE);
    EXPECT_EQ(events[4].type(), EventType::PERFORMANCE_UPDATE);

    EXPECT_DOUBLE_EQ(result.portfolio_history.front().cash, 100.0);
    EXPECT_DOUBLE_EQ(result.portfolio_history.back().total_value, 100.0 + 666 * 170.0);
    EXPECT_NEAR(result.performance_metrics.total_return,
                (100.0 + 666 * 170.0) / 100000.0 - 1.0, 1e-12);
    EXPECT_TRUE(PortfolioLedger::check_invariants(result.final_portfolio).is_ok());
}

TEST_F(BacktestRunnerTest, StreamReplayMatchesResult) {
    auto bull = std::make_shared<ScriptedSignalProducer>("bull", Direction::BULLISH, 80);
    auto runner = runner_with({bull});
    auto result = run(runner);
    auto terminal = BacktestRunner::terminal_event("BT_TEST", result);

    std::vector<nlohmann::json> stream;
    for (const auto& event : events) {
        stream.push_back(nlohmann::json::parse(event.to_json().dump()));
    }
    auto replayed = replay_snapshots(stream);
    ASSERT_EQ(replayed.size(), result.portfolio_history.size());
    for (size_t i = 0; i < replayed.size(); ++i) {
        EXPECT_EQ(replayed[i].to_json(), result.portfolio_history[i].to_json());
    }

    ASSERT_EQ(terminal.type(), EventType::COMPLETE);
    const auto& complete = std::get<CompletePayload>(terminal.payload);
    EXPECT_EQ(complete.status, "completed");
    EXPECT_EQ(complete.final_performance.to_json(), result.performance_metrics.to_json());

    auto last_update = std::find_if(events.rbegin(), events.rend(), [](const Event& e) {
        return e.type() == EventType::PERFORMANCE_UPDATE;
    });
    ASSERT_NE(last_update, events.rend());
    const auto& streamed = std::get<PerformanceUpdatePayload>(last_update->payload).metrics;
    EXPECT_NEAR(streamed.sharpe_ratio, result.performance_metrics.sharpe_ratio, 1e-9);
    EXPECT_NEAR(streamed.max_drawdown, result.performance_metrics.max_drawdown, 1e-12);
}

TEST_F(BacktestRunnerTest, BearishFlipSellsPosition) {
    const Timestamp flip = date("2024-01-03");
    auto flipper = std::make_shared<LambdaSignalProducer>("bull", [flip](const SignalContext& c) {
        return Result<Signal>(
            make_signal(c, c.date < flip ? Direction::BULLISH : Direction::BEARISH, 70));
    });
    auto runner = runner_with({flipper});
    auto result = run(runner);

    ASSERT_EQ(result.status, SessionStatus::COMPLETED);
    std::vector<TradingPayload> trades;
    for (const auto& event : events) {
        if (event.type() == EventType::TRADING) {
            trades.push_back(std::get<TradingPayload>(event.payload));
        }
    }

    // Buy on day one, sell on the flip, then short the rest of the way
    ASSERT_GE(trades.size(), 2u);
    EXPECT_EQ(trades[0].action, Action::BUY);
    EXPECT_EQ(trades[1].action, Action::SELL);
    EXPECT_EQ(trades[1].date, "2024-01-03");
    EXPECT_EQ(trades[1].quantity, 666);
    EXPECT_DOUBLE_EQ(result.final_portfolio.realized_gains.at("X"), (160.0 - 150.0) * 666);
}

TEST_F(BacktestRunnerTest, MarginedShortsKeepSnapshotInvariants) {
    request.margin_requirement = 0.5;
    const Timestamp flip = date("2024-01-03");
    auto flipper = std::make_shared<LambdaSignalProducer>("bull", [flip](const SignalContext& c) {
        return Result<Signal>(
            make_signal(c, c.date < flip ? Direction::BEARISH : Direction::BULLISH, 70));
    });
    auto runner = runner_with({flipper});
    auto result = run(runner);

    ASSERT_EQ(result.status, SessionStatus::COMPLETED);
    ASSERT_EQ(result.portfolio_history.size(), 5u);

    std::vector<Action> actions;
    for (const auto& event : events) {
        if (event.type() == EventType::TRADING) {
            actions.push_back(std::get<TradingPayload>(event.payload).action);
        }
    }
    ASSERT_GE(actions.size(), 2u);
    EXPECT_EQ(actions[0], Action::SHORT);
    EXPECT_NE(std::find(actions.begin(), actions.end(), Action::COVER), actions.end());

    // Day one shorts 666 at 150 and reserves half the proceeds
    const auto& opening = result.portfolio_history.front();
    EXPECT_EQ(opening.positions.at("X").short_quantity, 666);
    EXPECT_DOUBLE_EQ(opening.margin_used, 666 * 150.0 * 0.5);

    for (const auto& snapshot : result.portfolio_history) {
        double net_market_value = 0.0;
        for (const auto& entry : snapshot.positions) {
            const auto& position = entry.second;
            net_market_value +=
                static_cast<double>(position.long_quantity - position.short_quantity) *
                position.price;
        }
        EXPECT_NEAR(snapshot.total_value, snapshot.cash + net_market_value, 1e-6)
            << core::format_date(snapshot.date);
        EXPECT_GE(snapshot.cash, -request.margin_requirement * snapshot.total_value)
            << core::format_date(snapshot.date);
        EXPECT_GE(snapshot.margin_used, 0.0);
        EXPECT_LE(snapshot.margin_used, snapshot.cash + 1e-6);
    }
    EXPECT_TRUE(PortfolioLedger::check_invariants(result.final_portfolio).is_ok());
}

TEST_F(BacktestRunnerTest, RangeWithoutDataCompletesWithOpeningSnapshot) {
    request.start_date = "2023-06-01";
    request.end_date = "2023-06-30";
    auto bull = std::make_shared<ScriptedSignalProducer>("bull", Direction::BULLISH, 80);
    auto runner = runner_with({bull});
    auto result = run(runner);

    EXPECT_EQ(result.status, SessionStatus::COMPLETED);
    EXPECT_EQ(result.total_days, 0);
    ASSERT_EQ(result.portfolio_history.size(), 1u);
    EXPECT_DOUBLE_EQ(result.portfolio_history[0].total_value, 100000.0);
    EXPECT_DOUBLE_EQ(result.performance_metrics.total_return, 0.0);
    EXPECT_DOUBLE_EQ(result.performance_metrics.sharpe_ratio, 0.0);
    EXPECT_EQ(count(EventType::PORTFOLIO_UPDATE), 1u);
    EXPECT_EQ(count(EventType::PROGRESS), 0u);
    EXPECT_EQ(bull->calls(), 0);
}

TEST_F(BacktestRunnerTest, MissingTickerDataBecomesWarning) {
    request.tickers = {"X", "GHOST"};
    auto bull = std::make_shared<ScriptedSignalProducer>("bull", Direction::BULLISH, 80);
    auto runner = runner_with({bull});
    auto result = run(runner);

    ASSERT_EQ(result.status, SessionStatus::COMPLETED);
    EXPECT_EQ(result.total_days, 5);
    ASSERT_EQ(result.warnings.size(), 5u);
    EXPECT_EQ(result.warnings[0], "GHOST: no market data for 2024-01-01");
    EXPECT_EQ(result.final_portfolio.position("GHOST").long_quantity, 0);

    auto update = std::find_if(events.begin(), events.end(), [](const Event& e) {
        return e.type() == EventType::PORTFOLIO_UPDATE;
    });
    ASSERT_NE(update, events.end());
    EXPECT_EQ(std::get<PortfolioUpdatePayload>(update->payload).warnings.size(), 1u);
}

TEST_F(BacktestRunnerTest, CancelStopsAtDayBoundary) {
    auto bull = std::make_shared<ScriptedSignalProducer>("bull", Direction::BULLISH, 80);
    auto runner = runner_with({bull});
    std::vector<int> committed;
    auto result = run(runner, [this, &committed](const DayProgress& progress) {
        committed.push_back(progress.completed_days);
        if (progress.completed_days == 2) {
            cancel = true;
        }
    });

    EXPECT_EQ(result.status, SessionStatus::CANCELLED);
    EXPECT_EQ(result.portfolio_history.size(), 2u);
    EXPECT_EQ(count(EventType::PORTFOLIO_UPDATE), 2u);
    EXPECT_EQ(bull->calls(), 2);
    EXPECT_EQ(committed, (std::vector<int>{0, 1, 1, 2}));

    auto terminal = BacktestRunner::terminal_event("BT_TEST", result);
    ASSERT_EQ(terminal.type(), EventType::COMPLETE);
    EXPECT_EQ(std::get<CompletePayload>(terminal.payload).status, "cancelled");
    EXPECT_EQ(std::get<CompletePayload>(terminal.payload).portfolio_history.size(), 2u);
}

TEST_F(BacktestRunnerTest, UnexpectedExceptionFailsRun) {
    auto broken = std::make_shared<ThrowingLookbackProvider>();
    add_series(*broken, "X", "2024-01-01", {150.0, 151.0});
    auto bull = std::make_shared<ScriptedSignalProducer>("bull", Direction::BULLISH, 80);
    auto runner = runner_with({bull}, broken);
    auto result = run(runner);

    EXPECT_EQ(result.status, SessionStatus::FAILED);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_NE(result.error_message->find("storage offline"), std::string::npos);
    EXPECT_TRUE(result.portfolio_history.empty());

    auto terminal = BacktestRunner::terminal_event("BT_TEST", result);
    ASSERT_EQ(terminal.type(), EventType::ERROR);
    EXPECT_TRUE(terminal.is_terminal());
}

TEST_F(BacktestRunnerTest, SameRequestSameResult) {
    auto bull = std::make_shared<ScriptedSignalProducer>("bull", Direction::BULLISH, 80);
    auto first_runner = runner_with({bull});
    auto second_runner = runner_with({bull});

    auto first = first_runner.run(cancel, nullptr);
    auto second = second_runner.run(cancel, nullptr);
    EXPECT_EQ(first.to_json(), second.to_json());
}
