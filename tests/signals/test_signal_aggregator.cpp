#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "../data/test_market_data.hpp"
#include "hedge_ngin/signals/signal_aggregator.hpp"
#include "mock_signal_producer.hpp"

using namespace hedge_ngin;
using namespace hedge_ngin::testing;
using ::testing::_;

class SignalAggregatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        pool = std::make_shared<ThreadPool>(4);
        config.producer_timeout_ms = 2000;
        config.retry_backoff_ms = 1;
    }

    void TearDown() override {
        pool->shutdown();
        TestBase::TearDown();
    }

    SignalContext context_for(const std::string& ticker) {
        SignalContext context;
        context.ticker = ticker;
        context.date = date("2024-01-02");
        context.lookback = {make_bar(ticker, "2024-01-02", 100.0)};
        return context;
    }

    std::shared_ptr<ThreadPool> pool;
    AggregatorConfig config;
};

TEST_F(SignalAggregatorTest, CollectsEverySignalInProducerOrder) {
    SignalAggregator aggregator(pool, config);
    auto first = std::make_shared<ScriptedSignalProducer>("first", Direction::BULLISH, 80);
    auto second = std::make_shared<ScriptedSignalProducer>("second", Direction::BEARISH, 30);

    auto day = aggregator.collect_day({first, second}, {context_for("AAPL"), context_for("MSFT")});

    ASSERT_EQ(day.size(), 2u);
    for (const auto& ticker : {"AAPL", "MSFT"}) {
        const auto& bucket = day.at(ticker);
        EXPECT_EQ(bucket.ticker, ticker);
        EXPECT_TRUE(bucket.warnings.empty());
        ASSERT_EQ(bucket.signals.size(), 2u);
        EXPECT_EQ(bucket.signals[0].producer_id, "first");
        EXPECT_EQ(bucket.signals[0].ticker, ticker);
        EXPECT_EQ(bucket.signals[1].producer_id, "second");
        EXPECT_EQ(bucket.signals[1].direction, Direction::BEARISH);
    }
    EXPECT_EQ(first->calls(), 2);
    EXPECT_EQ(second->calls(), 2);
}

TEST_F(SignalAggregatorTest, CallsRunConcurrently) {
    SignalAggregator aggregator(pool, config);
    std::vector<std::shared_ptr<SignalProducer>> producers;
    for (int i = 0; i < 4; ++i) {
        producers.push_back(std::make_shared<ScriptedSignalProducer>(
            "slow" + std::to_string(i), Direction::NEUTRAL, 0, std::chrono::milliseconds(200)));
    }

    auto started = std::chrono::steady_clock::now();
    auto bucket = aggregator.collect(producers, context_for("X"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(bucket.signals.size(), 4u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(700));
}

TEST_F(SignalAggregatorTest, DeadlineMissDropsOnlyTheSlowProducer) {
    config.producer_timeout_ms = 50;
    SignalAggregator aggregator(pool, config);
    auto fast = std::make_shared<ScriptedSignalProducer>("fast", Direction::BULLISH, 60);
    auto slow = std::make_shared<ScriptedSignalProducer>("slow", Direction::BEARISH, 60,
                                                         std::chrono::milliseconds(400));

    auto bucket = aggregator.collect({fast, slow}, context_for("X"));

    ASSERT_EQ(bucket.signals.size(), 1u);
    EXPECT_EQ(bucket.signals[0].producer_id, "fast");
    ASSERT_EQ(bucket.warnings.size(), 1u);
    EXPECT_EQ(bucket.warnings[0], "X: slow timed out after 50ms");
}

TEST_F(SignalAggregatorTest, QueuedCallsGetTheirOwnDeadline) {
    auto single = std::make_shared<ThreadPool>(1);
    config.producer_timeout_ms = 500;
    SignalAggregator aggregator(single, config);
    std::vector<std::shared_ptr<SignalProducer>> producers;
    for (const auto& id : {"a", "b", "c"}) {
        producers.push_back(std::make_shared<ScriptedSignalProducer>(
            id, Direction::BULLISH, 50, std::chrono::milliseconds(300)));
    }

    // Serialized on one worker the last call starts at ~600ms but runs for only 300ms
    auto bucket = aggregator.collect(producers, context_for("X"));
    single->shutdown();

    EXPECT_EQ(bucket.signals.size(), 3u);
    EXPECT_TRUE(bucket.warnings.empty());
}

TEST_F(SignalAggregatorTest, CallsAbandonedWhileQueuedNeverRun) {
    auto single = std::make_shared<ThreadPool>(1);
    config.producer_timeout_ms = 100;
    config.max_queue_wait_ms = 150;
    SignalAggregator aggregator(single, config);
    auto blocker = std::make_shared<ScriptedSignalProducer>("blocker", Direction::BULLISH, 50,
                                                            std::chrono::milliseconds(600));
    auto queued = std::make_shared<ScriptedSignalProducer>("queued", Direction::BULLISH, 50);

    auto bucket = aggregator.collect({blocker, queued}, context_for("X"));
    // Give the worker time to free up and pop the abandoned task
    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    single->shutdown();

    EXPECT_TRUE(bucket.signals.empty());
    ASSERT_EQ(bucket.warnings.size(), 2u);
    EXPECT_EQ(bucket.warnings[0], "X: blocker timed out after 100ms");
    EXPECT_EQ(bucket.warnings[1], "X: queued still queued after 150ms");
    EXPECT_EQ(queued->calls(), 0);
}

TEST_F(SignalAggregatorTest, UpstreamTimeoutsAreRetried) {
    config.max_attempts = 3;
    SignalAggregator aggregator(pool, config);

    auto flaky = std::make_shared<MockSignalProducer>("flaky");
    int calls = 0;
    EXPECT_CALL(*flaky, generate_signal(_))
        .Times(3)
        .WillRepeatedly([&calls](const SignalContext& context) -> Result<Signal> {
            if (++calls < 3) {
                return make_error<Signal>(ErrorCode::UPSTREAM_TIMEOUT, "gateway timeout");
            }
            return Result<Signal>(make_signal(context, Direction::BULLISH, 55));
        });

    auto bucket = aggregator.collect({flaky}, context_for("X"));
    ASSERT_EQ(bucket.signals.size(), 1u);
    EXPECT_EQ(bucket.signals[0].producer_id, "flaky");
    EXPECT_TRUE(bucket.warnings.empty());
}

TEST_F(SignalAggregatorTest, ExhaustedRetriesDropTheSignal) {
    config.max_attempts = 2;
    SignalAggregator aggregator(pool, config);

    auto down = std::make_shared<MockSignalProducer>("down");
    EXPECT_CALL(*down, generate_signal(_))
        .Times(2)
        .WillRepeatedly([](const SignalContext&) {
            return make_error<Signal>(ErrorCode::UPSTREAM_TIMEOUT, "gateway timeout");
        });

    auto bucket = aggregator.collect({down}, context_for("X"));
    EXPECT_TRUE(bucket.signals.empty());
    ASSERT_EQ(bucket.warnings.size(), 1u);
    EXPECT_EQ(bucket.warnings[0], "X: down signal dropped: gateway timeout");
}

TEST_F(SignalAggregatorTest, OtherFailuresAreNotRetried) {
    SignalAggregator aggregator(pool, config);

    auto broken = std::make_shared<MockSignalProducer>("broken");
    EXPECT_CALL(*broken, generate_signal(_)).Times(1).WillOnce([](const SignalContext&) {
        return make_error<Signal>(ErrorCode::API_ERROR, "HTTP 500");
    });

    auto bucket = aggregator.collect({broken}, context_for("X"));
    EXPECT_TRUE(bucket.signals.empty());
    ASSERT_EQ(bucket.warnings.size(), 1u);
    EXPECT_NE(bucket.warnings[0].find("HTTP 500"), std::string::npos);
}

TEST_F(SignalAggregatorTest, ThrowingProducerBecomesAWarning) {
    SignalAggregator aggregator(pool, config);
    auto thrower = std::make_shared<LambdaSignalProducer>(
        "thrower", [](const SignalContext&) -> Result<Signal> {
            throw std::runtime_error("model not loaded");
        });
    auto steady = std::make_shared<ScriptedSignalProducer>("steady", Direction::BULLISH, 10);

    auto bucket = aggregator.collect({thrower, steady}, context_for("X"));
    ASSERT_EQ(bucket.signals.size(), 1u);
    EXPECT_EQ(bucket.signals[0].producer_id, "steady");
    ASSERT_EQ(bucket.warnings.size(), 1u);
    EXPECT_NE(bucket.warnings[0].find("thrower threw: model not loaded"), std::string::npos);
}

TEST_F(SignalAggregatorTest, OutOfRangeConfidenceIsDropped) {
    SignalAggregator aggregator(pool, config);
    auto wild = std::make_shared<ScriptedSignalProducer>("wild", Direction::BULLISH, 250);

    auto bucket = aggregator.collect({wild}, context_for("X"));
    EXPECT_TRUE(bucket.signals.empty());
    ASSERT_EQ(bucket.warnings.size(), 1u);
}

TEST_F(SignalAggregatorTest, ProducerIdentityIsStampedOnTheSignal) {
    SignalAggregator aggregator(pool, config);
    auto sloppy = std::make_shared<LambdaSignalProducer>(
        "sloppy", [](const SignalContext&) -> Result<Signal> {
            Signal signal;
            signal.producer_id = "someone_else";
            signal.ticker = "WRONG";
            signal.direction = Direction::BEARISH;
            signal.confidence = 40;
            return Result<Signal>(std::move(signal));
        });

    auto bucket = aggregator.collect({sloppy}, context_for("X"));
    ASSERT_EQ(bucket.signals.size(), 1u);
    EXPECT_EQ(bucket.signals[0].producer_id, "sloppy");
    EXPECT_EQ(bucket.signals[0].ticker, "X");
    EXPECT_EQ(bucket.signals[0].date, date("2024-01-02"));
}

TEST_F(SignalAggregatorTest, StoppedPoolReportsDispatchFailure) {
    SignalAggregator aggregator(pool, config);
    pool->shutdown();

    auto producer = std::make_shared<ScriptedSignalProducer>("p", Direction::BULLISH, 10);
    auto bucket = aggregator.collect({producer}, context_for("X"));
    EXPECT_TRUE(bucket.signals.empty());
    ASSERT_EQ(bucket.warnings.size(), 1u);
    EXPECT_NE(bucket.warnings[0].find("could not be dispatched"), std::string::npos);
}

TEST_F(SignalAggregatorTest, RequiresAPool) {
    EXPECT_THROW(SignalAggregator(nullptr, config), HedgeError);
}
