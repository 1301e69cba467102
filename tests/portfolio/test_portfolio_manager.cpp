#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>
#include "../core/test_base.hpp"
#include "hedge_ngin/portfolio/ledger.hpp"
#include "hedge_ngin/portfolio/portfolio_manager.hpp"
#include "hedge_ngin/risk/risk_manager.hpp"

using namespace hedge_ngin;
using namespace hedge_ngin::testing;

class PortfolioManagerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        portfolio.cash = 100000.0;
    }

    static Signal vote(const std::string& producer, const std::string& ticker,
                       Direction direction, double confidence) {
        Signal signal;
        signal.producer_id = producer;
        signal.ticker = ticker;
        signal.direction = direction;
        signal.confidence = confidence;
        return signal;
    }

    static PositionLimit limit_of(const std::string& ticker, Price price, Quantity max_shares) {
        PositionLimit limit;
        limit.ticker = ticker;
        limit.price = price;
        limit.share_limit = max_shares;
        limit.margin_limit = max_shares;
        limit.max_shares = max_shares;
        return limit;
    }

    Portfolio portfolio;
};

TEST_F(PortfolioManagerTest, ConsensusPicksStrictWinner) {
    auto result = PortfolioManager::consensus({vote("a", "X", Direction::BULLISH, 60),
                                               vote("b", "X", Direction::BEARISH, 30),
                                               vote("c", "X", Direction::BEARISH, 20)});
    EXPECT_DOUBLE_EQ(result.bullish_weight, 60.0);
    EXPECT_DOUBLE_EQ(result.bearish_weight, 50.0);
    EXPECT_EQ(result.direction, Direction::BULLISH);
    EXPECT_FALSE(result.tie);
}

TEST_F(PortfolioManagerTest, TiedConsensusHolds) {
    std::vector<Signal> signals = {vote("a", "X", Direction::BULLISH, 40),
                                   vote("b", "X", Direction::BEARISH, 40)};
    auto consensus = PortfolioManager::consensus(signals);
    EXPECT_TRUE(consensus.tie);

    auto order = PortfolioManager::decide("X", signals, limit_of("X", 100.0, 500), portfolio,
                                          0.5, portfolio.free_cash());
    EXPECT_EQ(order.action, Action::HOLD);
    EXPECT_EQ(order.quantity, 0);
    EXPECT_NE(order.reasoning.find("Tied"), std::string::npos);
}

TEST_F(PortfolioManagerTest, NeutralConsensusAndNoSignalsHold) {
    auto neutral = PortfolioManager::decide("X", {vote("a", "X", Direction::NEUTRAL, 90)},
                                            limit_of("X", 100.0, 500), portfolio, 0.5,
                                            portfolio.free_cash());
    EXPECT_EQ(neutral.action, Action::HOLD);

    auto silent = PortfolioManager::decide("X", {}, limit_of("X", 100.0, 500), portfolio, 0.5,
                                           portfolio.free_cash());
    EXPECT_EQ(silent.action, Action::HOLD);
    EXPECT_EQ(silent.quantity, 0);
}

TEST_F(PortfolioManagerTest, BuyLimitedByAffordabilityAtFullCap) {
    RiskConfig config;
    config.max_position_fraction = 1.0;
    RiskManager risk(config);
    PriceMap prices = {{"X", 150.0}};
    std::map<std::string, std::vector<Signal>> signals = {
        {"X", {vote("trend", "X", Direction::BULLISH, 80)}}};

    auto limits = risk.compute_limits(portfolio, prices, {"X"}, signals, 0.5);
    ASSERT_TRUE(limits.is_ok());
    ASSERT_EQ(limits.value().at("X").max_shares, 666);

    auto orders =
        PortfolioManager::generate_orders({"X"}, signals, limits.value(), portfolio, 0.5);
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].action, Action::BUY);
    EXPECT_EQ(orders[0].quantity, 666);

    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "X", Action::BUY, orders[0].quantity,
                                            150.0, 0.5)
                    .is_ok());
    EXPECT_DOUBLE_EQ(portfolio.cash, 100.0);
}

TEST_F(PortfolioManagerTest, TinyMarginStillBuysAndShortsUpToCap) {
    RiskConfig config;
    config.max_position_fraction = 1.0;
    RiskManager risk(config);
    PriceMap prices = {{"X", 150.0}};
    std::map<std::string, std::vector<Signal>> signals = {
        {"X", {vote("trend", "X", Direction::BULLISH, 80)}}};

    auto limits = risk.compute_limits(portfolio, prices, {"X"}, signals, 1e-17);
    ASSERT_TRUE(limits.is_ok());
    EXPECT_EQ(limits.value().at("X").max_shares, 666);

    auto orders =
        PortfolioManager::generate_orders({"X"}, signals, limits.value(), portfolio, 1e-17);
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].action, Action::BUY);
    EXPECT_EQ(orders[0].quantity, 666);

    auto short_order = PortfolioManager::decide(
        "X", {vote("trend", "X", Direction::BEARISH, 70)}, limit_of("X", 150.0, 400), portfolio,
        1e-17, portfolio.free_cash());
    EXPECT_EQ(short_order.action, Action::SHORT);
    EXPECT_EQ(short_order.quantity, 400);
}

TEST_F(PortfolioManagerTest, BuyLimitedByRiskCap) {
    std::map<std::string, std::vector<Signal>> signals = {
        {"X", {vote("trend", "X", Direction::BULLISH, 80)}}};
    RiskLimits limits = {{"X", limit_of("X", 150.0, 100)}};

    auto orders = PortfolioManager::generate_orders({"X"}, signals, limits, portfolio, 0.5);
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].action, Action::BUY);
    EXPECT_EQ(orders[0].quantity, 100);

    ASSERT_TRUE(
        PortfolioLedger::apply_fill(portfolio, "X", Action::BUY, 100, 150.0, 0.5).is_ok());
    EXPECT_DOUBLE_EQ(portfolio.cash, 85000.0);
}

TEST_F(PortfolioManagerTest, BearishFlipSellsWholeLong) {
    ASSERT_TRUE(
        PortfolioLedger::apply_fill(portfolio, "X", Action::BUY, 50, 100.0, 0.5).is_ok());

    auto order = PortfolioManager::decide("X", {vote("trend", "X", Direction::BEARISH, 70)},
                                          limit_of("X", 120.0, 10), portfolio, 0.5,
                                          portfolio.free_cash());
    EXPECT_EQ(order.action, Action::SELL);
    EXPECT_EQ(order.quantity, 50);

    auto realized = PortfolioLedger::apply_fill(portfolio, "X", Action::SELL, order.quantity,
                                                120.0, 0.5);
    ASSERT_TRUE(realized.is_ok());
    EXPECT_DOUBLE_EQ(realized.value(), (120.0 - 100.0) * 50);
}

TEST_F(PortfolioManagerTest, BearishWithoutLongOpensShortWithinMargin) {
    auto order = PortfolioManager::decide("X", {vote("trend", "X", Direction::BEARISH, 70)},
                                          limit_of("X", 100.0, 5000), portfolio, 0.5,
                                          portfolio.free_cash());
    EXPECT_EQ(order.action, Action::SHORT);
    EXPECT_EQ(order.quantity, 2000);

    auto capped = PortfolioManager::decide("X", {vote("trend", "X", Direction::BEARISH, 70)},
                                           limit_of("X", 100.0, 150), portfolio, 0.5,
                                           portfolio.free_cash());
    EXPECT_EQ(capped.quantity, 150);
}

TEST_F(PortfolioManagerTest, BullishCoversShortBeforeBuying) {
    ASSERT_TRUE(
        PortfolioLedger::apply_fill(portfolio, "X", Action::SHORT, 30, 100.0, 0.5).is_ok());

    auto order = PortfolioManager::decide("X", {vote("trend", "X", Direction::BULLISH, 70)},
                                          limit_of("X", 90.0, 1000), portfolio, 0.5,
                                          portfolio.free_cash());
    EXPECT_EQ(order.action, Action::COVER);
    EXPECT_EQ(order.quantity, 30);

    // 30 * 90 - 1500 released
    EXPECT_DOUBLE_EQ(PortfolioManager::cash_drawn(order, portfolio, 90.0, 0.5), 1200.0);
}

TEST_F(PortfolioManagerTest, CoverSizedOnNetCostWhenCashIsShort) {
    ASSERT_TRUE(
        PortfolioLedger::apply_fill(portfolio, "X", Action::SHORT, 100, 100.0, 0.5).is_ok());

    // 50 margin per share, price 150: each cover costs 100 of free cash
    auto order = PortfolioManager::decide("X", {vote("trend", "X", Direction::BULLISH, 70)},
                                          limit_of("X", 150.0, 1000), portfolio, 0.5, 4000.0);
    EXPECT_EQ(order.action, Action::COVER);
    EXPECT_EQ(order.quantity, 40);
}

TEST_F(PortfolioManagerTest, RunningBudgetKeepsDayAffordable) {
    std::map<std::string, std::vector<Signal>> signals = {
        {"AAA", {vote("trend", "AAA", Direction::BULLISH, 80)}},
        {"BBB", {vote("trend", "BBB", Direction::BULLISH, 80)}}};
    RiskLimits limits = {{"AAA", limit_of("AAA", 150.0, 600)},
                         {"BBB", limit_of("BBB", 100.0, 600)}};

    auto orders =
        PortfolioManager::generate_orders({"AAA", "BBB"}, signals, limits, portfolio, 0.5);
    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].quantity, 600);
    EXPECT_EQ(orders[1].action, Action::BUY);
    EXPECT_EQ(orders[1].quantity, 100);

    double spent = 600 * 150.0 + 100 * 100.0;
    EXPECT_LE(spent, portfolio.free_cash());
}

TEST_F(PortfolioManagerTest, ExhaustedBudgetHolds) {
    std::map<std::string, std::vector<Signal>> signals = {
        {"AAA", {vote("trend", "AAA", Direction::BULLISH, 80)}},
        {"BBB", {vote("trend", "BBB", Direction::BULLISH, 80)}}};
    RiskLimits limits = {{"AAA", limit_of("AAA", 100.0, 1000)},
                         {"BBB", limit_of("BBB", 100.0, 1000)}};

    auto orders =
        PortfolioManager::generate_orders({"AAA", "BBB"}, signals, limits, portfolio, 0.5);
    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].quantity, 1000);
    EXPECT_EQ(orders[1].action, Action::HOLD);
    EXPECT_NE(orders[1].reasoning.find("No capacity"), std::string::npos);
}

TEST_F(PortfolioManagerTest, OneOrderPerTickerIncludingMissingLimits) {
    std::map<std::string, std::vector<Signal>> signals = {
        {"AAA", {vote("trend", "AAA", Direction::BULLISH, 80)}}};
    RiskLimits limits = {{"AAA", limit_of("AAA", 100.0, 10)}};

    auto orders =
        PortfolioManager::generate_orders({"AAA", "ZZZ"}, signals, limits, portfolio, 0.5);
    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].ticker, "AAA");
    EXPECT_EQ(orders[1].ticker, "ZZZ");
    EXPECT_EQ(orders[1].action, Action::HOLD);
    EXPECT_EQ(orders[1].reasoning, "No risk limit");
}

TEST_F(PortfolioManagerTest, SameInputsSameOrders) {
    ASSERT_TRUE(
        PortfolioLedger::apply_fill(portfolio, "BBB", Action::BUY, 20, 50.0, 0.5).is_ok());
    std::map<std::string, std::vector<Signal>> signals = {
        {"AAA", {vote("a", "AAA", Direction::BEARISH, 55), vote("b", "AAA", Direction::BULLISH, 20)}},
        {"BBB", {vote("a", "BBB", Direction::BEARISH, 90)}}};
    RiskLimits limits = {{"AAA", limit_of("AAA", 75.0, 300)}, {"BBB", limit_of("BBB", 52.0, 300)}};

    auto first = PortfolioManager::generate_orders({"AAA", "BBB"}, signals, limits, portfolio, 0.5);
    auto second =
        PortfolioManager::generate_orders({"AAA", "BBB"}, signals, limits, portfolio, 0.5);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].to_json(), second[i].to_json());
    }
    EXPECT_EQ(first[0].action, Action::SHORT);
    EXPECT_EQ(first[1].action, Action::SELL);
    EXPECT_EQ(first[1].quantity, 20);
}
