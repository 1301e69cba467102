#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../data/test_market_data.hpp"
#include "hedge_ngin/portfolio/ledger.hpp"

using namespace hedge_ngin;
using namespace hedge_ngin::testing;

class PortfolioLedgerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        portfolio.cash = 100000.0;
    }

    Portfolio portfolio;
};

TEST_F(PortfolioLedgerTest, BuyAveragesCostBasis) {
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 100, 100.0, 0.5)
                    .is_ok());
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 100, 120.0, 0.5)
                    .is_ok());

    const auto& position = portfolio.position("AAPL");
    EXPECT_EQ(position.long_quantity, 200);
    EXPECT_DOUBLE_EQ(position.long_cost_basis, 110.0);
    EXPECT_DOUBLE_EQ(portfolio.cash, 78000.0);
    EXPECT_TRUE(PortfolioLedger::check_invariants(portfolio).is_ok());
}

TEST_F(PortfolioLedgerTest, SellRealizesGainAgainstCostBasis) {
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 50, 100.0, 0.5)
                    .is_ok());

    auto realized = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::SELL, 50, 110.0, 0.5);
    ASSERT_TRUE(realized.is_ok());
    EXPECT_DOUBLE_EQ(realized.value(), 500.0);
    EXPECT_DOUBLE_EQ(portfolio.realized_gains.at("AAPL"), 500.0);
    EXPECT_DOUBLE_EQ(portfolio.cash, 100500.0);
    EXPECT_EQ(portfolio.positions.count("AAPL"), 0u);
}

TEST_F(PortfolioLedgerTest, PartialSellKeepsCostBasis) {
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 100, 100.0, 0.5)
                    .is_ok());
    auto realized = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::SELL, 40, 90.0, 0.5);
    ASSERT_TRUE(realized.is_ok());
    EXPECT_DOUBLE_EQ(realized.value(), -400.0);

    const auto& position = portfolio.position("AAPL");
    EXPECT_EQ(position.long_quantity, 60);
    EXPECT_DOUBLE_EQ(position.long_cost_basis, 100.0);
}

TEST_F(PortfolioLedgerTest, ShortReservesMarginAndCreditsProceeds) {
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "TSLA", Action::SHORT, 100, 200.0, 0.5)
                    .is_ok());

    EXPECT_DOUBLE_EQ(portfolio.cash, 120000.0);
    EXPECT_DOUBLE_EQ(portfolio.margin_used, 10000.0);
    EXPECT_DOUBLE_EQ(portfolio.free_cash(), 110000.0);

    const auto& position = portfolio.position("TSLA");
    EXPECT_EQ(position.short_quantity, 100);
    EXPECT_DOUBLE_EQ(position.short_cost_basis, 200.0);
    EXPECT_DOUBLE_EQ(position.short_margin_used, 10000.0);

    EXPECT_DOUBLE_EQ(portfolio.total_value({{"TSLA", 200.0}}), 100000.0);
    EXPECT_DOUBLE_EQ(portfolio.total_value({{"TSLA", 180.0}}), 102000.0);
    EXPECT_TRUE(PortfolioLedger::check_invariants(portfolio).is_ok());
}

TEST_F(PortfolioLedgerTest, CoverReleasesMarginProportionally) {
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "TSLA", Action::SHORT, 100, 200.0, 0.5)
                    .is_ok());

    auto partial = PortfolioLedger::apply_fill(portfolio, "TSLA", Action::COVER, 40, 150.0, 0.5);
    ASSERT_TRUE(partial.is_ok());
    EXPECT_DOUBLE_EQ(partial.value(), 2000.0);
    EXPECT_DOUBLE_EQ(portfolio.margin_used, 6000.0);
    EXPECT_DOUBLE_EQ(portfolio.position("TSLA").short_margin_used, 6000.0);
    EXPECT_DOUBLE_EQ(portfolio.cash, 114000.0);

    auto rest = PortfolioLedger::apply_fill(portfolio, "TSLA", Action::COVER, 60, 210.0, 0.5);
    ASSERT_TRUE(rest.is_ok());
    EXPECT_DOUBLE_EQ(rest.value(), -600.0);
    EXPECT_DOUBLE_EQ(portfolio.margin_used, 0.0);
    EXPECT_DOUBLE_EQ(portfolio.cash, 101400.0);
    EXPECT_EQ(portfolio.positions.count("TSLA"), 0u);
    EXPECT_DOUBLE_EQ(portfolio.realized_gains.at("TSLA"), 1400.0);
    EXPECT_TRUE(PortfolioLedger::check_invariants(portfolio).is_ok());
}

TEST_F(PortfolioLedgerTest, LongAndShortSidesCoexist) {
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 10, 100.0, 0.5)
                    .is_ok());
    ASSERT_TRUE(PortfolioLedger::apply_fill(portfolio, "AAPL", Action::SHORT, 4, 100.0, 0.5)
                    .is_ok());

    const auto& position = portfolio.position("AAPL");
    EXPECT_EQ(position.long_quantity, 10);
    EXPECT_EQ(position.short_quantity, 4);
    EXPECT_DOUBLE_EQ(position.market_value(110.0), 660.0);
}

TEST_F(PortfolioLedgerTest, RejectsOrdersItCannotFill) {
    auto too_big = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 1001, 100.0, 0.5);
    ASSERT_TRUE(too_big.is_error());
    EXPECT_EQ(too_big.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);

    auto oversell = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::SELL, 1, 100.0, 0.5);
    ASSERT_TRUE(oversell.is_error());
    EXPECT_EQ(oversell.error()->code(), ErrorCode::INVALID_ORDER);

    auto overcover = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::COVER, 1, 100.0, 0.5);
    ASSERT_TRUE(overcover.is_error());
    EXPECT_EQ(overcover.error()->code(), ErrorCode::INVALID_ORDER);

    auto big_short =
        PortfolioLedger::apply_fill(portfolio, "AAPL", Action::SHORT, 2001, 100.0, 0.5);
    ASSERT_TRUE(big_short.is_error());
    EXPECT_EQ(big_short.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);

    auto no_price = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 1, 0.0, 0.5);
    ASSERT_TRUE(no_price.is_error());
    EXPECT_EQ(no_price.error()->code(), ErrorCode::INVALID_ORDER);

    auto negative = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, -5, 100.0, 0.5);
    ASSERT_TRUE(negative.is_error());

    EXPECT_DOUBLE_EQ(portfolio.cash, 100000.0);
    EXPECT_TRUE(portfolio.positions.empty());
}

TEST_F(PortfolioLedgerTest, HoldAndZeroQuantityAreNoOps) {
    auto hold = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::HOLD, 10, 100.0, 0.5);
    ASSERT_TRUE(hold.is_ok());
    auto zero = PortfolioLedger::apply_fill(portfolio, "AAPL", Action::BUY, 0, 100.0, 0.5);
    ASSERT_TRUE(zero.is_ok());
    EXPECT_DOUBLE_EQ(portfolio.cash, 100000.0);
    EXPECT_TRUE(portfolio.positions.empty());
}

TEST_F(PortfolioLedgerTest, InvariantsCatchInconsistentMargin) {
    Portfolio broken = portfolio;
    broken.margin_used = 500.0;
    auto result = PortfolioLedger::check_invariants(broken);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::COMPUTE_ERROR);

    broken.margin_used = 0.0;
    broken.cash = -1.0;
    EXPECT_TRUE(PortfolioLedger::check_invariants(broken).is_error());
}

TEST_F(PortfolioLedgerTest, CommitRefusesBrokenState) {
    PortfolioLedger ledger(100000.0, 0.5);
    Portfolio broken = ledger.portfolio();
    broken.cash = -10.0;

    auto result = ledger.commit(broken);
    ASSERT_TRUE(result.is_error());
    EXPECT_DOUBLE_EQ(ledger.portfolio().cash, 100000.0);
}

TEST_F(PortfolioLedgerTest, SnapshotsChainDailyReturns) {
    PortfolioLedger ledger(100000.0, 0.5);
    Portfolio working = ledger.portfolio();
    ASSERT_TRUE(
        PortfolioLedger::apply_fill(working, "AAPL", Action::BUY, 100, 100.0, 0.5).is_ok());
    ASSERT_TRUE(ledger.commit(working).is_ok());

    auto first = ledger.record_snapshot(date("2024-01-02"), {{"AAPL", 100.0}});
    ASSERT_TRUE(first.is_ok());
    EXPECT_DOUBLE_EQ(first.value().total_value, 100000.0);
    EXPECT_DOUBLE_EQ(first.value().daily_return, 0.0);

    auto second = ledger.record_snapshot(date("2024-01-03"), {{"AAPL", 110.0}});
    ASSERT_TRUE(second.is_ok());
    EXPECT_DOUBLE_EQ(second.value().total_value, 101000.0);
    EXPECT_NEAR(second.value().daily_return, 0.01, 1e-12);
    ASSERT_EQ(second.value().positions.count("AAPL"), 1u);
    EXPECT_DOUBLE_EQ(second.value().positions.at("AAPL").market_value, 11000.0);

    EXPECT_EQ(ledger.history().size(), 2u);
    EXPECT_DOUBLE_EQ(ledger.last_value(), 101000.0);
}

TEST_F(PortfolioLedgerTest, SnapshotDatesMustIncrease) {
    PortfolioLedger ledger(100000.0, 0.5);
    ASSERT_TRUE(ledger.record_snapshot(date("2024-01-03"), {}).is_ok());

    auto same_day = ledger.record_snapshot(date("2024-01-03"), {});
    ASSERT_TRUE(same_day.is_error());
    EXPECT_EQ(same_day.error()->code(), ErrorCode::COMPUTE_ERROR);
    EXPECT_TRUE(ledger.record_snapshot(date("2024-01-02"), {}).is_error());
    EXPECT_EQ(ledger.history().size(), 1u);
}

TEST_F(PortfolioLedgerTest, SnapshotJsonRoundTrip) {
    PortfolioLedger ledger(50000.0, 0.5);
    Portfolio working = ledger.portfolio();
    ASSERT_TRUE(
        PortfolioLedger::apply_fill(working, "MSFT", Action::SHORT, 10, 400.0, 0.5).is_ok());
    ASSERT_TRUE(ledger.commit(working).is_ok());
    auto snapshot = ledger.record_snapshot(date("2024-02-01"), {{"MSFT", 390.0}});
    ASSERT_TRUE(snapshot.is_ok());

    auto restored = DailySnapshot::from_json(snapshot.value().to_json());
    EXPECT_EQ(restored.to_json(), snapshot.value().to_json());
    EXPECT_EQ(restored.positions.at("MSFT").short_quantity, 10);
    EXPECT_DOUBLE_EQ(restored.margin_used, 2000.0);
}
