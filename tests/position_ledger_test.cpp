// position_ledger_test.cpp — Tests for PositionLedger and ExecutionCosts
//
// Buy sizing, commission on both sides, the one-position-per-symbol state
// machine, insufficient cash, and the trade log.

#include <gtest/gtest.h>

#include "backtest/execution_costs.hpp"
#include "backtest/position_ledger.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

// ===========================================================================
// 1. ExecutionCosts
// ===========================================================================

TEST(ExecutionCostsTest, DefaultRate) {
    ExecutionCosts costs;
    EXPECT_DOUBLE_EQ(costs.commission_rate, 0.001);
    EXPECT_NO_THROW(costs.validate());
}

TEST(ExecutionCostsTest, BuyAndSellSides) {
    ExecutionCosts costs;
    EXPECT_NEAR(costs.buy_cost(500, 100.0), 50050.0, 1e-6);
    EXPECT_NEAR(costs.sell_proceeds(500, 120.0), 59940.0, 1e-6);
    EXPECT_NEAR(costs.per_side_commission(500, 100.0), 50.0, 1e-9);
    EXPECT_NEAR(costs.round_trip_commission(500, 100.0, 120.0), 110.0, 1e-9);
}

TEST(ExecutionCostsTest, ZeroCommission) {
    ExecutionCosts costs;
    costs.commission_rate = 0.0;
    EXPECT_DOUBLE_EQ(costs.buy_cost(10, 5.0), 50.0);
    EXPECT_DOUBLE_EQ(costs.sell_proceeds(10, 5.0), 50.0);
}

TEST(ExecutionCostsTest, RateOutsideRangeRejected) {
    ExecutionCosts costs;
    costs.commission_rate = -0.001;
    EXPECT_THROW(costs.validate(), InvalidConfiguration);
    costs.commission_rate = 1.0;
    EXPECT_THROW(costs.validate(), InvalidConfiguration);
}

// ===========================================================================
// 2. PositionLedger
// ===========================================================================

class PositionLedgerTest : public ::testing::Test {
protected:
    PositionLedger ledger{100000.0, ExecutionCosts{}};
};

TEST_F(PositionLedgerTest, StartsFlatWithInitialCash) {
    EXPECT_DOUBLE_EQ(ledger.cash(), 100000.0);
    EXPECT_FALSE(ledger.has_position("AAA"));
    EXPECT_EQ(ledger.shares_held("AAA"), 0);
    EXPECT_EQ(ledger.position("AAA"), nullptr);
    EXPECT_TRUE(ledger.trade_log().empty());
}

TEST_F(PositionLedgerTest, BuySizesByFractionOfCash) {
    ASSERT_EQ(ledger.buy("AAA", 0.5, 100.0, 1, 0), BuyOutcome::OPENED);
    const Position* p = ledger.position("AAA");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->shares, 500);
    EXPECT_DOUBLE_EQ(p->entry_price, 100.0);
    EXPECT_NEAR(p->cost_basis, 50050.0, 1e-6);
    EXPECT_NEAR(ledger.cash(), 49950.0, 1e-6);
}

TEST_F(PositionLedgerTest, SharesRoundDown) {
    ASSERT_EQ(ledger.buy("AAA", 0.1, 333.0, 1, 0), BuyOutcome::OPENED);
    EXPECT_EQ(ledger.shares_held("AAA"), 30);  // floor(10000 / 333)
}

TEST_F(PositionLedgerTest, SecondBuyIgnoredWhileOpen) {
    ASSERT_EQ(ledger.buy("AAA", 0.5, 100.0, 1, 0), BuyOutcome::OPENED);
    double cash = ledger.cash();
    EXPECT_EQ(ledger.buy("AAA", 0.5, 90.0, 2, 1), BuyOutcome::ALREADY_OPEN);
    EXPECT_EQ(ledger.shares_held("AAA"), 500);
    EXPECT_DOUBLE_EQ(ledger.cash(), cash);
}

TEST_F(PositionLedgerTest, SellWhileFlatIsNoOp) {
    EXPECT_FALSE(ledger.sell("AAA", 100.0, 1, 0).has_value());
    EXPECT_DOUBLE_EQ(ledger.cash(), 100000.0);
    EXPECT_TRUE(ledger.trade_log().empty());
}

TEST_F(PositionLedgerTest, PriceTooHighForOneShare) {
    EXPECT_EQ(ledger.buy("AAA", 0.1, 20000.0, 1, 0), BuyOutcome::ZERO_SHARES);
    EXPECT_EQ(ledger.buy("AAA", 0.1, 0.0, 1, 0), BuyOutcome::ZERO_SHARES);
    EXPECT_FALSE(ledger.has_position("AAA"));
}

TEST_F(PositionLedgerTest, FullFractionWithCommissionIsInsufficientCash) {
    // floor(cash / price) shares cost more than cash once commission is added.
    EXPECT_EQ(ledger.buy("AAA", 1.0, 100.0, 1, 0), BuyOutcome::INSUFFICIENT_CASH);
    EXPECT_DOUBLE_EQ(ledger.cash(), 100000.0);
    EXPECT_FALSE(ledger.has_position("AAA"));
}

TEST(PositionLedgerNoCommissionTest, FullFractionWithoutCommissionSpendsAll) {
    ExecutionCosts costs;
    costs.commission_rate = 0.0;
    PositionLedger ledger(1000.0, costs);
    ASSERT_EQ(ledger.buy("AAA", 1.0, 10.0, 1, 0), BuyOutcome::OPENED);
    EXPECT_EQ(ledger.shares_held("AAA"), 100);
    EXPECT_DOUBLE_EQ(ledger.cash(), 0.0);
}

TEST_F(PositionLedgerTest, RoundTripRecordsTrade) {
    ASSERT_EQ(ledger.buy("AAA", 0.5, 100.0, 10, 3), BuyOutcome::OPENED);
    auto t = ledger.sell("AAA", 120.0, 20, 5);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->symbol, "AAA");
    EXPECT_EQ(t->shares, 500);
    EXPECT_EQ(t->entry_ts, 10u);
    EXPECT_EQ(t->exit_ts, 20u);
    EXPECT_EQ(t->entry_bar_idx, 3);
    EXPECT_EQ(t->exit_bar_idx, 5);
    EXPECT_EQ(t->bars_held, 2);
    EXPECT_NEAR(t->cost_basis, 50050.0, 1e-6);
    EXPECT_NEAR(t->proceeds, 59940.0, 1e-6);
    EXPECT_NEAR(t->gross_pnl, 10000.0, 1e-9);
    EXPECT_NEAR(t->commission, 110.0, 1e-9);
    EXPECT_DOUBLE_EQ(t->realized_profit, 9890.0);
    EXPECT_EQ(t->realized_profit, t->gross_pnl - t->commission);
    EXPECT_NEAR(t->return_pct, 9890.0 / 50000.0 * 100.0, 1e-9);
    EXPECT_EQ(t->exit_reason, ExitReason::SIGNAL);

    EXPECT_NEAR(ledger.cash(), 109890.0, 1e-6);
    EXPECT_FALSE(ledger.has_position("AAA"));
    ASSERT_EQ(ledger.trade_log().size(), 1u);
}

TEST_F(PositionLedgerTest, LosingTradeHasNegativeProfit) {
    ASSERT_EQ(ledger.buy("AAA", 0.2, 50.0, 1, 0), BuyOutcome::OPENED);
    auto t = ledger.sell("AAA", 45.0, 2, 1, ExitReason::END_OF_RUN);
    ASSERT_TRUE(t.has_value());
    EXPECT_LT(t->realized_profit, 0.0);
    EXPECT_EQ(t->exit_reason, ExitReason::END_OF_RUN);
}

TEST_F(PositionLedgerTest, PortfolioValueMarksOpenPosition) {
    ASSERT_EQ(ledger.buy("AAA", 0.5, 100.0, 1, 0), BuyOutcome::OPENED);
    EXPECT_NEAR(ledger.portfolio_value("AAA", 110.0), ledger.cash() + 500 * 110.0, 1e-9);
    EXPECT_DOUBLE_EQ(ledger.portfolio_value("BBB", 110.0), ledger.cash());
}

TEST_F(PositionLedgerTest, SymbolsAreIndependent) {
    ASSERT_EQ(ledger.buy("AAA", 0.1, 100.0, 1, 0), BuyOutcome::OPENED);
    ASSERT_EQ(ledger.buy("BBB", 0.1, 50.0, 1, 0), BuyOutcome::OPENED);
    EXPECT_EQ(ledger.open_positions().size(), 2u);
    ASSERT_TRUE(ledger.sell("AAA", 101.0, 2, 1).has_value());
    EXPECT_TRUE(ledger.has_position("BBB"));
}

TEST_F(PositionLedgerTest, CashNeverNegative) {
    for (int i = 0; i < 50; ++i) {
        double price = 100.0 + (i % 7) * 3.0;
        ledger.buy("AAA", 0.9, price, static_cast<uint64_t>(i), i);
        EXPECT_GE(ledger.cash(), 0.0);
        ledger.sell("AAA", price * 0.95, static_cast<uint64_t>(i), i);
        EXPECT_GE(ledger.cash(), 0.0);
    }
}

TEST_F(PositionLedgerTest, ProfitIsGrossLessCommissionExactly) {
    ASSERT_EQ(ledger.buy("AAA", 0.37, 33.33, 1, 0), BuyOutcome::OPENED);
    auto t = ledger.sell("AAA", 41.17, 2, 1);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->realized_profit, t->gross_pnl - t->commission);
    EXPECT_NEAR(t->realized_profit, t->proceeds - t->cost_basis, 1e-6);
}

TEST_F(PositionLedgerTest, FractionOutsideRangeRejected) {
    EXPECT_THROW(ledger.buy("AAA", std::nan(""), 100.0, 1, 0), InvalidConfiguration);
    EXPECT_THROW(ledger.buy("AAA", 0.0, 100.0, 1, 0), InvalidConfiguration);
    EXPECT_THROW(ledger.buy("AAA", 1.5, 100.0, 1, 0), InvalidConfiguration);
    EXPECT_THROW(ledger.buy("AAA", -0.1, 100.0, 1, 0), InvalidConfiguration);
    EXPECT_FALSE(ledger.has_position("AAA"));
    EXPECT_DOUBLE_EQ(ledger.cash(), 100000.0);
}

TEST_F(PositionLedgerTest, NonFinitePriceBuysNothing) {
    EXPECT_EQ(ledger.buy("AAA", 0.5, std::nan(""), 1, 0), BuyOutcome::ZERO_SHARES);
    EXPECT_EQ(ledger.buy("AAA", 0.5, std::numeric_limits<double>::infinity(), 1, 0),
              BuyOutcome::ZERO_SHARES);
    EXPECT_FALSE(ledger.has_position("AAA"));
}

TEST(PositionLedgerRangeTest, ShareCountBeyondInt64Throws) {
    PositionLedger ledger(1e30, ExecutionCosts{});
    EXPECT_THROW(ledger.buy("AAA", 1.0, 1e-5, 1, 0), std::overflow_error);
    EXPECT_FALSE(ledger.has_position("AAA"));
}

TEST(PositionLedgerConfigTest, RejectsBadCapitalOrCosts) {
    EXPECT_THROW(PositionLedger(0.0, ExecutionCosts{}), InvalidConfiguration);
    EXPECT_THROW(PositionLedger(-5.0, ExecutionCosts{}), InvalidConfiguration);
    ExecutionCosts bad;
    bad.commission_rate = 2.0;
    EXPECT_THROW(PositionLedger(1000.0, bad), InvalidConfiguration);
}
