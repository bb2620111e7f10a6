#include <gtest/gtest.h>
#include "../src/core/trade_simulator.hpp"
#include "../src/core/errors.hpp"
#include "test_helpers.hpp"

using namespace strategy_sim;
using strategy_sim::test::make_series;

TEST(TradeSimulatorTest, BuyThenPartialSell) {
    TradeSimulator sim(100000.0);
    auto buy = sim.buy("HSI", 20000.0, 2);
    EXPECT_EQ(buy.side, TradeSide::BUY);
    EXPECT_DOUBLE_EQ(buy.amount, 40000.0);
    EXPECT_DOUBLE_EQ(buy.resulting_cash, 60000.0);
    EXPECT_DOUBLE_EQ(sim.cash(), 60000.0);

    auto sell = sim.sell("HSI", 22000.0, 1);
    EXPECT_EQ(sell.side, TradeSide::SELL);
    EXPECT_DOUBLE_EQ(sell.amount, 22000.0);
    EXPECT_DOUBLE_EQ(sell.resulting_cash, 82000.0);
    EXPECT_DOUBLE_EQ(sim.cash(), 82000.0);

    auto positions = sim.positions();
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_DOUBLE_EQ(positions["HSI"], 1.0);
    EXPECT_EQ(sim.trade_log().size(), 2u);
}

TEST(TradeSimulatorTest, RoundTripRestoresCash) {
    TradeSimulator sim(100000.0);
    double before = sim.cash();
    sim.buy("HSI", 20000.0, 3);
    sim.sell("HSI", 20000.0, 3);
    EXPECT_DOUBLE_EQ(sim.cash(), before);
    EXPECT_TRUE(sim.positions().empty());
}

TEST(TradeSimulatorTest, InsufficientFundsLeavesLedgerUntouched) {
    TradeSimulator sim(100000.0);
    EXPECT_THROW(sim.buy("HSI", 20000.0, 6), InsufficientFunds);
    EXPECT_DOUBLE_EQ(sim.cash(), 100000.0);
    EXPECT_TRUE(sim.positions().empty());
    EXPECT_TRUE(sim.trade_log().empty());
}

TEST(TradeSimulatorTest, BuyingExactlyAllCashIsAllowed) {
    TradeSimulator sim(40000.0);
    sim.buy("HSI", 20000.0, 2);
    EXPECT_DOUBLE_EQ(sim.cash(), 0.0);
}

TEST(TradeSimulatorTest, InsufficientPosition) {
    TradeSimulator sim(100000.0);
    sim.buy("HSI", 20000.0, 2);
    try {
        sim.sell("HSI", 22000.0, 3);
        FAIL() << "expected InsufficientPosition";
    } catch (const InsufficientPosition& e) {
        EXPECT_DOUBLE_EQ(e.requested(), 3.0);
        EXPECT_DOUBLE_EQ(e.held(), 2.0);
    }
    EXPECT_DOUBLE_EQ(sim.cash(), 60000.0);
    EXPECT_DOUBLE_EQ(sim.positions()["HSI"], 2.0);
    EXPECT_EQ(sim.trade_log().size(), 1u);
}

TEST(TradeSimulatorTest, UnknownPosition) {
    TradeSimulator sim(100000.0);
    EXPECT_THROW(sim.sell("HSI", 22000.0, 1), UnknownPosition);
}

TEST(TradeSimulatorTest, NonPositiveOrderValues) {
    TradeSimulator sim(100000.0);
    EXPECT_THROW(sim.buy("HSI", 20000.0, 0), InvalidInput);
    EXPECT_THROW(sim.buy("HSI", -1.0, 1), InvalidInput);
    sim.buy("HSI", 100.0, 1);
    EXPECT_THROW(sim.sell("HSI", 100.0, -1), InvalidInput);
}

TEST(TradeSimulatorTest, SimulateBuyHoldSell) {
    TradeSimulator sim(100000.0);
    auto series = make_series({20000, 20500, 21000, 21500});
    auto result = sim.simulate(series, {Signal::BUY, Signal::HOLD, Signal::HOLD, Signal::SELL}, "HSI", 1.0);

    auto log = sim.trade_log();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].side, TradeSide::BUY);
    EXPECT_DOUBLE_EQ(log[0].price, 20000.0);
    EXPECT_EQ(log[0].timestamp, series[0].date);
    EXPECT_EQ(log[1].side, TradeSide::SELL);
    EXPECT_DOUBLE_EQ(log[1].price, 21500.0);
    EXPECT_EQ(log[1].timestamp, series[3].date);

    EXPECT_DOUBLE_EQ(result.final_cash, 101500.0);
    EXPECT_TRUE(result.final_positions.empty());
    EXPECT_EQ(result.total_trades, 2u);
    EXPECT_EQ(result.skipped_orders, 0u);
    EXPECT_DOUBLE_EQ(result.portfolio_value.total_value, 101500.0);
    EXPECT_EQ(result.performance.buy_trades, 1u);
    EXPECT_EQ(result.performance.sell_trades, 1u);
    EXPECT_DOUBLE_EQ(result.performance.cash_change, 1500.0);
    EXPECT_DOUBLE_EQ(result.performance.cash_change_percent, 1.5);
}

TEST(TradeSimulatorTest, SimulateSkipsRejectedOrders) {
    TradeSimulator sim(30000.0);
    auto series = make_series({20000, 20000, 20000, 21000, 21000, 22000});
    std::vector<Signal> signals{Signal::SELL, Signal::BUY, Signal::BUY, Signal::BUY, Signal::SELL, Signal::SELL};
    SimulationResult result;
    ASSERT_NO_THROW(result = sim.simulate(series, signals, "HSI", 1.0));
    // One buy at 20000; the other buys lack funds; second sell has nothing left.
    EXPECT_EQ(result.total_trades, 2u);
    EXPECT_EQ(result.skipped_orders, 2u);
    EXPECT_DOUBLE_EQ(result.final_cash, 31000.0);
    EXPECT_TRUE(result.final_positions.empty());
}

TEST(TradeSimulatorTest, SimulateSellsAtMostHeld) {
    TradeSimulator sim(100000.0);
    auto series = make_series({100, 110, 120, 130});
    auto result = sim.simulate(series, {Signal::BUY, Signal::BUY, Signal::SELL, Signal::SELL}, "ABC", 5.0);
    auto log = sim.trade_log();
    ASSERT_EQ(log.size(), 4u);
    EXPECT_DOUBLE_EQ(log[2].quantity, 5.0);
    EXPECT_DOUBLE_EQ(log[3].quantity, 5.0);
    EXPECT_TRUE(result.final_positions.empty());
    EXPECT_DOUBLE_EQ(result.final_cash, 100000.0 - 500.0 - 550.0 + 600.0 + 650.0);
}

TEST(TradeSimulatorTest, FractionalLotsCloseOutCompletely) {
    TradeSimulator sim(1000.0);
    auto series = make_series({10, 10, 10, 11, 11, 11, 11});
    std::vector<Signal> signals{Signal::BUY, Signal::BUY, Signal::BUY,
                                Signal::SELL, Signal::SELL, Signal::SELL, Signal::SELL};
    auto result = sim.simulate(series, signals, "HSI", 0.1);
    EXPECT_EQ(result.total_trades, 6u);
    EXPECT_EQ(result.skipped_orders, 0u);
    EXPECT_TRUE(result.final_positions.empty());
    EXPECT_NEAR(result.final_cash, 1000.3, 1e-9);
}

TEST(TradeSimulatorTest, SellWithinRoundingOfHoldingIsAccepted) {
    TradeSimulator sim(1000.0);
    sim.buy("HSI", 10.0, 0.1);
    sim.buy("HSI", 10.0, 0.2);
    EXPECT_NO_THROW(sim.sell("HSI", 10.0, 0.3));
    EXPECT_TRUE(sim.positions().empty());
}

TEST(TradeSimulatorTest, SimulateResetsLedgerEachRun) {
    TradeSimulator sim(100000.0);
    sim.buy("OTHER", 10.0, 10);
    auto series = make_series({20000, 21000});
    std::vector<Signal> signals{Signal::BUY, Signal::SELL};
    auto first = sim.simulate(series, signals, "HSI", 1.0);
    auto second = sim.simulate(series, signals, "HSI", 1.0);
    EXPECT_EQ(first.total_trades, 2u);
    EXPECT_EQ(second.total_trades, 2u);
    EXPECT_DOUBLE_EQ(first.final_cash, second.final_cash);
    EXPECT_EQ(sim.positions().count("OTHER"), 0u);
}

TEST(TradeSimulatorTest, SimulateHoldingLeftOpenIsValuedAtLastClose) {
    TradeSimulator sim(100000.0);
    auto series = make_series({100, 120});
    auto result = sim.simulate(series, {Signal::BUY, Signal::HOLD}, "ABC", 10.0);
    EXPECT_DOUBLE_EQ(result.final_cash, 99000.0);
    EXPECT_DOUBLE_EQ(result.portfolio_value.positions_value, 1200.0);
    EXPECT_DOUBLE_EQ(result.portfolio_value.total_value, 100200.0);
}

TEST(TradeSimulatorTest, SimulateRejectsMisalignedSignals) {
    TradeSimulator sim(100000.0);
    EXPECT_THROW(sim.simulate(make_series({1, 2, 3}), {Signal::BUY}, "HSI", 1.0), InvalidInput);
    EXPECT_THROW(sim.simulate(make_series({1}), {Signal::BUY}, "HSI", 0.0), InvalidInput);
}

TEST(TradeSimulatorTest, PortfolioValueMarksUnresolvedPrices) {
    TradeSimulator sim(100000.0);
    sim.buy("HSI", 20000.0, 2);
    sim.buy("AAPL", 150.0, 100);
    auto value = sim.get_portfolio_value({{"HSI", 22000.0}});
    EXPECT_DOUBLE_EQ(value.cash, 100000.0 - 40000.0 - 15000.0);
    EXPECT_DOUBLE_EQ(value.positions_value, 44000.0);
    EXPECT_DOUBLE_EQ(value.total_value, value.cash + 44000.0);

    const auto& hsi = value.positions_detail.at("HSI");
    EXPECT_TRUE(hsi.resolved());
    EXPECT_DOUBLE_EQ(*hsi.value, 44000.0);

    const auto& aapl = value.positions_detail.at("AAPL");
    EXPECT_FALSE(aapl.resolved());
    EXPECT_FALSE(aapl.value.has_value());
    EXPECT_DOUBLE_EQ(aapl.quantity, 100.0);
}

TEST(TradeSimulatorTest, PerformanceSummary) {
    TradeSimulator sim(100000.0);
    sim.buy("HSI", 20000.0, 2);
    sim.sell("HSI", 22000.0, 1);
    auto summary = sim.get_performance_summary();
    EXPECT_EQ(summary.total_trades, 2u);
    EXPECT_EQ(summary.buy_trades, 1u);
    EXPECT_EQ(summary.sell_trades, 1u);
    EXPECT_DOUBLE_EQ(summary.cash_change, -18000.0);
    EXPECT_DOUBLE_EQ(summary.cash_change_percent, -18.0);

    TradeSimulator empty(0.0);
    EXPECT_DOUBLE_EQ(empty.get_performance_summary().cash_change_percent, 0.0);
}

TEST(TradeSimulatorTest, ResetRestoresInitialState) {
    TradeSimulator sim(5000.0);
    sim.buy("HSI", 100.0, 10);
    sim.reset();
    EXPECT_DOUBLE_EQ(sim.cash(), 5000.0);
    EXPECT_TRUE(sim.positions().empty());
    EXPECT_TRUE(sim.trade_log().empty());
}
