#pragma once

#include <string>
#include <vector>
#include "price_series.hpp"
#include "strategy.hpp"
#include "position_tracker.hpp"
#include "trade_simulator.hpp"
#include "performance.hpp"

namespace strategy_sim {

struct BacktestOptions {
    std::string symbol{"HSI"};
    double unit_quantity{1.0};
    double risk_free_rate{PerformanceAnalyzer::kDefaultRiskFreeRate};
};

struct BacktestResult {
    std::string strategy_name;
    std::vector<Timestamp> dates;
    std::vector<Signal> signals;
    std::vector<Position> positions;
    std::vector<Crossover> crossovers;
    std::vector<TradeRecord> trades;
    SimulationResult simulation;
    PerformanceTable capital;
    PerformanceReport report;
    PerformanceTable ledger;          // executed trades marked to each close
    PerformanceReport ledger_report;
};

/**
 * Analytic capital curve for a position sequence. Each period earns the
 * exposure held at the previous close times the period return. Commission is
 * charged once at the end: the last row's capital is scaled by
 * 1 - changes * commission_rate (floored at zero), where changes is the
 * number of dates on which the position differs from the previous date.
 */
PerformanceTable build_capital_table(const PriceSeries& series,
                                     const std::vector<Position>& positions,
                                     double initial_capital,
                                     double commission_rate);

/**
 * Capital curve of an executed trade ledger: cash plus held quantity marked
 * to each close. Trades are applied on the first bar at or after their
 * timestamp; position is the quantity held after that bar's trades and
 * strategy_returns is the period change of capital.
 */
PerformanceTable build_ledger_table(const PriceSeries& series,
                                    const std::vector<TradeRecord>& trades,
                                    double initial_cash);

/**
 * Full pipeline: signals, positions, analytic capital curve, executed trade
 * ledger and a performance report for each. The series is validated up front; the
 * strategy config is validated when the strategy is built.
 */
BacktestResult run_backtest(const StrategyConfig& config,
                            const PriceSeries& series,
                            double initial_capital = 100000.0,
                            double commission_rate = 0.0,
                            const BacktestOptions& options = {});

// Same pipeline over a caller-owned strategy and simulator.
BacktestResult run_backtest(const Strategy& strategy,
                            const PriceSeries& series,
                            TradeSimulator& simulator,
                            double commission_rate,
                            const BacktestOptions& options = {});

} // namespace strategy_sim
