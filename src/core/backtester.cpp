#include "backtester.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace strategy_sim {

namespace {

void require_commission(double commission_rate) {
    if (!(commission_rate >= 0.0 && commission_rate < 1.0)) {
        throw InvalidParameters("commission rate must be in [0, 1), got " + std::to_string(commission_rate));
    }
}

double period_return(double prev, double cur) {
    return prev != 0.0 ? utils::finite_or_zero(cur / prev - 1.0) : 0.0;
}

} // namespace

PerformanceTable build_capital_table(const PriceSeries& series,
                                     const std::vector<Position>& positions,
                                     double initial_capital,
                                     double commission_rate) {
    if (positions.size() != series.size()) {
        throw InvalidInput("position count " + std::to_string(positions.size()) +
                           " does not match series length " + std::to_string(series.size()));
    }
    require_commission(commission_rate);

    PerformanceTable table;
    table.rows.reserve(series.size());
    double capital = initial_capital;
    size_t changes = 0;
    for (size_t i = 0; i < series.size(); ++i) {
        PerformanceRow row;
        row.timestamp = series[i].date;
        row.position = static_cast<double>(position_exposure(positions[i]));
        if (i > 0) {
            row.returns = period_return(series[i - 1].close, series[i].close);
            row.strategy_returns = static_cast<double>(position_exposure(positions[i - 1])) * row.returns;
            capital *= 1.0 + row.strategy_returns;
            if (positions[i] != positions[i - 1]) ++changes;
        }
        row.capital = capital;
        table.record(row);
    }
    if (commission_rate > 0.0 && !table.empty()) {
        double factor = std::max(0.0, 1.0 - static_cast<double>(changes) * commission_rate);
        table.rows.back().capital *= factor;
    }
    return table;
}

PerformanceTable build_ledger_table(const PriceSeries& series,
                                    const std::vector<TradeRecord>& trades,
                                    double initial_cash) {
    PerformanceTable table;
    table.rows.reserve(series.size());
    double cash = initial_cash;
    double held = 0.0;
    size_t next = 0;
    for (size_t i = 0; i < series.size(); ++i) {
        const auto& bar = series[i];
        for (; next < trades.size() && trades[next].timestamp <= bar.date; ++next) {
            const auto& t = trades[next];
            if (t.side == TradeSide::BUY) {
                cash -= t.amount;
                held += t.quantity;
            } else {
                cash += t.amount;
                held -= t.quantity;
            }
        }
        PerformanceRow row;
        row.timestamp = bar.date;
        row.position = held;
        row.capital = cash + held * bar.close;
        if (i > 0) {
            row.returns = period_return(series[i - 1].close, bar.close);
            row.strategy_returns = period_return(table.rows.back().capital, row.capital);
        }
        table.record(row);
    }
    if (next < trades.size()) {
        spdlog::warn("{} trades fall after the last bar and were not marked", trades.size() - next);
    }
    return table;
}

BacktestResult run_backtest(const Strategy& strategy,
                            const PriceSeries& series,
                            TradeSimulator& simulator,
                            double commission_rate,
                            const BacktestOptions& options) {
    validate_series(series);
    require_commission(commission_rate);

    BacktestResult result;
    result.strategy_name = strategy.name();

    auto generated = strategy.generate_signals(series);
    result.dates = std::move(generated.dates);
    result.signals = std::move(generated.signals);
    result.crossovers = std::move(generated.crossovers);
    result.positions = PositionTracker::track(result.signals);

    result.capital = build_capital_table(series, result.positions, simulator.initial_cash(), commission_rate);
    result.simulation = simulator.simulate(series, result.signals, options.symbol, options.unit_quantity);
    result.trades = simulator.trade_log();

    result.ledger = build_ledger_table(series, result.trades, simulator.initial_cash());

    PerformanceAnalyzer analyzer(options.risk_free_rate);
    result.report = analyzer.evaluate(result.capital);
    result.ledger_report = analyzer.evaluate(result.ledger);

    spdlog::info("Backtest {} on {}: bars={} crossovers={} trades={} total_return={:.4f} "
                 "max_drawdown={:.4f} sharpe={:.4f} ledger_return={:.4f}",
                 result.strategy_name, options.symbol, series.size(), result.crossovers.size(),
                 result.trades.size(), result.report.total_return, result.report.max_drawdown,
                 result.report.sharpe_ratio, result.ledger_report.total_return);
    return result;
}

BacktestResult run_backtest(const StrategyConfig& config,
                            const PriceSeries& series,
                            double initial_capital,
                            double commission_rate,
                            const BacktestOptions& options) {
    auto strategy = make_strategy(config);
    TradeSimulator simulator(initial_capital);
    return run_backtest(*strategy, series, simulator, commission_rate, options);
}

} // namespace strategy_sim
