#pragma once

#include <nlohmann/json.hpp>
#include "backtester.hpp"
#include "utils.hpp"

namespace strategy_sim {
namespace result_format {

inline nlohmann::json format_report(const PerformanceReport& r) {
    return {
        {"total_return", r.total_return},
        {"annual_return", r.annual_return},
        {"max_drawdown", r.max_drawdown},
        {"trade_count", r.trade_count},
        {"win_rate", r.win_rate},
        {"sharpe_ratio", r.sharpe_ratio},
        {"volatility", r.volatility}
    };
}

inline nlohmann::json format_trade(const TradeRecord& t) {
    return {
        {"timestamp", utils::ts_to_date(t.timestamp)},
        {"symbol", t.symbol},
        {"side", trade_side_to_string(t.side)},
        {"price", t.price},
        {"quantity", t.quantity},
        {"amount", t.amount},
        {"resulting_cash", t.resulting_cash}
    };
}

inline nlohmann::json format_crossover(const Crossover& c) {
    return {
        {"date", utils::ts_to_date(c.date)},
        {"type", cross_type_to_string(c.type)},
        {"price", c.price},
        {"fast_value", c.fast_value},
        {"slow_value", c.slow_value}
    };
}

inline nlohmann::json format_portfolio(const PortfolioValue& p) {
    nlohmann::json detail = nlohmann::json::object();
    for (const auto& kv : p.positions_detail) {
        const auto& h = kv.second;
        detail[kv.first] = {
            {"quantity", h.quantity},
            {"current_price", h.resolved() ? nlohmann::json(*h.current_price) : nlohmann::json("unresolved")},
            {"value", h.value ? nlohmann::json(*h.value) : nlohmann::json("unresolved")}
        };
    }
    return {
        {"cash", p.cash},
        {"positions_value", p.positions_value},
        {"total_value", p.total_value},
        {"positions_detail", detail}
    };
}

inline nlohmann::json format_simulation(const SimulationResult& s) {
    return {
        {"final_cash", s.final_cash},
        {"final_positions", s.final_positions},
        {"portfolio_value", format_portfolio(s.portfolio_value)},
        {"total_trades", s.total_trades},
        {"skipped_orders", s.skipped_orders},
        {"performance", {
            {"total_trades", s.performance.total_trades},
            {"buy_trades", s.performance.buy_trades},
            {"sell_trades", s.performance.sell_trades},
            {"cash_change", s.performance.cash_change},
            {"cash_change_percent", s.performance.cash_change_percent}
        }}
    };
}

inline nlohmann::json format_backtest(const BacktestResult& r) {
    nlohmann::json result;
    result["strategy"] = r.strategy_name;
    result["report"] = format_report(r.report);
    result["ledger_report"] = format_report(r.ledger_report);
    result["simulation"] = format_simulation(r.simulation);

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : r.trades) trades.push_back(format_trade(t));
    result["trades"] = trades;

    nlohmann::json crossovers = nlohmann::json::array();
    for (const auto& c : r.crossovers) crossovers.push_back(format_crossover(c));
    result["crossovers"] = crossovers;

    nlohmann::json days = nlohmann::json::array();
    for (size_t i = 0; i < r.dates.size(); ++i) {
        days.push_back({
            {"date", utils::ts_to_date(r.dates[i])},
            {"signal", signal_to_string(r.signals[i])},
            {"position", position_to_string(r.positions[i])},
            {"capital", r.capital.rows[i].capital},
            {"ledger_capital", r.ledger.rows[i].capital}
        });
    }
    result["days"] = days;
    return result;
}

} // namespace result_format
} // namespace strategy_sim
