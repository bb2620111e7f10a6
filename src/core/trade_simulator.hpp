#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <mutex>
#include "price_series.hpp"
#include "strategy.hpp"

namespace strategy_sim {

enum class TradeSide { BUY, SELL };

std::string trade_side_to_string(TradeSide side);

struct TradeRecord {
    Timestamp timestamp;
    std::string symbol;
    TradeSide side{TradeSide::BUY};
    double price{0.0};
    double quantity{0.0};
    double amount{0.0};          // cost for buys, proceeds for sells
    double resulting_cash{0.0};
};

struct PortfolioState {
    double cash{0.0};
    std::unordered_map<std::string, double> holdings;
};

// A holding priced at the supplied quotes; price/value stay empty when unresolved.
struct HoldingValuation {
    std::string symbol;
    double quantity{0.0};
    std::optional<double> current_price;
    std::optional<double> value;

    bool resolved() const { return current_price.has_value(); }
};

struct PortfolioValue {
    double cash{0.0};
    double positions_value{0.0};
    double total_value{0.0};
    std::unordered_map<std::string, HoldingValuation> positions_detail;
};

struct TradeSummary {
    size_t total_trades{0};
    size_t buy_trades{0};
    size_t sell_trades{0};
    double cash_change{0.0};
    double cash_change_percent{0.0};
};

struct SimulationResult {
    double final_cash{0.0};
    std::unordered_map<std::string, double> final_positions;
    PortfolioValue portfolio_value;
    size_t total_trades{0};
    size_t skipped_orders{0};
    TradeSummary performance;
};

/**
 * Cash/holdings ledger that executes discrete trades.
 *
 * buy/sell raise on ledger violations (InsufficientFunds, UnknownPosition,
 * InsufficientPosition) and leave the ledger untouched when they do.
 * simulate() replays a signal sequence best-effort: rejected orders are
 * logged and skipped, the run never aborts on one of them.
 *
 * One instance per concurrent backtest; the ledger is reset at the start of
 * every simulate() call.
 */
class TradeSimulator {
public:
    explicit TradeSimulator(double initial_cash = 100000.0);

    TradeRecord buy(const std::string& symbol, double price, double quantity,
                    Timestamp timestamp = std::chrono::system_clock::now());
    TradeRecord sell(const std::string& symbol, double price, double quantity,
                     Timestamp timestamp = std::chrono::system_clock::now());

    SimulationResult simulate(const PriceSeries& series,
                              const std::vector<Signal>& signals,
                              const std::string& symbol = "HSI",
                              double unit_quantity = 1.0);

    PortfolioValue get_portfolio_value(const std::unordered_map<std::string, double>& current_prices) const;
    TradeSummary get_performance_summary() const;

    // Back to initial cash, no holdings, empty trade log.
    void reset();

    double cash() const;
    double initial_cash() const { return initial_cash_; }
    std::unordered_map<std::string, double> positions() const;
    std::vector<TradeRecord> trade_log() const;

private:
    TradeRecord buy_locked(const std::string& symbol, double price, double quantity, Timestamp ts);
    TradeRecord sell_locked(const std::string& symbol, double price, double quantity, Timestamp ts);
    PortfolioValue portfolio_value_locked(const std::unordered_map<std::string, double>& current_prices) const;
    TradeSummary summary_locked() const;
    void reset_locked();

    mutable std::mutex mutex_;
    double initial_cash_;
    PortfolioState state_;
    std::vector<TradeRecord> trade_log_;
};

} // namespace strategy_sim
