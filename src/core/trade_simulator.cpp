#include "trade_simulator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace strategy_sim {

namespace {

constexpr double kQuantityTolerance = 1e-9;

void require_order_values(double price, double quantity) {
    if (!(price > 0.0)) {
        throw InvalidInput("order price must be positive, got " + std::to_string(price));
    }
    if (!(quantity > 0.0)) {
        throw InvalidInput("order quantity must be positive, got " + std::to_string(quantity));
    }
}

} // namespace

std::string trade_side_to_string(TradeSide side) {
    return side == TradeSide::BUY ? "buy" : "sell";
}

TradeSimulator::TradeSimulator(double initial_cash) : initial_cash_(initial_cash) {
    if (!(initial_cash >= 0.0)) {
        throw InvalidParameters("initial cash must be non-negative");
    }
    state_.cash = initial_cash;
}

TradeRecord TradeSimulator::buy(const std::string& symbol, double price, double quantity,
                                 Timestamp timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    return buy_locked(symbol, price, quantity, timestamp);
}

TradeRecord TradeSimulator::sell(const std::string& symbol, double price, double quantity,
                                  Timestamp timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sell_locked(symbol, price, quantity, timestamp);
}

TradeRecord TradeSimulator::buy_locked(const std::string& symbol, double price, double quantity,
                                        Timestamp ts) {
    require_order_values(price, quantity);
    double cost = price * quantity;
    if (cost > state_.cash) {
        throw InsufficientFunds(cost, state_.cash);
    }
    state_.cash -= cost;
    state_.holdings[symbol] += quantity;

    trade_log_.push_back({ts, symbol, TradeSide::BUY, price, quantity, cost, state_.cash});
    return trade_log_.back();
}

TradeRecord TradeSimulator::sell_locked(const std::string& symbol, double price, double quantity,
                                         Timestamp ts) {
    auto it = state_.holdings.find(symbol);
    if (it == state_.holdings.end()) {
        throw UnknownPosition(symbol);
    }
    require_order_values(price, quantity);
    // Fractional lots accumulate rounding error; residue below this is zero.
    const double tolerance = kQuantityTolerance * quantity;
    if (quantity > it->second + tolerance) {
        throw InsufficientPosition(symbol, quantity, it->second);
    }
    quantity = std::min(quantity, it->second);
    double proceeds = price * quantity;
    state_.cash += proceeds;
    it->second -= quantity;
    if (it->second <= tolerance) {
        state_.holdings.erase(it);
    }

    trade_log_.push_back({ts, symbol, TradeSide::SELL, price, quantity, proceeds, state_.cash});
    return trade_log_.back();
}

SimulationResult TradeSimulator::simulate(const PriceSeries& series,
                                          const std::vector<Signal>& signals,
                                          const std::string& symbol,
                                          double unit_quantity) {
    validate_series(series);
    if (signals.size() != series.size()) {
        throw InvalidInput("signal count " + std::to_string(signals.size()) +
                           " does not match series length " + std::to_string(series.size()));
    }
    if (!(unit_quantity > 0.0)) {
        throw InvalidInput("unit quantity must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();

    size_t skipped = 0;
    for (size_t i = 0; i < series.size(); ++i) {
        const auto& bar = series[i];
        Signal signal = signals[i];
        try {
            if (signal == Signal::BUY) {
                buy_locked(symbol, bar.close, unit_quantity, bar.date);
            } else if (signal == Signal::SELL) {
                auto it = state_.holdings.find(symbol);
                if (it == state_.holdings.end()) continue;
                double qty = std::min(unit_quantity, it->second);
                if (qty > 0.0) sell_locked(symbol, bar.close, qty, bar.date);
            }
        } catch (const SimError& e) {
            ++skipped;
            spdlog::warn("Order skipped: {} {} on {}: {}", signal_to_string(signal), symbol,
                         utils::ts_to_date(bar.date), e.what());
        }
    }

    SimulationResult result;
    result.final_cash = state_.cash;
    result.final_positions = state_.holdings;
    std::unordered_map<std::string, double> last_prices;
    if (!series.empty()) last_prices[symbol] = series.back().close;
    result.portfolio_value = portfolio_value_locked(last_prices);
    result.total_trades = trade_log_.size();
    result.skipped_orders = skipped;
    result.performance = summary_locked();

    spdlog::info("Simulation {} finished: bars={} trades={} skipped={} cash={:.2f} total_value={:.2f}",
                 symbol, series.size(), result.total_trades, skipped,
                 result.final_cash, result.portfolio_value.total_value);
    return result;
}

PortfolioValue TradeSimulator::get_portfolio_value(
    const std::unordered_map<std::string, double>& current_prices) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return portfolio_value_locked(current_prices);
}

PortfolioValue TradeSimulator::portfolio_value_locked(
    const std::unordered_map<std::string, double>& current_prices) const {
    PortfolioValue out;
    out.cash = state_.cash;
    for (const auto& kv : state_.holdings) {
        HoldingValuation detail;
        detail.symbol = kv.first;
        detail.quantity = kv.second;
        auto price_it = current_prices.find(kv.first);
        if (price_it != current_prices.end()) {
            detail.current_price = price_it->second;
            detail.value = kv.second * price_it->second;
            out.positions_value += *detail.value;
        }
        out.positions_detail.emplace(kv.first, std::move(detail));
    }
    out.total_value = out.cash + out.positions_value;
    return out;
}

TradeSummary TradeSimulator::get_performance_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_locked();
}

TradeSummary TradeSimulator::summary_locked() const {
    TradeSummary out;
    out.total_trades = trade_log_.size();
    for (const auto& t : trade_log_) {
        if (t.side == TradeSide::BUY)
            ++out.buy_trades;
        else
            ++out.sell_trades;
    }
    out.cash_change = state_.cash - initial_cash_;
    out.cash_change_percent = initial_cash_ != 0.0 ? out.cash_change / initial_cash_ * 100.0 : 0.0;
    return out;
}

void TradeSimulator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
}

void TradeSimulator::reset_locked() {
    state_.cash = initial_cash_;
    state_.holdings.clear();
    trade_log_.clear();
}

double TradeSimulator::cash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.cash;
}

std::unordered_map<std::string, double> TradeSimulator::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.holdings;
}

std::vector<TradeRecord> TradeSimulator::trade_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trade_log_;
}

} // namespace strategy_sim
