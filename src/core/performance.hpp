#pragma once

#include <vector>
#include <cstddef>
#include "utils.hpp"

namespace strategy_sim {

struct PerformanceRow {
    Timestamp timestamp;
    double position{0.0};          // exposure held over the period: 1, 0 or -1
    double returns{0.0};           // period return of the underlying
    double strategy_returns{0.0};
    double capital{0.0};
};

/**
 * Date-ordered capital curve. When date_indexed is false the elapsed period
 * used for annualization is the row count instead of calendar days.
 */
struct PerformanceTable {
    std::vector<PerformanceRow> rows;
    bool date_indexed{true};

    // Date-indexed tables require strictly increasing timestamps (InvalidInput).
    void record(const PerformanceRow& row);
    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
};

// Every field is finite; degenerate input resolves to zero.
struct PerformanceReport {
    double total_return{0.0};
    double annual_return{0.0};
    double max_drawdown{0.0};
    size_t trade_count{0};
    double win_rate{0.0};
    double sharpe_ratio{0.0};
    double volatility{0.0};
};

class PerformanceAnalyzer {
public:
    static constexpr double kTradingDaysPerYear = 252.0;
    static constexpr double kDefaultRiskFreeRate = 0.02;

    explicit PerformanceAnalyzer(double risk_free_rate = kDefaultRiskFreeRate)
        : risk_free_rate_(risk_free_rate) {}

    PerformanceReport evaluate(const PerformanceTable& table) const;

    double risk_free_rate() const { return risk_free_rate_; }

private:
    double risk_free_rate_;
};

} // namespace strategy_sim
