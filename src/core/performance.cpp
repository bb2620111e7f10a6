#include "performance.hpp"
#include "errors.hpp"
#include <cmath>
#include <algorithm>

namespace strategy_sim {

void PerformanceTable::record(const PerformanceRow& row) {
    if (date_indexed && !rows.empty() && !(rows.back().timestamp < row.timestamp)) {
        throw InvalidInput("performance row for " + utils::ts_to_date(row.timestamp) +
                           " is not after " + utils::ts_to_date(rows.back().timestamp));
    }
    rows.push_back(row);
}

namespace {

double sample_stddev(const std::vector<PerformanceRow>& rows) {
    std::vector<double> vals;
    vals.reserve(rows.size());
    for (const auto& r : rows) {
        if (std::isfinite(r.strategy_returns)) vals.push_back(r.strategy_returns);
    }
    if (vals.size() < 2) return 0.0;
    double mean = 0.0;
    for (double v : vals) mean += v;
    mean /= static_cast<double>(vals.size());
    double var = 0.0;
    for (double v : vals) {
        double d = v - mean;
        var += d * d;
    }
    var /= static_cast<double>(vals.size() - 1);
    return std::sqrt(var);
}

} // namespace

PerformanceReport PerformanceAnalyzer::evaluate(const PerformanceTable& table) const {
    PerformanceReport out;
    const auto& rows = table.rows;
    if (rows.empty()) return out;

    double start = rows.front().capital;
    double end = rows.back().capital;
    if (start != 0.0) out.total_return = utils::finite_or_zero(end / start - 1.0);

    if (rows.size() > 1) {
        int64_t elapsed = table.date_indexed
                              ? utils::days_between(rows.front().timestamp, rows.back().timestamp)
                              : static_cast<int64_t>(rows.size());
        double periods = static_cast<double>(std::max<int64_t>(elapsed, 1));
        out.annual_return = utils::finite_or_zero(
            std::pow(1.0 + out.total_return, kTradingDaysPerYear / periods) - 1.0);
    }

    double peak = rows.front().capital;
    double max_dd = 0.0;
    for (const auto& r : rows) {
        if (r.capital > peak) peak = r.capital;
        double dd = peak > 0.0 ? (peak - r.capital) / peak : 0.0;
        if (dd > max_dd) max_dd = dd;
    }
    out.max_drawdown = utils::finite_or_zero(max_dd);

    size_t wins = 0;
    for (size_t i = 1; i < rows.size(); ++i) {
        if (rows[i].position != rows[i - 1].position) {
            ++out.trade_count;
            if (rows[i].strategy_returns > 0.0) ++wins;
        }
    }
    if (out.trade_count > 0) {
        out.win_rate = static_cast<double>(wins) / static_cast<double>(out.trade_count);
    }

    if (rows.size() > 1) {
        out.volatility = utils::finite_or_zero(sample_stddev(rows) * std::sqrt(kTradingDaysPerYear));
        if (out.volatility > 0.0) {
            out.sharpe_ratio = utils::finite_or_zero((out.annual_return - risk_free_rate_) / out.volatility);
        }
    }
    return out;
}

} // namespace strategy_sim
