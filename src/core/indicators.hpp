#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cmath>
#include "price_series.hpp"

namespace strategy_sim {

// One value per bar; NaN marks the warm-up rows where the value is undefined.
using IndicatorSeries = std::vector<double>;

struct MacdResult {
    IndicatorSeries macd_line;
    IndicatorSeries signal_line;
    IndicatorSeries histogram;
};

/**
 * Bollinger bands. The band deviation is the sample standard deviation
 * (n - 1 denominator) over the same trailing window as the middle SMA.
 */
struct BollingerResult {
    IndicatorSeries middle;
    IndicatorSeries upper;
    IndicatorSeries lower;
    IndicatorSeries width;
};

enum class CrossType { GOLDEN_CROSS, DEATH_CROSS };

struct Crossover {
    Timestamp date;
    size_t index{0};
    CrossType type{CrossType::GOLDEN_CROSS};
    double fast_value{0.0};
    double slow_value{0.0};
    double price{0.0};   // close on the event date; set by strategies
};

struct Divergence {
    bool bullish{false};
    bool bearish{false};
};

std::string cross_type_to_string(CrossType type);

namespace indicators {

inline bool is_defined(double v) { return !std::isnan(v); }

/**
 * Price-series entry points validate the series (strictly increasing dates)
 * and resolve the column name before computing; both failures are InvalidInput.
 * A zero period is InvalidParameters.
 */
IndicatorSeries sma(const PriceSeries& series, size_t period, const std::string& column = "close");
IndicatorSeries ema(const PriceSeries& series, size_t period, const std::string& column = "close");
MacdResult macd(const PriceSeries& series,
                size_t fast_period = 12,
                size_t slow_period = 26,
                size_t signal_period = 9,
                const std::string& column = "close");
BollingerResult bollinger(const PriceSeries& series,
                          size_t period = 20,
                          double std_dev_multiplier = 2.0,
                          const std::string& column = "close");
IndicatorSeries rsi(const PriceSeries& series, size_t period = 14, const std::string& column = "close");

// Raw-value variants used to chain indicators (e.g. EMA of the MACD line).
IndicatorSeries sma(const std::vector<double>& values, size_t period);
IndicatorSeries ema(const std::vector<double>& values, size_t period);
IndicatorSeries rolling_stddev(const std::vector<double>& values, size_t period);
MacdResult macd(const std::vector<double>& values,
                size_t fast_period,
                size_t slow_period,
                size_t signal_period);
BollingerResult bollinger(const std::vector<double>& values, size_t period, double std_dev_multiplier);
IndicatorSeries rsi(const std::vector<double>& values, size_t period);

/**
 * Single forward pass over diff = fast - slow. A crossover is reported at t
 * when diff[t-1] and diff[t] are both defined, non-zero and of opposite sign:
 * negative to positive is a golden cross, positive to negative a death cross.
 */
std::vector<Crossover> detect_crossovers(const std::vector<Timestamp>& dates,
                                         const IndicatorSeries& fast,
                                         const IndicatorSeries& slow);

/**
 * Price/MACD divergence over a trailing lookback window. A new price low with
 * the MACD above its prior window minimum is bullish; a new price high with
 * the MACD below its prior window maximum is bearish.
 */
std::vector<Divergence> detect_macd_divergence(const std::vector<double>& closes,
                                               const IndicatorSeries& macd_line,
                                               size_t lookback = 20);

} // namespace indicators
} // namespace strategy_sim
