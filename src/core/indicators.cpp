#include "indicators.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>

namespace strategy_sim {

namespace {

constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

void require_period(size_t period, const char* what) {
    if (period == 0) {
        throw InvalidParameters(std::string(what) + " period must be positive");
    }
}

std::vector<double> prepare(const PriceSeries& series, const std::string& column) {
    validate_series(series);
    return extract_column(series, column);
}

int sign_of(double v) {
    if (v > 0.0) return 1;
    if (v < 0.0) return -1;
    return 0;
}

} // namespace

std::string cross_type_to_string(CrossType type) {
    switch (type) {
        case CrossType::GOLDEN_CROSS: return "golden_cross";
        case CrossType::DEATH_CROSS: return "death_cross";
    }
    return "golden_cross";
}

namespace indicators {

IndicatorSeries sma(const std::vector<double>& values, size_t period) {
    require_period(period, "SMA");
    IndicatorSeries out(values.size(), kUndefined);
    // Compensated running sum keeps long windows from drifting. Non-finite
    // values stay out of the sum; the window is undefined while it holds any.
    double sum = 0.0;
    double comp = 0.0;
    size_t bad = 0;
    auto add = [&](double x) {
        double y = x - comp;
        double t = sum + y;
        comp = (t - sum) - y;
        sum = t;
    };
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isfinite(values[i]))
            add(values[i]);
        else
            ++bad;
        if (i >= period) {
            double old = values[i - period];
            if (std::isfinite(old))
                add(-old);
            else
                --bad;
        }
        if (i + 1 >= period && bad == 0) out[i] = sum / static_cast<double>(period);
    }
    return out;
}

IndicatorSeries ema(const std::vector<double>& values, size_t period) {
    require_period(period, "EMA");
    IndicatorSeries out(values.size(), kUndefined);
    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    bool seeded = false;
    double prev = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        double v = values[i];
        if (!is_defined(v)) {
            if (seeded) out[i] = prev;
            continue;
        }
        prev = seeded ? alpha * v + (1.0 - alpha) * prev : v;
        seeded = true;
        out[i] = prev;
    }
    return out;
}

IndicatorSeries rolling_stddev(const std::vector<double>& values, size_t period) {
    require_period(period, "standard deviation");
    IndicatorSeries out(values.size(), kUndefined);
    if (period < 2) return out;
    // Sliding Welford over the finite values of the window.
    size_t count = 0;
    size_t bad = 0;
    double mean = 0.0;
    double m2 = 0.0;
    auto add = [&](double x) {
        ++count;
        double delta = x - mean;
        mean += delta / static_cast<double>(count);
        m2 += delta * (x - mean);
    };
    auto remove = [&](double y) {
        if (count <= 1) {
            count = 0;
            mean = 0.0;
            m2 = 0.0;
            return;
        }
        double old_mean = mean;
        --count;
        mean -= (y - old_mean) / static_cast<double>(count);
        m2 -= (y - old_mean) * (y - mean);
        if (m2 < 0.0) m2 = 0.0;
    };
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isfinite(values[i]))
            add(values[i]);
        else
            ++bad;
        if (i >= period) {
            double old = values[i - period];
            if (std::isfinite(old))
                remove(old);
            else
                --bad;
        }
        if (i + 1 >= period && bad == 0) {
            out[i] = std::sqrt(m2 / (static_cast<double>(period) - 1.0));
        }
    }
    return out;
}

MacdResult macd(const std::vector<double>& values,
                size_t fast_period,
                size_t slow_period,
                size_t signal_period) {
    if (fast_period >= slow_period) {
        throw InvalidParameters("MACD fast period (" + std::to_string(fast_period) +
                                ") must be less than slow period (" + std::to_string(slow_period) + ")");
    }
    require_period(signal_period, "MACD signal");
    auto fast = ema(values, fast_period);
    auto slow = ema(values, slow_period);

    MacdResult out;
    out.macd_line.resize(values.size(), kUndefined);
    for (size_t i = 0; i < values.size(); ++i) {
        out.macd_line[i] = fast[i] - slow[i];
    }
    out.signal_line = ema(out.macd_line, signal_period);
    out.histogram.resize(values.size(), kUndefined);
    for (size_t i = 0; i < values.size(); ++i) {
        out.histogram[i] = out.macd_line[i] - out.signal_line[i];
    }
    return out;
}

BollingerResult bollinger(const std::vector<double>& values, size_t period, double std_dev_multiplier) {
    if (period < 2) {
        throw InvalidParameters("Bollinger period must be at least 2");
    }
    BollingerResult out;
    out.middle = sma(values, period);
    auto stddev = rolling_stddev(values, period);
    const size_t n = values.size();
    out.upper.assign(n, kUndefined);
    out.lower.assign(n, kUndefined);
    out.width.assign(n, kUndefined);
    for (size_t i = 0; i < n; ++i) {
        if (!is_defined(out.middle[i]) || !is_defined(stddev[i])) continue;
        out.upper[i] = out.middle[i] + std_dev_multiplier * stddev[i];
        out.lower[i] = out.middle[i] - std_dev_multiplier * stddev[i];
        out.width[i] = out.middle[i] == 0.0 ? 0.0 : (out.upper[i] - out.lower[i]) / out.middle[i];
    }
    return out;
}

IndicatorSeries rsi(const std::vector<double>& values, size_t period) {
    require_period(period, "RSI");
    const size_t n = values.size();
    IndicatorSeries out(n, kUndefined);
    if (n < 2) return out;

    std::vector<double> gains(n - 1);
    std::vector<double> losses(n - 1);
    for (size_t i = 1; i < n; ++i) {
        double delta = values[i] - values[i - 1];
        gains[i - 1] = delta > 0.0 ? delta : 0.0;
        losses[i - 1] = delta < 0.0 ? -delta : 0.0;
    }
    auto avg_gain = sma(gains, period);
    auto avg_loss = sma(losses, period);
    for (size_t i = 0; i + 1 < n; ++i) {
        double g = avg_gain[i];
        double l = avg_loss[i];
        if (!is_defined(g) || !is_defined(l)) continue;
        if (l == 0.0) {
            if (g > 0.0) out[i + 1] = 100.0;
            continue;
        }
        out[i + 1] = 100.0 - 100.0 / (1.0 + g / l);
    }
    return out;
}

IndicatorSeries sma(const PriceSeries& series, size_t period, const std::string& column) {
    return sma(prepare(series, column), period);
}

IndicatorSeries ema(const PriceSeries& series, size_t period, const std::string& column) {
    return ema(prepare(series, column), period);
}

MacdResult macd(const PriceSeries& series,
                size_t fast_period,
                size_t slow_period,
                size_t signal_period,
                const std::string& column) {
    return macd(prepare(series, column), fast_period, slow_period, signal_period);
}

BollingerResult bollinger(const PriceSeries& series,
                          size_t period,
                          double std_dev_multiplier,
                          const std::string& column) {
    return bollinger(prepare(series, column), period, std_dev_multiplier);
}

IndicatorSeries rsi(const PriceSeries& series, size_t period, const std::string& column) {
    return rsi(prepare(series, column), period);
}

std::vector<Crossover> detect_crossovers(const std::vector<Timestamp>& dates,
                                         const IndicatorSeries& fast,
                                         const IndicatorSeries& slow) {
    if (fast.size() != slow.size() || fast.size() != dates.size()) {
        throw InvalidInput("crossover inputs are not aligned: dates=" + std::to_string(dates.size()) +
                           " fast=" + std::to_string(fast.size()) +
                           " slow=" + std::to_string(slow.size()));
    }
    std::vector<Crossover> out;
    double prev_diff = kUndefined;
    for (size_t i = 0; i < fast.size(); ++i) {
        double diff = fast[i] - slow[i];
        if (is_defined(prev_diff) && is_defined(diff)) {
            int prev_sign = sign_of(prev_diff);
            int cur_sign = sign_of(diff);
            if (prev_sign != 0 && cur_sign != 0 && prev_sign != cur_sign) {
                Crossover c;
                c.date = dates[i];
                c.index = i;
                c.type = cur_sign > 0 ? CrossType::GOLDEN_CROSS : CrossType::DEATH_CROSS;
                c.fast_value = fast[i];
                c.slow_value = slow[i];
                out.push_back(c);
            }
        }
        prev_diff = diff;
    }
    return out;
}

std::vector<Divergence> detect_macd_divergence(const std::vector<double>& closes,
                                               const IndicatorSeries& macd_line,
                                               size_t lookback) {
    if (closes.size() != macd_line.size()) {
        throw InvalidInput("divergence inputs are not aligned");
    }
    require_period(lookback, "divergence lookback");
    std::vector<Divergence> out(closes.size());
    for (size_t i = lookback; i < closes.size(); ++i) {
        auto first = closes.begin() + static_cast<std::ptrdiff_t>(i - lookback);
        auto last = closes.begin() + static_cast<std::ptrdiff_t>(i);
        auto m_first = macd_line.begin() + static_cast<std::ptrdiff_t>(i - lookback);
        auto m_last = macd_line.begin() + static_cast<std::ptrdiff_t>(i);
        double price_low = *std::min_element(first, last);
        double price_high = *std::max_element(first, last);
        double macd_low = *std::min_element(m_first, m_last);
        double macd_high = *std::max_element(m_first, m_last);
        if (closes[i] < price_low && macd_line[i] > macd_low) out[i].bullish = true;
        if (closes[i] > price_high && macd_line[i] < macd_high) out[i].bearish = true;
    }
    return out;
}

} // namespace indicators
} // namespace strategy_sim
