#include "strategy.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace strategy_sim {

std::string signal_to_string(Signal signal) {
    switch (signal) {
        case Signal::BUY: return "buy";
        case Signal::HOLD: return "hold";
        case Signal::SELL: return "sell";
    }
    return "hold";
}

std::string ma_kind_to_string(MovingAverageKind kind) {
    switch (kind) {
        case MovingAverageKind::SMA: return "sma";
        case MovingAverageKind::EMA: return "ema";
    }
    return "sma";
}

MovingAverageKind parse_ma_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sma") return MovingAverageKind::SMA;
    if (lower == "ema") return MovingAverageKind::EMA;
    throw InvalidParameters("moving average type must be 'sma' or 'ema', got '" + name + "'");
}

std::vector<Signal> signals_from_crossovers(size_t length,
                                            const std::vector<Crossover>& crossovers,
                                            size_t warmup_period) {
    std::vector<Signal> out(length, Signal::HOLD);
    for (const auto& c : crossovers) {
        if (c.index >= length || c.index < warmup_period) continue;
        out[c.index] = c.type == CrossType::GOLDEN_CROSS ? Signal::BUY : Signal::SELL;
    }
    return out;
}

namespace {

void attach_prices(std::vector<Crossover>& crossovers, const PriceSeries& series) {
    for (auto& c : crossovers) {
        if (c.index < series.size()) c.price = series[c.index].close;
    }
}

} // namespace

// --- MovingAverageCrossStrategy ---

MovingAverageCrossStrategy::MovingAverageCrossStrategy(MovingAverageCrossConfig config)
    : config_(std::move(config)) {
    if (config_.short_period == 0) {
        throw InvalidParameters("short period must be positive");
    }
    if (config_.short_period >= config_.long_period) {
        throw InvalidParameters("short period (" + std::to_string(config_.short_period) +
                                ") must be less than long period (" +
                                std::to_string(config_.long_period) + ")");
    }
    if (config_.ma_kind != MovingAverageKind::SMA && config_.ma_kind != MovingAverageKind::EMA) {
        throw InvalidParameters("unrecognized moving average type");
    }
    parse_column(config_.column);
    spdlog::debug("MovingAverageCrossStrategy short={} long={} kind={} column={}",
                  config_.short_period, config_.long_period,
                  ma_kind_to_string(config_.ma_kind), config_.column);
}

MovingAverageCrossStrategy::MovingAverageCrossStrategy(size_t short_period,
                                                       size_t long_period,
                                                       MovingAverageKind kind)
    : MovingAverageCrossStrategy(MovingAverageCrossConfig{short_period, long_period, kind, "close"}) {}

std::string MovingAverageCrossStrategy::name() const {
    return ma_kind_to_string(config_.ma_kind) + "_cross(" + std::to_string(config_.short_period) +
           "," + std::to_string(config_.long_period) + ")";
}

size_t MovingAverageCrossStrategy::warmup_period() const {
    return config_.ma_kind == MovingAverageKind::SMA ? config_.long_period - 1 : 0;
}

StrategySignals MovingAverageCrossStrategy::generate_signals(const PriceSeries& series) const {
    validate_series(series);
    auto values = extract_column(series, config_.column);

    StrategySignals out;
    out.dates = extract_dates(series);
    if (config_.ma_kind == MovingAverageKind::SMA) {
        out.fast = indicators::sma(values, config_.short_period);
        out.slow = indicators::sma(values, config_.long_period);
    } else {
        out.fast = indicators::ema(values, config_.short_period);
        out.slow = indicators::ema(values, config_.long_period);
    }
    out.crossovers = indicators::detect_crossovers(out.dates, out.fast, out.slow);
    attach_prices(out.crossovers, series);
    out.signals = signals_from_crossovers(series.size(), out.crossovers, warmup_period());
    return out;
}

// --- MacdCrossStrategy ---

MacdCrossStrategy::MacdCrossStrategy(MacdCrossConfig config)
    : config_(std::move(config)) {
    if (config_.fast_period == 0 || config_.signal_period == 0) {
        throw InvalidParameters("MACD periods must be positive");
    }
    if (config_.fast_period >= config_.slow_period) {
        throw InvalidParameters("fast period (" + std::to_string(config_.fast_period) +
                                ") must be less than slow period (" +
                                std::to_string(config_.slow_period) + ")");
    }
    parse_column(config_.column);
    spdlog::debug("MacdCrossStrategy fast={} slow={} signal={} column={}",
                  config_.fast_period, config_.slow_period, config_.signal_period, config_.column);
}

MacdCrossStrategy::MacdCrossStrategy(size_t fast_period, size_t slow_period, size_t signal_period)
    : MacdCrossStrategy(MacdCrossConfig{fast_period, slow_period, signal_period, "close"}) {}

std::string MacdCrossStrategy::name() const {
    return "macd_cross(" + std::to_string(config_.fast_period) + "," +
           std::to_string(config_.slow_period) + "," + std::to_string(config_.signal_period) + ")";
}

size_t MacdCrossStrategy::warmup_period() const {
    // EMA-based lines are defined from the first bar.
    return 0;
}

StrategySignals MacdCrossStrategy::generate_signals(const PriceSeries& series) const {
    validate_series(series);
    auto values = extract_column(series, config_.column);
    auto m = indicators::macd(values, config_.fast_period, config_.slow_period, config_.signal_period);

    StrategySignals out;
    out.dates = extract_dates(series);
    out.fast = std::move(m.macd_line);
    out.slow = std::move(m.signal_line);
    out.crossovers = indicators::detect_crossovers(out.dates, out.fast, out.slow);
    attach_prices(out.crossovers, series);
    out.signals = signals_from_crossovers(series.size(), out.crossovers, warmup_period());
    return out;
}

// --- factory ---

namespace {

struct StrategyBuilder {
    std::unique_ptr<Strategy> operator()(const MovingAverageCrossConfig& cfg) const {
        return std::make_unique<MovingAverageCrossStrategy>(cfg);
    }
    std::unique_ptr<Strategy> operator()(const MacdCrossConfig& cfg) const {
        return std::make_unique<MacdCrossStrategy>(cfg);
    }
};

} // namespace

std::unique_ptr<Strategy> make_strategy(const StrategyConfig& config) {
    return std::visit(StrategyBuilder{}, config);
}

} // namespace strategy_sim
