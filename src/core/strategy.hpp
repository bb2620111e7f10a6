#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "indicators.hpp"
#include "price_series.hpp"

namespace strategy_sim {

enum class Signal { BUY, HOLD, SELL };
enum class MovingAverageKind { SMA, EMA };

std::string signal_to_string(Signal signal);
std::string ma_kind_to_string(MovingAverageKind kind);
// Accepts "sma"/"ema" in any case; anything else is InvalidParameters.
MovingAverageKind parse_ma_kind(const std::string& name);

struct MovingAverageCrossConfig {
    size_t short_period{5};
    size_t long_period{20};
    MovingAverageKind ma_kind{MovingAverageKind::SMA};
    std::string column{"close"};
};

struct MacdCrossConfig {
    size_t fast_period{12};
    size_t slow_period{26};
    size_t signal_period{9};
    std::string column{"close"};
};

using StrategyConfig = std::variant<MovingAverageCrossConfig, MacdCrossConfig>;

/**
 * Output of one signal pass. Every vector except crossovers is aligned with
 * the input series; fast/slow hold the indicator pair that was compared.
 */
struct StrategySignals {
    std::vector<Timestamp> dates;
    std::vector<Signal> signals;
    std::vector<Crossover> crossovers;
    IndicatorSeries fast;
    IndicatorSeries slow;
};

/**
 * Signal generator interface. Implementations are immutable once constructed
 * and carry no state between generate_signals() calls.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::string name() const = 0;

    // Leading rows that are always HOLD because the slower indicator is undefined.
    virtual size_t warmup_period() const = 0;

    virtual StrategySignals generate_signals(const PriceSeries& series) const = 0;
};

/**
 * Short/long moving average crossover: golden cross buys, death cross sells.
 */
class MovingAverageCrossStrategy : public Strategy {
public:
    explicit MovingAverageCrossStrategy(MovingAverageCrossConfig config);
    MovingAverageCrossStrategy(size_t short_period, size_t long_period, MovingAverageKind kind);

    std::string name() const override;
    size_t warmup_period() const override;
    StrategySignals generate_signals(const PriceSeries& series) const override;

    const MovingAverageCrossConfig& config() const { return config_; }

private:
    MovingAverageCrossConfig config_;
};

/**
 * MACD line versus its signal line crossover.
 */
class MacdCrossStrategy : public Strategy {
public:
    explicit MacdCrossStrategy(MacdCrossConfig config);
    MacdCrossStrategy(size_t fast_period, size_t slow_period, size_t signal_period);

    std::string name() const override;
    size_t warmup_period() const override;
    StrategySignals generate_signals(const PriceSeries& series) const override;

    const MacdCrossConfig& config() const { return config_; }

private:
    MacdCrossConfig config_;
};

std::unique_ptr<Strategy> make_strategy(const StrategyConfig& config);

/**
 * Map crossover events onto a per-date signal vector: golden cross = BUY,
 * death cross = SELL, everything else (including rows inside the warm-up) HOLD.
 */
std::vector<Signal> signals_from_crossovers(size_t length,
                                            const std::vector<Crossover>& crossovers,
                                            size_t warmup_period);

} // namespace strategy_sim
