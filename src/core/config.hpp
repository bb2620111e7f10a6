#pragma once

#include <string>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "strategy.hpp"

namespace strategy_sim {

using json = nlohmann::json;

struct DataConfig {
    std::string csv_dir{"data"};
};

struct BacktestConfig {
    std::string symbol{"HSI"};
    std::string start_date{"2020-01-01"};
    std::string end_date{"2024-12-31"};
    double initial_capital{100000.0};
    double commission_rate{0.0};   // fraction of capital per position change
    double unit_quantity{1.0};
    double risk_free_rate{0.02};
};

struct StrategySettings {
    std::string type{"ma_cross"};  // "ma_cross" | "macd_cross"
    size_t short_period{5};
    size_t long_period{20};
    std::string ma_type{"sma"};
    size_t fast_period{12};
    size_t slow_period{26};
    size_t signal_period{9};
    std::string column{"close"};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};            // empty = console only
};

struct Config {
    DataConfig data;
    BacktestConfig backtest;
    StrategySettings strategy;
    LoggingConfig logging;
};

/**
 * Convert strategy settings into the typed variant. Unknown type or ma_type
 * is InvalidParameters; period ordering is checked by the strategy itself.
 */
inline StrategyConfig to_strategy_config(const StrategySettings& s) {
    std::string type = s.type;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (type == "ma_cross" || type == "moving_average") {
        MovingAverageCrossConfig cfg;
        cfg.short_period = s.short_period;
        cfg.long_period = s.long_period;
        cfg.ma_kind = parse_ma_kind(s.ma_type);
        cfg.column = s.column;
        return cfg;
    }
    if (type == "macd_cross" || type == "macd") {
        MacdCrossConfig cfg;
        cfg.fast_period = s.fast_period;
        cfg.slow_period = s.slow_period;
        cfg.signal_period = s.signal_period;
        cfg.column = s.column;
        return cfg;
    }
    throw InvalidParameters("unknown strategy type '" + s.type + "'");
}

inline void load_strategy_settings(StrategySettings& st, const json& s) {
    st.type = s.value("type", st.type);
    st.short_period = s.value("short_period", st.short_period);
    st.long_period = s.value("long_period", st.long_period);
    st.ma_type = s.value("ma_type", st.ma_type);
    st.fast_period = s.value("fast_period", st.fast_period);
    st.slow_period = s.value("slow_period", st.slow_period);
    st.signal_period = s.value("signal_period", st.signal_period);
    st.column = s.value("column", st.column);
}

inline StrategyConfig strategy_config_from_json(const json& j) {
    StrategySettings st;
    load_strategy_settings(st, j);
    return to_strategy_config(st);
}

inline void load_config_json(Config& cfg, const json& j) {
    if (j.contains("data")) {
        auto& d = j["data"];
        cfg.data.csv_dir = d.value("csv_dir", cfg.data.csv_dir);
    }
    if (j.contains("backtest")) {
        auto& b = j["backtest"];
        cfg.backtest.symbol = b.value("symbol", cfg.backtest.symbol);
        cfg.backtest.start_date = b.value("start_date", cfg.backtest.start_date);
        cfg.backtest.end_date = b.value("end_date", cfg.backtest.end_date);
        cfg.backtest.initial_capital = b.value("initial_capital", cfg.backtest.initial_capital);
        cfg.backtest.commission_rate = b.value("commission_rate", cfg.backtest.commission_rate);
        cfg.backtest.unit_quantity = b.value("unit_quantity", cfg.backtest.unit_quantity);
        cfg.backtest.risk_free_rate = b.value("risk_free_rate", cfg.backtest.risk_free_rate);
    }
    if (j.contains("strategy")) {
        load_strategy_settings(cfg.strategy, j["strategy"]);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
    }
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    load_config_json(cfg, j);
}

} // namespace strategy_sim
