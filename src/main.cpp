#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "core/config.hpp"
#include "core/csv_data_source.hpp"
#include "core/backtester.hpp"
#include "core/result_format.hpp"

namespace {

void configure_logging(const strategy_sim::LoggingConfig& cfg) {
    // Log to stderr so stdout carries only the JSON result.
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{console};
    if (!cfg.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, true));
    }
    auto logger = std::make_shared<spdlog::logger>("strategy_sim", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(cfg.level));
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    try {
        strategy_sim::Config cfg;
        strategy_sim::load_config(cfg, config_path);
        configure_logging(cfg.logging);

        spdlog::info("Strategy simulator starting. symbol={} strategy={} range={}..{}",
                     cfg.backtest.symbol, cfg.strategy.type,
                     cfg.backtest.start_date, cfg.backtest.end_date);

        auto start = strategy_sim::utils::parse_date(cfg.backtest.start_date);
        auto end = strategy_sim::utils::parse_date(cfg.backtest.end_date);
        if (!start || !end) {
            throw strategy_sim::InvalidParameters("start_date/end_date must be YYYY-MM-DD");
        }

        auto strategy_cfg = strategy_sim::to_strategy_config(cfg.strategy);
        strategy_sim::CsvDataSource source(cfg.data.csv_dir);
        auto series = source.fetch_history(cfg.backtest.symbol, *start, *end);

        strategy_sim::BacktestOptions options;
        options.symbol = cfg.backtest.symbol;
        options.unit_quantity = cfg.backtest.unit_quantity;
        options.risk_free_rate = cfg.backtest.risk_free_rate;

        auto result = strategy_sim::run_backtest(strategy_cfg, series,
                                                 cfg.backtest.initial_capital,
                                                 cfg.backtest.commission_rate,
                                                 options);
        std::cout << strategy_sim::result_format::format_backtest(result).dump(2) << std::endl;
    } catch (const std::exception& e) {
        spdlog::error("Backtest failed: {}", e.what());
        return 1;
    }
    return 0;
}
