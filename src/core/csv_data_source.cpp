#include "csv_data_source.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace strategy_sim {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) out.push_back(trim(field));
    return out;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

CsvDataSource::CsvDataSource(std::string directory) : directory_(std::move(directory)) {}

std::string CsvDataSource::path_for(const std::string& symbol) const {
    if (directory_.empty()) return symbol + ".csv";
    return directory_ + "/" + symbol + ".csv";
}

PriceSeries CsvDataSource::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw DataUnavailable("cannot open price file " + path);
    }
    PriceSeries series;
    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;
    while (std::getline(f, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        auto fields = split_fields(line);
        if (line_no == 1 && !fields.empty() && !utils::parse_date(fields[0])) {
            continue; // header
        }
        PriceBar bar;
        auto date = fields.empty() ? std::nullopt : utils::parse_date(fields[0]);
        if (fields.size() < 6 || !date ||
            !parse_double(fields[1], bar.open) || !parse_double(fields[2], bar.high) ||
            !parse_double(fields[3], bar.low) || !parse_double(fields[4], bar.close) ||
            !parse_double(fields[5], bar.volume)) {
            ++skipped;
            spdlog::warn("{}:{}: skipping malformed line", path, line_no);
            continue;
        }
        bar.date = *date;
        series.push_back(bar);
    }
    std::stable_sort(series.begin(), series.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });
    validate_series(series);
    spdlog::debug("Loaded {} bars from {} ({} skipped)", series.size(), path, skipped);
    return series;
}

PriceSeries CsvDataSource::fetch_history(const std::string& symbol,
                                         Timestamp start_time,
                                         Timestamp end_time) {
    if (end_time < start_time) {
        throw DataUnavailable("invalid range for " + symbol + ": end " + utils::ts_to_date(end_time) +
                              " is before start " + utils::ts_to_date(start_time));
    }
    auto all = load_file(path_for(symbol));
    PriceSeries out;
    for (const auto& bar : all) {
        if (bar.date >= start_time && bar.date <= end_time) out.push_back(bar);
    }
    if (out.empty()) {
        throw DataUnavailable("no data for " + symbol + " between " + utils::ts_to_date(start_time) +
                              " and " + utils::ts_to_date(end_time));
    }
    spdlog::info("Fetched {} bars for {} [{} .. {}]", out.size(), symbol,
                 utils::ts_to_date(out.front().date), utils::ts_to_date(out.back().date));
    return out;
}

} // namespace strategy_sim
