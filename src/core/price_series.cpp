#include "price_series.hpp"
#include "errors.hpp"
#include <cmath>

namespace strategy_sim {

PriceColumn parse_column(const std::string& name) {
    if (name == "open") return PriceColumn::OPEN;
    if (name == "high") return PriceColumn::HIGH;
    if (name == "low") return PriceColumn::LOW;
    if (name == "close") return PriceColumn::CLOSE;
    if (name == "volume") return PriceColumn::VOLUME;
    throw InvalidInput("price series has no column '" + name + "'");
}

void validate_series(const PriceSeries& series) {
    for (size_t i = 0; i < series.size(); ++i) {
        if (!std::isfinite(series[i].close)) {
            throw InvalidInput("non-finite close on " + utils::ts_to_date(series[i].date) +
                               " at index " + std::to_string(i));
        }
        if (i == 0) continue;
        if (series[i].date == series[i - 1].date) {
            throw InvalidInput("duplicate date " + utils::ts_to_date(series[i].date) +
                               " at index " + std::to_string(i));
        }
        if (series[i].date < series[i - 1].date) {
            throw InvalidInput("dates not increasing at index " + std::to_string(i) +
                               " (" + utils::ts_to_date(series[i].date) + ")");
        }
    }
}

std::vector<double> extract_column(const PriceSeries& series, PriceColumn column) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& bar : series) {
        switch (column) {
            case PriceColumn::OPEN: out.push_back(bar.open); break;
            case PriceColumn::HIGH: out.push_back(bar.high); break;
            case PriceColumn::LOW: out.push_back(bar.low); break;
            case PriceColumn::CLOSE: out.push_back(bar.close); break;
            case PriceColumn::VOLUME: out.push_back(bar.volume); break;
        }
    }
    return out;
}

std::vector<double> extract_column(const PriceSeries& series, const std::string& column) {
    return extract_column(series, parse_column(column));
}

std::vector<Timestamp> extract_dates(const PriceSeries& series) {
    std::vector<Timestamp> out;
    out.reserve(series.size());
    for (const auto& bar : series) out.push_back(bar.date);
    return out;
}

} // namespace strategy_sim
