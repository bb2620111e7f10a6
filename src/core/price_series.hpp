#pragma once

#include <string>
#include <vector>
#include "utils.hpp"

namespace strategy_sim {

struct PriceBar {
    Timestamp date;
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

// Ordered by date, strictly increasing. Owned by the caller, never mutated here.
using PriceSeries = std::vector<PriceBar>;

enum class PriceColumn { OPEN, HIGH, LOW, CLOSE, VOLUME };

/**
 * Resolve a column name ("open", "high", "low", "close", "volume").
 * Throws InvalidInput for any other name.
 */
PriceColumn parse_column(const std::string& name);

/**
 * Throws InvalidInput when dates are not strictly increasing or a close is
 * not finite.
 */
void validate_series(const PriceSeries& series);

// Values of one column, aligned with the series.
std::vector<double> extract_column(const PriceSeries& series, PriceColumn column);
std::vector<double> extract_column(const PriceSeries& series, const std::string& column);

std::vector<Timestamp> extract_dates(const PriceSeries& series);

} // namespace strategy_sim
