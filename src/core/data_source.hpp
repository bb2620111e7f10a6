#pragma once

#include <string>
#include "price_series.hpp"

namespace strategy_sim {

/**
 * Historical price provider.
 *
 * fetch_history returns the bars of symbol within [start_time, end_time],
 * ordered by date. Throws DataUnavailable when end_time < start_time or
 * nothing is found for the range.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual PriceSeries fetch_history(const std::string& symbol,
                                      Timestamp start_time,
                                      Timestamp end_time) = 0;
};

} // namespace strategy_sim
