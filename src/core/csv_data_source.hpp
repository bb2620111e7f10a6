#pragma once

#include <string>
#include "data_source.hpp"

namespace strategy_sim {

/**
 * Reads daily bars from <directory>/<SYMBOL>.csv.
 *
 * Expected layout (header optional, extra columns ignored):
 *   date,open,high,low,close,volume
 *   2024-01-02,16650.1,16790.3,16600.0,16788.6,1820000
 *
 * Malformed lines are skipped with a warning. Duplicate dates are InvalidInput.
 */
class CsvDataSource : public DataSource {
public:
    explicit CsvDataSource(std::string directory);

    PriceSeries fetch_history(const std::string& symbol,
                              Timestamp start_time,
                              Timestamp end_time) override;

    std::string path_for(const std::string& symbol) const;

    // Parse a whole file; no range filtering.
    static PriceSeries load_file(const std::string& path);

private:
    std::string directory_;
};

} // namespace strategy_sim
