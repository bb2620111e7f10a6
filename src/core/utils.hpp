#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <optional>
#include <cmath>
#include <cstdint>

namespace strategy_sim {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared date and numeric helpers.
 */
namespace utils {

/**
 * Format timestamp as date string (e.g., "2024-01-15").
 */
inline std::string ts_to_date(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}

/**
 * Parse date string ("2024-01-15") to Timestamp at UTC midnight.
 */
inline std::optional<Timestamp> parse_date(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::tm tm{};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) return std::nullopt;
    return Timestamp{} + std::chrono::seconds(timegm(&tm));
}

/**
 * Build a UTC-midnight timestamp from calendar fields.
 */
inline Timestamp make_date(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    return Timestamp{} + std::chrono::seconds(timegm(&tm));
}

/**
 * Whole calendar days between two timestamps (may be negative).
 */
inline int64_t days_between(Timestamp from, Timestamp to) {
    return std::chrono::duration_cast<std::chrono::hours>(to - from).count() / 24;
}

// Collapse NaN/Inf to zero before values leave the core.
inline double finite_or_zero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

} // namespace utils
} // namespace strategy_sim
