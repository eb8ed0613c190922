// include/allocsim/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace allocsim {

/**
 * @brief Timestamp type for consistent time representation
 * Daily data is keyed by the UTC midnight of its date.
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Single daily close of an asset
 */
struct PricePoint {
    Timestamp date;
    Price close;

    PricePoint() = default;
    PricePoint(Timestamp d, Price c) : date(d), close(c) {}
};

/**
 * @brief Ordered (date, value) series
 * Used for equity curves, drawdown curves and benchmark curves.
 */
using TimeSeries = std::vector<std::pair<Timestamp, double>>;

using EquityCurve = TimeSeries;
using DrawdownCurve = TimeSeries;

}  // namespace allocsim
