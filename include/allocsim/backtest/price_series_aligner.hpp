// include/allocsim/backtest/price_series_aligner.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "allocsim/core/asset_series.hpp"
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief Common trading calendar of several assets
 *
 * prices[t][i] is the close of codes[i] on dates[t]. Every asset has a
 * price on every date.
 */
struct AlignedCalendar {
    std::vector<std::string> codes;
    std::vector<Timestamp> dates;
    std::vector<std::vector<Price>> prices;

    size_t size() const {
        return dates.size();
    }

    bool empty() const {
        return dates.empty();
    }

    /**
     * @brief Column of an asset code, or -1 if the code is not aligned
     */
    int index_of(const std::string& code) const;
};

/**
 * @brief Part of a requested range an asset series does not cover
 */
struct CoverageGap {
    std::string code;
    Timestamp requested_start;
    Timestamp requested_end;
    Timestamp first_available;  // Equal to requested_end + 1 day when no data in range
    Timestamp last_available;
};

/**
 * @brief Inner-joins daily price series on date
 *
 * The aligner only intersects what it is given. Whether the inputs cover
 * the requested range is reported separately by find_coverage_gaps() so
 * callers can surface partial coverage instead of silently truncating.
 */
class PriceSeriesAligner {
public:
    PriceSeriesAligner() = default;

    /**
     * @brief Dates present in every series within [start, end]
     * @param series Series keyed by asset code
     * @param start First date of the range (inclusive)
     * @param end Last date of the range (inclusive)
     * @return The aligned calendar, INVALID_DATA for malformed series or
     *         INSUFFICIENT_DATA when the intersection is empty
     */
    Result<AlignedCalendar> align(const std::map<std::string, AssetSeries>& series,
                                  const Timestamp& start, const Timestamp& end) const;

    Result<AlignedCalendar> align(const std::vector<AssetSeries>& series,
                                  const Timestamp& start, const Timestamp& end) const;

    /**
     * @brief Series that start after start or end before end
     */
    std::vector<CoverageGap> find_coverage_gaps(
        const std::map<std::string, AssetSeries>& series, const Timestamp& start,
        const Timestamp& end) const;
};

}  // namespace backtest
}  // namespace allocsim
