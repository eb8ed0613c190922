// include/allocsim/backtest/benchmark_projector.hpp
#pragma once

#include <vector>
#include "allocsim/core/asset_series.hpp"
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {
namespace backtest {

/**
 * @brief Buy-and-hold projection of a reference index onto a strategy calendar
 *
 * value(t) = initial_capital * price(t) / price(t0), where t0 is the first
 * calendar date the index has a price for. Calendar dates before t0 are
 * left out of the curve; later dates without an index price repeat the
 * previous value.
 */
class BenchmarkProjector {
public:
    BenchmarkProjector() = default;

    /**
     * @brief Project a benchmark series
     * @param benchmark Daily closes of the reference index
     * @param calendar Strategy trading dates, ascending
     * @param initial_capital Value of the curve on its first date, > 0
     * @return The curve, or INVALID_ARGUMENT / INVALID_DATA / INVALID_PRICE /
     *         INSUFFICIENT_DATA when the index never trades on the calendar
     */
    Result<EquityCurve> project(const AssetSeries& benchmark,
                                const std::vector<Timestamp>& calendar,
                                double initial_capital) const;
};

}  // namespace backtest
}  // namespace allocsim
