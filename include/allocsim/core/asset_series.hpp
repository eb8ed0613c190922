// include/allocsim/core/asset_series.hpp

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {

/**
 * @brief Daily close history of one asset
 *
 * Dates are strictly increasing with no duplicates. The engine treats a
 * series as a read-only snapshot owned by the caller.
 */
struct AssetSeries {
    std::string code;
    std::vector<PricePoint> points;

    AssetSeries() = default;
    AssetSeries(std::string c, std::vector<PricePoint> p)
        : code(std::move(c)), points(std::move(p)) {}

    bool empty() const {
        return points.empty();
    }

    size_t size() const {
        return points.size();
    }

    /**
     * @brief Check ordering invariants
     * @return INVALID_DATA if dates are not strictly increasing
     */
    Result<void> validate() const;

    /**
     * @brief Copy of the points whose dates fall in [start, end]
     */
    AssetSeries slice(const Timestamp& start, const Timestamp& end) const;

    /**
     * @brief Close on an exact date, if present
     */
    std::optional<Price> price_on(const Timestamp& date) const;

    Timestamp first_date() const {
        return points.front().date;
    }

    Timestamp last_date() const {
        return points.back().date;
    }
};

}  // namespace allocsim
