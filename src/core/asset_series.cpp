// src/core/asset_series.cpp

#include "allocsim/core/asset_series.hpp"
#include <algorithm>
#include "allocsim/core/time_utils.hpp"

namespace allocsim {

Result<void> AssetSeries::validate() const {
    if (code.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Asset series has no code",
                                "AssetSeries");
    }

    for (size_t i = 1; i < points.size(); ++i) {
        if (points[i].date <= points[i - 1].date) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Dates of " + code + " are not strictly increasing at " +
                                        core::format_date(points[i].date),
                                    "AssetSeries");
        }
    }
    return Result<void>();
}

AssetSeries AssetSeries::slice(const Timestamp& start, const Timestamp& end) const {
    auto first = std::lower_bound(
        points.begin(), points.end(), start,
        [](const PricePoint& p, const Timestamp& ts) { return p.date < ts; });
    auto last = std::upper_bound(
        first, points.end(), end,
        [](const Timestamp& ts, const PricePoint& p) { return ts < p.date; });
    return AssetSeries(code, std::vector<PricePoint>(first, last));
}

std::optional<Price> AssetSeries::price_on(const Timestamp& date) const {
    auto it = std::lower_bound(
        points.begin(), points.end(), date,
        [](const PricePoint& p, const Timestamp& ts) { return p.date < ts; });
    if (it == points.end() || it->date != date) {
        return std::nullopt;
    }
    return it->close;
}

}  // namespace allocsim
