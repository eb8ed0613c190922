// src/backtest/price_series_aligner.cpp

#include "allocsim/backtest/price_series_aligner.hpp"
#include <algorithm>
#include <chrono>
#include <set>
#include "allocsim/core/time_utils.hpp"

namespace allocsim {
namespace backtest {

int AlignedCalendar::index_of(const std::string& code) const {
    auto it = std::find(codes.begin(), codes.end(), code);
    return it == codes.end() ? -1 : static_cast<int>(it - codes.begin());
}

Result<AlignedCalendar> PriceSeriesAligner::align(
    const std::map<std::string, AssetSeries>& series, const Timestamp& start,
    const Timestamp& end) const {
    std::vector<AssetSeries> ordered;
    ordered.reserve(series.size());
    for (const auto& [code, s] : series) {
        ordered.emplace_back(code, s.points);
    }
    return align(ordered, start, end);
}

Result<AlignedCalendar> PriceSeriesAligner::align(const std::vector<AssetSeries>& series,
                                                  const Timestamp& start,
                                                  const Timestamp& end) const {
    if (series.empty()) {
        return make_error<AlignedCalendar>(ErrorCode::INVALID_ARGUMENT,
                                           "No price series provided for alignment",
                                           "PriceSeriesAligner");
    }
    if (end < start) {
        return make_error<AlignedCalendar>(ErrorCode::INVALID_ARGUMENT,
                                           "Range end " + core::format_date(end) +
                                               " is before start " + core::format_date(start),
                                           "PriceSeriesAligner");
    }

    std::set<std::string> seen;
    std::vector<AssetSeries> windows;
    windows.reserve(series.size());
    for (const auto& s : series) {
        auto valid = s.validate();
        if (valid.is_error()) {
            return forward_error<AlignedCalendar>(valid, "PriceSeriesAligner");
        }
        if (!seen.insert(s.code).second) {
            return make_error<AlignedCalendar>(ErrorCode::INVALID_ARGUMENT,
                                               "Duplicate series for asset " + s.code,
                                               "PriceSeriesAligner");
        }
        windows.push_back(s.slice(start, end));
    }

    // Intersect dates, starting from the first asset's window
    std::vector<Timestamp> dates;
    dates.reserve(windows.front().size());
    for (const auto& point : windows.front().points) {
        bool in_all = std::all_of(windows.begin() + 1, windows.end(), [&](const AssetSeries& w) {
            return w.price_on(point.date).has_value();
        });
        if (in_all) {
            dates.push_back(point.date);
        }
    }

    if (dates.empty()) {
        std::string names;
        for (const auto& w : windows) {
            if (!names.empty()) {
                names += ", ";
            }
            names += w.code + " (" + std::to_string(w.size()) + " dates)";
        }
        return make_error<AlignedCalendar>(
            ErrorCode::INSUFFICIENT_DATA,
            "No common trading dates between " + core::format_date(start) + " and " +
                core::format_date(end) + " for " + names,
            "PriceSeriesAligner");
    }

    AlignedCalendar calendar;
    calendar.dates = dates;
    calendar.codes.reserve(windows.size());
    for (const auto& w : windows) {
        calendar.codes.push_back(w.code);
    }

    calendar.prices.reserve(dates.size());
    for (const auto& date : dates) {
        std::vector<Price> row;
        row.reserve(windows.size());
        for (const auto& w : windows) {
            row.push_back(*w.price_on(date));
        }
        calendar.prices.push_back(std::move(row));
    }

    return calendar;
}

std::vector<CoverageGap> PriceSeriesAligner::find_coverage_gaps(
    const std::map<std::string, AssetSeries>& series, const Timestamp& start,
    const Timestamp& end) const {
    std::vector<CoverageGap> gaps;

    for (const auto& [code, s] : series) {
        AssetSeries window = s.slice(start, end);
        if (window.empty()) {
            gaps.push_back(
                CoverageGap{code, start, end, end + std::chrono::hours(24), start});
            continue;
        }
        // Up to 3 missing days at either bound (weekends) still count as covered
        bool late_start = core::days_between(start, window.first_date()) > 3;
        bool early_end = core::days_between(window.last_date(), end) > 3;
        if (late_start || early_end) {
            gaps.push_back(
                CoverageGap{code, start, end, window.first_date(), window.last_date()});
        }
    }

    return gaps;
}

}  // namespace backtest
}  // namespace allocsim
