// src/data/market_data_source.cpp

#include "allocsim/data/market_data_source.hpp"
#include "allocsim/core/time_utils.hpp"

namespace allocsim {

Result<void> InMemoryMarketDataSource::add_series(AssetSeries series) {
    auto valid = series.validate();
    if (valid.is_error()) {
        return forward_error<void>(valid, "InMemoryMarketDataSource");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string code = series.code;
    series_[code] = std::move(series);
    return Result<void>();
}

bool InMemoryMarketDataSource::has_series(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series_.find(code) != series_.end();
}

std::vector<std::string> InMemoryMarketDataSource::codes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(series_.size());
    for (const auto& [code, series] : series_) {
        result.push_back(code);
    }
    return result;
}

Result<std::map<std::string, AssetSeries>> InMemoryMarketDataSource::get_aligned_series(
    const std::vector<std::string>& codes, const Timestamp& start_date,
    const Timestamp& end_date) const {
    if (codes.empty()) {
        return make_error<std::map<std::string, AssetSeries>>(
            ErrorCode::INVALID_ARGUMENT, "No asset codes requested", "InMemoryMarketDataSource");
    }

    std::map<std::string, AssetSeries> result;
    for (const auto& code : codes) {
        auto range = get_range(code, start_date, end_date);
        if (range.is_error()) {
            return forward_error<std::map<std::string, AssetSeries>>(range,
                                                                     "InMemoryMarketDataSource");
        }
        result.emplace(code, range.release());
    }
    return result;
}

Result<AssetSeries> InMemoryMarketDataSource::get_benchmark_series(
    const std::string& index_code, const Timestamp& start_date,
    const Timestamp& end_date) const {
    return get_range(index_code, start_date, end_date);
}

Result<AssetSeries> InMemoryMarketDataSource::get_range(const std::string& code,
                                                        const Timestamp& start_date,
                                                        const Timestamp& end_date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(code);
    if (it == series_.end()) {
        return make_error<AssetSeries>(ErrorCode::DATA_UNAVAILABLE, "No data for " + code,
                                       "InMemoryMarketDataSource");
    }

    AssetSeries slice = it->second.slice(start_date, end_date);
    if (slice.empty()) {
        return make_error<AssetSeries>(ErrorCode::DATA_UNAVAILABLE,
                                       "No data for " + code + " between " +
                                           core::format_date(start_date) + " and " +
                                           core::format_date(end_date),
                                       "InMemoryMarketDataSource");
    }
    return slice;
}

}  // namespace allocsim
