// include/allocsim/data/market_data_source.hpp

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "allocsim/core/asset_series.hpp"
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {

/**
 * @brief Abstract provider of daily close series
 *
 * Implementations return snapshots: the engine never sees a series change
 * while a run is in progress.
 */
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    /**
     * @brief Close series of every requested asset within a date range
     * @param codes Asset codes to fetch
     * @param start_date First date (inclusive)
     * @param end_date Last date (inclusive)
     * @return Series keyed by code, or DATA_UNAVAILABLE if any code has no data
     */
    virtual Result<std::map<std::string, AssetSeries>> get_aligned_series(
        const std::vector<std::string>& codes, const Timestamp& start_date,
        const Timestamp& end_date) const = 0;

    /**
     * @brief Close series of a reference index within a date range
     * @param index_code Index code, e.g. "000300"
     * @param start_date First date (inclusive)
     * @param end_date Last date (inclusive)
     * @return The series, or DATA_UNAVAILABLE
     */
    virtual Result<AssetSeries> get_benchmark_series(const std::string& index_code,
                                                     const Timestamp& start_date,
                                                     const Timestamp& end_date) const = 0;
};

/**
 * @brief MarketDataSource over series held in memory
 *
 * Assets and benchmark indices share one code space. Thread-safe.
 */
class InMemoryMarketDataSource : public MarketDataSource {
public:
    InMemoryMarketDataSource() = default;

    /**
     * @brief Add or replace the series stored under series.code
     * @return INVALID_DATA if the series fails validation
     */
    Result<void> add_series(AssetSeries series);

    bool has_series(const std::string& code) const;

    std::vector<std::string> codes() const;

    Result<std::map<std::string, AssetSeries>> get_aligned_series(
        const std::vector<std::string>& codes, const Timestamp& start_date,
        const Timestamp& end_date) const override;

    Result<AssetSeries> get_benchmark_series(const std::string& index_code,
                                             const Timestamp& start_date,
                                             const Timestamp& end_date) const override;

private:
    Result<AssetSeries> get_range(const std::string& code, const Timestamp& start_date,
                                  const Timestamp& end_date) const;

    mutable std::mutex mutex_;
    std::map<std::string, AssetSeries> series_;
};

}  // namespace allocsim
