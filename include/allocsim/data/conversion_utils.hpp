// include/allocsim/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include "allocsim/core/asset_series.hpp"
#include "allocsim/core/error.hpp"
#include "allocsim/core/types.hpp"

namespace allocsim {

class DataConversionUtils {
public:
    /**
     * @brief Convert an Arrow table of daily closes to an AssetSeries
     *
     * The table needs a "date" column (date32, date64, timestamp or
     * YYYY-MM-DD string) and a "close" column (double). Rows may come in
     * any order; the result is sorted by date.
     *
     * @param table Arrow table containing the closes of one asset
     * @param code Asset code of the resulting series
     * @return Result containing the series; INVALID_DATA for nulls, missing
     *         columns or duplicate dates, CONVERSION_ERROR for unsupported types
     */
    static Result<AssetSeries> arrow_table_to_series(const std::shared_ptr<arrow::Table>& table,
                                                     const std::string& code);

    /**
     * @brief Read a "date,close" CSV file through the Arrow CSV reader
     * @param path CSV file path
     * @param code Asset code of the resulting series
     * @return Result containing the series, or FILE_IO_ERROR / CONVERSION_ERROR
     */
    static Result<AssetSeries> read_csv_series(const std::string& path, const std::string& code);

private:
    /**
     * @brief Extract a date from an Arrow array
     * @param array Arrow array containing dates
     * @param index Row index
     * @return Result containing the UTC-midnight date
     */
    static Result<Timestamp> extract_date(const std::shared_ptr<arrow::Array>& array,
                                          int64_t index);

    /**
     * @brief Extract double value from Arrow array
     * @param array Arrow array containing doubles
     * @param index Row index
     * @return Result containing double value
     */
    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);
};

}  // namespace allocsim
