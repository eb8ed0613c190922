// src/data/conversion_utils.cpp

#include "allocsim/data/conversion_utils.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <chrono>
#include "allocsim/core/time_utils.hpp"

namespace allocsim {

Result<AssetSeries> DataConversionUtils::arrow_table_to_series(
    const std::shared_ptr<arrow::Table>& table, const std::string& code) {
    if (!table) {
        return make_error<AssetSeries>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                       "DataConversionUtils");
    }

    for (const std::string col : {"date", "close"}) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<AssetSeries>(ErrorCode::INVALID_DATA,
                                           "Missing required column: " + col,
                                           "DataConversionUtils");
        }
    }

    AssetSeries series;
    series.code = code;
    if (table->num_rows() == 0) {
        return series;
    }

    try {
        // Columns of a table read in blocks can be split into several chunks
        auto combined = table->CombineChunks();
        if (!combined.ok()) {
            return make_error<AssetSeries>(ErrorCode::CONVERSION_ERROR,
                                           "Failed to combine chunks: " +
                                               combined.status().ToString(),
                                           "DataConversionUtils");
        }
        std::shared_ptr<arrow::Table> flat = *combined;

        auto date_array = flat->GetColumnByName("date")->chunk(0);
        auto close_array = flat->GetColumnByName("close")->chunk(0);

        series.points.reserve(flat->num_rows());
        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto date_result = extract_date(date_array, i);
            if (date_result.is_error()) {
                return forward_error<AssetSeries>(date_result, "DataConversionUtils");
            }

            auto close_result = extract_double(close_array, i);
            if (close_result.is_error()) {
                return forward_error<AssetSeries>(close_result, "DataConversionUtils");
            }

            series.points.emplace_back(date_result.value(), close_result.value());
        }
    } catch (const std::exception& e) {
        return make_error<AssetSeries>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to series: ") + e.what(), "DataConversionUtils");
    }

    std::sort(series.points.begin(), series.points.end(),
              [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });

    auto valid = series.validate();
    if (valid.is_error()) {
        return forward_error<AssetSeries>(valid, "DataConversionUtils");
    }
    return series;
}

Result<AssetSeries> DataConversionUtils::read_csv_series(const std::string& path,
                                                         const std::string& code) {
    auto file_result = arrow::io::ReadableFile::Open(path);
    if (!file_result.ok()) {
        return make_error<AssetSeries>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to open " + path + ": " +
                                           file_result.status().ToString(),
                                       "DataConversionUtils");
    }
    std::shared_ptr<arrow::io::ReadableFile> input = *file_result;

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.include_columns = {"date", "close"};
    convert_options.column_types["date"] = arrow::utf8();
    convert_options.column_types["close"] = arrow::float64();

    auto reader_result = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                                       read_options, parse_options,
                                                       convert_options);
    if (!reader_result.ok()) {
        return make_error<AssetSeries>(ErrorCode::CONVERSION_ERROR,
                                       "Failed to create CSV reader for " + path + ": " +
                                           reader_result.status().ToString(),
                                       "DataConversionUtils");
    }

    auto table_result = (*reader_result)->Read();
    if (!table_result.ok()) {
        return make_error<AssetSeries>(ErrorCode::CONVERSION_ERROR,
                                       "Failed to read " + path + ": " +
                                           table_result.status().ToString(),
                                       "DataConversionUtils");
    }

    return arrow_table_to_series(*table_result, code);
}

Result<Timestamp> DataConversionUtils::extract_date(const std::shared_ptr<arrow::Array>& array,
                                                    int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }

    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null date value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::DATE32: {
            auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
            using days = std::chrono::duration<int64_t, std::ratio<86400>>;
            return Timestamp(days(date_array->Value(index)));
        }
        case arrow::Type::DATE64: {
            auto date_array = std::static_pointer_cast<arrow::Date64Array>(array);
            return core::to_date(Timestamp(std::chrono::milliseconds(date_array->Value(index))));
        }
        case arrow::Type::TIMESTAMP: {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            const auto& ts_type = static_cast<const arrow::TimestampType&>(*ts_array->type());
            int64_t raw = ts_array->Value(index);
            Timestamp ts;
            switch (ts_type.unit()) {
                case arrow::TimeUnit::SECOND:
                    ts = Timestamp(std::chrono::seconds(raw));
                    break;
                case arrow::TimeUnit::MILLI:
                    ts = Timestamp(std::chrono::milliseconds(raw));
                    break;
                case arrow::TimeUnit::MICRO:
                    ts = Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::microseconds(raw)));
                    break;
                case arrow::TimeUnit::NANO:
                default:
                    ts = Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::nanoseconds(raw)));
                    break;
            }
            return core::to_date(ts);
        }
        case arrow::Type::STRING: {
            auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
            auto parsed = core::parse_date(string_array->GetString(index));
            if (parsed.is_error()) {
                return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                             std::string(parsed.error()->what()) + " at index " +
                                                 std::to_string(index),
                                             "DataConversionUtils");
            }
            return parsed.value();
        }
        default:
            return make_error<Timestamp>(
                ErrorCode::CONVERSION_ERROR,
                "Unsupported date column type: " + array->type()->ToString(),
                "DataConversionUtils");
    }
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                    int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "Unsupported close column type: " + array->type()->ToString(),
                                  "DataConversionUtils");
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null close value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }

    return double_array->Value(index);
}

}  // namespace allocsim
