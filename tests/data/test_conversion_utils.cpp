#include <gtest/gtest.h>
#include <arrow/api.h>
#include <arrow/util/logging.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "allocsim/core/time_utils.hpp"
#include "allocsim/data/conversion_utils.hpp"

using namespace allocsim;
using allocsim::core::make_date;

namespace {

int32_t days_since_epoch(const Timestamp& date) {
    return static_cast<int32_t>(
        std::chrono::duration_cast<std::chrono::hours>(date.time_since_epoch()).count() / 24);
}

std::shared_ptr<arrow::Array> close_array(const std::vector<double>& closes) {
    arrow::DoubleBuilder builder;
    for (double close : closes) {
        ARROW_CHECK_OK(builder.Append(close));
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_CHECK_OK(builder.Finish(&array));
    return array;
}

std::shared_ptr<arrow::Table> date32_table(const std::vector<Timestamp>& dates,
                                           const std::vector<double>& closes) {
    arrow::Date32Builder date_builder;
    for (const auto& date : dates) {
        ARROW_CHECK_OK(date_builder.Append(days_since_epoch(date)));
    }
    std::shared_ptr<arrow::Array> date_array;
    ARROW_CHECK_OK(date_builder.Finish(&date_array));

    auto schema = arrow::schema(
        {arrow::field("date", arrow::date32()), arrow::field("close", arrow::float64())});
    return arrow::Table::Make(schema, {date_array, close_array(closes)});
}

}  // namespace

class DataConversionUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "allocsim_conversion_test";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string write_csv(const std::string& name, const std::string& content) {
        auto path = (dir_ / name).string();
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(DataConversionUtilsTest, Date32Table) {
    auto table = date32_table({make_date(2024, 1, 2), make_date(2024, 1, 3)}, {3.95, 4.01});

    auto result = DataConversionUtils::arrow_table_to_series(table, "510300");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& series = result.value();

    EXPECT_EQ(series.code, "510300");
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.points[0].date, make_date(2024, 1, 2));
    EXPECT_DOUBLE_EQ(series.points[0].close, 3.95);
    EXPECT_EQ(series.points[1].date, make_date(2024, 1, 3));
    EXPECT_DOUBLE_EQ(series.points[1].close, 4.01);
}

TEST_F(DataConversionUtilsTest, TimestampColumnTruncatesToDate) {
    arrow::TimestampBuilder ts_builder(arrow::timestamp(arrow::TimeUnit::SECOND),
                                       arrow::default_memory_pool());
    auto close_time = make_date(2024, 2, 5) + std::chrono::hours(15);
    ARROW_CHECK_OK(ts_builder.Append(
        std::chrono::duration_cast<std::chrono::seconds>(close_time.time_since_epoch()).count()));
    std::shared_ptr<arrow::Array> ts_array;
    ARROW_CHECK_OK(ts_builder.Finish(&ts_array));

    auto schema = arrow::schema({arrow::field("date", arrow::timestamp(arrow::TimeUnit::SECOND)),
                                 arrow::field("close", arrow::float64())});
    auto table = arrow::Table::Make(schema, {ts_array, close_array({3280.5})});

    auto result = DataConversionUtils::arrow_table_to_series(table, "000300");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value().points[0].date, make_date(2024, 2, 5));
}

TEST_F(DataConversionUtilsTest, StringDates) {
    arrow::StringBuilder date_builder;
    ARROW_CHECK_OK(date_builder.Append("2023-12-29"));
    ARROW_CHECK_OK(date_builder.Append("2024-01-02"));
    std::shared_ptr<arrow::Array> date_array;
    ARROW_CHECK_OK(date_builder.Finish(&date_array));

    auto schema =
        arrow::schema({arrow::field("date", arrow::utf8()), arrow::field("close", arrow::float64())});
    auto table = arrow::Table::Make(schema, {date_array, close_array({1.0, 1.1})});

    auto result = DataConversionUtils::arrow_table_to_series(table, "518880");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().first_date(), make_date(2023, 12, 29));
    EXPECT_EQ(result.value().last_date(), make_date(2024, 1, 2));
}

TEST_F(DataConversionUtilsTest, SortsRowsByDate) {
    auto table = date32_table({make_date(2024, 1, 4), make_date(2024, 1, 2), make_date(2024, 1, 3)},
                              {12.0, 10.0, 11.0});

    auto result = DataConversionUtils::arrow_table_to_series(table, "X");
    ASSERT_TRUE(result.is_ok());
    const auto& points = result.value().points;
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0].close, 10.0);
    EXPECT_DOUBLE_EQ(points[1].close, 11.0);
    EXPECT_DOUBLE_EQ(points[2].close, 12.0);
}

TEST_F(DataConversionUtilsTest, DuplicateDatesAreInvalid) {
    auto table = date32_table({make_date(2024, 1, 2), make_date(2024, 1, 2)}, {10.0, 10.5});

    auto result = DataConversionUtils::arrow_table_to_series(table, "X");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(DataConversionUtilsTest, NullCloseIsInvalid) {
    arrow::DoubleBuilder close_builder;
    ARROW_CHECK_OK(close_builder.Append(10.0));
    ARROW_CHECK_OK(close_builder.AppendNull());
    std::shared_ptr<arrow::Array> closes;
    ARROW_CHECK_OK(close_builder.Finish(&closes));

    auto base = date32_table({make_date(2024, 1, 2), make_date(2024, 1, 3)}, {0.0, 0.0});
    auto table = arrow::Table::Make(base->schema(), {base->column(0)->chunk(0), closes});

    auto result = DataConversionUtils::arrow_table_to_series(table, "X");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(DataConversionUtilsTest, MissingColumn) {
    auto schema = arrow::schema({arrow::field("close", arrow::float64())});
    auto table = arrow::Table::Make(schema, {close_array({1.0})});

    auto result = DataConversionUtils::arrow_table_to_series(table, "X");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(DataConversionUtilsTest, UnsupportedColumnTypes) {
    arrow::Int64Builder int_builder;
    ARROW_CHECK_OK(int_builder.Append(20240102));
    std::shared_ptr<arrow::Array> int_dates;
    ARROW_CHECK_OK(int_builder.Finish(&int_dates));

    auto schema = arrow::schema(
        {arrow::field("date", arrow::int64()), arrow::field("close", arrow::float64())});
    auto table = arrow::Table::Make(schema, {int_dates, close_array({1.0})});
    EXPECT_EQ(DataConversionUtils::arrow_table_to_series(table, "X").error()->code(),
              ErrorCode::CONVERSION_ERROR);

    arrow::Int64Builder int_close_builder;
    ARROW_CHECK_OK(int_close_builder.Append(10));
    std::shared_ptr<arrow::Array> int_closes;
    ARROW_CHECK_OK(int_close_builder.Finish(&int_closes));

    auto base = date32_table({make_date(2024, 1, 2)}, {0.0});
    auto int_close_schema = arrow::schema(
        {arrow::field("date", arrow::date32()), arrow::field("close", arrow::int64())});
    auto int_close_table =
        arrow::Table::Make(int_close_schema, {base->column(0)->chunk(0), int_closes});
    EXPECT_EQ(DataConversionUtils::arrow_table_to_series(int_close_table, "X").error()->code(),
              ErrorCode::CONVERSION_ERROR);
}

TEST_F(DataConversionUtilsTest, NullAndEmptyTables) {
    EXPECT_EQ(DataConversionUtils::arrow_table_to_series(nullptr, "X").error()->code(),
              ErrorCode::INVALID_ARGUMENT);

    auto empty = date32_table({}, {});
    auto result = DataConversionUtils::arrow_table_to_series(empty, "X");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(DataConversionUtilsTest, ReadCsvSeries) {
    auto path = write_csv("510300.csv",
                          "date,open,close\n"
                          "2024-01-03,3.40,3.45\n"
                          "2024-01-02,3.38,3.41\n"
                          "2024-01-04,3.46,3.50\n");

    auto result = DataConversionUtils::read_csv_series(path, "510300");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& series = result.value();

    EXPECT_EQ(series.code, "510300");
    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(series.first_date(), make_date(2024, 1, 2));
    EXPECT_DOUBLE_EQ(series.points[0].close, 3.41);
    EXPECT_DOUBLE_EQ(series.points[2].close, 3.50);
}

TEST_F(DataConversionUtilsTest, CsvWithoutCloseColumn) {
    auto path = write_csv("no_close.csv", "date,open\n2024-01-02,3.38\n");

    auto result = DataConversionUtils::read_csv_series(path, "X");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(DataConversionUtilsTest, CsvWithMalformedDate) {
    auto path = write_csv("bad_date.csv", "date,close\n02/01/2024,3.41\n");

    auto result = DataConversionUtils::read_csv_series(path, "X");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(DataConversionUtilsTest, MissingCsvFile) {
    auto result =
        DataConversionUtils::read_csv_series((dir_ / "does_not_exist.csv").string(), "X");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}
