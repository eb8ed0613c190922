#include <gtest/gtest.h>
#include "allocsim/backtest/price_series_aligner.hpp"
#include "backtest/test_utils.hpp"

using namespace allocsim;
using namespace allocsim::backtest;
using allocsim::core::make_date;
using allocsim::testing::make_series;

class PriceSeriesAlignerTest : public ::testing::Test {
protected:
    PriceSeriesAligner aligner;
    Timestamp d1 = make_date(2024, 1, 2);
    Timestamp d2 = make_date(2024, 1, 3);
    Timestamp d3 = make_date(2024, 1, 4);
    Timestamp d4 = make_date(2024, 1, 5);
};

TEST_F(PriceSeriesAlignerTest, InnerJoinOnDate) {
    std::map<std::string, AssetSeries> series;
    series["A"] = make_series("A", {d1, d2, d3, d4}, {10.0, 11.0, 12.0, 13.0});
    series["B"] = make_series("B", {d1, d3, d4}, {20.0, 22.0, 23.0});

    auto result = aligner.align(series, d1, d4);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& calendar = result.value();
    ASSERT_EQ(calendar.size(), 3u);
    EXPECT_EQ(calendar.dates[0], d1);
    EXPECT_EQ(calendar.dates[1], d3);
    EXPECT_EQ(calendar.dates[2], d4);

    ASSERT_EQ(calendar.codes.size(), 2u);
    int a = calendar.index_of("A");
    int b = calendar.index_of("B");
    ASSERT_GE(a, 0);
    ASSERT_GE(b, 0);
    EXPECT_DOUBLE_EQ(calendar.prices[1][a], 12.0);
    EXPECT_DOUBLE_EQ(calendar.prices[1][b], 22.0);
    EXPECT_EQ(calendar.index_of("C"), -1);
}

TEST_F(PriceSeriesAlignerTest, RangeIsInclusive) {
    std::vector<AssetSeries> series = {make_series("A", {d1, d2, d3, d4}, {1, 2, 3, 4})};

    auto result = aligner.align(series, d2, d3);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value().dates.front(), d2);
    EXPECT_EQ(result.value().dates.back(), d3);
}

TEST_F(PriceSeriesAlignerTest, EmptyIntersectionIsInsufficientData) {
    std::vector<AssetSeries> series = {make_series("A", {d1, d2}, {1.0, 1.1}),
                                       make_series("B", {d3, d4}, {2.0, 2.1})};

    auto result = aligner.align(series, d1, d4);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    std::string message = result.error()->what();
    EXPECT_NE(message.find("A"), std::string::npos);
    EXPECT_NE(message.find("B"), std::string::npos);
    EXPECT_NE(message.find("2024-01-02"), std::string::npos);
}

TEST_F(PriceSeriesAlignerTest, NoDataInRangeIsInsufficientData) {
    std::vector<AssetSeries> series = {make_series("A", {d1, d2}, {1.0, 1.1})};

    auto result = aligner.align(series, make_date(2025, 1, 1), make_date(2025, 2, 1));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(PriceSeriesAlignerTest, InvalidInputs) {
    std::vector<AssetSeries> none;
    EXPECT_EQ(aligner.align(none, d1, d4).error()->code(), ErrorCode::INVALID_ARGUMENT);

    std::vector<AssetSeries> one = {make_series("A", {d1, d2}, {1.0, 1.1})};
    EXPECT_EQ(aligner.align(one, d4, d1).error()->code(), ErrorCode::INVALID_ARGUMENT);

    std::vector<AssetSeries> duplicate = {make_series("A", {d1}, {1.0}),
                                          make_series("A", {d1}, {1.0})};
    EXPECT_EQ(aligner.align(duplicate, d1, d4).error()->code(), ErrorCode::INVALID_ARGUMENT);

    std::vector<AssetSeries> unordered = {make_series("A", {d2, d1}, {1.0, 1.1})};
    EXPECT_EQ(aligner.align(unordered, d1, d4).error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(PriceSeriesAlignerTest, CoverageGapsReported) {
    std::map<std::string, AssetSeries> series;
    series["FULL"] = make_series("FULL", {make_date(2024, 1, 2), make_date(2024, 3, 29)},
                                 {1.0, 1.0});
    series["LATE"] = make_series("LATE", {make_date(2024, 2, 15), make_date(2024, 3, 29)},
                                 {1.0, 1.0});
    series["NONE"] = make_series("NONE", {make_date(2023, 5, 1)}, {1.0});

    // Jan 1 is a holiday and Mar 31 a Sunday: both are within tolerance for FULL
    auto gaps = aligner.find_coverage_gaps(series, make_date(2024, 1, 1), make_date(2024, 3, 31));
    ASSERT_EQ(gaps.size(), 2u);

    EXPECT_EQ(gaps[0].code, "LATE");
    EXPECT_EQ(gaps[0].first_available, make_date(2024, 2, 15));
    EXPECT_EQ(gaps[0].last_available, make_date(2024, 3, 29));

    EXPECT_EQ(gaps[1].code, "NONE");
    EXPECT_GT(gaps[1].first_available, gaps[1].last_available);
}
