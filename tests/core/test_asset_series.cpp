#include <gtest/gtest.h>
#include "allocsim/core/asset_series.hpp"
#include "allocsim/core/time_utils.hpp"

using namespace allocsim;
using core::make_date;

class AssetSeriesTest : public ::testing::Test {
protected:
    void SetUp() override {
        series = AssetSeries("510300", {{make_date(2024, 1, 2), 3.50},
                                        {make_date(2024, 1, 3), 3.55},
                                        {make_date(2024, 1, 4), 3.40},
                                        {make_date(2024, 1, 5), 3.45}});
    }

    AssetSeries series;
};

TEST_F(AssetSeriesTest, ValidSeriesPasses) {
    EXPECT_TRUE(series.validate().is_ok());
    EXPECT_EQ(series.size(), 4u);
    EXPECT_EQ(series.first_date(), make_date(2024, 1, 2));
    EXPECT_EQ(series.last_date(), make_date(2024, 1, 5));
}

TEST_F(AssetSeriesTest, DuplicateDateRejected) {
    series.points.push_back({make_date(2024, 1, 5), 3.50});
    auto result = series.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(AssetSeriesTest, UnorderedDatesRejected) {
    std::swap(series.points[1], series.points[2]);
    EXPECT_TRUE(series.validate().is_error());
}

TEST_F(AssetSeriesTest, MissingCodeRejected) {
    series.code.clear();
    EXPECT_TRUE(series.validate().is_error());
}

TEST_F(AssetSeriesTest, SliceIsInclusive) {
    AssetSeries window = series.slice(make_date(2024, 1, 3), make_date(2024, 1, 4));
    ASSERT_EQ(window.size(), 2u);
    EXPECT_EQ(window.code, "510300");
    EXPECT_DOUBLE_EQ(window.points[0].close, 3.55);
    EXPECT_DOUBLE_EQ(window.points[1].close, 3.40);

    EXPECT_TRUE(series.slice(make_date(2024, 2, 1), make_date(2024, 3, 1)).empty());
    EXPECT_EQ(series.slice(make_date(2023, 1, 1), make_date(2025, 1, 1)).size(), 4u);
}

TEST_F(AssetSeriesTest, PriceOnExactDate) {
    auto price = series.price_on(make_date(2024, 1, 4));
    ASSERT_TRUE(price.has_value());
    EXPECT_DOUBLE_EQ(*price, 3.40);

    EXPECT_FALSE(series.price_on(make_date(2024, 1, 6)).has_value());
    EXPECT_FALSE(series.price_on(make_date(2024, 1, 1)).has_value());
}
