#include <gtest/gtest.h>
#include <thread>
#include "allocsim/core/time_utils.hpp"
#include "allocsim/data/market_data_source.hpp"

using namespace allocsim;
using allocsim::core::make_date;

class InMemoryMarketDataSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<PricePoint> points;
        for (const auto& date :
             core::weekday_calendar(make_date(2024, 1, 1), make_date(2024, 1, 31))) {
            points.emplace_back(date, 100.0 + static_cast<double>(points.size()));
        }
        ASSERT_TRUE(source_.add_series(AssetSeries("510300", points)).is_ok());
        ASSERT_TRUE(source_.add_series(AssetSeries("000300", points)).is_ok());
    }

    InMemoryMarketDataSource source_;
};

TEST_F(InMemoryMarketDataSourceTest, StoresSeriesByCode) {
    EXPECT_TRUE(source_.has_series("510300"));
    EXPECT_FALSE(source_.has_series("159915"));
    EXPECT_EQ(source_.codes(), (std::vector<std::string>{"000300", "510300"}));
}

TEST_F(InMemoryMarketDataSourceTest, SlicesRequestedRange) {
    auto result =
        source_.get_aligned_series({"510300"}, make_date(2024, 1, 8), make_date(2024, 1, 12));
    ASSERT_TRUE(result.is_ok());
    const auto& series = result.value().at("510300");
    ASSERT_EQ(series.size(), 5u);
    EXPECT_EQ(series.first_date(), make_date(2024, 1, 8));
    EXPECT_EQ(series.last_date(), make_date(2024, 1, 12));
}

TEST_F(InMemoryMarketDataSourceTest, UnknownCodeIsDataUnavailable) {
    auto result = source_.get_aligned_series({"510300", "159915"}, make_date(2024, 1, 1),
                                             make_date(2024, 1, 31));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(InMemoryMarketDataSourceTest, EmptyRangeIsDataUnavailable) {
    auto result =
        source_.get_benchmark_series("000300", make_date(2023, 1, 1), make_date(2023, 12, 31));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_UNAVAILABLE);
}

TEST_F(InMemoryMarketDataSourceTest, BenchmarkSeries) {
    auto result =
        source_.get_benchmark_series("000300", make_date(2024, 1, 1), make_date(2024, 1, 5));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().code, "000300");
    EXPECT_EQ(result.value().size(), 5u);
}

TEST_F(InMemoryMarketDataSourceTest, NoCodesRequested) {
    auto result = source_.get_aligned_series({}, make_date(2024, 1, 1), make_date(2024, 1, 31));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(InMemoryMarketDataSourceTest, RejectsUnorderedSeries) {
    AssetSeries bad("X", {PricePoint(make_date(2024, 1, 3), 1.0),
                          PricePoint(make_date(2024, 1, 2), 1.0)});
    auto result = source_.add_series(bad);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_FALSE(source_.has_series("X"));
}

TEST_F(InMemoryMarketDataSourceTest, ReplacesExistingSeries) {
    AssetSeries replacement("510300", {PricePoint(make_date(2024, 1, 2), 7.0)});
    ASSERT_TRUE(source_.add_series(replacement).is_ok());

    auto result =
        source_.get_aligned_series({"510300"}, make_date(2024, 1, 1), make_date(2024, 1, 31));
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().at("510300").size(), 1u);
    EXPECT_DOUBLE_EQ(result.value().at("510300").points[0].close, 7.0);
}

TEST_F(InMemoryMarketDataSourceTest, ConcurrentReads) {
    std::vector<std::thread> threads;
    std::vector<size_t> sizes(8, 0);
    for (size_t i = 0; i < sizes.size(); ++i) {
        threads.emplace_back([this, &sizes, i]() {
            auto result = source_.get_aligned_series({"510300", "000300"}, make_date(2024, 1, 1),
                                                     make_date(2024, 1, 31));
            if (result.is_ok()) {
                sizes[i] = result.value().at("510300").size();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (size_t size : sizes) {
        EXPECT_EQ(size, 23u);
    }
}
