#include <gtest/gtest.h>
#include "allocsim/backtest/benchmark_projector.hpp"
#include "backtest/test_utils.hpp"

using namespace allocsim;
using namespace allocsim::backtest;
using allocsim::testing::make_series;
using allocsim::testing::month_starts;

class BenchmarkProjectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        calendar_ = month_starts(2024, 1, 4);
    }

    std::vector<Timestamp> calendar_;
    BenchmarkProjector projector_;
};

TEST_F(BenchmarkProjectorTest, NormalizesToInitialCapital) {
    auto index = make_series("000300", calendar_, {3000.0, 3300.0, 2700.0, 3600.0});

    auto result = projector_.project(index, calendar_, 100000.0);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& curve = result.value();

    ASSERT_EQ(curve.size(), 4u);
    EXPECT_EQ(curve[0].first, calendar_[0]);
    EXPECT_DOUBLE_EQ(curve[0].second, 100000.0);
    EXPECT_NEAR(curve[1].second, 110000.0, 1e-6);
    EXPECT_NEAR(curve[2].second, 90000.0, 1e-6);
    EXPECT_NEAR(curve[3].second, 120000.0, 1e-6);
}

TEST_F(BenchmarkProjectorTest, SkipsDatesBeforeFirstPrice) {
    std::vector<Timestamp> dates{calendar_[2], calendar_[3]};
    auto index = make_series("000001", dates, {2500.0, 2750.0});

    auto result = projector_.project(index, calendar_, 1000.0);
    ASSERT_TRUE(result.is_ok());
    const auto& curve = result.value();

    ASSERT_EQ(curve.size(), 2u);
    EXPECT_EQ(curve[0].first, calendar_[2]);
    EXPECT_DOUBLE_EQ(curve[0].second, 1000.0);
    EXPECT_NEAR(curve[1].second, 1100.0, 1e-9);
}

TEST_F(BenchmarkProjectorTest, CarriesValueOverMissingDates) {
    std::vector<Timestamp> dates{calendar_[0], calendar_[2], calendar_[3]};
    auto index = make_series("000300", dates, {100.0, 120.0, 90.0});

    auto result = projector_.project(index, calendar_, 1000.0);
    ASSERT_TRUE(result.is_ok());
    const auto& curve = result.value();

    ASSERT_EQ(curve.size(), 4u);
    EXPECT_EQ(curve[1].first, calendar_[1]);
    EXPECT_DOUBLE_EQ(curve[1].second, curve[0].second);
    EXPECT_NEAR(curve[2].second, 1200.0, 1e-9);
    EXPECT_NEAR(curve[3].second, 900.0, 1e-9);
}

TEST_F(BenchmarkProjectorTest, IgnoresPricesOffCalendar) {
    // Mid-month closes never land on the calendar
    std::vector<Timestamp> dates{core::make_date(2023, 12, 15), calendar_[0],
                                core::make_date(2024, 1, 15), calendar_[1],
                                core::make_date(2024, 2, 15), calendar_[2], calendar_[3]};
    auto index = make_series("000300", dates, {1.0, 50.0, 999.0, 55.0, 1.0, 60.0, 40.0});

    auto result = projector_.project(index, calendar_, 100.0);
    ASSERT_TRUE(result.is_ok());
    const auto& curve = result.value();

    ASSERT_EQ(curve.size(), 4u);
    EXPECT_DOUBLE_EQ(curve[0].second, 100.0);
    EXPECT_NEAR(curve[1].second, 110.0, 1e-9);
    EXPECT_NEAR(curve[2].second, 120.0, 1e-9);
    EXPECT_NEAR(curve[3].second, 80.0, 1e-9);
}

TEST_F(BenchmarkProjectorTest, NoOverlapIsInsufficientData) {
    auto index = make_series("000300", month_starts(2025, 1, 3), {1.0, 2.0, 3.0});

    auto result = projector_.project(index, calendar_, 1000.0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    auto empty_index = make_series("000300", {}, {});
    EXPECT_EQ(projector_.project(empty_index, calendar_, 1000.0).error()->code(),
              ErrorCode::INSUFFICIENT_DATA);

    auto full_index = make_series("000300", calendar_, {1.0, 2.0, 3.0, 4.0});
    EXPECT_EQ(projector_.project(full_index, {}, 1000.0).error()->code(),
              ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(BenchmarkProjectorTest, RejectsNonPositiveClose) {
    auto index = make_series("000300", calendar_, {100.0, 0.0, 110.0, 120.0});

    auto result = projector_.project(index, calendar_, 1000.0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_PRICE);
}

TEST_F(BenchmarkProjectorTest, RejectsUnorderedSeries) {
    std::vector<Timestamp> dates{calendar_[1], calendar_[0]};
    auto index = make_series("000300", dates, {100.0, 110.0});

    auto result = projector_.project(index, calendar_, 1000.0);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(BenchmarkProjectorTest, RejectsNonPositiveCapital) {
    auto index = make_series("000300", calendar_, {1.0, 2.0, 3.0, 4.0});
    EXPECT_EQ(projector_.project(index, calendar_, 0.0).error()->code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(projector_.project(index, calendar_, -5.0).error()->code(),
              ErrorCode::INVALID_ARGUMENT);
}
