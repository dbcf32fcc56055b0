// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "yieldsolve/cashflow/cashflow_series.hpp"
#include <string>
#include <vector>

using namespace yieldsolve;

TEST(CashflowSeriesTest, PeriodicOffsetsArePeriodIndices) {
    std::vector<double> amounts{-100.0, 39.0, 59.0, 55.0, 20.0};
    auto series = CashflowSeries::periodic(amounts);

    ASSERT_TRUE(series.has_value());
    ASSERT_EQ(series->size(), 5u);
    EXPECT_FALSE(series->is_dated());
    EXPECT_FALSE(series->reference_date().has_value());
    for (size_t i = 0; i < series->size(); ++i) {
        EXPECT_DOUBLE_EQ((*series)[i].amount, amounts[i]);
        EXPECT_DOUBLE_EQ((*series)[i].time_offset, static_cast<double>(i));
    }
}

TEST(CashflowSeriesTest, SingleEntryIsAccepted) {
    std::vector<double> amounts{-100.0};
    auto series = CashflowSeries::periodic(amounts);

    ASSERT_TRUE(series.has_value());
    EXPECT_EQ(series->size(), 1u);
}

TEST(CashflowSeriesTest, EmptyPeriodicFails) {
    std::vector<double> amounts;
    auto series = CashflowSeries::periodic(amounts);

    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ValidationErrorCode::EmptyCashflows);
}

TEST(CashflowSeriesTest, NoSignChangeIsAccepted) {
    std::vector<double> amounts{100.0, 50.0, 25.0};
    EXPECT_TRUE(CashflowSeries::periodic(amounts).has_value());
}

TEST(CashflowSeriesTest, DatedOffsetsUseActual365) {
    std::vector<double> amounts{-10000.0, 2750.0, 4250.0, 3250.0, 2750.0};
    std::vector<Date> dates{
        make_date(2008, 1, 1), make_date(2008, 3, 1), make_date(2008, 10, 30),
        make_date(2009, 2, 15), make_date(2009, 4, 1)};

    auto series = CashflowSeries::dated(amounts, dates);

    ASSERT_TRUE(series.has_value());
    EXPECT_TRUE(series->is_dated());
    EXPECT_EQ(*series->reference_date(), make_date(2008, 1, 1));

    const double expected[] = {0.0, 0.16438356, 0.83013699, 1.12602740, 1.24931507};
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_NEAR((*series)[i].time_offset, expected[i], 1e-8);
    }
}

TEST(CashflowSeriesTest, ReferenceDateIsEarliestNotFirst) {
    std::vector<double> amounts{2750.0, -10000.0, 4250.0};
    std::vector<Date> dates{
        make_date(2008, 3, 1), make_date(2008, 1, 1), make_date(2008, 10, 30)};

    auto series = CashflowSeries::dated(amounts, dates);

    ASSERT_TRUE(series.has_value());
    EXPECT_EQ(*series->reference_date(), make_date(2008, 1, 1));
    EXPECT_NEAR((*series)[0].time_offset, 60.0 / 365.0, 1e-12);
    EXPECT_DOUBLE_EQ((*series)[1].time_offset, 0.0);
    for (const CashFlow& cf : *series) {
        EXPECT_GE(cf.time_offset, 0.0);
    }
}

TEST(CashflowSeriesTest, LengthMismatchFails) {
    std::vector<double> amounts{-100.0, 50.0, 60.0};
    std::vector<Date> dates{make_date(2020, 1, 1), make_date(2021, 1, 1)};

    auto series = CashflowSeries::dated(amounts, dates);

    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ValidationErrorCode::LengthMismatch);
    EXPECT_DOUBLE_EQ(series.error().value, 2.0);
    EXPECT_EQ(series.error().index, 3u);
}

TEST(CashflowSeriesTest, EmptyDatedFails) {
    std::vector<double> amounts;
    std::vector<Date> dates;

    auto series = CashflowSeries::dated(amounts, dates);

    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ValidationErrorCode::EmptyCashflows);
}

TEST(CashflowSeriesTest, StringDatesAreParsed) {
    std::vector<double> amounts{-1000.0, 1100.0};
    std::vector<std::string> dates{"2020-01-01", "2021-01-01"};

    auto series = CashflowSeries::dated(amounts, dates);

    ASSERT_TRUE(series.has_value());
    EXPECT_DOUBLE_EQ((*series)[1].time_offset, 366.0 / 365.0);
}

TEST(CashflowSeriesTest, InvalidStringDateReportsIndex) {
    std::vector<double> amounts{-1000.0, 500.0, 600.0};
    std::vector<std::string> dates{"2023-01-01", "2023-06-01", "2023-02-29"};

    auto series = CashflowSeries::dated(amounts, dates);

    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ValidationErrorCode::InvalidDate);
    EXPECT_EQ(series.error().index, 2u);
}

TEST(CashflowSeriesTest, LengthCheckedBeforeDateParsing) {
    std::vector<double> amounts{-1000.0, 500.0};
    std::vector<std::string> dates{"not-a-date"};

    auto series = CashflowSeries::dated(amounts, dates);

    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ValidationErrorCode::LengthMismatch);
}
