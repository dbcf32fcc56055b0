// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "yieldsolve/cashflow/irr.hpp"
#include "yieldsolve/cashflow/irr_batch.hpp"
#include <vector>

using namespace yieldsolve;

TEST(IrrBatchTest, MixedBatchCountsOutcomes) {
    std::vector<std::vector<double>> series{
        {-100.0, 39.0, 59.0, 55.0, 20.0},   // converges
        {},                                 // validation failure
        {100.0, 50.0, 25.0},                // no sign change
        {-100.0, 0.0, 0.0, 74.0}            // converges
    };

    auto batch = solve_irr_batch(series);

    ASSERT_EQ(batch.results.size(), 4u);
    EXPECT_EQ(batch.failed_count, 1u);
    EXPECT_EQ(batch.unconverged_count, 1u);
    EXPECT_FALSE(batch.all_succeeded());

    ASSERT_TRUE(batch.results[0].has_value());
    EXPECT_NEAR(*batch.results[0]->rate, 0.2809484211, 1e-10);

    ASSERT_FALSE(batch.results[1].has_value());
    EXPECT_EQ(batch.results[1].error().code, ValidationErrorCode::EmptyCashflows);

    ASSERT_TRUE(batch.results[2].has_value());
    EXPECT_FALSE(batch.results[2]->converged);

    ASSERT_TRUE(batch.results[3].has_value());
    EXPECT_NEAR(*batch.results[3]->rate, -0.0954958304, 1e-10);
}

TEST(IrrBatchTest, MatchesSequentialSolves) {
    std::vector<std::vector<double>> series;
    for (int i = 0; i < 200; ++i) {
        const double bump = 0.5 * i;
        series.push_back({-1000.0, 200.0 + bump, 300.0, 400.0 + bump, 250.0});
    }

    auto batch = solve_irr_batch(series);

    EXPECT_TRUE(batch.all_succeeded());
    ASSERT_EQ(batch.results.size(), series.size());
    for (size_t i = 0; i < series.size(); ++i) {
        auto single = irr(series[i]);
        ASSERT_TRUE(batch.results[i].has_value());
        EXPECT_EQ(batch.results[i]->rate, single->rate) << "series " << i;
        EXPECT_EQ(batch.results[i]->iterations, single->iterations) << "series " << i;
    }
}

TEST(IrrBatchTest, ConfigIsForwarded) {
    std::vector<std::vector<double>> series{{-100.0, 39.0, 59.0, 55.0, 20.0}};

    auto batch = solve_irr_batch(series, RateSolverConfig{.max_iter = 2});

    ASSERT_TRUE(batch.results[0].has_value());
    EXPECT_FALSE(batch.results[0]->converged);
    EXPECT_EQ(batch.results[0]->iterations, 2u);
    EXPECT_EQ(batch.unconverged_count, 1u);
}

TEST(IrrBatchTest, EmptyBatch) {
    std::vector<std::vector<double>> series;

    auto batch = solve_irr_batch(series);

    EXPECT_TRUE(batch.results.empty());
    EXPECT_TRUE(batch.all_succeeded());
}

TEST(XirrBatchTest, DatedSeries) {
    std::vector<DatedCashflows> series{
        DatedCashflows{
            .amounts = {-10000.0, 2750.0, 4250.0, 3250.0, 2750.0},
            .dates = {make_date(2008, 1, 1), make_date(2008, 3, 1), make_date(2008, 10, 30),
                      make_date(2009, 2, 15), make_date(2009, 4, 1)}},
        DatedCashflows{
            .amounts = {-100.0, 110.0, 5.0},
            .dates = {make_date(2020, 1, 1), make_date(2021, 1, 1)}}
    };

    auto batch = solve_xirr_batch(series);

    ASSERT_EQ(batch.results.size(), 2u);
    ASSERT_TRUE(batch.results[0].has_value());
    EXPECT_NEAR(*batch.results[0]->rate, 0.3733625335, 1e-10);

    ASSERT_FALSE(batch.results[1].has_value());
    EXPECT_EQ(batch.results[1].error().code, ValidationErrorCode::LengthMismatch);
    EXPECT_EQ(batch.failed_count, 1u);
    EXPECT_EQ(batch.unconverged_count, 0u);
}

TEST(XirrBatchTest, InvalidDateStringFailsOnlyItsSeries) {
    std::vector<IsoDatedCashflows> series{
        IsoDatedCashflows{
            .amounts = {-10000.0, 2750.0, 4250.0, 3250.0, 2750.0},
            .dates = {"2008-01-01", "2008-03-01", "2008-10-30", "2009-02-15", "2009-04-01"}},
        IsoDatedCashflows{
            .amounts = {-100.0, 110.0},
            .dates = {"2023-01-01", "2023-02-29"}},
        IsoDatedCashflows{
            .amounts = {-1000.0, 1100.0},
            .dates = {"2020-01-01", "2021-01-01"}}
    };

    auto batch = solve_xirr_batch(series);

    ASSERT_EQ(batch.results.size(), 3u);
    EXPECT_EQ(batch.failed_count, 1u);
    EXPECT_EQ(batch.unconverged_count, 0u);

    ASSERT_TRUE(batch.results[0].has_value());
    EXPECT_NEAR(*batch.results[0]->rate, 0.3733625335, 1e-10);

    ASSERT_FALSE(batch.results[1].has_value());
    EXPECT_EQ(batch.results[1].error().code, ValidationErrorCode::InvalidDate);
    EXPECT_EQ(batch.results[1].error().index, 1u);

    ASSERT_TRUE(batch.results[2].has_value());
    EXPECT_TRUE(batch.results[2]->converged);
}
