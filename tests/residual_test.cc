// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "yieldsolve/cashflow/residual.hpp"
#include <cmath>
#include <vector>

using namespace yieldsolve;

namespace {

CashflowSeries periodic(std::vector<double> amounts) {
    auto series = CashflowSeries::periodic(amounts);
    EXPECT_TRUE(series.has_value());
    return std::move(*series);
}

}  // namespace

TEST(ResidualTest, ValueAndDerivativeAtRoot) {
    auto series = periodic({-100.0, 110.0});

    auto r = evaluate_residual(0.1, series);

    EXPECT_NEAR(r.value, 0.0, 1e-12);
    // -1 * 110 / 1.1^2
    EXPECT_NEAR(r.derivative, -110.0 / 1.21, 1e-12);
}

TEST(ResidualTest, ZeroRateIsUndiscountedSum) {
    auto series = periodic({-100.0, 30.0, 40.0, 50.0});

    auto r = evaluate_residual(0.0, series);

    EXPECT_DOUBLE_EQ(r.value, 20.0);
    // -(1*30 + 2*40 + 3*50)
    EXPECT_DOUBLE_EQ(r.derivative, -260.0);
}

TEST(ResidualTest, DerivativeMatchesFiniteDifference) {
    auto series = periodic({-100.0, 39.0, 59.0, 55.0, 20.0});
    const double rate = 0.17;
    const double h = 1e-6;

    auto r = evaluate_residual(rate, series);
    double fd = (npv_at(rate + h, series) - npv_at(rate - h, series)) / (2.0 * h);

    EXPECT_NEAR(r.derivative, fd, 1e-5);
}

TEST(ResidualTest, FractionalOffsets) {
    std::vector<double> amounts{-1000.0, 1100.0};
    std::vector<Date> dates{make_date(2025, 1, 1), make_date(2025, 7, 1)};
    auto series = CashflowSeries::dated(amounts, dates);
    ASSERT_TRUE(series.has_value());

    const double t = 181.0 / 365.0;
    auto r = evaluate_residual(0.1, *series);

    EXPECT_NEAR(r.value, -1000.0 + 1100.0 / std::pow(1.1, t), 1e-9);
    EXPECT_NEAR(r.derivative, -t * 1100.0 / std::pow(1.1, t + 1.0), 1e-9);
}

TEST(ResidualTest, RateAtMinusOneIsNaN) {
    auto series = periodic({-100.0, 110.0});

    auto at_minus_one = evaluate_residual(-1.0, series);
    EXPECT_TRUE(std::isnan(at_minus_one.value));
    EXPECT_TRUE(std::isnan(at_minus_one.derivative));
    EXPECT_TRUE(std::isnan(npv_at(-1.0, series)));
}

TEST(ResidualTest, RateBelowMinusOneWithWholePeriods) {
    auto series = periodic({-100.0, 110.0});

    // Base -0.5: -100 + 110 / -0.5
    auto below = evaluate_residual(-1.5, series);
    EXPECT_DOUBLE_EQ(below.value, -320.0);
    EXPECT_DOUBLE_EQ(below.derivative, -440.0);

    EXPECT_DOUBLE_EQ(npv_at(-2.0, series), -210.0);
}

TEST(ResidualTest, RateBelowMinusOneWithFractionalOffsetIsNaN) {
    std::vector<double> amounts{-1000.0, 1100.0};
    std::vector<Date> dates{make_date(2020, 1, 1), make_date(2020, 6, 30)};
    auto series = CashflowSeries::dated(amounts, dates);
    ASSERT_TRUE(series.has_value());

    auto below = evaluate_residual(-1.5, *series);
    EXPECT_TRUE(std::isnan(below.value));
    EXPECT_TRUE(std::isnan(below.derivative));
    EXPECT_TRUE(std::isnan(npv_at(-1.5, *series)));
}

TEST(ResidualTest, NonFiniteRateIsNaN) {
    auto series = periodic({-100.0, 110.0});

    EXPECT_TRUE(std::isnan(evaluate_residual(std::nan(""), series).value));
    EXPECT_TRUE(std::isnan(evaluate_residual(INFINITY, series).value));
}

TEST(ResidualTest, NpvAtMatchesResidualValue) {
    auto series = periodic({-40000.0, 5000.0, 8000.0, 12000.0, 30000.0});

    EXPECT_DOUBLE_EQ(npv_at(0.08, series), evaluate_residual(0.08, series).value);
    EXPECT_NEAR(npv_at(0.08, series), 3065.2226681795255, 1e-6);
}
