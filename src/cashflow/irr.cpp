// SPDX-License-Identifier: MIT
#include "yieldsolve/cashflow/irr.hpp"
#include "yieldsolve/cashflow/residual.hpp"

namespace yieldsolve {

std::expected<RateResult, ValidationError>
irr(std::span<const double> cashflows, const RateSolverConfig& config) {
    return CashflowSeries::periodic(cashflows)
        .transform([&config](const CashflowSeries& series) {
            return solve_rate(series, config);
        });
}

std::expected<RateResult, ValidationError>
xirr(std::span<const double> cashflows, std::span<const Date> dates,
     const RateSolverConfig& config) {
    return CashflowSeries::dated(cashflows, dates)
        .transform([&config](const CashflowSeries& series) {
            return solve_rate(series, config);
        });
}

std::expected<RateResult, ValidationError>
xirr(std::span<const double> cashflows, std::span<const std::string> dates,
     const RateSolverConfig& config) {
    return CashflowSeries::dated(cashflows, dates)
        .transform([&config](const CashflowSeries& series) {
            return solve_rate(series, config);
        });
}

double npv(double rate, std::span<const double> cashflows) {
    if (cashflows.empty()) {
        return 0.0;  // Empty sum
    }
    return CashflowSeries::periodic(cashflows)
        .transform([rate](const CashflowSeries& series) {
            return npv_at(rate, series);
        })
        .value_or(0.0);
}

std::expected<double, ValidationError>
xnpv(double rate, std::span<const double> cashflows, std::span<const Date> dates) {
    return CashflowSeries::dated(cashflows, dates)
        .transform([rate](const CashflowSeries& series) {
            return npv_at(rate, series);
        });
}

std::expected<double, ValidationError>
xnpv(double rate, std::span<const double> cashflows, std::span<const std::string> dates) {
    return CashflowSeries::dated(cashflows, dates)
        .transform([rate](const CashflowSeries& series) {
            return npv_at(rate, series);
        });
}

}  // namespace yieldsolve
