// SPDX-License-Identifier: MIT
#include "yieldsolve/tvm/amortization.hpp"
#include "yieldsolve/support/yieldsolve_trace.h"
#include <cmath>

namespace yieldsolve {

namespace {

double round_cents(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

}  // namespace

std::expected<std::vector<AmortizationRow>, ValidationError>
amortization_schedule(double rate, int periods, double present_value,
                      double future_value, PaymentTiming when) {
    YIELDSOLVE_TRACE_ALGO_START(MODULE_AMORTIZATION, periods, rate, present_value);

    if (periods < 1) {
        YIELDSOLVE_TRACE_VALIDATION_ERROR(MODULE_AMORTIZATION,
            static_cast<int>(ValidationErrorCode::InvalidTerm),
            static_cast<double>(periods), 0);
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidTerm, static_cast<double>(periods)));
    }

    const double payment = pmt(rate, static_cast<double>(periods), present_value,
                               future_value, when);

    std::vector<AmortizationRow> rows;
    rows.reserve(static_cast<size_t>(periods));

    // Accumulators stay unrounded; rounding happens only on output
    double balance = present_value;
    double cumulative_interest = 0.0;
    double cumulative_principal = 0.0;

    for (int period = 1; period <= periods; ++period) {
        const double interest = balance * rate;
        const double principal = std::abs(payment) - interest;
        balance = balance * (1.0 + rate) + payment;

        cumulative_interest += interest;
        cumulative_principal += principal;

        rows.push_back(AmortizationRow{
            .period = period,
            .payment = round_cents(std::abs(payment)),
            .interest = round_cents(interest),
            .principal = round_cents(principal),
            .cumulative_interest = round_cents(cumulative_interest),
            .cumulative_principal = round_cents(cumulative_principal),
            .remaining_balance = round_cents(balance)
        });
    }

    YIELDSOLVE_TRACE_ALGO_COMPLETE(MODULE_AMORTIZATION, periods, balance);
    return rows;
}

}  // namespace yieldsolve
