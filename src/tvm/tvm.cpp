// SPDX-License-Identifier: MIT
#include "yieldsolve/tvm/tvm.hpp"
#include "yieldsolve/support/yieldsolve_trace.h"
#include <cmath>

namespace yieldsolve {

namespace {

/// Annuity factor (1 + r*w) * ((1+r)^n - 1) / r, valid for r != 0
double annuity_factor(double rate, double periods, PaymentTiming when) {
    return (1.0 + rate * timing_weight(when)) * (std::pow(1.0 + rate, periods) - 1.0) / rate;
}

std::expected<void, ValidationError> validate_period(double per) {
    if (!(per >= 1.0)) {
        YIELDSOLVE_TRACE_VALIDATION_ERROR(MODULE_TVM,
            static_cast<int>(ValidationErrorCode::InvalidPeriod), per, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidPeriod, per));
    }
    return {};
}

}  // namespace

double fv(double rate, double periods, double payment, double present_value,
          PaymentTiming when) {
    if (rate == 0.0) {
        return -(present_value + payment * periods);
    }
    return -present_value * std::pow(1.0 + rate, periods)
           - payment * annuity_factor(rate, periods, when);
}

double pv(double rate, double periods, double payment, double future_value,
          PaymentTiming when) {
    if (rate == 0.0) {
        return -(future_value + payment * periods);
    }
    return -(future_value + payment * annuity_factor(rate, periods, when))
           / std::pow(1.0 + rate, periods);
}

double pmt(double rate, double periods, double present_value, double future_value,
           PaymentTiming when) {
    if (rate == 0.0) {
        return -(future_value + present_value) / periods;
    }
    return -(future_value + present_value * std::pow(1.0 + rate, periods))
           / annuity_factor(rate, periods, when);
}

double nper(double rate, double payment, double present_value, double future_value,
            PaymentTiming when) {
    if (rate == 0.0) {
        return -(future_value + present_value) / payment;
    }
    // z: present value of a perpetuity of `payment`
    const double z = payment * (1.0 + rate * timing_weight(when)) / rate;
    return std::log((z - future_value) / (z + present_value)) / std::log1p(rate);
}

std::expected<double, ValidationError>
ipmt(double rate, double per, double periods, double present_value,
     double future_value, PaymentTiming when) {
    if (auto ok = validate_period(per); !ok) {
        return std::unexpected(ok.error());
    }
    if (when == PaymentTiming::Begin && per == 1.0) {
        return 0.0;
    }

    const double payment = pmt(rate, periods, present_value, future_value, when);
    const double interest = fv(rate, per - 1.0, payment, present_value, when) * rate;

    if (when == PaymentTiming::Begin) {
        return interest / (1.0 + rate);
    }
    return interest;
}

std::expected<double, ValidationError>
ppmt(double rate, double per, double periods, double present_value,
     double future_value, PaymentTiming when) {
    return ipmt(rate, per, periods, present_value, future_value, when)
        .transform([&](double interest) {
            return pmt(rate, periods, present_value, future_value, when) - interest;
        });
}

std::expected<double, ValidationError>
mirr(std::span<const double> cashflows, double finance_rate, double reinvest_rate) {
    const size_t n = cashflows.size();
    YIELDSOLVE_TRACE_ALGO_START(MODULE_TVM, n, finance_rate, reinvest_rate);

    if (n < 2) {
        YIELDSOLVE_TRACE_VALIDATION_ERROR(MODULE_TVM,
            static_cast<int>(ValidationErrorCode::InsufficientCashflows),
            static_cast<double>(n), 0);
        return std::unexpected(ValidationError(
            ValidationErrorCode::InsufficientCashflows, static_cast<double>(n)));
    }

    double npv_positive = 0.0;  // inflows at the reinvestment rate
    double npv_negative = 0.0;  // outflows at the finance rate
    for (size_t t = 0; t < n; ++t) {
        const double v = cashflows[t];
        const double period = static_cast<double>(t);
        if (v > 0.0) {
            npv_positive += v / std::pow(1.0 + reinvest_rate, period);
        } else if (v < 0.0) {
            npv_negative += v / std::pow(1.0 + finance_rate, period);
        }
    }

    if (npv_positive == 0.0 || npv_negative == 0.0) {
        YIELDSOLVE_TRACE_VALIDATION_ERROR(MODULE_TVM,
            static_cast<int>(ValidationErrorCode::MissingSignChange),
            npv_positive, n);
        return std::unexpected(ValidationError(ValidationErrorCode::MissingSignChange));
    }

    const double exponent = 1.0 / static_cast<double>(n - 1);
    const double result = std::pow(npv_positive / std::abs(npv_negative), exponent)
                          * (1.0 + reinvest_rate) - 1.0;

    YIELDSOLVE_TRACE_ALGO_COMPLETE(MODULE_TVM, n, result);
    return result;
}

}  // namespace yieldsolve
