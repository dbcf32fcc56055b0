// SPDX-License-Identifier: MIT
/**
 * @file tvm.hpp
 * @brief Closed-form time-value-of-money formulas
 *
 * All formulas follow the spreadsheet sign convention: money paid out is
 * negative, money received is positive. They are the solutions, for one
 * variable at a time, of
 *
 *   fv + pv*(1+r)^n + pmt*(1+r*w)/r*((1+r)^n - 1) = 0
 *
 * where w is 0 for end-of-period payments and 1 for beginning-of-period
 * payments. At r = 0 the equation degenerates to fv + pv + pmt*n = 0.
 *
 * Example:
 * @code
 * // Monthly payment on a 15-year 200k loan at 7.5%
 * double payment = yieldsolve::pmt(0.075 / 12, 180, 200000.0);  // -1854.02
 * @endcode
 */

#pragma once

#include "yieldsolve/support/error_types.hpp"
#include <expected>
#include <span>

namespace yieldsolve {

/// When payments fall within each period
enum class PaymentTiming {
    End = 0,    ///< Ordinary annuity (default)
    Begin = 1   ///< Annuity due
};

/// Numeric weight w of a timing in the annuity factor (1 + r*w)
inline double timing_weight(PaymentTiming when) {
    return when == PaymentTiming::Begin ? 1.0 : 0.0;
}

/// Future value after `periods` payments
double fv(double rate, double periods, double payment, double present_value,
          PaymentTiming when = PaymentTiming::End);

/// Present value of `periods` payments plus a terminal amount
double pv(double rate, double periods, double payment, double future_value = 0.0,
          PaymentTiming when = PaymentTiming::End);

/// Constant payment per period that amortizes present_value down to future_value
double pmt(double rate, double periods, double present_value, double future_value = 0.0,
           PaymentTiming when = PaymentTiming::End);

/// Number of periods needed to reach future_value with a constant payment
///
/// The result is generally fractional. Returns NaN when no finite number of
/// periods exists (e.g. the payment does not cover the interest).
double nper(double rate, double payment, double present_value, double future_value = 0.0,
            PaymentTiming when = PaymentTiming::End);

/// Interest portion of the payment in period `per` (1-based)
///
/// Computed from the balance after per-1 payments:
///   ipmt = fv(rate, per-1, pmt, pv, when) * rate
/// For Begin timing the first payment carries no interest and later ones are
/// discounted by one period.
///
/// @return Interest portion, or ValidationError{InvalidPeriod} when per < 1
std::expected<double, ValidationError>
ipmt(double rate, double per, double periods, double present_value,
     double future_value = 0.0, PaymentTiming when = PaymentTiming::End);

/// Principal portion of the payment in period `per`: pmt - ipmt
///
/// @return Principal portion, or ValidationError{InvalidPeriod} when per < 1
std::expected<double, ValidationError>
ppmt(double rate, double per, double periods, double present_value,
     double future_value = 0.0, PaymentTiming when = PaymentTiming::End);

/// Modified internal rate of return
///
/// Positive flows are compounded at reinvest_rate, negative flows are
/// discounted at finance_rate:
///   MIRR = (NPV+(reinvest) / |NPV-(finance)|)^(1/(n-1)) * (1 + reinvest) - 1
///
/// @return MIRR, or ValidationError{InsufficientCashflows} for fewer than two
///         flows, or ValidationError{MissingSignChange} when the series has no
///         positive or no negative flow
std::expected<double, ValidationError>
mirr(std::span<const double> cashflows, double finance_rate, double reinvest_rate);

}  // namespace yieldsolve
