// SPDX-License-Identifier: MIT
/**
 * @file amortization.hpp
 * @brief Period-by-period loan amortization schedule
 */

#pragma once

#include "yieldsolve/support/error_types.hpp"
#include "yieldsolve/tvm/tvm.hpp"
#include <expected>
#include <vector>

namespace yieldsolve {

/// One period of an amortization schedule
///
/// Monetary fields are rounded to cents. Payment, interest and principal are
/// reported as positive magnitudes; cumulative sums are taken over the
/// unrounded per-period values.
struct AmortizationRow {
    int period;                   ///< 1-based period number
    double payment;               ///< |pmt|
    double interest;              ///< Opening balance * rate
    double principal;             ///< payment - interest
    double cumulative_interest;
    double cumulative_principal;
    double remaining_balance;     ///< Closing balance
};

/// Build the schedule for a level-payment loan
///
/// The payment is pmt(rate, periods, present_value, future_value, when). Each
/// period then advances the balance by the forward recurrence
///
///   interest  = balance * rate
///   principal = |payment| - interest
///   balance   = balance * (1 + rate) + payment
///
/// Timing only enters through the payment amount; the recurrence itself is
/// the end-of-period one.
///
/// @param rate Interest rate per period
/// @param periods Number of payments (>= 1)
/// @param present_value Opening balance (loan principal)
/// @param future_value Balance remaining after the last payment
/// @param when Payment timing used to size the payment
/// @return One row per period, or ValidationError{InvalidTerm} when periods < 1
std::expected<std::vector<AmortizationRow>, ValidationError>
amortization_schedule(double rate, int periods, double present_value,
                      double future_value = 0.0,
                      PaymentTiming when = PaymentTiming::End);

}  // namespace yieldsolve
