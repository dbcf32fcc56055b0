// SPDX-License-Identifier: MIT
#include "yieldsolve/cashflow/residual.hpp"
#include <cmath>
#include <limits>

namespace yieldsolve {

namespace {

/// True when (1+rate)^t is defined for every offset of the series
///
/// A zero or non-finite base is never usable. A negative base is usable only
/// when every offset is a whole number, which holds for periodic series and
/// for dated series whose dates fall whole years apart.
bool discount_base_defined(double base, const CashflowSeries& series) noexcept {
    if (base == 0.0 || !std::isfinite(base)) {
        return false;
    }
    if (base > 0.0) {
        return true;
    }
    for (const CashFlow& cf : series) {
        if (cf.time_offset != std::trunc(cf.time_offset)) {
            return false;
        }
    }
    return true;
}

}  // namespace

NpvResidual evaluate_residual(double rate, const CashflowSeries& series) noexcept {
    const double base = 1.0 + rate;

    if (!discount_base_defined(base, series)) {
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();
        return NpvResidual{.value = nan, .derivative = nan};
    }

    double value = 0.0;
    double derivative = 0.0;
    for (const CashFlow& cf : series) {
        const double discount = std::pow(base, cf.time_offset);
        value += cf.amount / discount;
        derivative -= cf.time_offset * cf.amount / (discount * base);
    }
    return NpvResidual{.value = value, .derivative = derivative};
}

double npv_at(double rate, const CashflowSeries& series) noexcept {
    const double base = 1.0 + rate;
    if (!discount_base_defined(base, series)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double value = 0.0;
    for (const CashFlow& cf : series) {
        value += cf.amount / std::pow(base, cf.time_offset);
    }
    return value;
}

}  // namespace yieldsolve
