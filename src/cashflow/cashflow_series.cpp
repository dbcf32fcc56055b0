// SPDX-License-Identifier: MIT
#include "yieldsolve/cashflow/cashflow_series.hpp"
#include "yieldsolve/support/yieldsolve_trace.h"
#include <algorithm>

namespace yieldsolve {

namespace {

std::expected<void, ValidationError>
validate_shape(size_t n_amounts, std::optional<size_t> n_dates, int module_id) {
    if (n_amounts == 0) {
        YIELDSOLVE_TRACE_VALIDATION_ERROR(module_id,
            static_cast<int>(ValidationErrorCode::EmptyCashflows), 0.0, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::EmptyCashflows));
    }
    if (n_dates.has_value() && *n_dates != n_amounts) {
        YIELDSOLVE_TRACE_VALIDATION_ERROR(module_id,
            static_cast<int>(ValidationErrorCode::LengthMismatch),
            static_cast<double>(n_amounts), *n_dates);
        return std::unexpected(ValidationError(
            ValidationErrorCode::LengthMismatch,
            static_cast<double>(*n_dates),
            n_amounts));
    }
    return {};
}

}  // namespace

std::expected<CashflowSeries, ValidationError>
CashflowSeries::periodic(std::span<const double> amounts) {
    if (auto ok = validate_shape(amounts.size(), std::nullopt, MODULE_IRR); !ok) {
        return std::unexpected(ok.error());
    }

    std::vector<CashFlow> flows;
    flows.reserve(amounts.size());
    for (size_t i = 0; i < amounts.size(); ++i) {
        flows.push_back(CashFlow{.amount = amounts[i],
                                 .time_offset = static_cast<double>(i)});
    }
    return CashflowSeries(std::move(flows), std::nullopt);
}

std::expected<CashflowSeries, ValidationError>
CashflowSeries::dated(std::span<const double> amounts, std::span<const Date> dates) {
    if (auto ok = validate_shape(amounts.size(), dates.size(), MODULE_XIRR); !ok) {
        return std::unexpected(ok.error());
    }

    // Reference date is the earliest date, wherever it sits in the input
    const Date reference = *std::min_element(dates.begin(), dates.end());

    std::vector<CashFlow> flows;
    flows.reserve(amounts.size());
    for (size_t i = 0; i < amounts.size(); ++i) {
        flows.push_back(CashFlow{.amount = amounts[i],
                                 .time_offset = year_fraction_act365(reference, dates[i])});
    }
    return CashflowSeries(std::move(flows), reference);
}

std::expected<CashflowSeries, ValidationError>
CashflowSeries::dated(std::span<const double> amounts, std::span<const std::string> dates) {
    if (auto ok = validate_shape(amounts.size(), dates.size(), MODULE_XIRR); !ok) {
        return std::unexpected(ok.error());
    }

    std::vector<Date> parsed;
    parsed.reserve(dates.size());
    for (size_t i = 0; i < dates.size(); ++i) {
        auto date = parse_iso_date(dates[i]);
        if (!date) {
            YIELDSOLVE_TRACE_VALIDATION_ERROR(MODULE_XIRR,
                static_cast<int>(ValidationErrorCode::InvalidDate), 0.0, i);
            return std::unexpected(ValidationError(ValidationErrorCode::InvalidDate, 0.0, i));
        }
        parsed.push_back(*date);
    }
    return dated(amounts, std::span<const Date>(parsed));
}

}  // namespace yieldsolve
