// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>

namespace yieldsolve {

/// Error codes for input validation failures
enum class ValidationErrorCode {
    EmptyCashflows,         ///< No cash flows supplied
    LengthMismatch,         ///< Amounts and dates differ in length
    InvalidDate,            ///< Date string is not a valid YYYY-MM-DD calendar date
    InvalidPeriod,          ///< Payment period below 1
    InvalidTerm,            ///< Number of periods must be at least 1
    InsufficientCashflows,  ///< Fewer flows than the formula needs
    MissingSignChange       ///< Formula requires both inflows and outflows
};

/// Detailed validation error for malformed input
///
/// Validation errors are the only hard failures in the library. Numeric
/// pathologies (zero derivative, non-convergence) are reported through the
/// result's converged flag instead.
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided (e.g. a length)
    size_t index;  // Optional index for array errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Short human-readable name of a validation error code
inline std::string_view to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::EmptyCashflows: return "EmptyCashflows";
        case ValidationErrorCode::LengthMismatch: return "LengthMismatch";
        case ValidationErrorCode::InvalidDate: return "InvalidDate";
        case ValidationErrorCode::InvalidPeriod: return "InvalidPeriod";
        case ValidationErrorCode::InvalidTerm: return "InvalidTerm";
        case ValidationErrorCode::InsufficientCashflows: return "InsufficientCashflows";
        case ValidationErrorCode::MissingSignChange: return "MissingSignChange";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

}  // namespace yieldsolve
