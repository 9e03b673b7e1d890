// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>

namespace hedgelab {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidSpotPrice,
    InvalidStrike,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidTransactionCost,
    InvalidStepCount,
    InvalidOptionType,
    InvalidActionMode,
    InvalidAction,
    InvalidWindow,
    InvalidWeight,
    InvalidState,
    InvalidEpisodeCount
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for array errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Human-readable name of a validation error code
inline const char* to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidSpotPrice:       return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidStrike:          return "InvalidStrike";
        case ValidationErrorCode::InvalidMaturity:        return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility:      return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate:            return "InvalidRate";
        case ValidationErrorCode::InvalidTransactionCost: return "InvalidTransactionCost";
        case ValidationErrorCode::InvalidStepCount:       return "InvalidStepCount";
        case ValidationErrorCode::InvalidOptionType:      return "InvalidOptionType";
        case ValidationErrorCode::InvalidActionMode:      return "InvalidActionMode";
        case ValidationErrorCode::InvalidAction:          return "InvalidAction";
        case ValidationErrorCode::InvalidWindow:          return "InvalidWindow";
        case ValidationErrorCode::InvalidWeight:          return "InvalidWeight";
        case ValidationErrorCode::InvalidState:           return "InvalidState";
        case ValidationErrorCode::InvalidEpisodeCount:    return "InvalidEpisodeCount";
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

}  // namespace hedgelab
