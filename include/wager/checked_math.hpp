#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"

namespace wager {

// Overflow-checked arithmetic on ledger amounts. Nothing wraps or saturates.
inline Result<Amount> checked_add(Amount a, Amount b) {
    Amount out;
    if (__builtin_add_overflow(a, b, &out)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    return out;
}

inline Result<Amount> checked_sub(Amount a, Amount b) {
    if (b > a) {
        return ErrorCode::ARITHMETIC_UNDERFLOW;
    }
    return a - b;
}

inline Result<Amount> checked_mul(Amount a, Amount b) {
    Amount out;
    if (__builtin_mul_overflow(a, b, &out)) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }
    return out;
}

// amount * bps / 10000, truncating
inline Result<Amount> apply_basis_points(Amount amount, BasisPoints bps) {
    auto scaled = checked_mul(amount, bps);
    if (scaled.has_error()) return scaled;
    return scaled.value() / BASIS_POINTS_DENOM;
}

} // namespace wager
