#pragma once
/*
===============================================================================
Core: Numeric Guards + Rounding
File: cpp/engine/core/numeric.hpp
===============================================================================
*/

#include "engine/core/error.hpp"

#include <cmath>
#include <string>

namespace skid {

// -----------------------------
// Finite checks
// -----------------------------
inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

// -----------------------------
// Rounding
// -----------------------------
// Round to nearest integer, exact .5 ties go to the even neighbour.
// Independent of the floating-point environment's rounding mode.
inline double round_half_even(double x) noexcept {
    if (!is_finite(x)) return x;
    const double r = std::round(x);  // ties away from zero
    if (std::fabs(x - std::trunc(x)) == 0.5) {
        // r is odd on a tie exactly when r/2 is not integral
        if (std::fmod(r, 2.0) != 0.0) return r - std::copysign(1.0, x);
    }
    return r;
}

// Round the stored binary value of x to `digits` decimals (digits >= 0) with
// the same tie policy. x * scale is itself rounded, so a product that lands
// exactly on .5 is only a tie when the multiplication was exact; otherwise the
// residual fma(x, scale, -y) says which side the true value lies on
// (0.35 is stored below 0.35 and rounds to 0.3).
inline double round_half_even(double x, int digits) noexcept {
    if (!is_finite(x)) return x;
    const double scale = std::pow(10.0, digits);
    const double y = x * scale;
    if (!is_finite(y)) return x;

    double r = round_half_even(y);
    if (std::fabs(y - std::trunc(y)) == 0.5) {
        const double residual = std::fma(x, scale, -y);
        if (residual > 0.0) r = std::floor(y) + 1.0;
        else if (residual < 0.0) r = std::floor(y);
    }
    return r / scale;
}

// -----------------------------
// Require wrappers
// -----------------------------
inline void require_finite(double x, ErrorCode code, const std::string& what) {
    SKID_ENSURE(is_finite(x), code, what + " must be finite");
}

inline void require_positive(double x, ErrorCode code, const std::string& what) {
    SKID_ENSURE(is_finite(x) && x > 0.0, code, what + " must be > 0");
}

inline void require_nonnegative(double x, ErrorCode code, const std::string& what) {
    SKID_ENSURE(is_finite(x) && x >= 0.0, code, what + " must be >= 0");
}

// Efficiency/loss factors live in (0,1].
inline void require_fraction(double x, ErrorCode code, const std::string& what) {
    SKID_ENSURE(is_finite(x) && x > 0.0 && x <= 1.0, code, what + " must be in (0,1]");
}

}  // namespace skid
