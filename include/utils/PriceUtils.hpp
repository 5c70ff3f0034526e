#pragma once

#include <cfloat>
#include <cmath>

namespace avail {
    /// Half-up rounding to 2 decimals, nudged by DBL_EPSILON.
    inline double roundToCents(double value) noexcept {
        return std::round((value + DBL_EPSILON) * 100.0) / 100.0;
    }
} // namespace avail
