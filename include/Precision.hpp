#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

#include "DecimalFloat.hpp"

/**
 * @namespace Precision
 * @brief Floating Point Safety for Log-Space Economics
 * @details Standard '==' is dangerous for doubles that went through log10/pow
 * round trips. These helpers compare by relative error and floor log-space
 * estimates without losing a whole unit to a rounding error in the last bit.
 */
namespace Precision {
    /**
     * @brief Default relative tolerance.
     * @details A double carries ~15.9 significant digits. One log10/pow10 round
     * trip costs a few ulps, so 1e-9 leaves six orders of magnitude of headroom
     * while still catching any real pricing error.
     */
    inline constexpr double EPSILON = 1e-9;

    /**
     * @brief Slack added before flooring an analytic run length.
     * @details log(1.331) / log(1.1) evaluates to 2.9999999999999996; without the
     * slack floor() would return 2. Over-estimates are corrected afterwards by
     * checking the actual cost.
     */
    inline constexpr double LOG_EPSILON = 1e-9;

    inline bool isClose(double a, double b, double relTol = EPSILON) noexcept {
        if (a == b) return true;
        double scale = std::max(std::abs(a), std::abs(b));
        return std::abs(a - b) <= relTol * scale;
    }

    /**
     * @brief Relative comparison in decimal-float space.
     * @details Works for magnitudes far outside double range: the ratio a / b is
     * computed as a DecimalFloat, so only a value near 1 is ever materialized.
     */
    inline bool isClose(const DecimalFloat& a, const DecimalFloat& b, double relTol = EPSILON) noexcept {
        if (!a.isPositive() || !b.isPositive()) return a.isPositive() == b.isPositive();
        double ratio = a.divide(b).toNumber();
        return std::abs(ratio - 1.0) <= relTol;
    }

    /**
     * @brief floor(value + LOG_EPSILON), clamped into [0, limit].
     * @details NaN and values beyond the limit are handled before the cast so the
     * conversion to an integer is always defined.
     */
    inline int64_t floorWithSlack(double value, int64_t limit) noexcept {
        if (std::isnan(value) || value <= 0.0) return 0;
        double floored = std::floor(value + LOG_EPSILON);
        if (!(floored < static_cast<double>(limit))) return limit;
        return static_cast<int64_t>(floored);
    }
}
