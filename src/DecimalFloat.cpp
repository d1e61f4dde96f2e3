#include "DecimalFloat.hpp"

#include <cmath>
#include <limits>

#include "Constants.hpp"

namespace {

/**
 * @brief mantissa / 10^shift without overflowing the divisor.
 * @details 10^-320 is already subnormal and 10^-324 is zero, so subnormal
 * mantissas (|shift| > 300) are rescaled in two halves.
 */
double dividePow10(double mantissa, int64_t shift) noexcept {
    if (shift > 300 || shift < -300) {
        int64_t half = shift / 2;
        mantissa /= std::pow(10.0, static_cast<double>(half));
        return mantissa / std::pow(10.0, static_cast<double>(shift - half));
    }
    return mantissa / std::pow(10.0, static_cast<double>(shift));
}

}

DecimalFloat DecimalFloat::fromNumber(double value) noexcept {
    if (!std::isfinite(value) || value <= 0.0) return zero();
    return normalize(value, 0.0);
}

DecimalFloat DecimalFloat::largest() noexcept {
    return {std::nextafter(10.0, 0.0), static_cast<int64_t>(Config::MAX_EXPONENT)};
}

DecimalFloat DecimalFloat::normalize(double mantissa, double exponent) noexcept {
    if (mantissa == 0.0 || !std::isfinite(mantissa) || !std::isfinite(exponent)) [[unlikely]] {
        return zero();
    }

    double truncated = std::trunc(exponent);
    if (std::abs(truncated) > Config::MAX_EXPONENT) [[unlikely]] return zero();

    int64_t e = static_cast<int64_t>(truncated);
    const double sign = mantissa < 0.0 ? -1.0 : 1.0;
    double m = std::abs(mantissa);

    // Coarse shift: one division puts m within a rounding error of [1, 10).
    int64_t shift = static_cast<int64_t>(std::floor(std::log10(m)));
    if (shift != 0) {
        m = dividePow10(m, shift);
        e += shift;
    }

    // Fix-up: absorb drift such as 9.9999999997 or 10.0000000003.
    while (m >= 10.0) { m /= 10.0; ++e; }
    while (m < 1.0) { m *= 10.0; --e; }

    if (!std::isfinite(m) || std::abs(static_cast<double>(e)) > Config::MAX_EXPONENT) [[unlikely]] {
        return zero();
    }
    return {sign * m, e};
}

DecimalFloat DecimalFloat::pow10(double exponent) noexcept {
    if (!std::isfinite(exponent) || exponent < Config::MIN_POW10_EXPONENT) return zero();

    double whole = std::floor(exponent);
    double frac = exponent - whole;   // [0, 1)
    return normalize(std::pow(10.0, frac), whole);
}

int DecimalFloat::compare(const DecimalFloat& other) const noexcept {
    const bool lhsZero = !isPositive();
    const bool rhsZero = !other.isPositive();
    if (lhsZero && rhsZero) return 0;
    if (lhsZero) return -1;
    if (rhsZero) return 1;

    if (exponent_ != other.exponent_) return exponent_ < other.exponent_ ? -1 : 1;
    if (mantissa_ == other.mantissa_) return 0;
    return mantissa_ < other.mantissa_ ? -1 : 1;
}

DecimalFloat DecimalFloat::add(const DecimalFloat& other) const noexcept {
    if (!isPositive()) return other.isPositive() ? other : zero();
    if (!other.isPositive()) return *this;

    const DecimalFloat& hi = exponent_ >= other.exponent_ ? *this : other;
    const DecimalFloat& lo = exponent_ >= other.exponent_ ? other : *this;

    int64_t gap = hi.exponent_ - lo.exponent_;
    if (gap > Config::PRECISION_CUTOFF_EXPONENT) return hi;

    double m = hi.mantissa_ + lo.mantissa_ / std::pow(10.0, static_cast<double>(gap));
    return normalize(m, static_cast<double>(hi.exponent_));
}

DecimalFloat DecimalFloat::subtract(const DecimalFloat& other) const noexcept {
    if (compare(other) <= 0) return zero();
    if (!other.isPositive()) return *this;

    // compare() > 0 guarantees exponent_ >= other.exponent_.
    int64_t gap = exponent_ - other.exponent_;
    if (gap > Config::PRECISION_CUTOFF_EXPONENT) return *this;

    double m = mantissa_ - other.mantissa_ / std::pow(10.0, static_cast<double>(gap));
    DecimalFloat result = normalize(m, static_cast<double>(exponent_));
    return result.isPositive() ? result : zero();
}

DecimalFloat DecimalFloat::multiply(const DecimalFloat& other) const noexcept {
    if (!isPositive() || !other.isPositive()) return zero();
    return normalize(mantissa_ * other.mantissa_,
                     static_cast<double>(exponent_) + static_cast<double>(other.exponent_));
}

DecimalFloat DecimalFloat::divide(const DecimalFloat& other) const noexcept {
    if (!isPositive() || !other.isPositive()) return zero();
    return normalize(mantissa_ / other.mantissa_,
                     static_cast<double>(exponent_) - static_cast<double>(other.exponent_));
}

DecimalFloat DecimalFloat::scale(double scalar) const noexcept {
    if (!isPositive() || !std::isfinite(scalar) || scalar <= 0.0) return zero();
    return normalize(mantissa_ * scalar, static_cast<double>(exponent_));
}

double DecimalFloat::log10() const noexcept {
    if (!isPositive()) return -std::numeric_limits<double>::infinity();
    return std::log10(mantissa_) + static_cast<double>(exponent_);
}

double DecimalFloat::toNumber() const noexcept {
    if (isZero()) return 0.0;
    return mantissa_ * std::pow(10.0, static_cast<double>(exponent_));
}
