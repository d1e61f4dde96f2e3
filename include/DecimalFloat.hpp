#pragma once

#include <compare>
#include <cstdint>

/**
 * @brief Extended-Range Currency Value
 * @details value = mantissa * 10^exponent, with the mantissa kept in [1, 10)
 * or exactly 0. A plain double overflows near 1.8e308; incremental-growth
 * balances pass that within a few hours of play, so the exponent is carried
 * separately as a 64-bit integer.
 *
 * INVARIANTS (hold for every instance, by construction):
 * 1. Canonical zero is (0, 0). No other zero exists.
 * 2. Non-zero values satisfy 1 <= |mantissa| < 10.
 * 3. NaN/Inf never survive construction; they become canonical zero.
 *
 * Instances are immutable. Every operation returns a new value and none of
 * them throws: the ledger calls these from inside its update loop, where a
 * zero result is always preferable to a fault.
 */
class DecimalFloat {
public:
    constexpr DecimalFloat() noexcept = default;

    // --- Factories (the only ways in; all of them normalize) ---

    static constexpr DecimalFloat zero() noexcept { return {}; }
    static constexpr DecimalFloat one() noexcept { return {1.0, 0}; }

    /**
     * @brief Largest representable value: just under 10 * 10^Config::MAX_EXPONENT.
     * @details Used by callers that must saturate rather than fall back to zero.
     */
    static DecimalFloat largest() noexcept;

    /**
     * @brief Converts a plain number. Non-finite or non-positive input is zero.
     */
    static DecimalFloat fromNumber(double value) noexcept;

    /**
     * @brief The Normalizer
     * @details Rewrites any (mantissa, exponent) candidate into canonical form.
     * The exponent is truncated to an integer. A zero or non-finite mantissa,
     * a non-finite exponent, or an exponent beyond Config::MAX_EXPONENT all
     * yield canonical zero. The sign of the mantissa is preserved here; the
     * arithmetic below treats non-positive values as zero.
     */
    static DecimalFloat normalize(double mantissa, double exponent) noexcept;

    /**
     * @brief 10^exponent for a real (fractional) exponent.
     * @details Splits the exponent into floor(x) and frac(x) so only 10^frac,
     * which lies in [1, 10), is ever computed in double precision.
     */
    static DecimalFloat pow10(double exponent) noexcept;

    // --- Accessors ---

    double mantissa() const noexcept { return mantissa_; }
    int64_t exponent() const noexcept { return exponent_; }

    bool isZero() const noexcept { return mantissa_ == 0.0; }
    bool isPositive() const noexcept { return mantissa_ > 0.0; }

    // --- Arithmetic Core ---

    /**
     * @return -1, 0 or 1. Negative values compare as zero.
     */
    int compare(const DecimalFloat& other) const noexcept;

    DecimalFloat add(const DecimalFloat& other) const noexcept;

    /**
     * @brief Currency-clamped subtraction: never negative.
     * @details Yields zero whenever compare(*this, other) <= 0.
     */
    DecimalFloat subtract(const DecimalFloat& other) const noexcept;

    DecimalFloat multiply(const DecimalFloat& other) const noexcept;

    /**
     * @brief Division; a zero divisor yields zero instead of faulting.
     */
    DecimalFloat divide(const DecimalFloat& other) const noexcept;

    // Multiply by a plain scalar. Zero, negative or non-finite scalars yield zero.
    DecimalFloat scale(double scalar) const noexcept;

    /**
     * @return log10(mantissa) + exponent, or -infinity for zero.
     */
    double log10() const noexcept;

    // Plain double value; overflows to +infinity past ~1.8e308.
    double toNumber() const noexcept;

    // --- Operators ---

    DecimalFloat operator+(const DecimalFloat& rhs) const noexcept { return add(rhs); }
    DecimalFloat operator-(const DecimalFloat& rhs) const noexcept { return subtract(rhs); }
    DecimalFloat operator*(const DecimalFloat& rhs) const noexcept { return multiply(rhs); }
    DecimalFloat operator/(const DecimalFloat& rhs) const noexcept { return divide(rhs); }

    bool operator==(const DecimalFloat& rhs) const noexcept { return compare(rhs) == 0; }

    std::weak_ordering operator<=>(const DecimalFloat& rhs) const noexcept {
        int c = compare(rhs);
        if (c < 0) return std::weak_ordering::less;
        if (c > 0) return std::weak_ordering::greater;
        return std::weak_ordering::equivalent;
    }

private:
    constexpr DecimalFloat(double m, int64_t e) noexcept : mantissa_(m), exponent_(e) {}

    double mantissa_ = 0.0;
    int64_t exponent_ = 0;
};
