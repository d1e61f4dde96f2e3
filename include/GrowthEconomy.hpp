#pragma once

#include <cstdint>

#include "DecimalFloat.hpp"

/**
 * @namespace Growth
 * @brief Geometric-Growth Pricing
 * @details Unit n of an entity costs baseCost * growth^n. Every function here is
 * pure, works in log space so `owned` may grow into the thousands without a
 * double overflow, and never throws. A price whose exponent would pass
 * Config::MAX_EXPONENT saturates at DecimalFloat::largest(); it never wraps to zero.
 */
namespace Growth {

    /**
     * @brief Price of the next unit when `owned` units are already held.
     * @details baseCost * 10^(owned * log10(growth)). Negative `owned` counts as 0.
     */
    DecimalFloat priceAtOwnedCount(const DecimalFloat& baseCost, double growth, int64_t owned) noexcept;

    /**
     * @brief Cost of buying `count` contiguous units starting at `owned`.
     * @details Closed-form geometric series c0 * (growth^count - 1) / (growth - 1).
     * count <= 0 yields zero. A degenerate growth (<= 1 or non-finite) falls back
     * to the linear c0 * count.
     */
    DecimalFloat totalCostForRun(const DecimalFloat& baseCost, double growth,
                                 int64_t owned, int64_t count) noexcept;

    /**
     * @brief Largest run length whose total cost fits in `budget`.
     * @details Solves count <= log_growth(1 + budget * (growth - 1) / c0) in log
     * space, then checks the estimate against totalCostForRun() so that
     *   totalCostForRun(count) <= budget < totalCostForRun(count + 1)
     * holds under DecimalFloat::compare. Returns 0 when the first unit is
     * unaffordable or growth is degenerate; never exceeds Config::MAX_AFFORDABLE_RUN.
     */
    int64_t maxAffordableRun(const DecimalFloat& budget, const DecimalFloat& baseCost,
                             double growth, int64_t owned) noexcept;

    // --- Income ---

    /**
     * @brief Product of the profit (or cycle) factors of every milestone that
     * `owned` has reached. 1 below the first milestone.
     */
    double milestoneProfitMultiplier(int64_t owned) noexcept;
    double milestoneCycleMultiplier(int64_t owned) noexcept;

    /**
     * @brief Seconds per payout: baseCycle * milestone factor, clamped to
     * [Config::MIN_CYCLE_SECONDS, Config::MAX_CYCLE_SECONDS].
     */
    double cycleSeconds(double baseCycle, int64_t owned) noexcept;

    /**
     * @brief baseProfit * owned * milestone factor * profitMultiplier.
     * @details Built in DecimalFloat, so counts past 1e300 units still pay.
     * Zero when nothing is owned.
     */
    DecimalFloat payoutPerCycle(double baseProfit, int64_t owned, double profitMultiplier) noexcept;

    DecimalFloat incomePerSecond(double baseProfit, double baseCycle, int64_t owned,
                                 double profitMultiplier) noexcept;

    // --- Prestige ---

    /**
     * @brief Influence awarded for resetting with `lifetime` earned:
     * floor((log10(lifetime) - 6)^2), 0 up to a lifetime of 1e6, capped at
     * Config::MAX_INFLUENCE_GAIN.
     */
    int64_t influenceGain(const DecimalFloat& lifetime) noexcept;

    // 1 + 5% per point of influence held. Negative influence counts as none.
    double influenceProfitMultiplier(int64_t influence) noexcept;

    // --- Offline Progress ---

    /**
     * @brief income * elapsed, with elapsed capped at Config::OFFLINE_CAP_SECONDS.
     * @details Gaps shorter than Config::OFFLINE_MIN_SECONDS, negative gaps
     * (clock skew) and non-finite gaps earn nothing.
     */
    DecimalFloat offlineGain(const DecimalFloat& incomePerSecond, double elapsedSeconds) noexcept;
}
