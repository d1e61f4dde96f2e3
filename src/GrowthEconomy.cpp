#include "GrowthEconomy.hpp"

#include <algorithm>
#include <cmath>

#include "Constants.hpp"
#include "Precision.hpp"

namespace {

// expm1() stays exact and finite up to here; beyond it growth^count - 1 is
// built in log space where the "-1" would be dropped by the cutoff anyway.
constexpr double EXPM1_LIMIT = 700.0;

bool isDegenerate(double growth) noexcept {
    double step = growth - 1.0;
    return !(step > 0.0) || !std::isfinite(step);
}

/**
 * @brief a * b, saturating at DecimalFloat::largest() where the product's
 * exponent no longer fits. Prices only ever grow; they must not wrap to zero.
 */
DecimalFloat saturatingMultiply(const DecimalFloat& a, const DecimalFloat& b) noexcept {
    if (!a.isPositive() || !b.isPositive()) return DecimalFloat::zero();
    if (a.log10() + b.log10() >= Config::MAX_EXPONENT) [[unlikely]] return DecimalFloat::largest();
    return a.multiply(b);
}

// base * 10^logFactor with the same saturation.
DecimalFloat saturatingScalePow10(const DecimalFloat& base, double logFactor) noexcept {
    if (!base.isPositive()) return DecimalFloat::zero();
    const double logTotal = base.log10() + logFactor;
    if (logTotal >= Config::MAX_EXPONENT) [[unlikely]] return DecimalFloat::largest();
    if (std::abs(logFactor) >= Config::MAX_EXPONENT) [[unlikely]] return DecimalFloat::pow10(logTotal);
    return base.multiply(DecimalFloat::pow10(logFactor));
}

}

namespace Growth {

DecimalFloat priceAtOwnedCount(const DecimalFloat& baseCost, double growth, int64_t owned) noexcept {
    owned = std::max<int64_t>(owned, 0);
    return saturatingScalePow10(baseCost, static_cast<double>(owned) * std::log10(growth));
}

DecimalFloat totalCostForRun(const DecimalFloat& baseCost, double growth,
                             int64_t owned, int64_t count) noexcept {
    if (count <= 0) return DecimalFloat::zero();

    DecimalFloat first = priceAtOwnedCount(baseCost, growth, owned);
    // A run of one is exactly the next price; the series form rounds.
    if (count == 1) return first;
    if (isDegenerate(growth)) [[unlikely]] {
        return saturatingMultiply(first, DecimalFloat::fromNumber(static_cast<double>(count)));
    }

    const double naturalExp = static_cast<double>(count) * std::log1p(growth - 1.0);
    if (naturalExp < EXPM1_LIMIT) {
        DecimalFloat series = DecimalFloat::fromNumber(std::expm1(naturalExp)).scale(1.0 / (growth - 1.0));
        return saturatingMultiply(first, series);
    }
    // growth^count is past 10^300 here, so the "-1" is far below the cutoff.
    return saturatingScalePow10(first, static_cast<double>(count) * std::log10(growth) - std::log10(growth - 1.0));
}

int64_t maxAffordableRun(const DecimalFloat& budget, const DecimalFloat& baseCost,
                         double growth, int64_t owned) noexcept {
    DecimalFloat first = priceAtOwnedCount(baseCost, growth, owned);
    if (!first.isPositive() || budget.compare(first) < 0) return 0;
    if (isDegenerate(growth)) return 0;

    const double logGrowth = std::log10(growth);
    // log10(budget * (growth - 1) / first)
    const double logRatio = budget.log10() + std::log10(growth - 1.0) - first.log10();

    double estimate;
    if (logRatio < Config::LINEAR_RATIO_LOG_LIMIT) {
        estimate = std::log1p(std::pow(10.0, logRatio)) / std::log1p(growth - 1.0);
    } else {
        // ratio >= 1e6: the "+1" is below the precision of the ratio.
        estimate = logRatio / logGrowth;
    }

    int64_t count = Precision::floorWithSlack(estimate, Config::MAX_AFFORDABLE_RUN);

    // The estimate is within a unit of the answer; settle it against real costs.
    for (int step = 0; step < Config::AFFORDABILITY_REFINE_STEPS && count > 0; ++step) {
        if (totalCostForRun(baseCost, growth, owned, count).compare(budget) <= 0) break;
        --count;
    }
    for (int step = 0; step < Config::AFFORDABILITY_REFINE_STEPS && count < Config::MAX_AFFORDABLE_RUN; ++step) {
        if (totalCostForRun(baseCost, growth, owned, count + 1).compare(budget) > 0) break;
        ++count;
    }
    return count;
}

// ============================================================================
// INCOME
// ============================================================================

double milestoneProfitMultiplier(int64_t owned) noexcept {
    double multiplier = 1.0;
    for (const auto& milestone : Config::MILESTONES) {
        if (owned >= milestone.threshold) multiplier *= milestone.profit;
    }
    return multiplier;
}

double milestoneCycleMultiplier(int64_t owned) noexcept {
    double multiplier = 1.0;
    for (const auto& milestone : Config::MILESTONES) {
        if (owned >= milestone.threshold) multiplier *= milestone.cycle;
    }
    return multiplier;
}

double cycleSeconds(double baseCycle, int64_t owned) noexcept {
    double cycle = baseCycle * milestoneCycleMultiplier(owned);
    if (!std::isfinite(cycle)) [[unlikely]] return Config::MAX_CYCLE_SECONDS;
    return std::clamp(cycle, Config::MIN_CYCLE_SECONDS, Config::MAX_CYCLE_SECONDS);
}

DecimalFloat payoutPerCycle(double baseProfit, int64_t owned, double profitMultiplier) noexcept {
    if (owned <= 0) return DecimalFloat::zero();
    return DecimalFloat::fromNumber(baseProfit)
        .scale(static_cast<double>(owned))
        .scale(milestoneProfitMultiplier(owned))
        .scale(profitMultiplier);
}

DecimalFloat incomePerSecond(double baseProfit, double baseCycle, int64_t owned,
                             double profitMultiplier) noexcept {
    return payoutPerCycle(baseProfit, owned, profitMultiplier).scale(1.0 / cycleSeconds(baseCycle, owned));
}

// ============================================================================
// PRESTIGE
// ============================================================================

int64_t influenceGain(const DecimalFloat& lifetime) noexcept {
    const double logLifetime = lifetime.log10();
    if (!std::isfinite(logLifetime) || logLifetime <= Config::INFLUENCE_LOG_THRESHOLD) return 0;

    const double excess = logLifetime - Config::INFLUENCE_LOG_THRESHOLD;
    const double gain = std::floor(excess * excess);
    if (gain >= static_cast<double>(Config::MAX_INFLUENCE_GAIN)) return Config::MAX_INFLUENCE_GAIN;
    return static_cast<int64_t>(gain);
}

double influenceProfitMultiplier(int64_t influence) noexcept {
    return 1.0 + static_cast<double>(std::max<int64_t>(influence, 0)) * Config::INFLUENCE_PROFIT_BONUS;
}

// ============================================================================
// OFFLINE PROGRESS
// ============================================================================

DecimalFloat offlineGain(const DecimalFloat& incomePerSecond, double elapsedSeconds) noexcept {
    if (!std::isfinite(elapsedSeconds) || elapsedSeconds < Config::OFFLINE_MIN_SECONDS) return DecimalFloat::zero();
    return incomePerSecond.scale(std::min(elapsedSeconds, Config::OFFLINE_CAP_SECONDS));
}

}
