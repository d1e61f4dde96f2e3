#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "Constants.hpp"
#include "DecimalFloat.hpp"
#include "GrowthEconomy.hpp"
#include "Precision.hpp"

/**
 * @brief Geometric pricing: unit price, run cost and affordability.
 */
class GrowthEconomySuite : public ::testing::Test {
protected:
    static DecimalFloat num(double v) { return DecimalFloat::fromNumber(v); }

    const DecimalFloat ten = num(10.0);
};

// --- SECTION 1: Unit Price ---

TEST_F(GrowthEconomySuite, FirstUnitCostsBase) {
    auto price = Growth::priceAtOwnedCount(ten, 1.1, 0);
    EXPECT_DOUBLE_EQ(price.mantissa(), 1.0);
    EXPECT_EQ(price.exponent(), 1);
}

TEST_F(GrowthEconomySuite, PriceGrowsGeometrically) {
    auto price = Growth::priceAtOwnedCount(ten, 1.1, 2);
    EXPECT_NEAR(price.toNumber(), 12.1, 1e-9);
}

TEST_F(GrowthEconomySuite, NegativeOwnedCountsAsZero) {
    auto price = Growth::priceAtOwnedCount(ten, 1.1, -5);
    EXPECT_EQ(price.compare(ten), 0);
}

TEST_F(GrowthEconomySuite, LargeOwnedCountsStayFinite) {
    auto price = Growth::priceAtOwnedCount(num(1.0), 1.15, 10000);
    EXPECT_EQ(price.exponent(), 606);
    EXPECT_GE(price.mantissa(), 1.0);
    EXPECT_LT(price.mantissa(), 10.0);

    auto far = Growth::priceAtOwnedCount(num(1.0), 1.15, 5'000'000);
    EXPECT_TRUE(far.isPositive());
    EXPECT_NEAR(far.log10(), 5'000'000 * std::log10(1.15), 1e-3);
}

TEST_F(GrowthEconomySuite, OverflowingPriceSaturates) {
    auto price = Growth::priceAtOwnedCount(num(1.0), 1e300, 100'000'000'000'000);
    EXPECT_TRUE(price.isPositive());
    EXPECT_EQ(price.compare(DecimalFloat::largest()), 0);
}

// --- SECTION 2: Run Cost ---

TEST_F(GrowthEconomySuite, ThreeUnitRunCost) {
    auto total = Growth::totalCostForRun(ten, 1.1, 0, 3);
    EXPECT_NEAR(total.toNumber(), 33.1, 1e-9);
}

TEST_F(GrowthEconomySuite, SingleUnitRunIsNextPrice) {
    for (int64_t owned : {0, 1, 17, 900}) {
        auto price = Growth::priceAtOwnedCount(ten, 1.155, owned);
        auto run = Growth::totalCostForRun(ten, 1.155, owned, 1);
        EXPECT_EQ(run.compare(price), 0) << "owned=" << owned;
    }
}

TEST_F(GrowthEconomySuite, EmptyRunCostsNothing) {
    EXPECT_TRUE(Growth::totalCostForRun(ten, 1.1, 0, 0).isZero());
    EXPECT_TRUE(Growth::totalCostForRun(ten, 1.1, 4, -3).isZero());
}

TEST_F(GrowthEconomySuite, DegenerateGrowthPricesLinearly) {
    auto flat = Growth::totalCostForRun(ten, 1.0, 0, 5);
    EXPECT_NEAR(flat.toNumber(), 50.0, 1e-9);

    auto shrinking = Growth::totalCostForRun(ten, 0.5, 0, 5);
    EXPECT_NEAR(shrinking.toNumber(), 50.0, 1e-9);
}

TEST_F(GrowthEconomySuite, LongRunsLeaveDoubleRange) {
    // 1.15^10000 overflows a double; the run cost must not.
    auto total = Growth::totalCostForRun(num(1.0), 1.15, 0, 10000);
    EXPECT_TRUE(total.isPositive());
    double expected = 10000 * std::log10(1.15) - std::log10(0.15);
    EXPECT_NEAR(total.log10(), expected, 1e-6);
}

TEST_F(GrowthEconomySuite, HugeRunsNeverBecomeFree) {
    auto endless = Growth::totalCostForRun(num(1.0), 1.1, 0, std::numeric_limits<int64_t>::max());
    EXPECT_EQ(endless.compare(DecimalFloat::largest()), 0);

    auto flat = Growth::totalCostForRun(DecimalFloat::pow10(Config::MAX_EXPONENT - 2.0), 1.0, 0, 1'000'000'000);
    EXPECT_EQ(flat.compare(DecimalFloat::largest()), 0);
}

TEST_F(GrowthEconomySuite, RunCostNeverFallsAsCountGrows) {
    DecimalFloat previous = DecimalFloat::zero();
    for (int64_t count : {int64_t{1'000}, int64_t{1'000'000}, int64_t{1'000'000'000'000},
                          int64_t{100'000'000'000'000'000}, int64_t{1'000'000'000'000'000'000},
                          std::numeric_limits<int64_t>::max()}) {
        auto current = Growth::totalCostForRun(num(4.0), 1.1, 0, count);
        EXPECT_TRUE(current.isPositive()) << "count=" << count;
        EXPECT_GE(current.compare(previous), 0) << "count=" << count;
        previous = current;
    }
}

// --- SECTION 3: Affordability ---

TEST_F(GrowthEconomySuite, AffordsThreeWithExactBudget) {
    EXPECT_EQ(Growth::maxAffordableRun(num(33.1), ten, 1.1, 0), 3);
}

TEST_F(GrowthEconomySuite, AffordsNothingBelowFirstPrice) {
    EXPECT_EQ(Growth::maxAffordableRun(num(9.99), ten, 1.1, 0), 0);
    EXPECT_EQ(Growth::maxAffordableRun(DecimalFloat::zero(), ten, 1.1, 0), 0);
}

TEST_F(GrowthEconomySuite, AffordsExactlyOneAtFirstPrice) {
    EXPECT_EQ(Growth::maxAffordableRun(ten, ten, 1.1, 0), 1);
}

TEST_F(GrowthEconomySuite, DegenerateGrowthAffordsNothing) {
    EXPECT_EQ(Growth::maxAffordableRun(num(1e9), ten, 1.0, 0), 0);
    EXPECT_EQ(Growth::maxAffordableRun(num(1e9), ten, 0.9, 0), 0);
}

TEST_F(GrowthEconomySuite, SaturatedPriceIsUnaffordable) {
    EXPECT_EQ(Growth::maxAffordableRun(num(1e300), num(1.0), 1e300, 100'000'000'000'000), 0);
}

TEST_F(GrowthEconomySuite, AstronomicalBudgetIsCapped) {
    auto budget = DecimalFloat::pow10(1e7);
    EXPECT_EQ(Growth::maxAffordableRun(budget, num(1.0), 1.15, 0), Config::MAX_AFFORDABLE_RUN);
}

TEST_F(GrowthEconomySuite, AffordabilityAccountsForOwnedUnits) {
    auto budget = num(1e6);
    int64_t fresh = Growth::maxAffordableRun(budget, ten, 1.15, 0);
    int64_t veteran = Growth::maxAffordableRun(budget, ten, 1.15, 40);
    EXPECT_GT(fresh, veteran);
    EXPECT_GT(veteran, 0);
}
