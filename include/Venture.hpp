#pragma once

#include <cstdint>

#include "Constants.hpp"
#include "DecimalFloat.hpp"
#include "Types.hpp"

/**
 * @brief One purchasable line of business and how many units are held.
 * @details The template (base cost, growth, profit, cycle) is immutable
 * catalogue data. The mutable state is the owned count, which never decreases
 * except through restore() when a save is loaded, and whether a manager has
 * been hired. Only managed ventures produce income.
 */
class Venture {
public:
    explicit Venture(const Config::VentureTemplate& tmpl);

    // Fixed run lengths for X1/X10/X100; the affordable maximum for MAX.
    [[nodiscard]] int64_t runLength(BuyMode mode, const DecimalFloat& balance) const noexcept;

    [[nodiscard]] PurchaseQuote quote(BuyMode mode, const DecimalFloat& balance) const noexcept;

    [[nodiscard]] DecimalFloat nextPrice() const noexcept;

    void commit(int64_t count) noexcept;
    void restore(int64_t owned, bool managed = false) noexcept;

    // --- Income ---

    // baseCost * (250 + 220 * tier); independent of the owned count.
    [[nodiscard]] DecimalFloat managerCost() const noexcept;
    void hireManager() noexcept { managed_ = true; }
    bool managed() const noexcept { return managed_; }

    double cycleSeconds() const noexcept;
    [[nodiscard]] DecimalFloat payoutPerCycle(double profitMultiplier) const noexcept;

    /**
     * @brief Payout per second while a manager runs the cycles; zero otherwise.
     */
    [[nodiscard]] DecimalFloat incomePerSecond(double profitMultiplier) const noexcept;

    int64_t owned() const noexcept { return owned_; }
    const Config::VentureTemplate& info() const noexcept { return tmpl_; }

    VentureSnapshot snapshot() const noexcept;

private:
    const Config::VentureTemplate& tmpl_;
    DecimalFloat baseCost_;
    int64_t owned_ = 0;
    bool managed_ = false;
};
