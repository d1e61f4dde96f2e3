#include "Venture.hpp"

#include <algorithm>

#include "GrowthEconomy.hpp"

Venture::Venture(const Config::VentureTemplate& tmpl)
    : tmpl_(tmpl), baseCost_(DecimalFloat::fromNumber(tmpl.baseCost)) {}

int64_t Venture::runLength(BuyMode mode, const DecimalFloat& balance) const noexcept {
    switch (mode) {
        case BuyMode::X10:  return 10;
        case BuyMode::X100: return 100;
        case BuyMode::MAX:  return Growth::maxAffordableRun(balance, baseCost_, tmpl_.growth, owned_);
        default:            return 1;
    }
}

PurchaseQuote Venture::quote(BuyMode mode, const DecimalFloat& balance) const noexcept {
    PurchaseQuote q;
    q.ventureId = tmpl_.id;
    q.owned = owned_;
    q.count = runLength(mode, balance);
    q.cost = Growth::totalCostForRun(baseCost_, tmpl_.growth, owned_, q.count);
    q.affordable = q.count > 0 && q.cost.compare(balance) <= 0;
    return q;
}

DecimalFloat Venture::nextPrice() const noexcept {
    return Growth::priceAtOwnedCount(baseCost_, tmpl_.growth, owned_);
}

void Venture::commit(int64_t count) noexcept {
    if (count > 0) owned_ += count;
}

void Venture::restore(int64_t owned, bool managed) noexcept {
    owned_ = std::max<int64_t>(owned, 0);
    managed_ = managed;
}

DecimalFloat Venture::managerCost() const noexcept {
    const double tier = static_cast<double>(Config::ventureTier(tmpl_));
    return baseCost_.scale(Config::MANAGER_COST_BASE + tier * Config::MANAGER_COST_PER_TIER);
}

double Venture::cycleSeconds() const noexcept {
    return Growth::cycleSeconds(tmpl_.baseCycle, owned_);
}

DecimalFloat Venture::payoutPerCycle(double profitMultiplier) const noexcept {
    return Growth::payoutPerCycle(tmpl_.baseProfit, owned_, profitMultiplier);
}

DecimalFloat Venture::incomePerSecond(double profitMultiplier) const noexcept {
    if (!managed_) return DecimalFloat::zero();
    return Growth::incomePerSecond(tmpl_.baseProfit, tmpl_.baseCycle, owned_, profitMultiplier);
}

VentureSnapshot Venture::snapshot() const noexcept {
    return {tmpl_.id, tmpl_.name, owned_, nextPrice(), managed_};
}
