#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include "DecimalFloat.hpp"
#include "OutputHandler.hpp"
#include "Types.hpp"
#include "Venture.hpp"

/**
 * @brief The LedgerEngine: wallet, venture holdings and purchase rules.
 * @details This is the consumer of the growth-economy layer. It quotes a run,
 * checks the quote against the balance with DecimalFloat::compare, deducts, and
 * only then increments the owned count. Single-threaded: the shell drives it
 * from one processing thread.
 */
class LedgerEngine {
public:
    explicit LedgerEngine(OutputHandler& handler);

    // --- Shell Ingress ---
    void processCommand(const Command& cmd);

    // --- Wallet ---
    LedgerResponse deposit(const DecimalFloat& amount);

    // --- Purchases (mode defaults to the current buy mode) ---
    LedgerResponse quote(std::string_view ventureId, std::optional<BuyMode> mode = std::nullopt) const;
    LedgerResponse buy(std::string_view ventureId, std::optional<BuyMode> mode = std::nullopt);

    // --- Managers & Income ---
    LedgerResponse hireManager(std::string_view ventureId);

    /**
     * @brief Credits `seconds` of managed income to balance and lifetime.
     * @details The amount credited is returned in LedgerResponse::amount.
     */
    LedgerResponse advance(double seconds);

    /**
     * @brief Earnings for the time the shell was not running.
     * @details Same rate as advance(), but the gap is capped and very short gaps
     * earn nothing (Growth::offlineGain). Returns the amount credited.
     */
    DecimalFloat applyOfflineProgress(double elapsedSeconds);

    [[nodiscard]] DecimalFloat incomePerSecond() const;
    double profitMultiplier() const noexcept;

    // --- Prestige ---

    /**
     * @brief Trades the lifetime total for influence and starts over.
     * @details Keeps influence (plus the gain), lifetime, notation and buy mode;
     * everything else returns to the fresh ledger. NOTHING_TO_CLAIM while the
     * gain would be zero.
     */
    LedgerResponse prestige();
    int64_t pendingInfluence() const noexcept;
    int64_t influence() const noexcept { return influence_; }

    // --- Settings ---
    void setBuyMode(BuyMode mode) noexcept { buyMode_ = mode; }
    void setNotation(NotationMode notation) noexcept { notation_ = notation; }
    BuyMode buyMode() const noexcept { return buyMode_; }
    NotationMode notation() const noexcept { return notation_; }

    // --- Queries ---
    const DecimalFloat& balance() const noexcept { return balance_; }
    const DecimalFloat& lifetime() const noexcept { return lifetime_; }
    std::optional<int64_t> owned(std::string_view ventureId) const;
    std::optional<bool> managed(std::string_view ventureId) const;
    [[nodiscard]] LedgerSnapshot snapshot() const;

    // --- Persistence ---
    [[nodiscard]] Json::Value exportState() const;

    /**
     * @brief Restores a save document.
     * @details Tolerant by construction: damaged fields fall back to their fresh
     * defaults with a warning. Only a document that is not a JSON object at all
     * is reported as CORRUPT_SAVE; it is rejected before the ledger is reset, so
     * the live state survives a mistyped load.
     */
    LedgerResponse importState(const Json::Value& root);
    LedgerResponse importDocument(std::string_view document);

    // Unix time stamped into the last imported save, if it carried one.
    std::optional<int64_t> savedAt() const noexcept { return savedAt_; }

    void reset();

private:
    const Venture* findVenture(std::string_view id) const;
    Venture* findVenture(std::string_view id);

    std::string money(const DecimalFloat& value) const;

    void emitBalance();
    void emitPortfolio();

    OutputHandler& outputHandler_;

    DecimalFloat balance_;
    DecimalFloat lifetime_;
    int64_t influence_ = 0;
    std::optional<int64_t> savedAt_;
    BuyMode buyMode_ = BuyMode::X1;
    NotationMode notation_ = NotationMode::SUFFIX;

    // Catalogue order; ten entries, so lookups are a linear scan.
    std::vector<Venture> ventures_;
};
