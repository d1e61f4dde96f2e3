#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Constants.hpp"
#include "DecimalFloat.hpp"
#include "Notation.hpp"

// --- Enums ---
// Explicitly setting the underlying type keeps Command small.
enum class BuyMode : uint8_t { X1, X10, X100, MAX };

enum class CommandType : uint8_t {
    DEPOSIT, QUOTE, BUY, SET_MODE, SET_NOTATION, PORTFOLIO, SAVE, LOAD, RESET,
    HIRE, ADVANCE, INCOME, PRESTIGE
};

enum class LedgerStatusCode {
    OK                 = 0,
    VALIDATION_FAILURE = 400,
    INSUFFICIENT_FUNDS = 402,
    VENTURE_NOT_FOUND  = 404,
    NOTHING_AFFORDABLE = 409,
    ALREADY_MANAGED    = 410,
    NOTHING_TO_CLAIM   = 412,
    CORRUPT_SAVE       = 422
};

inline std::string_view buyModeName(BuyMode mode) noexcept {
    switch (mode) {
        case BuyMode::X10:  return "x10";
        case BuyMode::X100: return "x100";
        case BuyMode::MAX:  return "max";
        default:            return "x1";
    }
}

inline std::optional<BuyMode> parseBuyMode(std::string_view name) noexcept {
    if (name == "x1") return BuyMode::X1;
    if (name == "x10") return BuyMode::X10;
    if (name == "x100") return BuyMode::X100;
    if (name == "max") return BuyMode::MAX;
    return std::nullopt;
}

// --- Ledger Results ---

/**
 * @brief Price of a prospective purchase.
 * @details count is 0 in MAX mode when not even one unit is affordable; cost is
 * then zero as well.
 */
struct PurchaseQuote {
    std::string_view ventureId;
    int64_t owned = 0;
    int64_t count = 0;
    DecimalFloat cost;
    bool affordable = false;
};

struct VentureSnapshot {
    std::string_view id;
    std::string_view name;
    int64_t owned = 0;
    DecimalFloat nextPrice;
    bool managed = false;
};

struct LedgerSnapshot {
    DecimalFloat balance;
    DecimalFloat lifetime;
    DecimalFloat incomePerSecond;
    int64_t influence = 0;
    BuyMode buyMode = BuyMode::X1;
    NotationMode notation = NotationMode::SUFFIX;
    std::vector<VentureSnapshot> ventures;
};

struct LedgerResponse {
    LedgerStatusCode code;
    std::string message;
    std::optional<PurchaseQuote> quote = std::nullopt;
    // Money moved by the operation (manager price, income credited); zero otherwise.
    DecimalFloat amount = DecimalFloat::zero();

    static LedgerResponse Success(std::string msg, std::optional<PurchaseQuote> q = std::nullopt) {
        return { LedgerStatusCode::OK, std::move(msg), std::move(q) };
    }
    static LedgerResponse Error(LedgerStatusCode c, std::string msg, std::optional<PurchaseQuote> q = std::nullopt) {
        return { c, std::move(msg), std::move(q) };
    }

    bool isSuccess() const { return code == LedgerStatusCode::OK; }
};

// --- Shell Communication ---

/**
 * @brief One parsed shell command.
 * @details Only the fields relevant to `type` are meaningful. `mode` is empty
 * when the line did not name one, meaning "use the ledger's current mode".
 */
struct Command {
    CommandType type = CommandType::PORTFOLIO;
    std::string ventureId;
    std::optional<BuyMode> mode;
    NotationMode notation = NotationMode::SUFFIX;
    double amount = 0.0;
    std::string payload;
};
