#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Constants.hpp"
#include "DecimalFloat.hpp"

enum class NotationMode : uint8_t { SUFFIX, SCIENTIFIC };

/**
 * @namespace Format
 * @brief Human-readable rendering of DecimalFloat balances.
 * @details Both notations stay within a handful of characters regardless of
 * magnitude, so a balance of 10^3000 renders as compactly as 10^3.
 */
namespace Format {

    /**
     * @brief Suffix notation: "950", "1.50K", "12.3M", "450Qa".
     * @details Below 10^3 the value is a plain decimal. Above it the exponent is
     * bucketed in groups of three against Config::SUFFIXES; tiers past the table
     * fall back to scientific().
     */
    std::string suffix(const DecimalFloat& value, int decimals = Config::DEFAULT_DECIMALS);

    /**
     * @brief Scientific notation: "1.50e3", "4.321e99".
     */
    std::string scientific(const DecimalFloat& value, int decimals = Config::DEFAULT_DECIMALS);

    std::string money(const DecimalFloat& value, NotationMode mode);

    std::string_view notationName(NotationMode mode) noexcept;
    std::optional<NotationMode> parseNotation(std::string_view name) noexcept;
}
