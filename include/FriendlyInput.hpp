#pragma once

#include <optional>
#include <string_view>

/**
 * @namespace FriendlyInput
 * @brief Lenient parser for amounts typed by a player.
 * @details Grammar: NUMBER [SUFFIX]
 *   NUMBER  plain or scientific decimal literal; thousands separators (',') are
 *           stripped and a single leading '+' is allowed.
 *   SUFFIX  one of k, m, b, t, q (case-insensitive), optionally preceded by
 *           whitespace, scaling by 1e3, 1e6, 1e9, 1e12, 1e15.
 *
 * Unlike the numeric core, this parser distinguishes "no value" from zero:
 * malformed or non-finite input returns std::nullopt so the caller can reject
 * the input instead of treating garbage as $0.
 */
namespace FriendlyInput {

    std::optional<double> parseAmount(std::string_view text);

    /**
     * @return The multiplier for a magnitude letter, or std::nullopt.
     */
    std::optional<double> magnitudeFor(char letter) noexcept;
}
