#include "FriendlyInput.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
}

/**
 * @brief Strict literal conversion: the whole view must be one finite number.
 */
std::optional<double> parseLiteral(std::string_view sv) {
    if (!sv.empty() && sv.front() == '+') {
        sv.remove_prefix(1);
        // from_chars takes its own '-'; "+-5" must not slip through as -5.
        if (!sv.empty() && (sv.front() == '-' || sv.front() == '+')) return std::nullopt;
    }
    if (sv.empty()) return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value, std::chars_format::general);

    // Rejects "12.3abc", "1e999" (result_out_of_range) and the "inf"/"nan" spellings.
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value)) return std::nullopt;
    return value;
}

}

namespace FriendlyInput {

std::optional<double> magnitudeFor(char letter) noexcept {
    switch (std::tolower(static_cast<unsigned char>(letter))) {
        case 'k': return 1e3;
        case 'm': return 1e6;
        case 'b': return 1e9;
        case 't': return 1e12;
        case 'q': return 1e15;
        default:  return std::nullopt;
    }
}

std::optional<double> parseAmount(std::string_view text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : trim(text)) {
        if (c != ',') cleaned.push_back(c);
    }

    std::string_view sv = trim(cleaned);
    if (sv.empty()) return std::nullopt;

    // 1. Plain or scientific literal.
    if (auto plain = parseLiteral(sv)) return plain;

    // 2. Literal followed by one magnitude letter.
    auto multiplier = magnitudeFor(sv.back());
    if (!multiplier) return std::nullopt;

    std::string_view number = sv.substr(0, sv.size() - 1);
    while (!number.empty() && std::isspace(static_cast<unsigned char>(number.back()))) number.remove_suffix(1);

    auto base = parseLiteral(number);
    if (!base) return std::nullopt;

    double scaled = *base * *multiplier;
    if (!std::isfinite(scaled)) return std::nullopt;
    return scaled;
}

}
