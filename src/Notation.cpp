#include "Notation.hpp"

#include <cmath>
#include <format>

namespace {

// Fewer places as the value grows within its bucket: 1.23 / 12.3 / 123.
int placesFor(double shown, int decimals) noexcept {
    if (shown >= 100.0) return 0;
    if (shown >= 10.0) return 1;
    return decimals;
}

double roundTo(double value, int places) noexcept {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

}

namespace Format {

std::string suffix(const DecimalFloat& value, int decimals) {
    if (!value.isPositive()) return "0";

    size_t tier = 0;
    double shown;
    if (value.exponent() < 3) {
        shown = value.toNumber();
    } else {
        int64_t bucket = value.exponent() / 3;
        if (bucket >= static_cast<int64_t>(Config::SUFFIXES.size())) return scientific(value, decimals);
        tier = static_cast<size_t>(bucket);
        shown = value.mantissa() * std::pow(10.0, static_cast<double>(value.exponent() - bucket * 3));
    }

    // 999.996 would print as "1000"; move it into the next bucket instead.
    if (roundTo(shown, placesFor(shown, decimals)) >= 1000.0) {
        ++tier;
        shown /= 1000.0;
        if (tier >= Config::SUFFIXES.size()) return scientific(value, decimals);
    }

    // 9.996 rounds to 10.00; recompute so it prints as "10.0".
    int places = placesFor(roundTo(shown, placesFor(shown, decimals)), decimals);
    return std::format("{:.{}f}{}", shown, places, Config::SUFFIXES[tier]);
}

std::string scientific(const DecimalFloat& value, int decimals) {
    if (!value.isPositive()) return "0";

    int places = value.exponent() >= Config::SCI_DETAIL_EXPONENT ? decimals + 1 : decimals;
    double mantissa = value.mantissa();
    int64_t exponent = value.exponent();
    if (roundTo(mantissa, places) >= 10.0) {
        mantissa /= 10.0;
        ++exponent;
    }
    return std::format("{:.{}f}e{}", mantissa, places, exponent);
}

std::string money(const DecimalFloat& value, NotationMode mode) {
    return mode == NotationMode::SCIENTIFIC ? scientific(value) : suffix(value);
}

std::string_view notationName(NotationMode mode) noexcept {
    return mode == NotationMode::SCIENTIFIC ? "sci" : "suffix";
}

std::optional<NotationMode> parseNotation(std::string_view name) noexcept {
    if (name == "suffix") return NotationMode::SUFFIX;
    if (name == "sci") return NotationMode::SCIENTIFIC;
    return std::nullopt;
}

}
