#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

#include "DecimalFloat.hpp"

/**
 * @brief Plain persisted form of a DecimalFloat.
 */
struct DecimalRecord {
    double mantissa = 0.0;
    int64_t exponent = 0;
};

/**
 * @namespace Persistence
 * @brief Save-file adapter for DecimalFloat and the JSON text codec.
 * @details Loading never fails hard: a missing, non-numeric or non-finite field
 * becomes canonical zero so a damaged save degrades to a fresh-zero balance.
 * For every value the normalizer produced, fromRecord(toRecord(x)) == x.
 */
namespace Persistence {
    inline constexpr const char* MANTISSA_KEY = "mantissa";
    inline constexpr const char* EXPONENT_KEY = "exponent";

    DecimalRecord toRecord(const DecimalFloat& value) noexcept;
    DecimalFloat fromRecord(const DecimalRecord& record) noexcept;

    // {"mantissa": <double>, "exponent": <int>}
    Json::Value toJson(const DecimalFloat& value);
    DecimalFloat fromJson(const Json::Value& value) noexcept;

    /**
     * @brief Strict-mode parse of a JSON document.
     * @param errors Receives the reader's diagnostics on failure.
     */
    std::optional<Json::Value> parseDocument(std::string_view text, std::string& errors);

    // Compact, single-line rendering (no indentation).
    std::string writeDocument(const Json::Value& root);
}
