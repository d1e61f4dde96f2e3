#include "Persistence.hpp"

#include <cmath>
#include <memory>

namespace {

/**
 * @brief Reads a numeric member; anything else (missing, string, null) is NaN
 * so it takes the normalizer's sanitize-to-zero path.
 */
double numericMember(const Json::Value& object, const char* key) noexcept {
    const Json::Value* member = object.find(key, key + std::char_traits<char>::length(key));
    if (member == nullptr || !member->isNumeric()) return std::nan("");
    return member->asDouble();
}

}

namespace Persistence {

DecimalRecord toRecord(const DecimalFloat& value) noexcept {
    return {value.mantissa(), value.exponent()};
}

DecimalFloat fromRecord(const DecimalRecord& record) noexcept {
    DecimalFloat value = DecimalFloat::normalize(record.mantissa, static_cast<double>(record.exponent));
    // Balances are currency; a negative record is damage, not debt.
    return value.isPositive() ? value : DecimalFloat::zero();
}

Json::Value toJson(const DecimalFloat& value) {
    DecimalRecord record = toRecord(value);
    Json::Value out(Json::objectValue);
    out[MANTISSA_KEY] = record.mantissa;
    out[EXPONENT_KEY] = static_cast<Json::Int64>(record.exponent);
    return out;
}

DecimalFloat fromJson(const Json::Value& value) noexcept {
    if (!value.isObject()) return DecimalFloat::zero();

    double mantissa = numericMember(value, MANTISSA_KEY);
    double exponent = numericMember(value, EXPONENT_KEY);

    // normalize() rather than fromRecord(): the exponent may arrive fractional
    // or beyond int64 range, and both cases are handled there.
    DecimalFloat result = DecimalFloat::normalize(mantissa, exponent);
    return result.isPositive() ? result : DecimalFloat::zero();
}

std::optional<Json::Value> parseDocument(std::string_view text, std::string& errors) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    bool ok;
    try {
        ok = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    } catch (const Json::Exception& e) {
        errors = e.what();
        ok = false;
    }

    if (!ok) return std::nullopt;
    return root;
}

std::string writeDocument(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

}
