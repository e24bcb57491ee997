//src/data/conversion_utils.cpp
#include "tax_ngin/data/conversion_utils.hpp"
#include <cctype>

namespace tax_ngin {

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Expected a string column, got " +
                                           array->type()->ToString(),
                                       "DataConversionUtils");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return std::string();
    }
    return trim(string_array->GetString(index));
}

Result<Decimal> DataConversionUtils::parse_price(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c != ',') {
            cleaned.push_back(c);
        }
    }

    auto parsed = Decimal::from_string(cleaned);
    if (parsed.is_error()) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR,
                                   "Invalid price format: '" + text + "'",
                                   "DataConversionUtils");
    }
    return parsed;
}

Result<Date> DataConversionUtils::parse_date(const std::string& text) {
    return Date::parse(text);
}

std::string DataConversionUtils::trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return text.substr(begin, end - begin);
}

}  // namespace tax_ngin
