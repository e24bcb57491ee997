//include/tax_ngin/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include "tax_ngin/core/date.hpp"
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"

namespace tax_ngin {

class DataConversionUtils {
public:
    /**
     * @brief Extract string value from Arrow array
     * @param array Arrow array containing strings
     * @param index Row index
     * @return Result containing the trimmed string value, empty for null
     */
    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);

    /**
     * @brief Parse a price cell, ignoring thousands separators
     * @param text Cell text, e.g. "1,234.50"
     * @return Result containing the price
     */
    static Result<Decimal> parse_price(const std::string& text);

    /**
     * @brief Parse a date cell in any accepted ledger format
     * @param text Cell text, e.g. "15-Jan-20"
     * @return Result containing the date
     */
    static Result<Date> parse_date(const std::string& text);

    /**
     * @brief Strip leading and trailing whitespace
     */
    static std::string trim(const std::string& text);
};

}  // namespace tax_ngin
