//include/tax_ngin/data/trade_loader.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/ledger/trade_record.hpp"

namespace tax_ngin {

/**
 * @brief Trade records read from a ledger file
 */
struct LoadedLedger {
    std::vector<TradeRecord> trades;  // In file order
    std::vector<DataError> rejected;
    size_t rows_read{0};              // Data rows before the first blank line
    char delimiter{','};
};

/**
 * @brief Reads the trade ledger CSV through Arrow's CSV reader
 *
 * The first row is a header. Reading stops at the first blank line. Columns
 * are taken by position: 0 serial number, 1 stock name, 2 entry price,
 * 3 exit price, 6 entry date, 7 exit date. Every column is read as text
 * and converted here, so a bad cell rejects only its own row. Rows that
 * omit trailing empty fields are padded to the widest row; a row too short
 * to hold an entry date is rejected.
 */
class TradeLoader {
public:
    static constexpr int STOCK_NAME_COLUMN = 1;
    static constexpr int ENTRY_PRICE_COLUMN = 2;
    static constexpr int EXIT_PRICE_COLUMN = 3;
    static constexpr int ENTRY_DATE_COLUMN = 6;
    static constexpr int EXIT_DATE_COLUMN = 7;

    /**
     * @brief Load a ledger file
     * @param file_path Path to a .csv or delimited .txt file
     * @return LoadedLedger, FILE_NOT_FOUND, FILE_IO_ERROR or INVALID_DATA
     *         when the file has no usable layout
     */
    static Result<LoadedLedger> load_file(const std::filesystem::path& file_path);

    /**
     * @brief Load a ledger from in-memory text
     */
    static Result<LoadedLedger> load_text(const std::string& content);

    /**
     * @brief Tab if any of the first lines has one, else comma, else semicolon
     */
    static char detect_delimiter(const std::string& content);

    /**
     * @brief Pick the ledger file from a directory: first *.csv, else first *.txt
     * @return Path, or FILE_NOT_FOUND when the directory holds neither
     */
    static Result<std::filesystem::path> find_input_file(const std::filesystem::path& input_dir);
};

}  // namespace tax_ngin
