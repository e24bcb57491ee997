// include/tax_ngin/report/tax_csv_exporter.hpp
#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/ledger/trade_record.hpp"

namespace tax_ngin {
namespace report {

/**
 * @brief Output file name for an input ledger: tax-<stem>.csv
 */
std::string tax_report_filename(const std::filesystem::path& input_file);

/**
 * @brief Writes the per-trade tax report for closed trades
 *
 * Columns: Stock Name, Entry date, Entry price, Entry Amount, Quantity,
 * Exit date, Exit price, Exit amount, PNL, ST/LT, Tax, Corpus available.
 * Dates are DD-Mon-YY and money has two decimals.
 */
class TaxCSVExporter {
public:
    TaxCSVExporter(const std::string& output_directory, const std::string& filename);
    ~TaxCSVExporter();

    Result<void> initialize_file();

    /**
     * @brief Append rows ordered by exit date, stock name, then trade id
     */
    Result<void> write_trades(const std::vector<TradeOutput>& trades);

    void finalize();

    std::filesystem::path output_path() const {
        return std::filesystem::path(output_directory_) / filename_;
    }

    static std::vector<TradeOutput> sorted_for_report(std::vector<TradeOutput> trades);

private:
    std::string output_directory_;
    std::string filename_;
    std::ofstream file_;
};

}  // namespace report
}  // namespace tax_ngin
