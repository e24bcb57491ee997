// include/tax_ngin/report/monthly_summary.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/replay/replay_engine.hpp"

namespace tax_ngin {
namespace report {

/**
 * @brief Closed-trade totals for one exit month
 */
struct MonthlySummaryRow {
    std::string month;  // YYYY-MM
    size_t trades_closed{0};
    size_t short_term_trades{0};
    size_t long_term_trades{0};
    Decimal total_pnl;
    Decimal total_tax;
    Decimal net_post_tax_pnl;
    Decimal corpus_at_month_end;  // Last corpus snapshot within the month
};

/**
 * @brief Group a replay's closed trades by exit month, oldest first
 */
std::vector<MonthlySummaryRow> build_monthly_summary(const replay::ReplayResult& result);

/**
 * @brief Write monthly-<stem>.csv into the output directory
 * @return Path written, or FILE_IO_ERROR
 */
Result<std::filesystem::path> write_monthly_summary(const std::vector<MonthlySummaryRow>& rows,
                                                     const std::string& output_directory,
                                                     const std::filesystem::path& input_file);

}  // namespace report
}  // namespace tax_ngin
