// src/report/monthly_summary.cpp
#include "tax_ngin/report/monthly_summary.hpp"
#include <fstream>
#include <map>
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {
namespace report {

std::vector<MonthlySummaryRow> build_monthly_summary(const replay::ReplayResult& result) {
    std::map<std::string, MonthlySummaryRow> by_month;

    for (const auto& trade : result.closed_trades) {
        auto& row = by_month[trade.exit_date.month_key()];
        row.month = trade.exit_date.month_key();
        ++row.trades_closed;
        if (trade.term == HoldingTerm::LONG_TERM)
            ++row.long_term_trades;
        else
            ++row.short_term_trades;
        row.total_pnl += trade.pnl;
        row.total_tax += trade.tax;
    }

    for (const auto& settlement : result.settlements) {
        auto it = by_month.find(settlement.date.month_key());
        if (it != by_month.end()) {
            it->second.net_post_tax_pnl += settlement.net_post_tax_pnl;
        }
    }

    // History is in date order, so the last write per month wins
    for (const auto& snapshot : result.corpus_history) {
        auto it = by_month.find(snapshot.date.month_key());
        if (it != by_month.end()) {
            it->second.corpus_at_month_end = snapshot.corpus;
        }
    }

    std::vector<MonthlySummaryRow> rows;
    rows.reserve(by_month.size());
    for (auto& [month, row] : by_month) {
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::filesystem::path> write_monthly_summary(const std::vector<MonthlySummaryRow>& rows,
                                                     const std::string& output_directory,
                                                     const std::filesystem::path& input_file) {
    const std::filesystem::path path = std::filesystem::path(output_directory) /
                                       ("monthly-" + input_file.stem().string() + ".csv");
    try {
        std::filesystem::create_directories(output_directory);
        std::ofstream file(path);
        if (!file.is_open()) {
            return make_error<std::filesystem::path>(
                ErrorCode::FILE_IO_ERROR, "Failed to open " + path.string() + " for writing",
                "MonthlySummary");
        }

        file << "Month,Trades closed,ST trades,LT trades,Total PNL,Total tax,"
             << "Net post-tax PNL,Corpus at month end\n";
        for (const auto& row : rows) {
            file << row.month << "," << row.trades_closed << "," << row.short_term_trades << ","
                 << row.long_term_trades << "," << row.total_pnl.to_string(2) << ","
                 << row.total_tax.to_string(2) << "," << row.net_post_tax_pnl.to_string(2) << ","
                 << row.corpus_at_month_end.to_string(2) << "\n";
        }
        if (!file) {
            return make_error<std::filesystem::path>(
                ErrorCode::FILE_IO_ERROR, "Failed writing to " + path.string(), "MonthlySummary");
        }
    } catch (const std::exception& e) {
        return make_error<std::filesystem::path>(
            ErrorCode::FILE_IO_ERROR, std::string("Error writing monthly summary: ") + e.what(),
            "MonthlySummary");
    }

    INFO("Wrote " << rows.size() << " monthly rows to " << path.string());
    return path;
}

}  // namespace report
}  // namespace tax_ngin
