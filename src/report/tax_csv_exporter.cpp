// src/report/tax_csv_exporter.cpp
#include "tax_ngin/report/tax_csv_exporter.hpp"
#include <algorithm>
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {
namespace report {

namespace {

// Quote a cell when it holds the separator, a quote or a line break
std::string csv_cell(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"')
            quoted += "\"\"";
        else
            quoted += c;
    }
    quoted += "\"";
    return quoted;
}

}  // namespace

std::string tax_report_filename(const std::filesystem::path& input_file) {
    return "tax-" + input_file.stem().string() + ".csv";
}

TaxCSVExporter::TaxCSVExporter(const std::string& output_directory, const std::string& filename)
    : output_directory_(output_directory), filename_(filename) {}

TaxCSVExporter::~TaxCSVExporter() {
    finalize();
}

Result<void> TaxCSVExporter::initialize_file() {
    try {
        std::filesystem::create_directories(output_directory_);

        file_.open(output_path());
        if (!file_.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + output_path().string() + " for writing",
                                    "TaxCSVExporter");
        }
        file_ << "Stock Name,Entry date,Entry price,Entry Amount,Quantity,Exit date,"
              << "Exit price,Exit amount,PNL,ST/LT,Tax,Corpus available\n";
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error initializing tax report: ") + e.what(),
                                "TaxCSVExporter");
    }
}

std::vector<TradeOutput> TaxCSVExporter::sorted_for_report(std::vector<TradeOutput> trades) {
    std::stable_sort(trades.begin(), trades.end(),
                     [](const TradeOutput& a, const TradeOutput& b) {
                         if (a.exit_date != b.exit_date)
                             return a.exit_date < b.exit_date;
                         if (a.stock_name != b.stock_name)
                             return a.stock_name < b.stock_name;
                         return a.trade_id < b.trade_id;
                     });
    return trades;
}

Result<void> TaxCSVExporter::write_trades(const std::vector<TradeOutput>& trades) {
    if (!file_.is_open()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Tax report file is not open",
                                "TaxCSVExporter");
    }

    for (const auto& trade : sorted_for_report(trades)) {
        file_ << csv_cell(trade.stock_name) << "," << trade.entry_date.to_short_string() << ","
              << trade.entry_price.to_string(2) << "," << trade.entry_amount.to_string(2) << ","
              << trade.quantity << "," << trade.exit_date.to_short_string() << ","
              << trade.exit_price.to_string(2) << "," << trade.exit_amount.to_string(2) << ","
              << trade.pnl.to_string(2) << "," << holding_term_label(trade.term) << ","
              << trade.tax.to_string(2) << "," << trade.corpus_available.to_string(2) << "\n";
    }

    file_.flush();
    if (!file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed writing to " + output_path().string(), "TaxCSVExporter");
    }
    INFO("Wrote " << trades.size() << " closed trades to " << output_path().string());
    return Result<void>();
}

void TaxCSVExporter::finalize() {
    if (file_.is_open()) {
        file_.close();
    }
}

}  // namespace report
}  // namespace tax_ngin
