// src/report/run_summary.cpp
#include "tax_ngin/report/run_summary.hpp"
#include <fstream>
#include <iomanip>
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {
namespace report {

nlohmann::json build_run_summary(const ReplayConfig& config,
                                 const std::filesystem::path& input_file, size_t trades_loaded,
                                 const std::vector<DataError>& loader_rejected,
                                 const replay::ReplayResult& result) {
    nlohmann::json summary;
    summary["input_file"] = input_file.string();

    nlohmann::json config_echo = config.to_json();
    config_echo.erase("logging");
    summary["config"] = config_echo;

    nlohmann::json counts;
    counts["loaded"] = trades_loaded;
    counts["rejected"] = loader_rejected.size() + result.rejected.size();
    counts["closed"] = result.closed_trades.size();
    counts["open"] = result.open_positions.size();
    counts["skipped_entries"] = result.skipped_entries.size();
    counts["orphan_exits"] = result.orphan_exits.size();
    summary["trades"] = counts;

    summary["initial_capital"] = result.initial_capital.to_string(2);
    summary["final_corpus"] = result.final_corpus.to_string(2);
    summary["total_net_post_tax_pnl"] = result.total_net_post_tax_pnl.to_string(2);
    summary["open_principal"] = result.open_principal.to_string(2);

    nlohmann::json violations = nlohmann::json::array();
    for (const auto& violation : result.violations) {
        violations.push_back(violation.to_json());
    }
    summary["position_limit_violations"] = violations;

    nlohmann::json rejected = nlohmann::json::array();
    for (const auto& error : loader_rejected) {
        rejected.push_back(error.to_json());
    }
    for (const auto& error : result.rejected) {
        rejected.push_back(error.to_json());
    }
    summary["rejected_records"] = rejected;

    nlohmann::json open_positions = nlohmann::json::array();
    for (const auto& position : result.open_positions) {
        nlohmann::json j;
        j["trade_id"] = position.record.id;
        j["stock_name"] = position.record.stock_name;
        j["entry_date"] = position.record.entry_date.to_iso_string();
        j["quantity"] = position.entry.quantity;
        j["entry_amount"] = position.entry.entry_amount.to_string(2);
        open_positions.push_back(j);
    }
    summary["open_positions"] = open_positions;

    return summary;
}

Result<std::filesystem::path> write_run_summary(const nlohmann::json& summary,
                                                const std::string& output_directory,
                                                const std::filesystem::path& input_file) {
    const std::filesystem::path path = std::filesystem::path(output_directory) /
                                       ("summary-" + input_file.stem().string() + ".json");
    try {
        std::filesystem::create_directories(output_directory);
        std::ofstream file(path);
        if (!file.is_open()) {
            return make_error<std::filesystem::path>(
                ErrorCode::FILE_IO_ERROR, "Failed to open " + path.string() + " for writing",
                "RunSummary");
        }
        file << std::setw(4) << summary << std::endl;
        if (!file) {
            return make_error<std::filesystem::path>(
                ErrorCode::FILE_IO_ERROR, "Failed writing to " + path.string(), "RunSummary");
        }
    } catch (const std::exception& e) {
        return make_error<std::filesystem::path>(
            ErrorCode::FILE_IO_ERROR, std::string("Error writing run summary: ") + e.what(),
            "RunSummary");
    }

    INFO("Wrote run summary to " << path.string());
    return path;
}

}  // namespace report
}  // namespace tax_ngin
