// include/tax_ngin/report/run_summary.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "tax_ngin/core/config_loader.hpp"
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/ledger/trade_record.hpp"
#include "tax_ngin/replay/replay_engine.hpp"

namespace tax_ngin {
namespace report {

/**
 * @brief Summary document for one run
 *
 * Holds the configuration echo, trade counts (loaded, rejected, closed,
 * open), initial capital, final corpus, total net_post_tax_pnl, open
 * principal, stock-count violations and every rejected record.
 *
 * @param loader_rejected Records the loader could not read
 */
nlohmann::json build_run_summary(const ReplayConfig& config,
                                 const std::filesystem::path& input_file, size_t trades_loaded,
                                 const std::vector<DataError>& loader_rejected,
                                 const replay::ReplayResult& result);

/**
 * @brief Write summary-<stem>.json into the output directory
 * @return Path written, or FILE_IO_ERROR
 */
Result<std::filesystem::path> write_run_summary(const nlohmann::json& summary,
                                                const std::string& output_directory,
                                                const std::filesystem::path& input_file);

}  // namespace report
}  // namespace tax_ngin
