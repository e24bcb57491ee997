// include/tax_ngin/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "tax_ngin/core/config_base.hpp"
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {

/**
 * @brief What to do when more than max_stocks positions would be open
 */
enum class PositionLimitPolicy {
    WARN,   // Open every entry and report the violation
    CAP,    // Skip entries beyond the limit and report them
    ABORT   // Stop the run with POSITION_LIMIT_EXCEEDED
};

std::string position_limit_policy_to_string(PositionLimitPolicy policy);

Result<PositionLimitPolicy> position_limit_policy_from_string(const std::string& text);

/**
 * @brief Configuration for one replay run
 */
struct ReplayConfig : public ConfigBase {
    // Capital settings
    Decimal initial_capital{Decimal::from_int(2000000)};
    int max_stocks{20};

    // Tax rates
    Decimal short_term_tax_rate{Decimal::from_raw(20000)};  // 0.20
    Decimal long_term_tax_rate{Decimal::from_raw(10000)};   // 0.10

    PositionLimitPolicy position_limit_policy{PositionLimitPolicy::WARN};

    // File locations
    std::string input_dir{"input"};
    std::string output_dir{"output"};

    // Optional outputs
    bool write_monthly_summary{true};
    bool write_json_summary{true};

    LoggerConfig logging;

    nlohmann::json to_json() const override;

    /**
     * @brief Apply the keys present in j, leaving the others untouched
     * @throws nlohmann::json::exception or TradeError on a malformed value
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Loads ReplayConfig from a JSON file layered over the defaults
 *
 * The file is layered over the defaults through ConfigBase::load_from_file.
 * A missing file leaves the defaults in place.
 */
class ConfigLoader {
public:
    static constexpr int MAX_RATE_PLACES = 3;

    /**
     * @brief Load and validate the configuration
     * @param config_file_path Path to the JSON file, e.g. "./config.json"
     * @return Result containing ReplayConfig or error
     */
    static Result<ReplayConfig> load(const std::filesystem::path& config_file_path);

    /**
     * @brief Validate ranges of a fully assembled configuration
     * Rates must lie in [0, 1) with at most MAX_RATE_PLACES decimals. Also
     * used after command-line overrides have been applied
     */
    static Result<void> validate(const ReplayConfig& config);

private:
    static void log_config_summary(const ReplayConfig& config);
};

}  // namespace tax_ngin
