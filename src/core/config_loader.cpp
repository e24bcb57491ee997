// src/core/config_loader.cpp

#include "tax_ngin/core/config_loader.hpp"

namespace tax_ngin {

namespace {

// Money and rates may be written as JSON numbers or as decimal strings
Decimal decimal_from_json(const nlohmann::json& value, const std::string& key) {
    if (value.is_string()) {
        auto parsed = Decimal::from_string(value.get<std::string>());
        if (parsed.is_error()) {
            throw TradeError(ErrorCode::INVALID_DATA,
                             "Invalid value for " + key + ": " + parsed.error()->what(),
                             "ReplayConfig");
        }
        return parsed.value();
    }
    return Decimal(value.get<double>());
}

}  // namespace

std::string position_limit_policy_to_string(PositionLimitPolicy policy) {
    switch (policy) {
        case PositionLimitPolicy::WARN:
            return "WARN";
        case PositionLimitPolicy::CAP:
            return "CAP";
        case PositionLimitPolicy::ABORT:
            return "ABORT";
        default:
            return "UNKNOWN";
    }
}

Result<PositionLimitPolicy> position_limit_policy_from_string(const std::string& text) {
    if (text == "WARN")
        return PositionLimitPolicy::WARN;
    if (text == "CAP")
        return PositionLimitPolicy::CAP;
    if (text == "ABORT")
        return PositionLimitPolicy::ABORT;
    return make_error<PositionLimitPolicy>(
        ErrorCode::INVALID_ARGUMENT,
        "Unknown position_limit_policy '" + text + "', expected WARN, CAP or ABORT",
        "ReplayConfig");
}

nlohmann::json ReplayConfig::to_json() const {
    nlohmann::json j;
    j["initial_capital"] = initial_capital.to_string(2);
    j["max_stocks"] = max_stocks;
    j["short_term_tax_rate"] = static_cast<double>(short_term_tax_rate);
    j["long_term_tax_rate"] = static_cast<double>(long_term_tax_rate);
    j["position_limit_policy"] = position_limit_policy_to_string(position_limit_policy);
    j["input_dir"] = input_dir;
    j["output_dir"] = output_dir;
    j["write_monthly_summary"] = write_monthly_summary;
    j["write_json_summary"] = write_json_summary;
    j["logging"] = logging.to_json();
    return j;
}

void ReplayConfig::from_json(const nlohmann::json& j) {
    if (j.contains("initial_capital"))
        initial_capital = decimal_from_json(j.at("initial_capital"), "initial_capital").round(2);
    if (j.contains("max_stocks"))
        max_stocks = j.at("max_stocks").get<int>();
    if (j.contains("short_term_tax_rate"))
        short_term_tax_rate = decimal_from_json(j.at("short_term_tax_rate"), "short_term_tax_rate");
    if (j.contains("long_term_tax_rate"))
        long_term_tax_rate = decimal_from_json(j.at("long_term_tax_rate"), "long_term_tax_rate");
    if (j.contains("position_limit_policy")) {
        auto policy =
            position_limit_policy_from_string(j.at("position_limit_policy").get<std::string>());
        if (policy.is_error()) {
            throw *policy.error();
        }
        position_limit_policy = policy.value();
    }
    if (j.contains("input_dir"))
        input_dir = j.at("input_dir").get<std::string>();
    if (j.contains("output_dir"))
        output_dir = j.at("output_dir").get<std::string>();
    if (j.contains("write_monthly_summary"))
        write_monthly_summary = j.at("write_monthly_summary").get<bool>();
    if (j.contains("write_json_summary"))
        write_json_summary = j.at("write_json_summary").get<bool>();
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
}

Result<void> ConfigLoader::validate(const ReplayConfig& config) {
    if (!config.initial_capital.is_positive()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "initial_capital must be positive",
                                "ConfigLoader");
    }
    if (config.max_stocks <= 0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "max_stocks must be positive",
                                "ConfigLoader");
    }
    const Decimal one = Decimal::from_int(1);
    if (config.short_term_tax_rate.is_negative() || config.short_term_tax_rate >= one) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "short_term_tax_rate must be in [0.0, 1.0)", "ConfigLoader");
    }
    if (config.long_term_tax_rate.is_negative() || config.long_term_tax_rate >= one) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "long_term_tax_rate must be in [0.0, 1.0)", "ConfigLoader");
    }
    // Amounts carry 2 places, so a rate with at most 3 keeps every product
    // exact and the net is rounded only once
    if (config.short_term_tax_rate.round(MAX_RATE_PLACES) != config.short_term_tax_rate) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "short_term_tax_rate allows at most " +
                                    std::to_string(MAX_RATE_PLACES) + " decimal places",
                                "ConfigLoader");
    }
    if (config.long_term_tax_rate.round(MAX_RATE_PLACES) != config.long_term_tax_rate) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "long_term_tax_rate allows at most " +
                                    std::to_string(MAX_RATE_PLACES) + " decimal places",
                                "ConfigLoader");
    }
    if (config.output_dir.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "output_dir must not be empty",
                                "ConfigLoader");
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const ReplayConfig& config) {
    if (!Logger::instance().is_initialized()) {
        return;
    }
    INFO("Config summary: initial_capital=" << config.initial_capital.to_string(2)
                                            << ", max_stocks=" << config.max_stocks
                                            << ", st_rate=" << config.short_term_tax_rate
                                            << ", lt_rate=" << config.long_term_tax_rate
                                            << ", policy="
                                            << position_limit_policy_to_string(
                                                   config.position_limit_policy));
    INFO("Config summary: input_dir=" << config.input_dir
                                      << ", output_dir=" << config.output_dir);
}

Result<ReplayConfig> ConfigLoader::load(const std::filesystem::path& config_file_path) {
    ReplayConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(config_file_path, ec)) {
        if (Logger::instance().is_initialized()) {
            INFO("Config file " << config_file_path.string() << " not found, using defaults");
        }
    } else {
        auto loaded = config.load_from_file(config_file_path);
        if (loaded.is_error()) {
            return forward_error<ReplayConfig>(*loaded.error());
        }
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return forward_error<ReplayConfig>(*valid.error());
    }

    log_config_summary(config);
    return config;
}

}  // namespace tax_ngin
